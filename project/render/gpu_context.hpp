#pragma once
#include <memory>

#include "i_render.hpp"

// Backend-agnostic owner of the GPU session and render surface.
//
// Per-frame failures (SurfaceLost, Timeout, ValidationFailed) never escape as
// fatal: a lost surface is reconfigured once and the acquire retried once,
// everything else skips the frame. Zero-area resizes are deferred until the
// next non-zero size.
class GpuContext {
public:
    explicit GpuContext(std::unique_ptr<IRenderBackend> backend);
    ~GpuContext();

    GpuContext(const GpuContext&) = delete;
    GpuContext& operator=(const GpuContext&) = delete;

    Result<SurfaceInfo> initialize(const NativeSurfaceHandle& target,
                                   const SurfaceRequest& request);
    void resize(u32 width, u32 height);
    Result<FrameState> acquire_frame();
    Status present(FrameState& frame);
    void discard_frame(FrameState& frame);
    void gui_new_frame();
    void shutdown();

    IRenderBackend&    backend()       { return *backend_; }
    BackendProfile     profile() const { return backend_->profile(); }
    bool               initialized() const     { return initialized_; }
    u64                session_generation() const { return generation_; }
    const SurfaceInfo& surface_info() const    { return info_; }
    // drawable size the backend actually applied (may be clamped)
    Extent2D           surface_size() const    { return drawable_; }
    Extent2D           requested_size() const  { return requested_; }
    bool               resize_deferred() const { return deferred_; }

    u64 reconfigure_count() const { return reconfigurations_; }
    u64 frames_presented() const  { return presented_; }
    u64 frames_skipped() const    { return skipped_; }

private:
    bool reconfigure(const char* reason);
    bool surface_needs_configure() const;

    std::unique_ptr<IRenderBackend> backend_;
    SurfaceInfo info_{};

    Extent2D configured_{};   // last size handed to the backend
    Extent2D drawable_{};
    Extent2D requested_{};
    bool     initialized_{false};
    bool     deferred_{false};
    bool     dirty_{false};
    bool     pre_init_resize_{false};

    u64 generation_{0};
    u64 frame_counter_{0};
    u64 reconfigurations_{0};
    u64 presented_{0};
    u64 skipped_{0};
};
