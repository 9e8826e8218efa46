#include "gpu_context.hpp"

#include <iostream>

GpuContext::GpuContext(std::unique_ptr<IRenderBackend> backend)
    : backend_(std::move(backend))
{
}

GpuContext::~GpuContext()
{
    shutdown();
}

Result<SurfaceInfo> GpuContext::initialize(const NativeSurfaceHandle& target,
                                           const SurfaceRequest& request)
{
    if (initialized_) {
        std::cerr << "[GPU] initialize called twice, keeping generation "
                  << generation_ << "\n";
        return Result<SurfaceInfo>::success(info_);
    }

    if (target.size.is_zero()) {
        return Result<SurfaceInfo>::failure(
            ErrorKind::SurfaceConfigurationError,
            "drawable has zero size (" + std::to_string(target.size.width) + "x" +
            std::to_string(target.size.height) + ")");
    }

    SurfaceRequest req = request;
    req.size = target.size;

    Result<SurfaceInfo> r = backend_->initialize(target, req);
    if (!r.ok) {
        return r;
    }

    info_        = r.value;
    configured_  = req.size;
    drawable_    = r.value.size;
    initialized_ = true;
    deferred_    = false;
    dirty_       = false;
    ++generation_;

    std::cout << "[GPU] session " << generation_ << " ready: "
              << backend_profile_name(backend_->profile())
              << ", adapter '" << info_.adapter << "'"
              << ", format " << info_.format
              << ", present mode " << present_mode_name(info_.present_mode)
              << ", " << drawable_.width << "x" << drawable_.height << "\n";

    // a resize that raced the platform-ready signal wins over the initial size
    if (pre_init_resize_ && requested_ != configured_) {
        Extent2D want = requested_;
        pre_init_resize_ = false;
        resize(want.width, want.height);
    } else {
        requested_ = configured_;
        pre_init_resize_ = false;
    }

    return r;
}

void GpuContext::resize(u32 width, u32 height)
{
    requested_ = {width, height};

    if (!initialized_) {
        pre_init_resize_ = true;
        return;
    }

    if (requested_.is_zero()) {
        if (!deferred_) {
            std::cout << "[GPU] zero-area resize, deferring surface configuration\n";
        }
        deferred_ = true;
        return;
    }

    if (!surface_needs_configure()) {
        return;
    }

    reconfigure("resize");
}

bool GpuContext::surface_needs_configure() const
{
    return deferred_ || dirty_ || requested_ != configured_;
}

bool GpuContext::reconfigure(const char* reason)
{
    ++reconfigurations_;
    Result<Extent2D> applied = backend_->configure_surface(requested_);
    if (!applied.ok) {
        std::cerr << "[GPU] surface configuration (" << reason << ") failed: "
                  << error_kind_name(applied.err.kind) << ": " << applied.err.message << "\n";
        dirty_ = true;
        return false;
    }

    configured_ = requested_;
    drawable_   = applied.value.is_zero() ? requested_ : applied.value;
    info_.size  = drawable_;
    deferred_   = false;
    dirty_      = false;
    return true;
}

Result<FrameState> GpuContext::acquire_frame()
{
    if (!initialized_) {
        return Result<FrameState>::failure(ErrorKind::SurfaceConfigurationError,
                                           "GPU context is not initialized");
    }

    if (requested_.is_zero()) {
        ++skipped_;
        return Result<FrameState>::failure(ErrorKind::ResizeDegenerate,
                                           "surface has zero area");
    }

    if (surface_needs_configure() && !reconfigure("before acquire")) {
        ++skipped_;
        return Result<FrameState>::failure(ErrorKind::SurfaceLost,
                                           "surface could not be configured");
    }

    Result<FrameState> r = backend_->acquire_frame();

    if (!r.ok && r.err.kind == ErrorKind::SurfaceLost) {
        std::cerr << "[GPU] surface lost on acquire (" << r.err.message
                  << "), reconfiguring\n";
        if (!reconfigure("surface lost")) {
            ++skipped_;
            return r;
        }
        r = backend_->acquire_frame();
        if (!r.ok && r.err.kind == ErrorKind::SurfaceLost) {
            dirty_ = true;
        }
    }

    if (!r.ok) {
        ++skipped_;
        if (r.err.kind == ErrorKind::Timeout) {
            std::cerr << "[GPU] acquire timed out, skipping frame\n";
        } else {
            std::cerr << "[GPU] acquire failed: " << error_kind_name(r.err.kind)
                      << ": " << r.err.message << "\n";
        }
        return r;
    }

    r.value.frame_number = ++frame_counter_;
    if (r.value.size.is_zero()) r.value.size = drawable_;
    return r;
}

Status GpuContext::present(FrameState& frame)
{
    Status st = backend_->present(frame);
    if (!st.ok) {
        if (st.err.kind == ErrorKind::SurfaceLost) {
            dirty_ = true;
        }
        ++skipped_;
        return st;
    }

    if (frame.surface_outdated) {
        dirty_ = true;
    }
    ++presented_;
    return st;
}

void GpuContext::discard_frame(FrameState& frame)
{
    Status st = backend_->discard_frame(frame);
    if (!st.ok) {
        if (st.err.kind == ErrorKind::SurfaceLost) {
            dirty_ = true;
        } else {
            std::cerr << "[GPU] discarding frame " << frame.frame_number << " failed: "
                      << st.err.message << "\n";
        }
    }
    ++skipped_;
}

void GpuContext::gui_new_frame()
{
    if (initialized_) backend_->gui_new_frame();
}

void GpuContext::shutdown()
{
    if (!initialized_) return;

    backend_->wait_idle();
    backend_->shutdown();
    initialized_ = false;
    std::cout << "[GPU] session " << generation_ << " released\n";
}
