#pragma once
#include <string>
#include <webgpu/webgpu_cpp.h>

#include "../i_render.hpp"

// WebGPU backend for the browser. The canvas is presented by the browser at
// the end of each animation frame, so present() only submits.
class WebGpuRenderer : public IRenderBackend {
public:
    WebGpuRenderer() = default;
    ~WebGpuRenderer() override;

    WebGpuRenderer(const WebGpuRenderer&) = delete;
    WebGpuRenderer& operator=(const WebGpuRenderer&) = delete;

    BackendProfile profile() const override { return BackendProfile::WebGPU; }

    Result<SurfaceInfo> initialize(const NativeSurfaceHandle& target,
                                   const SurfaceRequest& request) override;
    Result<Extent2D> configure_surface(Extent2D size) override;
    Result<FrameState> acquire_frame() override;

    Status begin_scene_pass(FrameState& frame, const SceneUniforms& uniforms) override;
    Status draw_gui(FrameState& frame, const GuiFrameOutput& gui) override;
    Status end_scene_pass(FrameState& frame) override;

    Status present(FrameState& frame) override;
    Status discard_frame(FrameState& frame) override;

    void gui_new_frame() override;
    void wait_idle() override;
    void shutdown() override;

    void on_device_lost(const char* reason) { device_lost_ = true; lost_reason_ = reason; }

private:
    wgpu::Instance instance_;
    wgpu::Adapter  adapter_;
    wgpu::Device   device_;
    wgpu::Queue    queue_;
    wgpu::Surface  surface_;

    wgpu::TextureFormat format_{wgpu::TextureFormat::Undefined};
    wgpu::PresentMode   present_mode_{wgpu::PresentMode::Fifo};
    Extent2D            size_{};

    wgpu::Texture     depth_texture_;
    wgpu::TextureView depth_view_;

    wgpu::Buffer          vertex_buffer_;
    wgpu::Buffer          index_buffer_;
    wgpu::Buffer          uniform_buffer_;
    wgpu::BindGroupLayout bind_group_layout_;
    wgpu::BindGroup       bind_group_;
    wgpu::RenderPipeline  pipeline_;

    // per frame
    wgpu::TextureView        backbuffer_;
    wgpu::CommandEncoder     encoder_;
    wgpu::RenderPassEncoder  pass_;
    wgpu::CommandBuffer      commands_;

    bool        vsync_{true};
    BackendCaps caps_{};
    float       clear_color_[4]{0.19f, 0.24f, 0.42f, 1.0f};
    std::string adapter_name_;

    bool        device_lost_{false};
    std::string lost_reason_;
    bool        imgui_initialized_{false};

    bool request_adapter();
    bool request_device();
    bool create_surface(const char* canvas_selector);
    bool pick_surface_format();
    void configure(Extent2D size);
    void create_depth_texture();
    bool create_scene_resources();
    bool init_imgui();
};
