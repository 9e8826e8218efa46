#pragma once
#include <string>
#include <GLES3/gl3.h>
#include <emscripten/html5.h>

#include "../i_render.hpp"

// WebGL2 backend. The default framebuffer of the canvas is the backbuffer;
// the browser composites it once the animation frame returns.
class WebGlRenderer : public IRenderBackend {
public:
    WebGlRenderer() = default;
    ~WebGlRenderer() override;

    WebGlRenderer(const WebGlRenderer&) = delete;
    WebGlRenderer& operator=(const WebGlRenderer&) = delete;

    BackendProfile profile() const override { return BackendProfile::WebGL; }

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

private:
    EMSCRIPTEN_WEBGL_CONTEXT_HANDLE context_{0};
    std::string canvas_selector_;
    Extent2D    size_{};
    BackendCaps caps_{};
    float       clear_color_[4]{0.19f, 0.24f, 0.42f, 1.0f};

    GLuint program_{0};
    GLuint vao_{0};
    GLuint vbo_{0};
    GLuint ibo_{0};
    GLuint ubo_{0};

    bool imgui_initialized_{false};

    bool create_context();
    bool create_program();
    void create_buffers();
    bool context_lost() const;
};
