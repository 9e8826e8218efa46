#include "gl_renderer.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

#include <imgui.h>
#include <imgui_impl_opengl3.h>

#include "../scene_math.hpp"
#include "../vertex.hpp"
#include "../../ui/gui_overlay.hpp"

static const char* kVertexSrc = R"(#version 300 es
layout(std140) uniform SceneUbo {
    mat4 mvp;
};
layout(location = 0) in vec4 in_position;
layout(location = 1) in vec4 in_color;
out vec4 v_color;
void main() {
    v_color = in_color;
    gl_Position = mvp * in_position;
}
)";

static const char* kFragmentSrc = R"(#version 300 es
precision mediump float;
in vec4 v_color;
out vec4 out_color;
void main() {
    out_color = v_color;
}
)";

static GLuint compile_shader(GLenum type, const char* src)
{
    GLuint s = glCreateShader(type);
    glShaderSource(s, 1, &src, nullptr);
    glCompileShader(s);

    GLint ok = 0;
    glGetShaderiv(s, GL_COMPILE_STATUS, &ok);
    if (!ok) {
        GLint len = 0;
        glGetShaderiv(s, GL_INFO_LOG_LENGTH, &len);
        std::vector<char> log(static_cast<size_t>(std::max(len, 1)));
        glGetShaderInfoLog(s, len, nullptr, log.data());
        std::cerr << "[GL] shader compile error:\n" << log.data() << "\n";
        glDeleteShader(s);
        return 0;
    }
    return s;
}

WebGlRenderer::~WebGlRenderer()
{
    shutdown();
}

Result<SurfaceInfo> WebGlRenderer::initialize(const NativeSurfaceHandle& target,
                                              const SurfaceRequest& request)
{
    canvas_selector_ = target.canvas_selector ? target.canvas_selector : "#canvas";
    caps_ = request.caps;
    std::copy(request.clear_color, request.clear_color + 4, clear_color_);

    if (!create_context()) {
        return Result<SurfaceInfo>::failure(ErrorKind::BackendUnavailable,
                                            "WebGL2 context unavailable on " + canvas_selector_);
    }
    if (!create_program()) {
        shutdown();
        return Result<SurfaceInfo>::failure(ErrorKind::BackendUnavailable, "shader program link failed");
    }
    create_buffers();

    if (!ImGui_ImplOpenGL3_Init("#version 300 es")) {
        shutdown();
        return Result<SurfaceInfo>::failure(ErrorKind::BackendUnavailable, "imgui_impl_opengl3 initialization failed");
    }
    imgui_initialized_ = true;

    Result<Extent2D> applied = configure_surface(target.size);
    if (!applied.ok) {
        shutdown();
        return Result<SurfaceInfo>::failure(applied.err);
    }

    SurfaceInfo info;
    info.size         = size_;
    info.present_mode = PresentMode::Fifo;
    info.format       = "RGBA8";
    const GLubyte* renderer = glGetString(GL_RENDERER);
    info.adapter = renderer ? reinterpret_cast<const char*>(renderer) : "WebGL2";
    return Result<SurfaceInfo>::success(info);
}

bool WebGlRenderer::create_context()
{
    EmscriptenWebGLContextAttributes attrs;
    emscripten_webgl_init_context_attributes(&attrs);
    attrs.majorVersion = 2;
    attrs.minorVersion = 0;
    attrs.alpha   = false;
    attrs.depth   = true;
    attrs.stencil = false;
    attrs.antialias = true;

    context_ = emscripten_webgl_create_context(canvas_selector_.c_str(), &attrs);
    if (context_ <= 0) {
        std::cerr << "[GL] emscripten_webgl_create_context failed (" << context_ << ")\n";
        context_ = 0;
        return false;
    }
    if (emscripten_webgl_make_context_current(context_) != EMSCRIPTEN_RESULT_SUCCESS) {
        std::cerr << "[GL] cannot make the WebGL2 context current\n";
        emscripten_webgl_destroy_context(context_);
        context_ = 0;
        return false;
    }
    return true;
}

bool WebGlRenderer::create_program()
{
    GLuint vs = compile_shader(GL_VERTEX_SHADER, kVertexSrc);
    if (!vs) return false;
    GLuint fs = compile_shader(GL_FRAGMENT_SHADER, kFragmentSrc);
    if (!fs) { glDeleteShader(vs); return false; }

    program_ = glCreateProgram();
    glAttachShader(program_, vs);
    glAttachShader(program_, fs);
    glLinkProgram(program_);
    glDeleteShader(vs);
    glDeleteShader(fs);

    GLint ok = 0;
    glGetProgramiv(program_, GL_LINK_STATUS, &ok);
    if (!ok) {
        GLint len = 0;
        glGetProgramiv(program_, GL_INFO_LOG_LENGTH, &len);
        std::vector<char> log(static_cast<size_t>(std::max(len, 1)));
        glGetProgramInfoLog(program_, len, nullptr, log.data());
        std::cerr << "[GL] program link error:\n" << log.data() << "\n";
        glDeleteProgram(program_);
        program_ = 0;
        return false;
    }

    GLuint block = glGetUniformBlockIndex(program_, "SceneUbo");
    if (block == GL_INVALID_INDEX) {
        std::cerr << "[GL] SceneUbo block missing from program\n";
        return false;
    }
    glUniformBlockBinding(program_, block, 0);
    return true;
}

void WebGlRenderer::create_buffers()
{
    glGenVertexArrays(1, &vao_);
    glBindVertexArray(vao_);

    glGenBuffers(1, &vbo_);
    glBindBuffer(GL_ARRAY_BUFFER, vbo_);
    glBufferData(GL_ARRAY_BUFFER, sizeof(TRIANGLE_VERTICES), TRIANGLE_VERTICES, GL_STATIC_DRAW);

    glGenBuffers(1, &ibo_);
    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, ibo_);
    glBufferData(GL_ELEMENT_ARRAY_BUFFER, sizeof(TRIANGLE_INDICES), TRIANGLE_INDICES, GL_STATIC_DRAW);

    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 4, GL_FLOAT, GL_FALSE, sizeof(Vertex),
                          reinterpret_cast<const void*>(VERTEX_POSITION_OFFSET));
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(1, 4, GL_FLOAT, GL_FALSE, sizeof(Vertex),
                          reinterpret_cast<const void*>(VERTEX_COLOR_OFFSET));
    glBindVertexArray(0);

    glGenBuffers(1, &ubo_);
    glBindBuffer(GL_UNIFORM_BUFFER, ubo_);
    glBufferData(GL_UNIFORM_BUFFER, sizeof(SceneUbo), nullptr, GL_DYNAMIC_DRAW);
    glBindBuffer(GL_UNIFORM_BUFFER, 0);
}

bool WebGlRenderer::context_lost() const
{
    return context_ == 0 || emscripten_is_webgl_context_lost(context_);
}

Result<Extent2D> WebGlRenderer::configure_surface(Extent2D size)
{
    if (context_lost()) {
        return Result<Extent2D>::failure(ErrorKind::SurfaceLost, "WebGL context lost");
    }
    size_ = fit_to_max_dimension(size, caps_.max_texture_dimension_2d);
    if (size_ != size) {
        std::cerr << "[GL] drawable " << size.width << "x" << size.height << " clamped to "
                  << size_.width << "x" << size_.height << "\n";
    }

    // the drawing buffer follows the canvas backing store size
    emscripten_set_canvas_element_size(canvas_selector_.c_str(),
                                       static_cast<int>(size_.width),
                                       static_cast<int>(size_.height));
    glViewport(0, 0, static_cast<GLsizei>(size_.width), static_cast<GLsizei>(size_.height));
    return Result<Extent2D>::success(size_);
}

Result<FrameState> WebGlRenderer::acquire_frame()
{
    if (context_lost()) {
        return Result<FrameState>::failure(ErrorKind::SurfaceLost, "WebGL context lost");
    }
    emscripten_webgl_make_context_current(context_);

    FrameState frame;
    frame.size = size_;
    return Result<FrameState>::success(frame);
}

Status WebGlRenderer::begin_scene_pass(FrameState& frame, const SceneUniforms& uniforms)
{
    SceneUbo ubo;
    ubo.mvp = scene_mvp(BackendProfile::WebGL, uniforms);
    glBindBuffer(GL_UNIFORM_BUFFER, ubo_);
    glBufferSubData(GL_UNIFORM_BUFFER, 0, sizeof(ubo), &ubo);
    glBindBuffer(GL_UNIFORM_BUFFER, 0);

    glViewport(0, 0, static_cast<GLsizei>(size_.width), static_cast<GLsizei>(size_.height));
    glEnable(GL_DEPTH_TEST);
    glDepthFunc(GL_LESS);
    glDisable(GL_CULL_FACE);
    glClearColor(clear_color_[0], clear_color_[1], clear_color_[2], clear_color_[3]);
    glClearDepthf(1.0f);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
    frame.pass_open = true;

    glUseProgram(program_);
    glBindBufferBase(GL_UNIFORM_BUFFER, 0, ubo_);
    glBindVertexArray(vao_);
    glDrawElements(GL_TRIANGLES, TRIANGLE_INDEX_COUNT, GL_UNSIGNED_INT, nullptr);
    glBindVertexArray(0);

    GLenum err = glGetError();
    if (err != GL_NO_ERROR) {
        return Status::failure(ErrorKind::ValidationFailed,
                               "GL error " + std::to_string(static_cast<unsigned>(err)) + " in scene pass");
    }
    return Status::success();
}

Status WebGlRenderer::draw_gui(FrameState& frame, const GuiFrameOutput& gui)
{
    if (!frame.pass_open) {
        return Status::failure(ErrorKind::ValidationFailed, "GUI drawn outside the scene pass");
    }
    if (gui.draw_data) {
        ImGui_ImplOpenGL3_RenderDrawData(gui.draw_data);
    }
    return Status::success();
}

Status WebGlRenderer::end_scene_pass(FrameState& frame)
{
    frame.pass_open = false;
    return Status::success();
}

Status WebGlRenderer::present(FrameState&)
{
    if (context_lost()) {
        return Status::failure(ErrorKind::SurfaceLost, "WebGL context lost during the frame");
    }
    glFlush();
    return Status::success();
}

Status WebGlRenderer::discard_frame(FrameState& frame)
{
    // the canvas is composited regardless; leave only the clear colour in it
    frame.pass_open = false;
    if (context_lost()) {
        return Status::failure(ErrorKind::SurfaceLost, "WebGL context lost");
    }
    glClearColor(clear_color_[0], clear_color_[1], clear_color_[2], clear_color_[3]);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
    return Status::success();
}

void WebGlRenderer::gui_new_frame()
{
    if (imgui_initialized_) ImGui_ImplOpenGL3_NewFrame();
}

void WebGlRenderer::wait_idle()
{
    if (!context_lost()) glFinish();
}

void WebGlRenderer::shutdown()
{
    if (context_ == 0) return;
    emscripten_webgl_make_context_current(context_);

    if (imgui_initialized_) {
        ImGui_ImplOpenGL3_Shutdown();
        imgui_initialized_ = false;
    }
    if (ubo_) { glDeleteBuffers(1, &ubo_); ubo_ = 0; }
    if (ibo_) { glDeleteBuffers(1, &ibo_); ibo_ = 0; }
    if (vbo_) { glDeleteBuffers(1, &vbo_); vbo_ = 0; }
    if (vao_) { glDeleteVertexArrays(1, &vao_); vao_ = 0; }
    if (program_) { glDeleteProgram(program_); program_ = 0; }

    emscripten_webgl_destroy_context(context_);
    context_ = 0;
}
