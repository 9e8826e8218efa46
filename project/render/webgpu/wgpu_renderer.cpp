#include "wgpu_renderer.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <vector>

#include <imgui.h>
#include <imgui_impl_wgpu.h>

#include "../scene_math.hpp"
#include "../vertex.hpp"
#include "../../ui/gui_overlay.hpp"

static const char* kTriangleWGSL = R"(
struct Uniform {
    mvp: mat4x4<f32>,
};

@group(0) @binding(0)
var<uniform> ubo: Uniform;

struct VertexInput {
    @location(0) position: vec4<f32>,
    @location(1) color: vec4<f32>,
};

struct VertexOutput {
    @builtin(position) position: vec4<f32>,
    @location(0) color: vec4<f32>,
};

@vertex
fn vertex_main(vert: VertexInput) -> VertexOutput {
    var out: VertexOutput;
    out.color = vert.color;
    out.position = ubo.mvp * vert.position;
    return out;
}

@fragment
fn fragment_main(in: VertexOutput) -> @location(0) vec4<f32> {
    return in.color;
}
)";

static constexpr wgpu::TextureFormat kDepthFormat = wgpu::TextureFormat::Depth24Plus;

static std::string view_to_string(wgpu::StringView s)
{
    if (!s.data) return {};
    return s.length == WGPU_STRLEN ? std::string(s.data) : std::string(s.data, s.length);
}

static bool to_present_mode(wgpu::PresentMode m, PresentMode& out)
{
    switch (m) {
    case wgpu::PresentMode::Fifo:        out = PresentMode::Fifo;        return true;
    case wgpu::PresentMode::FifoRelaxed: out = PresentMode::FifoRelaxed; return true;
    case wgpu::PresentMode::Mailbox:     out = PresentMode::Mailbox;     return true;
    case wgpu::PresentMode::Immediate:   out = PresentMode::Immediate;   return true;
    default: return false;
    }
}

static wgpu::PresentMode to_wgpu_present_mode(PresentMode m)
{
    switch (m) {
    case PresentMode::Fifo:        return wgpu::PresentMode::Fifo;
    case PresentMode::FifoRelaxed: return wgpu::PresentMode::FifoRelaxed;
    case PresentMode::Mailbox:     return wgpu::PresentMode::Mailbox;
    case PresentMode::Immediate:   return wgpu::PresentMode::Immediate;
    }
    return wgpu::PresentMode::Fifo;
}

static const char* format_name(wgpu::TextureFormat f)
{
    switch (f) {
    case wgpu::TextureFormat::BGRA8Unorm:     return "BGRA8Unorm";
    case wgpu::TextureFormat::RGBA8Unorm:     return "RGBA8Unorm";
    case wgpu::TextureFormat::BGRA8UnormSrgb: return "BGRA8UnormSrgb";
    case wgpu::TextureFormat::RGBA8UnormSrgb: return "RGBA8UnormSrgb";
    default: return "other";
    }
}

WebGpuRenderer::~WebGpuRenderer()
{
    shutdown();
}

Result<SurfaceInfo> WebGpuRenderer::initialize(const NativeSurfaceHandle& target,
                                               const SurfaceRequest& request)
{
    vsync_ = request.vsync;
    caps_  = request.caps;
    std::copy(request.clear_color, request.clear_color + 4, clear_color_);

    auto fail = [this](ErrorKind kind, const std::string& msg) {
        shutdown();
        return Result<SurfaceInfo>::failure(kind, msg);
    };

    const auto kTimedWaitAny = wgpu::InstanceFeatureName::TimedWaitAny;
    wgpu::InstanceDescriptor id{};
    id.requiredFeatureCount = 1;
    id.requiredFeatures     = &kTimedWaitAny;
    instance_ = wgpu::CreateInstance(&id);
    if (!instance_) {
        return fail(ErrorKind::BackendUnavailable, "wgpu::CreateInstance failed (navigator.gpu missing?)");
    }

    const char* selector = target.canvas_selector ? target.canvas_selector : "#canvas";
    if (!create_surface(selector)) {
        return fail(ErrorKind::SurfaceConfigurationError,
                    std::string("cannot create a WebGPU surface for canvas ") + selector);
    }
    if (!request_adapter()) {
        return fail(ErrorKind::NoSuitableAdapter, "requestAdapter() returned no adapter");
    }
    if (!request_device()) {
        return fail(ErrorKind::NoSuitableAdapter, "requestDevice() failed");
    }
    if (!pick_surface_format()) {
        return fail(ErrorKind::SurfaceConfigurationError, "surface reports no formats for this adapter");
    }

    configure(target.size);

    if (!create_scene_resources()) {
        return fail(ErrorKind::BackendUnavailable, "pipeline creation failed");
    }
    if (!init_imgui()) {
        return fail(ErrorKind::BackendUnavailable, "imgui_impl_wgpu initialization failed");
    }

    SurfaceInfo info;
    info.size    = size_;
    info.format  = format_name(format_);
    info.adapter = adapter_name_;
    to_present_mode(present_mode_, info.present_mode);
    return Result<SurfaceInfo>::success(info);
}

bool WebGpuRenderer::create_surface(const char* canvas_selector)
{
    wgpu::EmscriptenSurfaceSourceCanvasHTMLSelector canvas{};
    canvas.selector = canvas_selector;

    wgpu::SurfaceDescriptor sd{};
    sd.nextInChain = &canvas;
    surface_ = instance_.CreateSurface(&sd);
    return static_cast<bool>(surface_);
}

bool WebGpuRenderer::request_adapter()
{
    wgpu::RequestAdapterOptions opts{};
    opts.compatibleSurface = surface_;
    opts.powerPreference   = wgpu::PowerPreference::HighPerformance;

    wgpu::Future f = instance_.RequestAdapter(&opts, wgpu::CallbackMode::WaitAnyOnly,
        [](wgpu::RequestAdapterStatus s, wgpu::Adapter a, wgpu::StringView m, WebGpuRenderer* self) {
            if (s != wgpu::RequestAdapterStatus::Success) {
                std::cerr << "[WGPU] RequestAdapter failed: " << view_to_string(m) << "\n";
                return;
            }
            self->adapter_ = std::move(a);
        }, this);
    if (instance_.WaitAny(f, UINT64_MAX) != wgpu::WaitStatus::Success || !adapter_) return false;

    wgpu::AdapterInfo info{};
    if (adapter_.GetInfo(&info) != wgpu::Status::Success) {
        adapter_name_ = "unknown adapter";
        return true;
    }
    adapter_name_ = view_to_string(info.description);
    if (adapter_name_.empty()) adapter_name_ = view_to_string(info.vendor);
    return true;
}

bool WebGpuRenderer::request_device()
{
    wgpu::DeviceDescriptor dd{};
    dd.SetUncapturedErrorCallback([](const wgpu::Device&, wgpu::ErrorType t, wgpu::StringView msg) {
        const char* errorType = "Unknown";
        switch (t) {
        case wgpu::ErrorType::Validation:  errorType = "Validation"; break;
        case wgpu::ErrorType::OutOfMemory: errorType = "OutOfMemory"; break;
        case wgpu::ErrorType::Internal:    errorType = "Internal"; break;
        default: break;
        }
        std::cerr << "[WGPU] Device error [" << errorType << "]: " << view_to_string(msg) << "\n";
    });
    dd.SetDeviceLostCallback(wgpu::CallbackMode::AllowSpontaneous,
        [](const wgpu::Device&, wgpu::DeviceLostReason reason, wgpu::StringView msg, WebGpuRenderer* self) {
            if (reason == wgpu::DeviceLostReason::Destroyed) return;
            std::cerr << "[WGPU] Device lost: " << view_to_string(msg) << "\n";
            self->on_device_lost("device lost");
        }, this);

    wgpu::Future f = adapter_.RequestDevice(&dd, wgpu::CallbackMode::WaitAnyOnly,
        [](wgpu::RequestDeviceStatus s, wgpu::Device d, wgpu::StringView m, WebGpuRenderer* self) {
            if (s != wgpu::RequestDeviceStatus::Success) {
                std::cerr << "[WGPU] RequestDevice failed: " << view_to_string(m) << "\n";
                return;
            }
            self->device_ = std::move(d);
        }, this);
    if (instance_.WaitAny(f, UINT64_MAX) != wgpu::WaitStatus::Success || !device_) return false;

    queue_ = device_.GetQueue();
    return true;
}

bool WebGpuRenderer::pick_surface_format()
{
    wgpu::SurfaceCapabilities caps;
    if (surface_.GetCapabilities(adapter_, &caps) != wgpu::Status::Success) return false;
    if (caps.formatCount == 0) return false;

    // ImGui blends in gamma space: prefer a non-sRGB target
    const wgpu::TextureFormat wanted[] = {
        caps_.prefer_srgb_surface ? wgpu::TextureFormat::BGRA8UnormSrgb : wgpu::TextureFormat::BGRA8Unorm,
        caps_.prefer_srgb_surface ? wgpu::TextureFormat::RGBA8UnormSrgb : wgpu::TextureFormat::RGBA8Unorm,
    };
    format_ = caps.formats[0];
    bool found = false;
    for (auto w : wanted) {
        for (size_t i = 0; i < caps.formatCount && !found; ++i) {
            if (caps.formats[i] == w) { format_ = w; found = true; }
        }
        if (found) break;
    }

    std::vector<PresentMode> supported;
    for (size_t i = 0; i < caps.presentModeCount; ++i) {
        PresentMode pm;
        if (to_present_mode(caps.presentModes[i], pm)) supported.push_back(pm);
    }
    present_mode_ = to_wgpu_present_mode(choose_present_mode(vsync_, supported));
    return true;
}

void WebGpuRenderer::configure(Extent2D size)
{
    size_ = fit_to_max_dimension(size, caps_.max_texture_dimension_2d);
    if (size_ != size) {
        std::cerr << "[WGPU] drawable " << size.width << "x" << size.height << " clamped to "
                  << size_.width << "x" << size_.height << "\n";
    }

    wgpu::SurfaceConfiguration cfg{};
    cfg.device      = device_;
    cfg.format      = format_;
    cfg.usage       = wgpu::TextureUsage::RenderAttachment;
    cfg.width       = size_.width;
    cfg.height      = size_.height;
    cfg.presentMode = present_mode_;
    cfg.alphaMode   = wgpu::CompositeAlphaMode::Opaque;
    surface_.Configure(&cfg);

    create_depth_texture();
}

void WebGpuRenderer::create_depth_texture()
{
    if (depth_texture_) depth_texture_.Destroy();

    wgpu::TextureDescriptor td{};
    td.size   = { size_.width, size_.height, 1 };
    td.format = kDepthFormat;
    td.usage  = wgpu::TextureUsage::RenderAttachment;
    depth_texture_ = device_.CreateTexture(&td);
    depth_view_    = depth_texture_.CreateView();
}

bool WebGpuRenderer::create_scene_resources()
{
    wgpu::BufferDescriptor vb{};
    vb.size  = sizeof(TRIANGLE_VERTICES);
    vb.usage = wgpu::BufferUsage::Vertex | wgpu::BufferUsage::CopyDst;
    vertex_buffer_ = device_.CreateBuffer(&vb);
    queue_.WriteBuffer(vertex_buffer_, 0, TRIANGLE_VERTICES, sizeof(TRIANGLE_VERTICES));

    wgpu::BufferDescriptor ib{};
    ib.size  = sizeof(TRIANGLE_INDICES);
    ib.usage = wgpu::BufferUsage::Index | wgpu::BufferUsage::CopyDst;
    index_buffer_ = device_.CreateBuffer(&ib);
    queue_.WriteBuffer(index_buffer_, 0, TRIANGLE_INDICES, sizeof(TRIANGLE_INDICES));

    wgpu::BufferDescriptor ub{};
    ub.size  = sizeof(SceneUbo);
    ub.usage = wgpu::BufferUsage::Uniform | wgpu::BufferUsage::CopyDst;
    uniform_buffer_ = device_.CreateBuffer(&ub);

    wgpu::BindGroupLayoutEntry e0{};
    e0.binding     = 0;
    e0.visibility  = wgpu::ShaderStage::Vertex;
    e0.buffer.type = wgpu::BufferBindingType::Uniform;
    e0.buffer.minBindingSize = sizeof(SceneUbo);
    wgpu::BindGroupLayoutDescriptor bgld{};
    bgld.entryCount = 1;
    bgld.entries    = &e0;
    bind_group_layout_ = device_.CreateBindGroupLayout(&bgld);

    wgpu::BindGroupEntry be{};
    be.binding = 0;
    be.buffer  = uniform_buffer_;
    be.size    = sizeof(SceneUbo);
    wgpu::BindGroupDescriptor bgd{};
    bgd.layout     = bind_group_layout_;
    bgd.entryCount = 1;
    bgd.entries    = &be;
    bind_group_ = device_.CreateBindGroup(&bgd);

    wgpu::ShaderSourceWGSL src{};
    src.code = kTriangleWGSL;
    wgpu::ShaderModuleDescriptor smd{};
    smd.nextInChain = &src;
    wgpu::ShaderModule shader = device_.CreateShaderModule(&smd);

    wgpu::PipelineLayoutDescriptor pld{};
    pld.bindGroupLayoutCount = 1;
    pld.bindGroupLayouts     = &bind_group_layout_;
    wgpu::PipelineLayout layout = device_.CreatePipelineLayout(&pld);

    wgpu::VertexAttribute va[2]{};
    va[0].format = wgpu::VertexFormat::Float32x4; va[0].offset = VERTEX_POSITION_OFFSET; va[0].shaderLocation = 0;
    va[1].format = wgpu::VertexFormat::Float32x4; va[1].offset = VERTEX_COLOR_OFFSET;    va[1].shaderLocation = 1;

    wgpu::VertexBufferLayout vbl{};
    vbl.arrayStride    = sizeof(Vertex);
    vbl.stepMode       = wgpu::VertexStepMode::Vertex;
    vbl.attributeCount = 2;
    vbl.attributes     = va;

    wgpu::BlendState blend{};
    blend.color = { wgpu::BlendOperation::Add, wgpu::BlendFactor::SrcAlpha, wgpu::BlendFactor::OneMinusSrcAlpha };
    blend.alpha = { wgpu::BlendOperation::Add, wgpu::BlendFactor::One, wgpu::BlendFactor::OneMinusSrcAlpha };

    wgpu::ColorTargetState color{};
    color.format    = format_;
    color.blend     = &blend;
    color.writeMask = wgpu::ColorWriteMask::All;

    wgpu::FragmentState fs{};
    fs.module      = shader;
    fs.entryPoint  = "fragment_main";
    fs.targetCount = 1;
    fs.targets     = &color;

    wgpu::DepthStencilState ds{};
    ds.format            = kDepthFormat;
    ds.depthWriteEnabled = wgpu::OptionalBool::True;
    ds.depthCompare      = wgpu::CompareFunction::Less;

    wgpu::RenderPipelineDescriptor rpd{};
    rpd.layout             = layout;
    rpd.vertex.module      = shader;
    rpd.vertex.entryPoint  = "vertex_main";
    rpd.vertex.bufferCount = 1;
    rpd.vertex.buffers     = &vbl;
    rpd.fragment           = &fs;
    rpd.depthStencil       = &ds;
    rpd.primitive.topology  = wgpu::PrimitiveTopology::TriangleList;
    rpd.primitive.frontFace = wgpu::FrontFace::CW;
    rpd.primitive.cullMode  = wgpu::CullMode::None;
    pipeline_ = device_.CreateRenderPipeline(&rpd);

    return static_cast<bool>(pipeline_);
}

bool WebGpuRenderer::init_imgui()
{
    ImGui_ImplWGPU_InitInfo init_info;
    init_info.Device             = device_.Get();
    init_info.NumFramesInFlight  = 3;
    init_info.RenderTargetFormat = static_cast<WGPUTextureFormat>(format_);
    init_info.DepthStencilFormat = static_cast<WGPUTextureFormat>(kDepthFormat);
    if (!ImGui_ImplWGPU_Init(&init_info)) return false;
    imgui_initialized_ = true;
    return true;
}

Result<Extent2D> WebGpuRenderer::configure_surface(Extent2D size)
{
    if (!device_) {
        return Result<Extent2D>::failure(ErrorKind::SurfaceConfigurationError, "device not created");
    }
    if (device_lost_) {
        return Result<Extent2D>::failure(ErrorKind::SurfaceLost, lost_reason_);
    }
    configure(size);
    return Result<Extent2D>::success(size_);
}

Result<FrameState> WebGpuRenderer::acquire_frame()
{
    if (device_lost_) {
        return Result<FrameState>::failure(ErrorKind::ValidationFailed, lost_reason_);
    }

    wgpu::SurfaceTexture st{};
    surface_.GetCurrentTexture(&st);

    FrameState frame;
    switch (st.status) {
    case wgpu::SurfaceGetCurrentTextureStatus::SuccessOptimal:
        break;
    case wgpu::SurfaceGetCurrentTextureStatus::SuccessSuboptimal:
        frame.surface_outdated = true;
        break;
    case wgpu::SurfaceGetCurrentTextureStatus::Timeout:
        return Result<FrameState>::failure(ErrorKind::Timeout, "GetCurrentTexture timed out");
    case wgpu::SurfaceGetCurrentTextureStatus::Outdated:
    case wgpu::SurfaceGetCurrentTextureStatus::Lost:
        return Result<FrameState>::failure(ErrorKind::SurfaceLost, "surface texture outdated or lost");
    default:
        return Result<FrameState>::failure(ErrorKind::ValidationFailed, "GetCurrentTexture failed");
    }

    backbuffer_ = st.texture.CreateView();
    frame.size  = size_;
    return Result<FrameState>::success(frame);
}

Status WebGpuRenderer::begin_scene_pass(FrameState& frame, const SceneUniforms& uniforms)
{
    if (!backbuffer_) {
        return Status::failure(ErrorKind::ValidationFailed, "no surface texture acquired");
    }

    SceneUbo ubo;
    ubo.mvp = scene_mvp(BackendProfile::WebGPU, uniforms);
    queue_.WriteBuffer(uniform_buffer_, 0, &ubo, sizeof(ubo));

    wgpu::RenderPassColorAttachment ca{};
    ca.view       = backbuffer_;
    ca.loadOp     = wgpu::LoadOp::Clear;
    ca.storeOp    = wgpu::StoreOp::Store;
    ca.clearValue = { clear_color_[0], clear_color_[1], clear_color_[2], clear_color_[3] };

    wgpu::RenderPassDepthStencilAttachment da{};
    da.view            = depth_view_;
    da.depthLoadOp     = wgpu::LoadOp::Clear;
    da.depthStoreOp    = wgpu::StoreOp::Store;
    da.depthClearValue = 1.0f;

    wgpu::RenderPassDescriptor rp{};
    rp.colorAttachmentCount   = 1;
    rp.colorAttachments       = &ca;
    rp.depthStencilAttachment = &da;

    encoder_ = device_.CreateCommandEncoder();
    pass_    = encoder_.BeginRenderPass(&rp);
    frame.pass_open = true;

    pass_.SetPipeline(pipeline_);
    pass_.SetBindGroup(0, bind_group_);
    pass_.SetVertexBuffer(0, vertex_buffer_, 0, wgpu::kWholeSize);
    pass_.SetIndexBuffer(index_buffer_, wgpu::IndexFormat::Uint32, 0, wgpu::kWholeSize);
    pass_.DrawIndexed(TRIANGLE_INDEX_COUNT, 1, 0, 0, 0);

    return Status::success();
}

Status WebGpuRenderer::draw_gui(FrameState& frame, const GuiFrameOutput& gui)
{
    if (!frame.pass_open) {
        return Status::failure(ErrorKind::ValidationFailed, "GUI drawn outside the scene pass");
    }
    if (gui.draw_data) {
        ImGui_ImplWGPU_RenderDrawData(gui.draw_data, pass_.Get());
    }
    return Status::success();
}

Status WebGpuRenderer::end_scene_pass(FrameState& frame)
{
    if (frame.pass_open) {
        pass_.End();
        pass_ = nullptr;
        frame.pass_open = false;
    }
    if (encoder_) {
        commands_ = encoder_.Finish();
        encoder_  = nullptr;
    }
    return Status::success();
}

Status WebGpuRenderer::present(FrameState&)
{
    if (!commands_) {
        return Status::failure(ErrorKind::ValidationFailed, "nothing recorded for this frame");
    }
    queue_.Submit(1, &commands_);
    commands_   = nullptr;
    backbuffer_ = nullptr;
    return Status::success();
}

Status WebGpuRenderer::discard_frame(FrameState& frame)
{
    // an unsubmitted surface texture is simply not shown
    Status st = end_scene_pass(frame);
    commands_   = nullptr;
    backbuffer_ = nullptr;
    return st;
}

void WebGpuRenderer::gui_new_frame()
{
    if (imgui_initialized_) ImGui_ImplWGPU_NewFrame();
}

void WebGpuRenderer::wait_idle()
{
    // queue work completes before the next animation frame on the web
}

void WebGpuRenderer::shutdown()
{
    if (imgui_initialized_) {
        ImGui_ImplWGPU_Shutdown();
        imgui_initialized_ = false;
    }

    pass_     = nullptr;
    encoder_  = nullptr;
    commands_ = nullptr;
    backbuffer_ = nullptr;

    pipeline_          = nullptr;
    bind_group_        = nullptr;
    bind_group_layout_ = nullptr;
    uniform_buffer_    = nullptr;
    index_buffer_      = nullptr;
    vertex_buffer_     = nullptr;
    depth_view_        = nullptr;
    if (depth_texture_) {
        depth_texture_.Destroy();
        depth_texture_ = nullptr;
    }

    if (surface_ && device_) surface_.Unconfigure();
    queue_   = nullptr;
    device_  = nullptr;
    adapter_ = nullptr;
    surface_ = nullptr;
    instance_ = nullptr;
}
