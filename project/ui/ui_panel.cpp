// ui/ui_panel.cpp
#include "ui_panel.hpp"

#include <imgui.h>

#include <iostream>

namespace ui
{

static ImGuiKey to_imgui_key(Key key)
{
    switch (key) {
    case Key::Escape:     return ImGuiKey_Escape;
    case Key::Tab:        return ImGuiKey_Tab;
    case Key::Enter:      return ImGuiKey_Enter;
    case Key::Backspace:  return ImGuiKey_Backspace;
    case Key::Delete:     return ImGuiKey_Delete;
    case Key::Space:      return ImGuiKey_Space;
    case Key::Left:       return ImGuiKey_LeftArrow;
    case Key::Right:      return ImGuiKey_RightArrow;
    case Key::Up:         return ImGuiKey_UpArrow;
    case Key::Down:       return ImGuiKey_DownArrow;
    case Key::Home:       return ImGuiKey_Home;
    case Key::End:        return ImGuiKey_End;
    case Key::PageUp:     return ImGuiKey_PageUp;
    case Key::PageDown:   return ImGuiKey_PageDown;
    case Key::A:          return ImGuiKey_A;
    case Key::C:          return ImGuiKey_C;
    case Key::V:          return ImGuiKey_V;
    case Key::X:          return ImGuiKey_X;
    case Key::Y:          return ImGuiKey_Y;
    case Key::Z:          return ImGuiKey_Z;
    case Key::LeftShift:  return ImGuiKey_LeftShift;
    case Key::RightShift: return ImGuiKey_RightShift;
    case Key::LeftCtrl:   return ImGuiKey_LeftCtrl;
    case Key::RightCtrl:  return ImGuiKey_RightCtrl;
    case Key::LeftAlt:    return ImGuiKey_LeftAlt;
    case Key::RightAlt:   return ImGuiKey_RightAlt;
    case Key::Unknown:    break;
    }
    return ImGuiKey_None;
}

static int to_imgui_button(MouseButton b)
{
    switch (b) {
    case MouseButton::Left:   return ImGuiMouseButton_Left;
    case MouseButton::Right:  return ImGuiMouseButton_Right;
    case MouseButton::Middle: return ImGuiMouseButton_Middle;
    }
    return ImGuiMouseButton_Left;
}

const char* window_title(BackendProfile profile)
{
    switch (profile) {
    case BackendProfile::Native: return "Vulkan";
    case BackendProfile::WebGPU: return "WebGPU";
    case BackendProfile::WebGL:  return "WebGL";
    }
    return "Unknown";
}

ImGuiOverlay::ImGuiOverlay()
{
    IMGUI_CHECKVERSION();
    context_ = ImGui::CreateContext();
    ImGui::SetCurrentContext(context_);
    ImGui::StyleColorsDark();

    ImGuiIO& io = ImGui::GetIO();
    // no keyboard navigation: keys are only captured while a widget is active
    io.IniFilename = nullptr;
}

ImGuiOverlay::~ImGuiOverlay()
{
    if (context_) {
        ImGui::DestroyContext(context_);
        context_ = nullptr;
    }
}

bool ImGuiOverlay::handle_input(const InputEvent& ev)
{
    ImGui::SetCurrentContext(context_);
    ImGuiIO& io = ImGui::GetIO();

    switch (ev.type) {
    case InputEvent::Type::PointerMove:
        io.AddMousePosEvent(ev.x, ev.y);
        return io.WantCaptureMouse;

    case InputEvent::Type::PointerButton:
        io.AddMousePosEvent(ev.x, ev.y);
        io.AddMouseButtonEvent(to_imgui_button(ev.button), ev.pressed);
        return io.WantCaptureMouse;

    case InputEvent::Type::Scroll:
        io.AddMouseWheelEvent(ev.scroll_x, ev.scroll_y);
        return io.WantCaptureMouse;

    case InputEvent::Type::KeyDown:
    case InputEvent::Type::KeyUp: {
        bool down = ev.type == InputEvent::Type::KeyDown;
        io.AddKeyEvent(ImGuiMod_Ctrl,  ev.mods.ctrl);
        io.AddKeyEvent(ImGuiMod_Shift, ev.mods.shift);
        io.AddKeyEvent(ImGuiMod_Alt,   ev.mods.alt);
        io.AddKeyEvent(ImGuiMod_Super, ev.mods.super);
        ImGuiKey key = to_imgui_key(ev.key);
        if (key != ImGuiKey_None) io.AddKeyEvent(key, down);
        return io.WantCaptureKeyboard;
    }

    case InputEvent::Type::Text:
        io.AddInputCharacter(ev.codepoint);
        return io.WantTextInput;
    }
    return false;
}

GuiFrameOutput ImGuiOverlay::build_frame(const GuiFrameContext& ctx)
{
    ImGui::SetCurrentContext(context_);
    ImGuiIO& io = ImGui::GetIO();

    // ctx.size is in framebuffer pixels, ImGui lays out in window units
    float ppp = ctx.pixels_per_point > 0.0f ? ctx.pixels_per_point : 1.0f;
    io.DisplaySize             = ImVec2(ctx.size.width / ppp, ctx.size.height / ppp);
    io.DisplayFramebufferScale = ImVec2(ppp, ppp);
    io.DeltaTime = ctx.delta_seconds > 0.0 ? static_cast<float>(ctx.delta_seconds) : 1.0f / 60.0f;

    ImGui::NewFrame();
    draw_panel(state_, ctx);
    ImGui::Render();

    GuiFrameOutput out;
    out.draw_data = ImGui::GetDrawData();
    if (out.draw_data) {
        out.command_lists = static_cast<u32>(out.draw_data->CmdListsCount);
        out.vertex_count  = static_cast<u32>(out.draw_data->TotalVtxCount);
        out.index_count   = static_cast<u32>(out.draw_data->TotalIdxCount);
    }
    return out;
}

static void panel_button(const char* label, const char* panel, int& counter)
{
    if (ImGui::Button(label)) {
        ++counter;
        std::cout << "[UI] " << panel << " button clicked\n";
    }
}

void draw_panel(UIState& ui_state, const GuiFrameContext& ctx)
{
    ImGui::Begin(window_title(ctx.profile));
    ImGui::Checkbox("Show Panels", &ui_state.show_panels);
    ImGui::Text("frames %llu  skipped %llu  reconfigured %llu",
                static_cast<unsigned long long>(ctx.stats.frames_presented),
                static_cast<unsigned long long>(ctx.stats.frames_skipped),
                static_cast<unsigned long long>(ctx.stats.reconfigurations));
    ImGui::Text("angle %.3f rad  %.1f fps", ctx.stats.angle_radians, ctx.stats.fps);
    ImGui::End();

    if (!ui_state.show_panels) return;

    const ImGuiViewport* vp = ImGui::GetMainViewport();
    const ImVec2 pos  = vp->WorkPos;
    const ImVec2 size = vp->WorkSize;
    const float  side_w   = size.x * 0.2f;
    const float  bottom_h = size.y * 0.25f;

    const ImGuiWindowFlags fixed = ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize
                                 | ImGuiWindowFlags_NoCollapse;

    // top menu strip
    if (ImGui::BeginMainMenuBar()) {
        if (ImGui::BeginMenu("File")) {
            if (ImGui::MenuItem("New"))  { ++ui_state.menu_clicks; std::cout << "[UI] File/New clicked\n"; }
            if (ImGui::MenuItem("Open")) { ++ui_state.menu_clicks; std::cout << "[UI] File/Open clicked\n"; }
            ImGui::EndMenu();
        }
        if (ImGui::BeginMenu("Edit")) {
            if (ImGui::MenuItem("Undo")) { ++ui_state.menu_clicks; std::cout << "[UI] Edit/Undo clicked\n"; }
            if (ImGui::MenuItem("Redo")) { ++ui_state.menu_clicks; std::cout << "[UI] Edit/Redo clicked\n"; }
            ImGui::EndMenu();
        }
        ImGui::EndMainMenuBar();
    }

    const float menu_h = ImGui::GetFrameHeight();
    const float top    = pos.y + menu_h;
    const float body_h = size.y - menu_h - bottom_h;

    ImGui::SetNextWindowPos(ImVec2(pos.x, top));
    ImGui::SetNextWindowSize(ImVec2(side_w, body_h));
    ImGui::Begin("Scene Explorer", nullptr, fixed);
    ImGui::TextUnformatted("Triangle");
    panel_button("Select", "Scene Explorer", ui_state.scene_clicks);
    ImGui::End();

    ImGui::SetNextWindowPos(ImVec2(pos.x + size.x - side_w, top));
    ImGui::SetNextWindowSize(ImVec2(side_w, body_h));
    ImGui::Begin("Inspector", nullptr, fixed);
    ImGui::Text("Rotation: %.2f rad", ctx.stats.angle_radians);
    panel_button("Apply", "Inspector", ui_state.inspector_clicks);
    ImGui::End();

    ImGui::SetNextWindowPos(ImVec2(pos.x, top + body_h));
    ImGui::SetNextWindowSize(ImVec2(size.x, bottom_h));
    ImGui::Begin("Assets", nullptr, fixed);
    panel_button("Import", "Assets", ui_state.assets_clicks);
    ImGui::End();
}

} // namespace ui
