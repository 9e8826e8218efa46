#pragma once
#include "gui_overlay.hpp"
#include "ui_state.hpp"

struct ImGuiContext;

namespace ui {

// Dear ImGui overlay. Input goes through the platform-neutral ImGuiIO event
// API so no platform backend is involved; the renderer backend (vulkan, wgpu,
// opengl3) is owned by the GPU backend and hooked via gui_new_frame().
class ImGuiOverlay : public IGuiOverlay {
public:
    ImGuiOverlay();
    ~ImGuiOverlay() override;

    ImGuiOverlay(const ImGuiOverlay&) = delete;
    ImGuiOverlay& operator=(const ImGuiOverlay&) = delete;

    bool handle_input(const InputEvent& ev) override;
    GuiFrameOutput build_frame(const GuiFrameContext& ctx) override;

    UIState&       state()       { return state_; }
    const UIState& state() const { return state_; }

private:
    ImGuiContext* context_{nullptr};
    UIState       state_{};
};

// Widgets of one frame. Must be called between ImGui::NewFrame and ImGui::Render.
void draw_panel(UIState& state, const GuiFrameContext& ctx);

const char* window_title(BackendProfile profile);

} // namespace ui
