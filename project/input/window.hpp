#pragma once
#include <deque>
#include <string>

#include "input_event.hpp"
#include "../core/common/config.hpp"

struct GLFWwindow;

// GLFW window turned into a PlatformEvent queue. Ready is queued by create(),
// everything else by the GLFW callbacks (and on the web by page visibility and
// unload handlers).
class Window : public IEventSource {
public:
    Window() = default;
    ~Window() override;

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    bool create(const WindowCfg& cfg);
    void destroy();

    bool poll(PlatformEvent& out) override;
    void wait() override;

    void push(const PlatformEvent& ev) { queue_.push_back(ev); }

    GLFWwindow* handle() const { return handle_; }
    NativeSurfaceHandle surface_handle() const;

private:
    GLFWwindow* handle_{nullptr};
    std::string canvas_selector_;
    std::deque<PlatformEvent> queue_;
    bool iconified_{false};

    Extent2D framebuffer_size() const;
    f32 pixels_per_point() const;
    KeyMods current_mods() const;

    static Window* from(GLFWwindow* w);
    static void on_framebuffer_size(GLFWwindow* w, int width, int height);
    static void on_iconify(GLFWwindow* w, int iconified);
    static void on_close(GLFWwindow* w);
    static void on_refresh(GLFWwindow* w);
    static void on_cursor_pos(GLFWwindow* w, double x, double y);
    static void on_mouse_button(GLFWwindow* w, int button, int action, int mods);
    static void on_scroll(GLFWwindow* w, double dx, double dy);
    static void on_key(GLFWwindow* w, int key, int scancode, int action, int mods);
    static void on_char(GLFWwindow* w, unsigned int codepoint);
};

// GLFW_KEY_* to Key, Key::Unknown for everything not listed in Key.
Key translate_glfw_key(int glfw_key);
