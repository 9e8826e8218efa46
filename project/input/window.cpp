#include "window.hpp"

#include <GLFW/glfw3.h>

#include <iostream>

#if defined(__EMSCRIPTEN__)
#include <emscripten/html5.h>

static EM_BOOL on_visibility_change(int, const EmscriptenVisibilityChangeEvent* e, void* user)
{
    auto* self = static_cast<Window*>(user);
    self->push(e->hidden ? PlatformEvent::suspend() : PlatformEvent::resume());
    return EM_TRUE;
}

static const char* on_before_unload(int, const void*, void* user)
{
    static_cast<Window*>(user)->push(PlatformEvent::close());
    return nullptr;
}
#endif

Key translate_glfw_key(int k)
{
    switch (k) {
    case GLFW_KEY_ESCAPE:        return Key::Escape;
    case GLFW_KEY_TAB:           return Key::Tab;
    case GLFW_KEY_ENTER:         return Key::Enter;
    case GLFW_KEY_BACKSPACE:     return Key::Backspace;
    case GLFW_KEY_DELETE:        return Key::Delete;
    case GLFW_KEY_SPACE:         return Key::Space;
    case GLFW_KEY_LEFT:          return Key::Left;
    case GLFW_KEY_RIGHT:         return Key::Right;
    case GLFW_KEY_UP:            return Key::Up;
    case GLFW_KEY_DOWN:          return Key::Down;
    case GLFW_KEY_HOME:          return Key::Home;
    case GLFW_KEY_END:           return Key::End;
    case GLFW_KEY_PAGE_UP:       return Key::PageUp;
    case GLFW_KEY_PAGE_DOWN:     return Key::PageDown;
    case GLFW_KEY_A:             return Key::A;
    case GLFW_KEY_C:             return Key::C;
    case GLFW_KEY_V:             return Key::V;
    case GLFW_KEY_X:             return Key::X;
    case GLFW_KEY_Y:             return Key::Y;
    case GLFW_KEY_Z:             return Key::Z;
    case GLFW_KEY_LEFT_SHIFT:    return Key::LeftShift;
    case GLFW_KEY_RIGHT_SHIFT:   return Key::RightShift;
    case GLFW_KEY_LEFT_CONTROL:  return Key::LeftCtrl;
    case GLFW_KEY_RIGHT_CONTROL: return Key::RightCtrl;
    case GLFW_KEY_LEFT_ALT:      return Key::LeftAlt;
    case GLFW_KEY_RIGHT_ALT:     return Key::RightAlt;
    default:                     return Key::Unknown;
    }
}

static KeyMods translate_mods(int mods)
{
    KeyMods m;
    m.shift = (mods & GLFW_MOD_SHIFT) != 0;
    m.ctrl  = (mods & GLFW_MOD_CONTROL) != 0;
    m.alt   = (mods & GLFW_MOD_ALT) != 0;
    m.super = (mods & GLFW_MOD_SUPER) != 0;
    return m;
}

Window::~Window()
{
    destroy();
}

bool Window::create(const WindowCfg& cfg)
{
    canvas_selector_ = cfg.canvas_selector;

    // every backend creates its own context / surface
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    handle_ = glfwCreateWindow(cfg.width, cfg.height, cfg.title.c_str(), nullptr, nullptr);
    if (!handle_) {
        std::cerr << "Failed to create GLFW window\n";
        return false;
    }

    glfwSetWindowUserPointer(handle_, this);
    glfwSetFramebufferSizeCallback(handle_, on_framebuffer_size);
    glfwSetWindowIconifyCallback(handle_, on_iconify);
    glfwSetWindowCloseCallback(handle_, on_close);
    glfwSetWindowRefreshCallback(handle_, on_refresh);
    glfwSetCursorPosCallback(handle_, on_cursor_pos);
    glfwSetMouseButtonCallback(handle_, on_mouse_button);
    glfwSetScrollCallback(handle_, on_scroll);
    glfwSetKeyCallback(handle_, on_key);
    glfwSetCharCallback(handle_, on_char);

#if defined(__EMSCRIPTEN__)
    emscripten_set_visibilitychange_callback(this, EM_FALSE, on_visibility_change);
    emscripten_set_beforeunload_callback(this, on_before_unload);
#endif

    queue_.push_back(PlatformEvent::ready(surface_handle()));
    return true;
}

void Window::destroy()
{
    if (!handle_) return;
#if defined(__EMSCRIPTEN__)
    emscripten_set_visibilitychange_callback(nullptr, EM_FALSE, nullptr);
    emscripten_set_beforeunload_callback(nullptr, nullptr);
#endif
    glfwDestroyWindow(handle_);
    handle_ = nullptr;
    queue_.clear();
}

bool Window::poll(PlatformEvent& out)
{
    if (queue_.empty() && handle_) {
        glfwPollEvents();
    }
    if (queue_.empty()) return false;
    out = queue_.front();
    queue_.pop_front();
    return true;
}

void Window::wait()
{
#if !defined(__EMSCRIPTEN__)
    if (handle_ && queue_.empty()) glfwWaitEvents();
#endif
}

NativeSurfaceHandle Window::surface_handle() const
{
    NativeSurfaceHandle h;
    h.window           = handle_;
    h.canvas_selector  = canvas_selector_.c_str();
    h.size             = framebuffer_size();
    h.pixels_per_point = pixels_per_point();
    return h;
}

Extent2D Window::framebuffer_size() const
{
    int w = 0, h = 0;
    if (handle_) glfwGetFramebufferSize(handle_, &w, &h);
    return { static_cast<u32>(w > 0 ? w : 0), static_cast<u32>(h > 0 ? h : 0) };
}

f32 Window::pixels_per_point() const
{
    int ww = 0, wh = 0, fw = 0, fh = 0;
    if (!handle_) return 1.0f;
    glfwGetWindowSize(handle_, &ww, &wh);
    glfwGetFramebufferSize(handle_, &fw, &fh);
    if (ww <= 0 || fw <= 0) return 1.0f;
    return static_cast<f32>(fw) / static_cast<f32>(ww);
}

KeyMods Window::current_mods() const
{
    KeyMods m;
    if (!handle_) return m;
    m.shift = glfwGetKey(handle_, GLFW_KEY_LEFT_SHIFT) == GLFW_PRESS
           || glfwGetKey(handle_, GLFW_KEY_RIGHT_SHIFT) == GLFW_PRESS;
    m.ctrl  = glfwGetKey(handle_, GLFW_KEY_LEFT_CONTROL) == GLFW_PRESS
           || glfwGetKey(handle_, GLFW_KEY_RIGHT_CONTROL) == GLFW_PRESS;
    m.alt   = glfwGetKey(handle_, GLFW_KEY_LEFT_ALT) == GLFW_PRESS
           || glfwGetKey(handle_, GLFW_KEY_RIGHT_ALT) == GLFW_PRESS;
    return m;
}

// ---------------- GLFW callbacks ----------------

Window* Window::from(GLFWwindow* w)
{
    return static_cast<Window*>(glfwGetWindowUserPointer(w));
}

void Window::on_framebuffer_size(GLFWwindow* w, int width, int height)
{
    Window* self = from(w);
    if (!self) return;
    self->queue_.push_back(PlatformEvent::resize(static_cast<u32>(width > 0 ? width : 0),
                                                 static_cast<u32>(height > 0 ? height : 0),
                                                 self->pixels_per_point()));
}

void Window::on_iconify(GLFWwindow* w, int iconified)
{
    Window* self = from(w);
    if (!self) return;
    bool now = iconified == GLFW_TRUE;
    if (now == self->iconified_) return;
    self->iconified_ = now;
    self->queue_.push_back(now ? PlatformEvent::suspend() : PlatformEvent::resume());
}

void Window::on_close(GLFWwindow* w)
{
    if (Window* self = from(w)) self->queue_.push_back(PlatformEvent::close());
}

void Window::on_refresh(GLFWwindow* w)
{
    if (Window* self = from(w)) self->queue_.push_back(PlatformEvent::redraw());
}

void Window::on_cursor_pos(GLFWwindow* w, double x, double y)
{
    Window* self = from(w);
    if (!self) return;
    InputEvent in;
    in.type = InputEvent::Type::PointerMove;
    in.x    = static_cast<f32>(x);
    in.y    = static_cast<f32>(y);
    self->queue_.push_back(PlatformEvent::from_input(in));
}

void Window::on_mouse_button(GLFWwindow* w, int button, int action, int mods)
{
    Window* self = from(w);
    if (!self) return;

    InputEvent in;
    in.type = InputEvent::Type::PointerButton;
    switch (button) {
    case GLFW_MOUSE_BUTTON_LEFT:   in.button = MouseButton::Left;   break;
    case GLFW_MOUSE_BUTTON_RIGHT:  in.button = MouseButton::Right;  break;
    case GLFW_MOUSE_BUTTON_MIDDLE: in.button = MouseButton::Middle; break;
    default: return;
    }
    in.pressed = action == GLFW_PRESS;
    in.mods    = translate_mods(mods);

    double x = 0.0, y = 0.0;
    glfwGetCursorPos(w, &x, &y);
    in.x = static_cast<f32>(x);
    in.y = static_cast<f32>(y);
    self->queue_.push_back(PlatformEvent::from_input(in));
}

void Window::on_scroll(GLFWwindow* w, double dx, double dy)
{
    Window* self = from(w);
    if (!self) return;
    InputEvent in;
    in.type     = InputEvent::Type::Scroll;
    in.scroll_x = static_cast<f32>(dx);
    in.scroll_y = static_cast<f32>(dy);
    self->queue_.push_back(PlatformEvent::from_input(in));
}

void Window::on_key(GLFWwindow* w, int key, int /*scancode*/, int action, int mods)
{
    Window* self = from(w);
    if (!self) return;
    if (action != GLFW_PRESS && action != GLFW_RELEASE && action != GLFW_REPEAT) return;

    InputEvent in;
    in.type = action == GLFW_RELEASE ? InputEvent::Type::KeyUp : InputEvent::Type::KeyDown;
    in.key  = translate_glfw_key(key);
    in.mods = translate_mods(mods);
    self->queue_.push_back(PlatformEvent::from_input(in));
}

void Window::on_char(GLFWwindow* w, unsigned int codepoint)
{
    Window* self = from(w);
    if (!self) return;
    InputEvent in;
    in.type      = InputEvent::Type::Text;
    in.codepoint = codepoint;
    in.mods      = self->current_mods();
    self->queue_.push_back(PlatformEvent::from_input(in));
}
