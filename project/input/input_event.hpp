// input/input_event.hpp
#pragma once
#include "../core/common/types.hpp"

enum class MouseButton { Left, Right, Middle };

// Keys the harness and the GUI care about. Everything else maps to Unknown.
enum class Key {
    Unknown,
    Escape, Tab, Enter, Backspace, Delete, Space,
    Left, Right, Up, Down, Home, End, PageUp, PageDown,
    A, C, V, X, Y, Z,
    LeftShift, RightShift, LeftCtrl, RightCtrl, LeftAlt, RightAlt,
};

struct KeyMods {
    bool shift{false};
    bool ctrl{false};
    bool alt{false};
    bool super{false};
};

struct InputEvent {
    enum class Type { PointerMove, PointerButton, Scroll, KeyDown, KeyUp, Text };

    Type type{Type::PointerMove};

    // PointerMove / PointerButton, window pixels
    f32 x{0.0f}, y{0.0f};
    MouseButton button{MouseButton::Left};
    bool pressed{false};

    // Scroll
    f32 scroll_x{0.0f}, scroll_y{0.0f};

    // KeyDown / KeyUp
    Key key{Key::Unknown};
    KeyMods mods{};

    // Text
    u32 codepoint{0};
};

// Handle to the drawable the GPU context binds to. Produced by the window
// layer, only consumed by the backends.
struct NativeSurfaceHandle {
    void*       window{nullptr};          // GLFWwindow*
    const char* canvas_selector{nullptr}; // web builds
    Extent2D    size{};                   // framebuffer pixels
    f32         pixels_per_point{1.0f};   // framebuffer pixels per window unit
};

struct PlatformEvent {
    enum class Type { Ready, Resize, RedrawRequested, Suspend, Resume, Close, Input };

    Type type{Type::RedrawRequested};
    NativeSurfaceHandle surface{}; // Ready
    Extent2D size{};               // Resize, framebuffer pixels
    f32 pixels_per_point{1.0f};    // Resize
    InputEvent input{};            // Input

    static PlatformEvent ready(const NativeSurfaceHandle& h) { PlatformEvent e; e.type = Type::Ready; e.surface = h; return e; }
    static PlatformEvent resize(u32 w, u32 h, f32 ppp = 1.0f)
    {
        PlatformEvent e;
        e.type = Type::Resize;
        e.size = {w, h};
        e.pixels_per_point = ppp;
        return e;
    }
    static PlatformEvent redraw()                            { PlatformEvent e; e.type = Type::RedrawRequested; return e; }
    static PlatformEvent suspend()                           { PlatformEvent e; e.type = Type::Suspend; return e; }
    static PlatformEvent resume()                            { PlatformEvent e; e.type = Type::Resume; return e; }
    static PlatformEvent close()                             { PlatformEvent e; e.type = Type::Close; return e; }
    static PlatformEvent from_input(const InputEvent& in)    { PlatformEvent e; e.type = Type::Input; e.input = in; return e; }
};

// "next event or next frame tick" pull interface over the platform.
class IEventSource {
public:
    virtual ~IEventSource() = default;

    // Non-blocking; false when the queue is empty.
    virtual bool poll(PlatformEvent& out) = 0;

    // Blocks until the platform has something to deliver. No-op on the web.
    virtual void wait() = 0;
};
