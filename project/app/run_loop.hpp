#pragma once
#include <deque>

#include "../core/common/clock.hpp"
#include "../input/input_event.hpp"
#include "../render/frame_renderer.hpp"
#include "../render/gpu_context.hpp"
#include "../ui/gui_overlay.hpp"

enum class LoopState { Uninitialized, Running, Suspended, Terminated };

const char* loop_state_name(LoopState s);

struct RunLoopOptions {
    SurfaceRequest surface{};
    bool continuous_redraw{true};   // native: request the next frame after each one
};

// Drives the harness from platform events.
//
//   Uninitialized --Ready--> Running <--Suspend/Resume--> Suspended
//   any --Close / init failure--> Terminated
//
// At most one frame is rendered per redraw request, and redraw requests that
// arrive while a frame is pending or in flight collapse into one.
class RunLoop {
public:
    RunLoop(GpuContext& gpu, FrameRenderer& renderer, IGuiOverlay& gui,
            const IClock& clock, RunLoopOptions options);

    // Queue an event from outside the pump (web tick, callbacks fired while a
    // frame is being recorded).
    void post(const PlatformEvent& ev);

    // Drain posted and platform events, then render at most one frame.
    // Returns false once the loop has terminated.
    bool step(IEventSource& source);

    // Native pump. Blocks in source.wait() whenever no frame is wanted.
    int run(IEventSource& source);

    void request_redraw();

    LoopState state() const          { return state_; }
    int  exit_code() const           { return exit_code_; }
    bool redraw_pending() const      { return redraw_pending_; }
    bool frame_in_flight() const     { return frame_in_flight_; }
    bool wants_frame() const;
    u64  frames_attempted() const    { return frames_attempted_; }
    u64  coalesced_redraws() const   { return coalesced_redraws_; }
    const FrameStats& stats() const  { return stats_; }

private:
    void dispatch(const PlatformEvent& ev);
    void on_ready(const NativeSurfaceHandle& surface);
    void on_input(const InputEvent& in);
    void render_frame();
    void update_stats(f64 delta_seconds);
    void terminate(int exit_code);

    GpuContext&    gpu_;
    FrameRenderer& renderer_;
    IGuiOverlay&   gui_;
    const IClock&  clock_;
    RunLoopOptions options_;

    LoopState state_{LoopState::Uninitialized};
    int       exit_code_{0};

    std::deque<PlatformEvent> posted_;
    bool redraw_pending_{false};
    bool frame_in_flight_{false};
    bool close_requested_{false};
    bool suspend_on_ready_{false};

    f32 pixels_per_point_{1.0f};
    f64 start_time_{0.0};
    f64 last_frame_time_{0.0};

    u64 frames_attempted_{0};
    u64 coalesced_redraws_{0};
    FrameStats stats_{};
};
