#include "run_loop.hpp"

#include <iostream>

const char* loop_state_name(LoopState s)
{
    switch (s) {
    case LoopState::Uninitialized: return "Uninitialized";
    case LoopState::Running:       return "Running";
    case LoopState::Suspended:     return "Suspended";
    case LoopState::Terminated:    return "Terminated";
    }
    return "?";
}

RunLoop::RunLoop(GpuContext& gpu, FrameRenderer& renderer, IGuiOverlay& gui,
                 const IClock& clock, RunLoopOptions options)
    : gpu_(gpu), renderer_(renderer), gui_(gui), clock_(clock), options_(options)
{
}

void RunLoop::post(const PlatformEvent& ev)
{
    if (state_ == LoopState::Terminated) return;

    if (frame_in_flight_) {
        switch (ev.type) {
        case PlatformEvent::Type::Close:
            close_requested_ = true;
            return;
        case PlatformEvent::Type::RedrawRequested:
            request_redraw();
            return;
        default:
            break;
        }
    }
    posted_.push_back(ev);
}

void RunLoop::request_redraw()
{
    if (state_ != LoopState::Running) return;

    if (redraw_pending_) {
        ++coalesced_redraws_;
        return;
    }
    redraw_pending_ = true;
}

bool RunLoop::wants_frame() const
{
    return !posted_.empty() || (state_ == LoopState::Running && redraw_pending_);
}

bool RunLoop::step(IEventSource& source)
{
    if (state_ == LoopState::Terminated) return false;

    while (!posted_.empty()) {
        PlatformEvent ev = posted_.front();
        posted_.pop_front();
        dispatch(ev);
        if (state_ == LoopState::Terminated) return false;
    }

    PlatformEvent ev;
    while (source.poll(ev)) {
        dispatch(ev);
        if (state_ == LoopState::Terminated) return false;
    }

    if (state_ == LoopState::Running && redraw_pending_) {
        render_frame();
    }

    return state_ != LoopState::Terminated;
}

int RunLoop::run(IEventSource& source)
{
    while (step(source)) {
        if (!wants_frame()) source.wait();
    }
    return exit_code_;
}

void RunLoop::dispatch(const PlatformEvent& ev)
{
    switch (ev.type) {
    case PlatformEvent::Type::Ready:
        on_ready(ev.surface);
        break;

    case PlatformEvent::Type::Resize:
        pixels_per_point_ = ev.pixels_per_point;
        gpu_.resize(ev.size.width, ev.size.height);
        // nothing to draw into until a non-zero size arrives
        if (!ev.size.is_zero()) request_redraw();
        break;

    case PlatformEvent::Type::RedrawRequested:
        request_redraw();
        break;

    case PlatformEvent::Type::Suspend:
        if (state_ == LoopState::Uninitialized) {
            suspend_on_ready_ = true;
        } else if (state_ == LoopState::Running) {
            state_ = LoopState::Suspended;
            redraw_pending_ = false;
            std::cout << "[Loop] suspended\n";
        }
        break;

    case PlatformEvent::Type::Resume:
        if (state_ == LoopState::Uninitialized) {
            suspend_on_ready_ = false;
        } else if (state_ == LoopState::Suspended) {
            state_ = LoopState::Running;
            std::cout << "[Loop] resumed\n";
            request_redraw();
        }
        break;

    case PlatformEvent::Type::Close:
        terminate(exit_code_);
        break;

    case PlatformEvent::Type::Input:
        on_input(ev.input);
        break;
    }
}

void RunLoop::on_ready(const NativeSurfaceHandle& surface)
{
    if (state_ != LoopState::Uninitialized) {
        std::cerr << "[Loop] ignoring repeated ready signal in state "
                  << loop_state_name(state_) << "\n";
        return;
    }

    SurfaceRequest req = options_.surface;
    req.size = surface.size;
    pixels_per_point_ = surface.pixels_per_point;

    Result<SurfaceInfo> r = gpu_.initialize(surface, req);
    if (!r.ok) {
        std::cerr << "[Loop] initialization failed ("
                  << error_kind_name(r.err.kind) << "): " << r.err.message << "\n";
        terminate(1);
        return;
    }

    start_time_      = clock_.now_seconds();
    last_frame_time_ = start_time_;

    if (suspend_on_ready_) {
        state_ = LoopState::Suspended;
        std::cout << "[Loop] ready, starting suspended\n";
        return;
    }

    state_ = LoopState::Running;
    request_redraw();
}

void RunLoop::on_input(const InputEvent& in)
{
    bool captured = gui_.handle_input(in);

    if (!captured && in.type == InputEvent::Type::KeyDown && in.key == Key::Escape) {
        std::cout << "[Loop] escape pressed, closing\n";
        terminate(exit_code_);
        return;
    }

    request_redraw();
}

void RunLoop::render_frame()
{
    redraw_pending_  = false;
    frame_in_flight_ = true;
    ++frames_attempted_;

    f64 now = clock_.now_seconds();
    FrameTime time;
    time.elapsed_seconds = now - start_time_;
    time.delta_seconds   = now - last_frame_time_;

    Result<FrameState> acq = gpu_.acquire_frame();
    if (!acq.ok) {
        frame_in_flight_ = false;
        update_stats(0.0);
        if (close_requested_) {
            terminate(exit_code_);
            return;
        }
        // zero-area surface: wait for the next resize instead of spinning
        if (acq.err.kind == ErrorKind::ResizeDegenerate) return;

        std::cerr << "[Loop] frame skipped: " << error_kind_name(acq.err.kind) << "\n";
        if (options_.continuous_redraw) request_redraw();
        return;
    }

    FrameState frame = acq.value;

    gpu_.gui_new_frame();
    GuiFrameContext ctx;
    ctx.size             = frame.size;
    ctx.pixels_per_point = pixels_per_point_;
    ctx.delta_seconds    = time.delta_seconds;
    ctx.profile          = gpu_.profile();
    ctx.stats            = stats_;
    GuiFrameOutput gui = gui_.build_frame(ctx);

    Status st = renderer_.render(gpu_, frame, time, gui);
    if (!st.ok) {
        std::cerr << "[Loop] frame " << frame.frame_number << " dropped ("
                  << error_kind_name(st.err.kind) << "): " << st.err.message << "\n";
        gpu_.discard_frame(frame);
    } else if (close_requested_) {
        gpu_.discard_frame(frame);
    } else {
        Status p = gpu_.present(frame);
        if (!p.ok) {
            std::cerr << "[Loop] present failed ("
                      << error_kind_name(p.err.kind) << "): " << p.err.message << "\n";
        }
    }

    frame_in_flight_ = false;
    last_frame_time_ = now;
    update_stats(time.delta_seconds);

    if (close_requested_) {
        terminate(exit_code_);
        return;
    }

    if (options_.continuous_redraw) request_redraw();
}

void RunLoop::update_stats(f64 delta_seconds)
{
    stats_.frames_presented = gpu_.frames_presented();
    stats_.frames_skipped   = gpu_.frames_skipped();
    stats_.reconfigurations = gpu_.reconfigure_count();
    stats_.angle_radians    = renderer_.last_angle();

    if (delta_seconds > 0.0) {
        f64 inst = 1.0 / delta_seconds;
        stats_.fps = stats_.fps == 0.0 ? inst : stats_.fps * 0.9 + inst * 0.1;
    }
}

void RunLoop::terminate(int exit_code)
{
    if (state_ == LoopState::Terminated) return;

    exit_code_ = exit_code;
    redraw_pending_ = false;
    posted_.clear();
    gpu_.shutdown();
    state_ = LoopState::Terminated;
    std::cout << "[Loop] terminated, exit code " << exit_code_ << "\n";
}
