#include <gtest/gtest.h>

#include <algorithm>
#include <memory>

#include "fakes.hpp"
#include "../project/app/run_loop.hpp"

// Helper: a RunLoop wired to fakes and a manual clock.
struct LoopFixture {
    CallLog            log;
    FakeRenderBackend* fake;
    GpuContext         gpu;
    FrameRenderer      renderer{1.0};
    FakeGuiOverlay     gui{&log};
    ManualClock        clock;
    FakeEventSource    source;
    RunLoop            loop;

    explicit LoopFixture(bool continuous = false)
        : fake(new FakeRenderBackend(&log)),
          gpu(std::unique_ptr<IRenderBackend>(fake)),
          loop(gpu, renderer, gui, clock, options(continuous))
    {
    }

    static RunLoopOptions options(bool continuous)
    {
        RunLoopOptions o;
        o.continuous_redraw = continuous;
        return o;
    }

    // Ready + the first frame it requests.
    void start(u32 w = 800, u32 h = 600)
    {
        source.push(PlatformEvent::ready(fake_surface(w, h)));
        ASSERT_TRUE(loop.step(source));
        ASSERT_EQ(loop.state(), LoopState::Running);
    }
};

// --- Startup ---

TEST(RunLoop, ReadyInitializesAndDrawsFirstFrame) {
    LoopFixture f;
    f.start();
    EXPECT_EQ(f.fake->initialize_calls, 1);
    EXPECT_EQ(f.gpu.session_generation(), 1u);
    EXPECT_EQ(f.loop.frames_attempted(), 1u);
    EXPECT_EQ(f.fake->present_calls, 1);
    EXPECT_FALSE(f.loop.redraw_pending());
}

TEST(RunLoop, InitializationFailureExitsWithCodeOne) {
    LoopFixture f;
    f.fake->init_error = ErrorKind::BackendUnavailable;
    f.source.push(PlatformEvent::ready(fake_surface(800, 600)));

    EXPECT_FALSE(f.loop.step(f.source));
    EXPECT_EQ(f.loop.state(), LoopState::Terminated);
    EXPECT_EQ(f.loop.exit_code(), 1);
    EXPECT_EQ(f.loop.frames_attempted(), 0u);
    EXPECT_EQ(f.fake->acquire_calls, 0);
}

TEST(RunLoop, RepeatedReadyIsIgnored) {
    LoopFixture f;
    f.start();
    f.source.push(PlatformEvent::ready(fake_surface(800, 600)));
    EXPECT_TRUE(f.loop.step(f.source));
    EXPECT_EQ(f.fake->initialize_calls, 1);
    EXPECT_EQ(f.gpu.session_generation(), 1u);
}

TEST(RunLoop, EventsBeforeReadyRenderNothing) {
    LoopFixture f;
    f.source.push(PlatformEvent::redraw());
    EXPECT_TRUE(f.loop.step(f.source));
    EXPECT_EQ(f.loop.state(), LoopState::Uninitialized);
    EXPECT_EQ(f.loop.frames_attempted(), 0u);
}

// --- Redraw coalescing ---

TEST(RunLoop, OneFramePerStepForManyRequests) {
    LoopFixture f;
    f.start();
    for (int i = 0; i < 5; ++i) f.source.push(PlatformEvent::redraw());

    EXPECT_TRUE(f.loop.step(f.source));
    EXPECT_EQ(f.loop.frames_attempted(), 2u);
    EXPECT_EQ(f.loop.coalesced_redraws(), 4u);
    EXPECT_FALSE(f.loop.redraw_pending());
}

TEST(RunLoop, RequestsDuringFrameCollapseIntoOne) {
    LoopFixture f;
    f.start();
    f.fake->on_begin = [&f] {
        for (int i = 0; i < 3; ++i) f.loop.post(PlatformEvent::redraw());
    };
    f.source.push(PlatformEvent::redraw());

    EXPECT_TRUE(f.loop.step(f.source));
    EXPECT_EQ(f.loop.frames_attempted(), 2u);
    EXPECT_TRUE(f.loop.redraw_pending());

    f.fake->on_begin = nullptr;
    EXPECT_TRUE(f.loop.step(f.source));
    EXPECT_EQ(f.loop.frames_attempted(), 3u);
    EXPECT_FALSE(f.loop.redraw_pending());
}

TEST(RunLoop, ContinuousRedrawKeepsAFramePending) {
    LoopFixture f(true);
    f.start();
    EXPECT_TRUE(f.loop.redraw_pending());
    EXPECT_TRUE(f.loop.wants_frame());

    EXPECT_TRUE(f.loop.step(f.source));
    EXPECT_EQ(f.loop.frames_attempted(), 2u);
}

// --- Suspend / resume ---

TEST(RunLoop, SuspendStopsFramesAndResumeKeepsSession) {
    LoopFixture f;
    f.start();

    f.source.push(PlatformEvent::suspend());
    EXPECT_TRUE(f.loop.step(f.source));
    EXPECT_EQ(f.loop.state(), LoopState::Suspended);

    f.source.push(PlatformEvent::redraw());
    EXPECT_TRUE(f.loop.step(f.source));
    EXPECT_EQ(f.loop.frames_attempted(), 1u);
    EXPECT_FALSE(f.loop.wants_frame());

    f.source.push(PlatformEvent::resume());
    EXPECT_TRUE(f.loop.step(f.source));
    EXPECT_EQ(f.loop.state(), LoopState::Running);
    EXPECT_EQ(f.loop.frames_attempted(), 2u);

    EXPECT_EQ(f.fake->initialize_calls, 1);
    EXPECT_EQ(f.fake->shutdown_calls, 0);
    EXPECT_EQ(f.gpu.session_generation(), 1u);
}

TEST(RunLoop, SuspendBeforeReadyStartsSuspended) {
    LoopFixture f;
    f.source.push(PlatformEvent::suspend());
    f.source.push(PlatformEvent::ready(fake_surface(800, 600)));
    EXPECT_TRUE(f.loop.step(f.source));
    EXPECT_EQ(f.loop.state(), LoopState::Suspended);
    EXPECT_EQ(f.loop.frames_attempted(), 0u);

    f.source.push(PlatformEvent::resume());
    EXPECT_TRUE(f.loop.step(f.source));
    EXPECT_EQ(f.loop.frames_attempted(), 1u);
}

// --- Close ---

TEST(RunLoop, CloseReleasesSession) {
    LoopFixture f;
    f.start();
    f.source.push(PlatformEvent::close());

    EXPECT_FALSE(f.loop.step(f.source));
    EXPECT_EQ(f.loop.state(), LoopState::Terminated);
    EXPECT_EQ(f.loop.exit_code(), 0);
    EXPECT_EQ(f.fake->shutdown_calls, 1);
}

TEST(RunLoop, CloseDuringFrameDropsPresentation) {
    LoopFixture f;
    f.start();
    f.fake->on_begin = [&f] { f.loop.post(PlatformEvent::close()); };
    f.source.push(PlatformEvent::redraw());

    EXPECT_FALSE(f.loop.step(f.source));
    EXPECT_EQ(f.fake->present_calls, 1);   // first frame only
    EXPECT_EQ(f.fake->discard_calls, 1);
    EXPECT_EQ(f.fake->shutdown_calls, 1);
    EXPECT_EQ(f.loop.state(), LoopState::Terminated);
}

TEST(RunLoop, EventsAfterCloseAreIgnored) {
    LoopFixture f;
    f.start();
    f.source.push(PlatformEvent::close());
    EXPECT_FALSE(f.loop.step(f.source));

    f.loop.post(PlatformEvent::redraw());
    f.source.push(PlatformEvent::resume());
    EXPECT_FALSE(f.loop.step(f.source));
    EXPECT_EQ(f.loop.frames_attempted(), 1u);
}

TEST(RunLoop, EscapeClosesWhenGuiDoesNotCaptureIt) {
    LoopFixture f;
    f.start();
    f.source.push(PlatformEvent::from_input(key_down(Key::Escape)));

    EXPECT_FALSE(f.loop.step(f.source));
    EXPECT_EQ(f.loop.state(), LoopState::Terminated);
    EXPECT_EQ(f.loop.exit_code(), 0);
}

TEST(RunLoop, EscapeCapturedByGuiKeepsRunning) {
    LoopFixture f;
    f.start();
    f.gui.capture_keyboard = true;
    f.source.push(PlatformEvent::from_input(key_down(Key::Escape)));

    EXPECT_TRUE(f.loop.step(f.source));
    EXPECT_EQ(f.loop.state(), LoopState::Running);
    EXPECT_EQ(f.loop.frames_attempted(), 2u);
}

// --- Input ordering ---

TEST(RunLoop, InputReachesGuiBeforeTheFrame) {
    LoopFixture f;
    f.start();
    f.log.clear();

    InputEvent move;
    move.type = InputEvent::Type::PointerMove;
    move.x = 10.0f;
    move.y = 20.0f;
    f.source.push(PlatformEvent::from_input(move));
    f.source.push(PlatformEvent::from_input(key_down(Key::A)));

    EXPECT_TRUE(f.loop.step(f.source));
    ASSERT_GE(f.log.size(), 4u);
    EXPECT_EQ(f.log[0], "input");
    EXPECT_EQ(f.log[1], "input");
    auto build = std::find(f.log.begin(), f.log.end(), "build");
    ASSERT_NE(build, f.log.end());
    EXPECT_GT(build - f.log.begin(), 1);
    EXPECT_EQ(f.log.back(), "present");

    ASSERT_EQ(f.gui.inputs.size(), 2u);
    EXPECT_EQ(f.gui.inputs[0].type, InputEvent::Type::PointerMove);
    EXPECT_EQ(f.gui.inputs[1].key, Key::A);
}

TEST(RunLoop, FrameOrderIsAcquireGuiRenderPresent) {
    LoopFixture f;
    f.start();
    f.log.clear();
    f.source.push(PlatformEvent::redraw());
    EXPECT_TRUE(f.loop.step(f.source));

    CallLog expected = { "acquire", "gui_new_frame", "build", "begin", "end", "present" };
    EXPECT_EQ(f.log, expected);
}

// --- Resize and transient failures ---

TEST(RunLoop, ZeroSizeSkipsQuietlyUntilResized) {
    LoopFixture f;
    f.start();

    f.source.push(PlatformEvent::resize(0, 0));
    EXPECT_TRUE(f.loop.step(f.source));
    EXPECT_EQ(f.fake->acquire_calls, 1);
    EXPECT_EQ(f.fake->configure_calls, 0);
    EXPECT_EQ(f.loop.frames_attempted(), 1u);
    EXPECT_FALSE(f.loop.redraw_pending());
    EXPECT_FALSE(f.loop.wants_frame());

    f.source.push(PlatformEvent::resize(640, 480));
    EXPECT_TRUE(f.loop.step(f.source));
    EXPECT_EQ(f.fake->configure_calls, 1);
    EXPECT_EQ(f.fake->present_calls, 2);
    EXPECT_EQ(f.gui.last_context.size, (Extent2D{640, 480}));
}

TEST(RunLoop, MinimizedWindowDoesNotScheduleFrames) {
    LoopFixture f;
    f.start();

    f.source.push(PlatformEvent::resize(0, 480));
    f.source.push(PlatformEvent::resize(0, 0));
    EXPECT_TRUE(f.loop.step(f.source));
    EXPECT_EQ(f.loop.frames_attempted(), 1u);
    EXPECT_EQ(f.loop.coalesced_redraws(), 0u);
    EXPECT_EQ(f.loop.stats().frames_skipped, 0u);

    f.source.push(PlatformEvent::resize(800, 600));
    EXPECT_TRUE(f.loop.step(f.source));
    EXPECT_EQ(f.loop.frames_attempted(), 2u);
    EXPECT_EQ(f.fake->present_calls, 2);
    EXPECT_EQ(f.loop.stats().frames_skipped, 0u);
}

TEST(RunLoop, ResizeCarriesPixelsPerPointToGui) {
    LoopFixture f;
    f.start();
    f.source.push(PlatformEvent::resize(1600, 1200, 2.0f));
    EXPECT_TRUE(f.loop.step(f.source));
    EXPECT_FLOAT_EQ(f.gui.last_context.pixels_per_point, 2.0f);
    EXPECT_EQ(f.gui.last_context.size, (Extent2D{1600, 1200}));
}

TEST(RunLoop, AcquireTimeoutSkipsAndContinues) {
    LoopFixture f(true);
    f.fake->acquire_script = { ErrorKind::Timeout };
    f.start();
    EXPECT_EQ(f.fake->present_calls, 0);
    EXPECT_TRUE(f.loop.redraw_pending());

    EXPECT_TRUE(f.loop.step(f.source));
    EXPECT_EQ(f.fake->present_calls, 1);
    EXPECT_EQ(f.loop.stats().frames_skipped, 1u);
}

TEST(RunLoop, RenderFailureDiscardsAndKeepsRunning) {
    LoopFixture f;
    f.fake->begin_error = ErrorKind::ValidationFailed;
    f.start();

    EXPECT_EQ(f.fake->discard_calls, 1);
    EXPECT_EQ(f.fake->present_calls, 0);
    EXPECT_EQ(f.loop.state(), LoopState::Running);

    f.source.push(PlatformEvent::redraw());
    EXPECT_TRUE(f.loop.step(f.source));
    EXPECT_EQ(f.fake->present_calls, 1);
}

// --- Time and stats ---

TEST(RunLoop, RotationFollowsInjectedClock) {
    LoopFixture f;
    f.start(800, 600);

    f.clock.set(1.5707963267948966);
    f.source.push(PlatformEvent::redraw());
    EXPECT_TRUE(f.loop.step(f.source));

    EXPECT_NEAR(f.fake->last_uniforms.angle_radians, 1.5707963f, 1e-5f);
    EXPECT_NEAR(f.fake->last_uniforms.aspect, 800.0f / 600.0f, 1e-6f);
    EXPECT_NEAR(f.loop.stats().angle_radians, 1.5707963267948966, 1e-9);
    EXPECT_EQ(f.loop.stats().frames_presented, 2u);
    EXPECT_NEAR(f.gui.last_context.delta_seconds, 1.5707963267948966, 1e-9);
}

TEST(RunLoop, RunWaitsWhenIdleAndReturnsExitCode) {
    LoopFixture f;
    f.source.close_on_wait = true;
    f.source.push(PlatformEvent::ready(fake_surface(800, 600)));

    int code = f.loop.run(f.source);
    EXPECT_EQ(code, 0);
    EXPECT_EQ(f.source.wait_calls, 1);
    EXPECT_EQ(f.loop.frames_attempted(), 1u);
    EXPECT_EQ(f.fake->shutdown_calls, 1);
}
