#include <gtest/gtest.h>

#include <cmath>
#include <memory>

#include "fakes.hpp"
#include "../project/render/frame_renderer.hpp"

static const double kPi = 3.141592653589793;

// --- compute_rotation_angle ---

TEST(RotationAngle, ZeroAtStart) {
    EXPECT_DOUBLE_EQ(compute_rotation_angle(0.0, 0.5235987755982988), 0.0);
}

TEST(RotationAngle, QuarterTurn) {
    EXPECT_NEAR(compute_rotation_angle(1.5707963267948966, 1.0), kPi / 2.0, 1e-12);
    // 30 deg/s for 3 s
    EXPECT_NEAR(compute_rotation_angle(3.0, 0.5235987755982988), kPi / 2.0, 1e-12);
}

TEST(RotationAngle, WrapsIntoOneTurn) {
    double a = compute_rotation_angle(10.0 * 2.0 * kPi + 0.5, 1.0);
    EXPECT_NEAR(a, 0.5, 1e-9);
}

TEST(RotationAngle, NegativeProductWrapsToPositive) {
    double a = compute_rotation_angle(-0.5, 1.0);
    EXPECT_NEAR(a, 2.0 * kPi - 0.5, 1e-12);
}

TEST(RotationAngle, AlwaysInHalfOpenRange) {
    for (int i = 0; i < 1000; ++i) {
        double t = i * 0.37;
        double a = compute_rotation_angle(t, 2.5);
        EXPECT_GE(a, 0.0);
        EXPECT_LT(a, 2.0 * kPi);
    }
}

TEST(RotationAngle, LongRunsStayAccurate) {
    // a day of runtime at 30 deg/s
    double t = 86400.25;
    double expected = std::fmod(t * 0.5235987755982988, 2.0 * kPi);
    EXPECT_NEAR(compute_rotation_angle(t, 0.5235987755982988), expected, 1e-9);
}

// --- FrameRenderer ---

// Helper: initialized GpuContext over a fake backend.
struct RendererFixture {
    FakeRenderBackend* fake;
    GpuContext gpu;
    FrameRenderer renderer{1.0};
    int dummy_draw_data{0};

    RendererFixture() : fake(new FakeRenderBackend()), gpu(std::unique_ptr<IRenderBackend>(fake))
    {
        gpu.initialize(fake_surface(800, 600), SurfaceRequest{});
    }

    GuiFrameOutput some_gui()
    {
        GuiFrameOutput g;
        g.draw_data     = reinterpret_cast<ImDrawData*>(&dummy_draw_data);
        g.command_lists = 1;
        return g;
    }
};

TEST(FrameRenderer, RecordsSceneAndGuiInOnePass) {
    RendererFixture f;
    Result<FrameState> acq = f.gpu.acquire_frame();
    ASSERT_TRUE(acq.ok);

    FrameTime t;
    t.elapsed_seconds = 1.5707963267948966;
    Status st = f.renderer.render(f.gpu, acq.value, t, f.some_gui());

    EXPECT_TRUE(st.ok);
    EXPECT_EQ(f.fake->begin_calls, 1);
    EXPECT_EQ(f.fake->gui_calls, 1);
    EXPECT_EQ(f.fake->end_calls, 1);
    EXPECT_FALSE(acq.value.pass_open);
    EXPECT_DOUBLE_EQ(acq.value.elapsed_seconds, t.elapsed_seconds);
    EXPECT_NEAR(f.fake->last_uniforms.angle_radians, 1.5707963f, 1e-6f);
    EXPECT_NEAR(f.fake->last_uniforms.aspect, 800.0f / 600.0f, 1e-6f);
    EXPECT_NEAR(f.renderer.last_angle(), kPi / 2.0, 1e-12);
}

TEST(FrameRenderer, EmptyGuiSkipsGuiDraw) {
    RendererFixture f;
    Result<FrameState> acq = f.gpu.acquire_frame();
    ASSERT_TRUE(acq.ok);

    Status st = f.renderer.render(f.gpu, acq.value, FrameTime{}, GuiFrameOutput{});
    EXPECT_TRUE(st.ok);
    EXPECT_EQ(f.fake->gui_calls, 0);
    EXPECT_EQ(f.fake->end_calls, 1);
}

TEST(FrameRenderer, GuiFailureStillEndsPass) {
    RendererFixture f;
    f.fake->gui_error = ErrorKind::ValidationFailed;
    Result<FrameState> acq = f.gpu.acquire_frame();
    ASSERT_TRUE(acq.ok);

    Status st = f.renderer.render(f.gpu, acq.value, FrameTime{}, f.some_gui());
    EXPECT_FALSE(st.ok);
    EXPECT_EQ(st.err.kind, ErrorKind::ValidationFailed);
    EXPECT_EQ(f.fake->end_calls, 1);
    EXPECT_FALSE(acq.value.pass_open);
}

TEST(FrameRenderer, BeginFailureStopsRecording) {
    RendererFixture f;
    f.fake->begin_error = ErrorKind::ValidationFailed;
    Result<FrameState> acq = f.gpu.acquire_frame();
    ASSERT_TRUE(acq.ok);

    Status st = f.renderer.render(f.gpu, acq.value, FrameTime{}, f.some_gui());
    EXPECT_FALSE(st.ok);
    EXPECT_EQ(f.fake->gui_calls, 0);
    EXPECT_EQ(f.fake->end_calls, 0);
}
