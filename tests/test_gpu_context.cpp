#include <gtest/gtest.h>

#include <memory>

#include "fakes.hpp"
#include "../project/render/gpu_context.hpp"

// Helper: GpuContext over a fake backend, `fake` stays valid while `gpu` lives.
struct GpuFixture {
    FakeRenderBackend* fake;
    GpuContext gpu;

    GpuFixture() : fake(new FakeRenderBackend()), gpu(std::unique_ptr<IRenderBackend>(fake)) {}

    void init(u32 w = 800, u32 h = 600)
    {
        Result<SurfaceInfo> r = gpu.initialize(fake_surface(w, h), SurfaceRequest{});
        ASSERT_TRUE(r.ok) << r.err.message;
    }
};

// --- Initialization ---

TEST(GpuContext, InitializeRejectsZeroSizedDrawable) {
    GpuFixture f;
    Result<SurfaceInfo> r = f.gpu.initialize(fake_surface(0, 600), SurfaceRequest{});
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err.kind, ErrorKind::SurfaceConfigurationError);
    EXPECT_EQ(f.fake->initialize_calls, 0);
    EXPECT_EQ(f.gpu.session_generation(), 0u);
    EXPECT_FALSE(f.gpu.initialized());
}

TEST(GpuContext, InitializeBumpsGenerationOnce) {
    GpuFixture f;
    f.init();
    EXPECT_TRUE(f.gpu.initialized());
    EXPECT_EQ(f.gpu.session_generation(), 1u);
    EXPECT_EQ(f.gpu.surface_size(), (Extent2D{800, 600}));
    EXPECT_EQ(f.gpu.surface_info().adapter, "fake adapter");

    // a second call keeps the existing session
    Result<SurfaceInfo> again = f.gpu.initialize(fake_surface(800, 600), SurfaceRequest{});
    EXPECT_TRUE(again.ok);
    EXPECT_EQ(f.fake->initialize_calls, 1);
    EXPECT_EQ(f.gpu.session_generation(), 1u);
}

TEST(GpuContext, InitializeFailureIsReported) {
    GpuFixture f;
    f.fake->init_error = ErrorKind::NoSuitableAdapter;
    Result<SurfaceInfo> r = f.gpu.initialize(fake_surface(800, 600), SurfaceRequest{});
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err.kind, ErrorKind::NoSuitableAdapter);
    EXPECT_TRUE(is_initialization_error(r.err.kind));
    EXPECT_EQ(f.gpu.session_generation(), 0u);
}

TEST(GpuContext, RequestSizeComesFromDrawable) {
    GpuFixture f;
    SurfaceRequest req;
    req.size  = {1, 1};
    req.vsync = false;
    ASSERT_TRUE(f.gpu.initialize(fake_surface(1024, 768), req).ok);
    EXPECT_EQ(f.fake->last_request.size, (Extent2D{1024, 768}));
    EXPECT_FALSE(f.fake->last_request.vsync);
}

// --- Resize ---

TEST(GpuContext, ZeroResizeIsDeferredWithoutBackendCall) {
    GpuFixture f;
    f.init();

    f.gpu.resize(0, 0);
    EXPECT_TRUE(f.gpu.resize_deferred());
    EXPECT_EQ(f.fake->configure_calls, 0);

    Result<FrameState> r = f.gpu.acquire_frame();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err.kind, ErrorKind::ResizeDegenerate);
    EXPECT_EQ(f.fake->acquire_calls, 0);
    EXPECT_EQ(f.gpu.frames_skipped(), 1u);

    f.gpu.resize(640, 480);
    EXPECT_FALSE(f.gpu.resize_deferred());
    EXPECT_EQ(f.fake->configure_calls, 1);
    EXPECT_EQ(f.fake->configured, (Extent2D{640, 480}));

    Result<FrameState> ok = f.gpu.acquire_frame();
    ASSERT_TRUE(ok.ok);
    EXPECT_EQ(ok.value.size, (Extent2D{640, 480}));
}

TEST(GpuContext, ZeroResizeBackToSameSizeStillReconfigures) {
    GpuFixture f;
    f.init();
    f.gpu.resize(800, 0);
    f.gpu.resize(800, 600);
    EXPECT_EQ(f.fake->configure_calls, 1);
    EXPECT_FALSE(f.gpu.resize_deferred());
}

TEST(GpuContext, ResizeIsIdempotent) {
    GpuFixture f;
    f.init();

    f.gpu.resize(800, 600);
    EXPECT_EQ(f.fake->configure_calls, 0);

    f.gpu.resize(1024, 768);
    f.gpu.resize(1024, 768);
    EXPECT_EQ(f.fake->configure_calls, 1);
    EXPECT_EQ(f.gpu.reconfigure_count(), 1u);
    EXPECT_EQ(f.gpu.surface_size(), (Extent2D{1024, 768}));
}

TEST(GpuContext, ResizeBeforeInitializeIsAppliedAfter) {
    GpuFixture f;
    f.gpu.resize(1024, 768);
    EXPECT_EQ(f.fake->configure_calls, 0);

    f.init(800, 600);
    EXPECT_EQ(f.fake->last_request.size, (Extent2D{800, 600}));
    EXPECT_EQ(f.fake->configure_calls, 1);
    EXPECT_EQ(f.gpu.surface_size(), (Extent2D{1024, 768}));
}

TEST(GpuContext, FailedReconfigureIsRetriedOnAcquire) {
    GpuFixture f;
    f.init();
    f.fake->configure_fails = true;
    f.gpu.resize(1024, 768);
    EXPECT_EQ(f.fake->configure_calls, 1);

    f.fake->configure_fails = false;
    Result<FrameState> r = f.gpu.acquire_frame();
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(f.fake->configure_calls, 2);
    EXPECT_EQ(r.value.size, (Extent2D{1024, 768}));
}

TEST(GpuContext, ClampedDrawableSizeReachesTheFrame) {
    GpuFixture f;
    f.fake->max_dimension = 2048;
    f.init();

    f.gpu.resize(5120, 2880);
    EXPECT_EQ(f.fake->configured, (Extent2D{2048, 1152}));
    EXPECT_EQ(f.gpu.surface_size(), (Extent2D{2048, 1152}));
    EXPECT_EQ(f.gpu.surface_info().size, (Extent2D{2048, 1152}));
    EXPECT_EQ(f.gpu.requested_size(), (Extent2D{5120, 2880}));

    Result<FrameState> r = f.gpu.acquire_frame();
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.value.size, f.fake->configured);

    // the clamped size is not mistaken for a pending resize
    Result<FrameState> next = f.gpu.acquire_frame();
    ASSERT_TRUE(next.ok);
    EXPECT_EQ(f.fake->configure_calls, 1);
}

TEST(GpuContext, ClampedInitialDrawableIsReported) {
    GpuFixture f;
    f.fake->max_dimension = 2048;
    f.init(4096, 4096);

    EXPECT_EQ(f.gpu.surface_size(), (Extent2D{2048, 2048}));
    Result<FrameState> r = f.gpu.acquire_frame();
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.value.size, (Extent2D{2048, 2048}));
    EXPECT_EQ(f.fake->configure_calls, 0);
}

// --- Acquire ---

TEST(GpuContext, SurfaceLostReconfiguresAndRetriesOnce) {
    GpuFixture f;
    f.init();
    f.fake->acquire_script = { ErrorKind::SurfaceLost };

    Result<FrameState> r = f.gpu.acquire_frame();
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(f.fake->acquire_calls, 2);
    EXPECT_EQ(f.fake->configure_calls, 1);
    EXPECT_EQ(f.gpu.frames_skipped(), 0u);
}

TEST(GpuContext, SurfaceLostTwiceSkipsTheFrame) {
    GpuFixture f;
    f.init();
    f.fake->acquire_script = { ErrorKind::SurfaceLost, ErrorKind::SurfaceLost };

    Result<FrameState> r = f.gpu.acquire_frame();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err.kind, ErrorKind::SurfaceLost);
    EXPECT_EQ(f.fake->acquire_calls, 2);
    EXPECT_EQ(f.fake->configure_calls, 1);
    EXPECT_EQ(f.gpu.frames_skipped(), 1u);

    // the next frame starts with a reconfiguration
    Result<FrameState> next = f.gpu.acquire_frame();
    EXPECT_TRUE(next.ok);
    EXPECT_EQ(f.fake->configure_calls, 2);
}

TEST(GpuContext, TimeoutSkipsWithoutReconfigure) {
    GpuFixture f;
    f.init();
    f.fake->acquire_script = { ErrorKind::Timeout };

    Result<FrameState> r = f.gpu.acquire_frame();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err.kind, ErrorKind::Timeout);
    EXPECT_EQ(f.fake->acquire_calls, 1);
    EXPECT_EQ(f.fake->configure_calls, 0);
    EXPECT_EQ(f.gpu.frames_skipped(), 1u);
}

TEST(GpuContext, AcquireBeforeInitializeFails) {
    GpuFixture f;
    Result<FrameState> r = f.gpu.acquire_frame();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(f.fake->acquire_calls, 0);
}

TEST(GpuContext, FrameNumbersIncrease) {
    GpuFixture f;
    f.init();
    Result<FrameState> a = f.gpu.acquire_frame();
    Result<FrameState> b = f.gpu.acquire_frame();
    ASSERT_TRUE(a.ok);
    ASSERT_TRUE(b.ok);
    EXPECT_LT(a.value.frame_number, b.value.frame_number);
}

// --- Present / discard ---

TEST(GpuContext, OutdatedPresentMarksSurfaceForRebuild) {
    GpuFixture f;
    f.init();
    f.fake->present_outdated = true;

    Result<FrameState> r = f.gpu.acquire_frame();
    ASSERT_TRUE(r.ok);
    Status st = f.gpu.present(r.value);
    EXPECT_TRUE(st.ok);
    EXPECT_EQ(f.gpu.frames_presented(), 1u);
    EXPECT_EQ(f.fake->configure_calls, 0);

    f.fake->present_outdated = false;
    ASSERT_TRUE(f.gpu.acquire_frame().ok);
    EXPECT_EQ(f.fake->configure_calls, 1);
}

TEST(GpuContext, LostPresentCountsAsSkipped) {
    GpuFixture f;
    f.init();
    f.fake->present_script = { ErrorKind::SurfaceLost };

    Result<FrameState> r = f.gpu.acquire_frame();
    ASSERT_TRUE(r.ok);
    Status st = f.gpu.present(r.value);
    EXPECT_FALSE(st.ok);
    EXPECT_EQ(f.gpu.frames_presented(), 0u);
    EXPECT_EQ(f.gpu.frames_skipped(), 1u);

    ASSERT_TRUE(f.gpu.acquire_frame().ok);
    EXPECT_EQ(f.fake->configure_calls, 1);
}

TEST(GpuContext, DiscardCountsAsSkipped) {
    GpuFixture f;
    f.init();
    Result<FrameState> r = f.gpu.acquire_frame();
    ASSERT_TRUE(r.ok);
    f.gpu.discard_frame(r.value);
    EXPECT_EQ(f.fake->discard_calls, 1);
    EXPECT_EQ(f.fake->present_calls, 0);
    EXPECT_EQ(f.gpu.frames_skipped(), 1u);
}

// --- Shutdown ---

TEST(GpuContext, ShutdownReleasesOnce) {
    GpuFixture f;
    f.init();
    f.gpu.shutdown();
    f.gpu.shutdown();
    EXPECT_FALSE(f.gpu.initialized());
    EXPECT_EQ(f.fake->wait_idle_calls, 1);
    EXPECT_EQ(f.fake->shutdown_calls, 1);
}
