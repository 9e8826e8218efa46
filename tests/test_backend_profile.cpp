#include <gtest/gtest.h>

#include <string>

#include "../project/core/backend/backend_profile.hpp"

// --- Profile selection ---

TEST(BackendProfile, HostBuildCompilesNative) {
    EXPECT_EQ(compiled_backend_profile(), BackendProfile::Native);
    EXPECT_STREQ(backend_profile_name(compiled_backend_profile()), "Native");
}

TEST(BackendProfile, RuntimeSupportHasNoFallback) {
    EXPECT_TRUE(check_runtime_support(BackendProfile::Native).ok);

    Status web = check_runtime_support(BackendProfile::WebGPU);
    EXPECT_FALSE(web.ok);
    EXPECT_EQ(web.err.kind, ErrorKind::BackendUnavailable);
    EXPECT_NE(web.err.message.find("WebGPU"), std::string::npos);

    Status gl = check_runtime_support(BackendProfile::WebGL);
    EXPECT_FALSE(gl.ok);
    EXPECT_EQ(gl.err.kind, ErrorKind::BackendUnavailable);
}

// --- Capabilities ---

TEST(BackendCaps, WebGlUsesDownlevelLimits) {
    BackendCaps caps = backend_caps(BackendProfile::WebGL);
    EXPECT_EQ(caps.max_texture_dimension_2d, 2048u);
    EXPECT_FALSE(caps.storage_buffers);
    EXPECT_FALSE(caps.compute);
}

TEST(BackendCaps, NativeAndWebGpuShareTextureLimit) {
    EXPECT_EQ(backend_caps(BackendProfile::Native).max_texture_dimension_2d, 8192u);
    EXPECT_EQ(backend_caps(BackendProfile::WebGPU).max_texture_dimension_2d, 8192u);
}

TEST(BackendCaps, BrowsersOnlyExposeFifo) {
    BackendCaps caps = backend_caps(BackendProfile::WebGPU);
    ASSERT_EQ(caps.present_modes.size(), 1u);
    EXPECT_EQ(caps.present_modes[0], PresentMode::Fifo);
}

TEST(BackendCaps, NoProfilePrefersSrgbSurface) {
    EXPECT_FALSE(backend_caps(BackendProfile::Native).prefer_srgb_surface);
    EXPECT_FALSE(backend_caps(BackendProfile::WebGPU).prefer_srgb_surface);
    EXPECT_FALSE(backend_caps(BackendProfile::WebGL).prefer_srgb_surface);
}

// --- Present mode policy ---

TEST(PresentModePolicy, VsyncPicksFifo) {
    std::vector<PresentMode> all = { PresentMode::Immediate, PresentMode::Mailbox,
                                     PresentMode::Fifo, PresentMode::FifoRelaxed };
    EXPECT_EQ(choose_present_mode(true, all), PresentMode::Fifo);
}

TEST(PresentModePolicy, NoVsyncPrefersMailboxThenImmediateThenRelaxed) {
    EXPECT_EQ(choose_present_mode(false, { PresentMode::Fifo, PresentMode::Immediate, PresentMode::Mailbox }),
              PresentMode::Mailbox);
    EXPECT_EQ(choose_present_mode(false, { PresentMode::FifoRelaxed, PresentMode::Immediate }),
              PresentMode::Immediate);
    EXPECT_EQ(choose_present_mode(false, { PresentMode::Fifo, PresentMode::FifoRelaxed }),
              PresentMode::FifoRelaxed);
}

TEST(PresentModePolicy, FallsBackToFirstSupported) {
    EXPECT_EQ(choose_present_mode(false, { PresentMode::Fifo }), PresentMode::Fifo);
    EXPECT_EQ(choose_present_mode(true, { PresentMode::Mailbox, PresentMode::Immediate }),
              PresentMode::Mailbox);
}

TEST(PresentModePolicy, EmptyListYieldsFifo) {
    EXPECT_EQ(choose_present_mode(true, {}), PresentMode::Fifo);
    EXPECT_EQ(choose_present_mode(false, {}), PresentMode::Fifo);
}

TEST(PresentModePolicy, NamesAreStable) {
    EXPECT_STREQ(present_mode_name(PresentMode::Mailbox), "Mailbox");
    EXPECT_STREQ(present_mode_name(PresentMode::FifoRelaxed), "FifoRelaxed");
}

// --- Drawable limits ---

TEST(DrawableLimits, SizeWithinLimitIsUnchanged) {
    EXPECT_EQ(fit_to_max_dimension({1920, 1080}, 2048), (Extent2D{1920, 1080}));
    EXPECT_EQ(fit_to_max_dimension({2048, 2048}, 2048), (Extent2D{2048, 2048}));
}

TEST(DrawableLimits, OversizedDrawableKeepsAspectRatio) {
    EXPECT_EQ(fit_to_max_dimension({5120, 2880}, 2048), (Extent2D{2048, 1152}));
    EXPECT_EQ(fit_to_max_dimension({1000, 4000}, 2048), (Extent2D{512, 2048}));
}

TEST(DrawableLimits, ThinDrawableKeepsOnePixel) {
    EXPECT_EQ(fit_to_max_dimension({100000, 1}, 2048), (Extent2D{2048, 1}));
}

// --- Error classification ---

TEST(ErrorKinds, InitializationAndFrameErrorsAreDisjoint) {
    EXPECT_TRUE(is_initialization_error(ErrorKind::NoSuitableAdapter));
    EXPECT_TRUE(is_initialization_error(ErrorKind::SurfaceConfigurationError));
    EXPECT_FALSE(is_initialization_error(ErrorKind::SurfaceLost));
    EXPECT_TRUE(is_transient_frame_error(ErrorKind::Timeout));
    EXPECT_FALSE(is_transient_frame_error(ErrorKind::BackendUnavailable));
    EXPECT_FALSE(is_initialization_error(ErrorKind::ResizeDegenerate));
    EXPECT_FALSE(is_transient_frame_error(ErrorKind::ResizeDegenerate));
}
