#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

#include "../project/core/common/config.hpp"

TEST(Config, DefaultsMatchDemo) {
    AppCfg cfg = default_app_config();
    EXPECT_EQ(cfg.window.width, 1280);
    EXPECT_EQ(cfg.window.height, 720);
    EXPECT_EQ(cfg.window.canvas_selector, "#canvas");
    EXPECT_EQ(cfg.backend, BackendProfile::Native);
    EXPECT_NEAR(cfg.render.angular_velocity, 0.5235987756, 1e-10);
    EXPECT_FLOAT_EQ(cfg.render.clear_color[0], 0.19f);
    EXPECT_FLOAT_EQ(cfg.render.clear_color[1], 0.24f);
    EXPECT_FLOAT_EQ(cfg.render.clear_color[2], 0.42f);
    EXPECT_FLOAT_EQ(cfg.render.clear_color[3], 1.0f);
    EXPECT_TRUE(cfg.render.continuous_redraw);
}

TEST(Config, TextOverridesKnownKeys) {
    AppCfg cfg = default_app_config();
    apply_config_text("width = 640\n"
                      "height=480\n"
                      "title = my window \n"
                      "vsync = off\n"
                      "angular_velocity = 1.5\n"
                      "continuous_redraw = false\n", cfg);
    EXPECT_EQ(cfg.window.width, 640);
    EXPECT_EQ(cfg.window.height, 480);
    EXPECT_EQ(cfg.window.title, "my window");
    EXPECT_FALSE(cfg.render.vsync);
    EXPECT_DOUBLE_EQ(cfg.render.angular_velocity, 1.5);
    EXPECT_FALSE(cfg.render.continuous_redraw);
}

TEST(Config, CommentsAndBlankLinesAreSkipped) {
    AppCfg cfg = default_app_config();
    apply_config_text("# window\n\n   \nwidth = 300 # narrow\n", cfg);
    EXPECT_EQ(cfg.window.width, 300);
}

TEST(Config, BadValuesKeepPreviousSetting) {
    AppCfg cfg = default_app_config();
    bool vsync = cfg.render.vsync;
    apply_config_text("width = wide\n"
                      "height = -5\n"
                      "vsync = maybe\n"
                      "angular_velocity = 2x\n", cfg);
    EXPECT_EQ(cfg.window.width, 1280);
    EXPECT_EQ(cfg.window.height, 720);
    EXPECT_EQ(cfg.render.vsync, vsync);
    EXPECT_NEAR(cfg.render.angular_velocity, 0.5235987756, 1e-10);
}

TEST(Config, OutOfRangeSizesKeepPreviousSetting) {
    AppCfg cfg = default_app_config();
    apply_config_text("width = 99999999999\n"
                      "height = 2147483648\n", cfg);
    EXPECT_EQ(cfg.window.width, 1280);
    EXPECT_EQ(cfg.window.height, 720);

    apply_config_text("width = 999999999999999999999999\n"
                      "height = 0\n", cfg);
    EXPECT_EQ(cfg.window.width, 1280);
    EXPECT_EQ(cfg.window.height, 720);

    apply_config_text("width = 2147483647\n", cfg);
    EXPECT_EQ(cfg.window.width, 2147483647);
}

TEST(Config, UnknownKeysAndBackendAreIgnored) {
    AppCfg cfg = default_app_config();
    apply_config_text("colour = red\n"
                      "backend = WebGL\n"
                      "no equals sign here\n", cfg);
    EXPECT_EQ(cfg.backend, BackendProfile::Native);
    EXPECT_EQ(cfg.window.width, 1280);
}

TEST(Config, MissingFileYieldsDefaults) {
    AppCfg cfg = load_app_config(testing::TempDir() + "does_not_exist.cfg");
    EXPECT_EQ(cfg.window.width, 1280);
    EXPECT_EQ(cfg.window.height, 720);
}

TEST(Config, LoadsFromFile) {
    std::string path = testing::TempDir() + "tri_harness_test.cfg";
    {
        std::ofstream out(path);
        ASSERT_TRUE(out.good());
        out << "width = 1024\nvsync = on\n";
    }
    AppCfg cfg = load_app_config(path);
    EXPECT_EQ(cfg.window.width, 1024);
    EXPECT_TRUE(cfg.render.vsync);
    std::remove(path.c_str());
}
