#pragma once
#include <string>

#include "types.hpp"
#include "../backend/backend_profile.hpp"

struct WindowCfg {
  i32 width{1280}, height{720};
  std::string title{"tri_harness"};
  std::string canvas_selector{"#canvas"};
};

struct RenderCfg {
  bool vsync{true};
  f64  angular_velocity{0.5235987755982988}; // 30 deg/s
  f32  clear_color[4]{0.19f, 0.24f, 0.42f, 1.0f};
  bool continuous_redraw{true};
};

struct AppCfg {
  WindowCfg window;
  RenderCfg render;
  BackendProfile backend{BackendProfile::Native};
};

// Defaults with the build-time options applied (backend, vsync).
AppCfg default_app_config();

// key = value overrides on top of default_app_config(). A missing file keeps
// the defaults; unknown keys and bad values are reported and skipped.
AppCfg load_app_config(const std::string& path);

// Same parser over an in-memory string, applied onto `cfg`.
void apply_config_text(const std::string& text, AppCfg& cfg);
