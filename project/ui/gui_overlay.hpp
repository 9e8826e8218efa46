// ui/gui_overlay.hpp
#pragma once
#include "../core/backend/backend_profile.hpp"
#include "../core/common/types.hpp"
#include "../input/input_event.hpp"

struct ImDrawData;

struct FrameStats {
  u64 frames_presented{0};
  u64 frames_skipped{0};
  u64 reconfigurations{0};
  f64 angle_radians{0.0};
  f64 fps{0.0};
};

struct GuiFrameContext {
  Extent2D       size{};
  f32            pixels_per_point{1.0f};
  f64            delta_seconds{0.0};
  BackendProfile profile{BackendProfile::Native};
  FrameStats     stats{};
};

// One frame of GUI draw data. `draw_data` stays owned by the GUI library and
// is valid until the next build_frame().
struct GuiFrameOutput {
  ImDrawData* draw_data{nullptr};
  u32 command_lists{0};
  u32 vertex_count{0};
  u32 index_count{0};

  bool empty() const { return draw_data == nullptr || command_lists == 0; }
};

class IGuiOverlay {
public:
  virtual ~IGuiOverlay() = default;

  // Returns true when the GUI captures the event.
  virtual bool handle_input(const InputEvent& ev) = 0;

  virtual GuiFrameOutput build_frame(const GuiFrameContext& ctx) = 0;
};
