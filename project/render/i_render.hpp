#pragma once
#include <string>

#include "../core/backend/backend_profile.hpp"
#include "../core/common/result.hpp"
#include "../core/common/types.hpp"
#include "../input/input_event.hpp"

struct GuiFrameOutput;

struct SurfaceRequest {
  Extent2D    size{};
  bool        vsync{true};
  BackendCaps caps{};
  f32         clear_color[4]{0.19f, 0.24f, 0.42f, 1.0f};
};

struct SurfaceInfo {
  Extent2D    size{};
  PresentMode present_mode{PresentMode::Fifo};
  std::string format{};
  std::string adapter{};
};

// Transient per-frame state. Backend resources (command buffer, texture view)
// stay inside the backend and are keyed by `slot` / `image_index`.
struct FrameState {
  u64      frame_number{0};
  u32      image_index{0};
  u32      slot{0};
  Extent2D size{};
  f64      elapsed_seconds{0.0};
  bool     pass_open{false};
  bool     surface_outdated{false}; // set by present when the swapchain wants a rebuild
};

struct SceneUniforms {
  f32 angle_radians{0.0f};
  f32 aspect{1.0f};
};

// One implementation per Backend Profile, picked once at startup.
class IRenderBackend {
public:
  virtual ~IRenderBackend() = default;

  virtual BackendProfile profile() const = 0;

  virtual Result<SurfaceInfo> initialize(const NativeSurfaceHandle& target,
                                         const SurfaceRequest& request) = 0;
  // Returns the drawable size actually applied, which may be smaller than
  // the request when the backend clamps to its limits.
  virtual Result<Extent2D> configure_surface(Extent2D size) = 0;
  virtual Result<FrameState> acquire_frame() = 0;

  virtual Status begin_scene_pass(FrameState& frame, const SceneUniforms& uniforms) = 0;
  virtual Status draw_gui(FrameState& frame, const GuiFrameOutput& gui) = 0;
  virtual Status end_scene_pass(FrameState& frame) = 0;

  // SurfaceLost from present/discard means "reconfigure before the next acquire".
  virtual Status present(FrameState& frame) = 0;
  virtual Status discard_frame(FrameState& frame) = 0;

  // GUI renderer hook, called before the overlay starts a frame.
  virtual void gui_new_frame() = 0;

  virtual void wait_idle() = 0;
  virtual void shutdown() = 0;
};
