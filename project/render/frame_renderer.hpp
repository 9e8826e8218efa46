#pragma once
#include "gpu_context.hpp"
#include "../ui/gui_overlay.hpp"

// (t * w) mod 2pi in [0, 2pi), from absolute elapsed time.
f64 compute_rotation_angle(f64 elapsed_seconds, f64 angular_velocity);

struct FrameTime {
    f64 elapsed_seconds{0.0};
    f64 delta_seconds{0.0};
};

// Records one frame: scene uniforms, clear, triangle, GUI composite, end of pass.
class FrameRenderer {
public:
    explicit FrameRenderer(f64 angular_velocity);

    Status render(GpuContext& gpu, FrameState& frame, const FrameTime& time,
                  const GuiFrameOutput& gui);

    f64 angular_velocity() const { return angular_velocity_; }
    f64 last_angle() const       { return last_angle_; }

private:
    f64 angular_velocity_;
    f64 last_angle_{0.0};
};
