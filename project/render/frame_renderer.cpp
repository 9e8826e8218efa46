#include "frame_renderer.hpp"

#include <cmath>
#include <iostream>

namespace {
constexpr f64 TWO_PI = 6.283185307179586;
}

f64 compute_rotation_angle(f64 elapsed_seconds, f64 angular_velocity)
{
    f64 a = std::fmod(elapsed_seconds * angular_velocity, TWO_PI);
    if (a < 0.0) a += TWO_PI;
    // fmod can land on exactly 2pi after the correction above
    if (a >= TWO_PI) a = 0.0;
    return a;
}

FrameRenderer::FrameRenderer(f64 angular_velocity)
    : angular_velocity_(angular_velocity)
{
}

Status FrameRenderer::render(GpuContext& gpu, FrameState& frame, const FrameTime& time,
                             const GuiFrameOutput& gui)
{
    frame.elapsed_seconds = time.elapsed_seconds;
    last_angle_ = compute_rotation_angle(time.elapsed_seconds, angular_velocity_);

    SceneUniforms uniforms;
    uniforms.angle_radians = static_cast<f32>(last_angle_);
    uniforms.aspect = frame.size.height > 0
        ? static_cast<f32>(frame.size.width) / static_cast<f32>(frame.size.height)
        : 1.0f;

    IRenderBackend& backend = gpu.backend();

    Status st = backend.begin_scene_pass(frame, uniforms);
    if (!st.ok) return st;

    if (!gui.empty()) {
        st = backend.draw_gui(frame, gui);
        if (!st.ok) {
            // close the pass so the frame can still be discarded cleanly
            Status end = backend.end_scene_pass(frame);
            if (!end.ok) {
                std::cerr << "[GPU] end of pass after GUI failure: " << end.err.message << "\n";
            }
            return st;
        }
    }

    return backend.end_scene_pass(frame);
}
