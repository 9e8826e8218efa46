#pragma once
#include <glm/glm.hpp>

#include "../core/backend/backend_profile.hpp"
#include "i_render.hpp"

// Uniform block shared by all three pipelines (std140: one mat4).
struct SceneUbo {
    glm::mat4 mvp{1.0f};
};

// Camera at (0, 0, 3) looking at the origin, 80 deg vertical fov, triangle
// spun around +Y. Clip-space conventions differ per profile: Vulkan needs
// [0,1] depth and a flipped Y, WebGPU [0,1] depth, WebGL [-1,1] depth.
glm::mat4 scene_mvp(BackendProfile profile, const SceneUniforms& u);
