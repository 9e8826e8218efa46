#include "scene_math.hpp"

#include <glm/ext/matrix_clip_space.hpp>
#include <glm/ext/matrix_transform.hpp>

namespace {
constexpr float FOV_Y_DEG = 80.0f;
constexpr float Z_NEAR    = 0.1f;
constexpr float Z_FAR     = 1000.0f;
}

glm::mat4 scene_mvp(BackendProfile profile, const SceneUniforms& u)
{
    float aspect = u.aspect > 0.0f ? u.aspect : 1.0f;

    glm::mat4 proj;
    if (profile == BackendProfile::WebGL) {
        proj = glm::perspectiveLH_NO(glm::radians(FOV_Y_DEG), aspect, Z_NEAR, Z_FAR);
    } else {
        proj = glm::perspectiveLH_ZO(glm::radians(FOV_Y_DEG), aspect, Z_NEAR, Z_FAR);
    }
    if (profile == BackendProfile::Native) {
        // Vulkan NDC has Y pointing down
        proj[1][1] *= -1.0f;
    }

    glm::mat4 view = glm::lookAtLH(glm::vec3(0.0f, 0.0f, 3.0f),
                                   glm::vec3(0.0f, 0.0f, 0.0f),
                                   glm::vec3(0.0f, 1.0f, 0.0f));

    glm::mat4 model = glm::rotate(glm::mat4(1.0f), u.angle_radians,
                                  glm::vec3(0.0f, 1.0f, 0.0f));

    return proj * view * model;
}
