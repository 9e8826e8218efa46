#include "backend_factory.hpp"

#include <iostream>

#if defined(TRI_HARNESS_BACKEND_NATIVE)
#include "vulkan/vk_renderer.hpp"
#elif defined(TRI_HARNESS_BACKEND_WEBGPU)
#include "webgpu/wgpu_renderer.hpp"
#elif defined(TRI_HARNESS_BACKEND_WEBGL)
#include "webgl/gl_renderer.hpp"
#endif

std::unique_ptr<IRenderBackend> make_render_backend(BackendProfile profile)
{
    if (profile != compiled_backend_profile()) {
        std::cerr << "[GPU] backend " << backend_profile_name(profile)
                  << " is not compiled into this build\n";
        return nullptr;
    }
#if defined(TRI_HARNESS_BACKEND_NATIVE)
    return std::make_unique<VulkanRenderer>();
#elif defined(TRI_HARNESS_BACKEND_WEBGPU)
    return std::make_unique<WebGpuRenderer>();
#elif defined(TRI_HARNESS_BACKEND_WEBGL)
    return std::make_unique<WebGlRenderer>();
#else
    return nullptr;
#endif
}
