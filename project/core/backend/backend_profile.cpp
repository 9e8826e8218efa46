// core/backend/backend_profile.cpp
#include "backend_profile.hpp"

#include <algorithm>

#if defined(__EMSCRIPTEN__)
#include <emscripten/emscripten.h>
#endif

#if (defined(TRI_HARNESS_BACKEND_NATIVE) + defined(TRI_HARNESS_BACKEND_WEBGPU) + defined(TRI_HARNESS_BACKEND_WEBGL)) != 1
#error "exactly one TRI_HARNESS_BACKEND_* must be defined"
#endif

BackendProfile compiled_backend_profile()
{
#if defined(TRI_HARNESS_BACKEND_WEBGPU)
    return BackendProfile::WebGPU;
#elif defined(TRI_HARNESS_BACKEND_WEBGL)
    return BackendProfile::WebGL;
#else
    return BackendProfile::Native;
#endif
}

BackendCaps backend_caps(BackendProfile profile)
{
    BackendCaps caps{};
    switch (profile) {
    case BackendProfile::Native:
        caps.max_texture_dimension_2d = 8192;
        caps.present_modes = { PresentMode::Fifo, PresentMode::FifoRelaxed,
                               PresentMode::Mailbox, PresentMode::Immediate };
        caps.storage_buffers = true;
        caps.compute         = true;
        break;

    case BackendProfile::WebGPU:
        // the browser owns presentation, only fifo is exposed
        caps.max_texture_dimension_2d = 8192;
        caps.present_modes   = { PresentMode::Fifo };
        caps.storage_buffers = true;
        caps.compute         = true;
        break;

    case BackendProfile::WebGL:
        // WebGL2 downlevel limits
        caps.max_texture_dimension_2d = 2048;
        caps.present_modes   = { PresentMode::Fifo };
        caps.storage_buffers = false;
        caps.compute         = false;
        break;
    }
    caps.prefer_srgb_surface = false;
    return caps;
}

Status check_runtime_support(BackendProfile profile)
{
#if defined(__EMSCRIPTEN__)
    if (profile == BackendProfile::Native) {
        return Status::failure(ErrorKind::BackendUnavailable,
                               "native backend cannot run inside a browser");
    }
    if (profile == BackendProfile::WebGPU) {
        int has_gpu = EM_ASM_INT({ return (typeof navigator !== 'undefined' && !!navigator.gpu) ? 1 : 0; });
        if (!has_gpu) {
            return Status::failure(ErrorKind::BackendUnavailable,
                                   "WebGPU selected but navigator.gpu is not available in this browser");
        }
    }
    if (profile == BackendProfile::WebGL) {
        int has_webgl2 = EM_ASM_INT({
            try {
                var c = document.createElement('canvas');
                return c.getContext('webgl2') ? 1 : 0;
            } catch (e) {
                return 0;
            }
        });
        if (!has_webgl2) {
            return Status::failure(ErrorKind::BackendUnavailable,
                                   "WebGL selected but this browser cannot create a WebGL2 context");
        }
    }
    return Status::success();
#else
    if (profile != BackendProfile::Native) {
        return Status::failure(ErrorKind::BackendUnavailable,
                               std::string(backend_profile_name(profile)) +
                               " backend requires a browser build");
    }
    return Status::success();
#endif
}

PresentMode choose_present_mode(bool vsync, const std::vector<PresentMode>& supported)
{
    auto has = [&](PresentMode m) {
        return std::find(supported.begin(), supported.end(), m) != supported.end();
    };

    if (vsync) {
        if (has(PresentMode::Fifo)) return PresentMode::Fifo;
    } else {
        const PresentMode preferred[] = { PresentMode::Mailbox,
                                          PresentMode::Immediate,
                                          PresentMode::FifoRelaxed };
        for (PresentMode m : preferred) {
            if (has(m)) return m;
        }
    }

    if (!supported.empty()) return supported.front();
    return PresentMode::Fifo;
}

Extent2D fit_to_max_dimension(Extent2D size, u32 max_dim)
{
    u32 longest = std::max(size.width, size.height);
    if (max_dim == 0 || longest <= max_dim) return size;

    // integer math, rounded down, so the long axis lands exactly on max_dim
    auto scale = [&](u32 v) {
        u64 s = static_cast<u64>(v) * max_dim / longest;
        return static_cast<u32>(std::max<u64>(s, 1));
    };
    return {scale(size.width), scale(size.height)};
}

const char* backend_profile_name(BackendProfile profile)
{
    switch (profile) {
    case BackendProfile::Native: return "Native";
    case BackendProfile::WebGPU: return "WebGPU";
    case BackendProfile::WebGL:  return "WebGL";
    }
    return "Unknown";
}

const char* present_mode_name(PresentMode mode)
{
    switch (mode) {
    case PresentMode::Fifo:        return "Fifo";
    case PresentMode::FifoRelaxed: return "FifoRelaxed";
    case PresentMode::Mailbox:     return "Mailbox";
    case PresentMode::Immediate:   return "Immediate";
    }
    return "Unknown";
}
