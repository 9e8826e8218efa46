// core/backend/backend_profile.hpp
#pragma once
#include <vector>

#include "../common/result.hpp"
#include "../common/types.hpp"

enum class BackendProfile { Native, WebGPU, WebGL };

enum class PresentMode { Fifo, FifoRelaxed, Mailbox, Immediate };

// Limits and features the GPU session is allowed to rely on.
struct BackendCaps {
    u32  max_texture_dimension_2d{8192};
    std::vector<PresentMode> present_modes;
    bool storage_buffers{true};
    bool compute{true};
    bool prefer_srgb_surface{false};
};

// Exactly one of TRI_HARNESS_BACKEND_{NATIVE,WEBGPU,WEBGL} is defined by the build.
BackendProfile compiled_backend_profile();

BackendCaps backend_caps(BackendProfile profile);

// Fails with BackendUnavailable when the running environment cannot host the
// profile. There is no fallback to another profile.
Status check_runtime_support(BackendProfile profile);

// vsync on  -> Fifo
// vsync off -> Mailbox, Immediate, FifoRelaxed in that order
// otherwise the first supported mode; Fifo when nothing is reported.
PresentMode choose_present_mode(bool vsync, const std::vector<PresentMode>& supported);

// Scales both axes by one factor so neither exceeds max_dim; the aspect
// ratio is kept and each axis stays at least 1.
Extent2D fit_to_max_dimension(Extent2D size, u32 max_dim);

const char* backend_profile_name(BackendProfile profile);
const char* present_mode_name(PresentMode mode);
