#pragma once
#include <memory>

#include "i_render.hpp"

// Creates the backend compiled into this build. Returns nullptr when the
// requested profile was not compiled in.
std::unique_ptr<IRenderBackend> make_render_backend(BackendProfile profile);
