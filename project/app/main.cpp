#include <GLFW/glfw3.h>

#include <cstring>
#include <iostream>
#include <memory>
#include <string>

#if defined(__EMSCRIPTEN__)
#include <emscripten/emscripten.h>
#endif

#include "run_loop.hpp"
#include "../core/backend/backend_profile.hpp"
#include "../core/common/clock.hpp"
#include "../core/common/config.hpp"
#include "../input/window.hpp"
#include "../render/backend_factory.hpp"
#include "../render/frame_renderer.hpp"
#include "../render/gpu_context.hpp"
#include "../ui/ui_panel.hpp"

#if defined(__EMSCRIPTEN__)
struct WebApp {
    RunLoop* loop;
    Window*  window;
};

// one requestAnimationFrame callback == one redraw request
static void web_tick(void* arg)
{
    auto* app = static_cast<WebApp*>(arg);
    app->loop->post(PlatformEvent::redraw());
    if (!app->loop->step(*app->window)) {
        emscripten_cancel_main_loop();
        app->window->destroy();
        glfwTerminate();
    }
}
#endif

static AppCfg parse_args(int argc, char** argv)
{
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "[Config] --config needs a path, using defaults\n";
                break;
            }
            return load_app_config(argv[i + 1]);
        }
        std::cerr << "[Config] ignoring unknown argument " << argv[i] << "\n";
    }
    return default_app_config();
}

int main(int argc, char** argv)
{
    AppCfg cfg = parse_args(argc, argv);

    Status support = check_runtime_support(cfg.backend);
    if (!support.ok) {
        std::cerr << "[GPU] " << backend_profile_name(cfg.backend) << " unavailable: "
                  << support.err.message << "\n";
        return 1;
    }

    // initiliza GLFW
    auto glfw_error_callback = [](int error, const char* description) {
        std::cerr << "[GLFW ERROR] (" << error << "): "
                  << (description ? description : "unknown") << "\n";
    };
    glfwSetErrorCallback(glfw_error_callback);

    if (!glfwInit()) {
        const char* desc = nullptr;
        int code = glfwGetError(&desc);
        std::cerr << "Failed to init GLFW, code = " << code
                  << ", msg = " << (desc ? desc : "unknown") << "\n";
        return 1;
    }

#if !defined(__EMSCRIPTEN__)
    if (!glfwVulkanSupported()) {
        std::cerr << "[GPU] Native unavailable: no Vulkan loader or ICD found\n";
        glfwTerminate();
        return 1;
    }
#endif

    Window window;
    if (!window.create(cfg.window)) {
        glfwTerminate();
        return 1;
    }

    std::unique_ptr<IRenderBackend> backend = make_render_backend(cfg.backend);
    if (!backend) {
        window.destroy();
        glfwTerminate();
        return 1;
    }

    int exit_code = 0;

    // overlay outlives the GPU context: the ImGui renderer backends live
    // inside the GPU backend and need the ImGui context until shutdown
    {
        ui::ImGuiOverlay overlay;
        GpuContext       gpu(std::move(backend));
        FrameRenderer    renderer(cfg.render.angular_velocity);
        SteadyClock      clock;

        RunLoopOptions options;
        options.surface.vsync = cfg.render.vsync;
        options.surface.caps  = backend_caps(cfg.backend);
        for (int i = 0; i < 4; ++i) options.surface.clear_color[i] = cfg.render.clear_color[i];
        options.continuous_redraw = cfg.render.continuous_redraw;

        RunLoop loop(gpu, renderer, overlay, clock, options);

        std::cout << "[Loop] " << cfg.window.title << " starting, "
                  << (cfg.render.vsync ? "vsync on" : "vsync off") << "\n";

#if defined(__EMSCRIPTEN__)
        // device requests suspend the program, run them outside the rAF callback
        if (!loop.step(window)) {
            window.destroy();
            glfwTerminate();
            return loop.exit_code();
        }
        static WebApp app{ &loop, &window };
        emscripten_set_main_loop_arg(web_tick, &app, 0, true);
#else
        exit_code = loop.run(window);
#endif
    }

    // destroy windows/GLFW
    window.destroy();
    glfwTerminate();

    return exit_code;
}
