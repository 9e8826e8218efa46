#include "config.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>

#ifndef TRI_HARNESS_VSYNC
#define TRI_HARNESS_VSYNC 1
#endif

static std::string trim(const std::string& s)
{
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return {};
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

static bool parse_bool(const std::string& v, bool& out)
{
    if (v == "1" || v == "true"  || v == "on"  || v == "yes") { out = true;  return true; }
    if (v == "0" || v == "false" || v == "off" || v == "no")  { out = false; return true; }
    return false;
}

// Positive 32-bit values only.
static bool parse_positive_int(const std::string& v, i32& out)
{
    char* end = nullptr;
    errno = 0;
    long long n = std::strtoll(v.c_str(), &end, 10);
    if (end == v.c_str() || *end != '\0' || errno == ERANGE) return false;
    if (n < 1 || n > std::numeric_limits<i32>::max()) return false;
    out = static_cast<i32>(n);
    return true;
}

static bool parse_double(const std::string& v, f64& out)
{
    char* end = nullptr;
    double d = std::strtod(v.c_str(), &end);
    if (end == v.c_str() || *end != '\0') return false;
    out = d;
    return true;
}

AppCfg default_app_config()
{
    AppCfg cfg;
    cfg.backend      = compiled_backend_profile();
    cfg.render.vsync = TRI_HARNESS_VSYNC != 0;

    switch (cfg.backend) {
    case BackendProfile::Native: cfg.window.title = "tri_harness (Vulkan)"; break;
    case BackendProfile::WebGPU: cfg.window.title = "tri_harness (WebGPU)"; break;
    case BackendProfile::WebGL:  cfg.window.title = "tri_harness (WebGL)";  break;
    }

    // the browser drives frames through requestAnimationFrame
    cfg.render.continuous_redraw = cfg.backend == BackendProfile::Native;
    return cfg;
}

void apply_config_text(const std::string& text, AppCfg& cfg)
{
    std::istringstream in(text);
    std::string line;
    int line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            std::cerr << "[Config] line " << line_no << ": expected key = value\n";
            continue;
        }

        std::string key   = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        bool good = true;

        if (key == "width") {
            i32 v = 0;
            good = parse_positive_int(value, v);
            if (good) cfg.window.width = v;
        } else if (key == "height") {
            i32 v = 0;
            good = parse_positive_int(value, v);
            if (good) cfg.window.height = v;
        } else if (key == "title") {
            cfg.window.title = value;
        } else if (key == "vsync") {
            good = parse_bool(value, cfg.render.vsync);
        } else if (key == "angular_velocity") {
            good = parse_double(value, cfg.render.angular_velocity);
        } else if (key == "continuous_redraw") {
            good = parse_bool(value, cfg.render.continuous_redraw);
        } else if (key == "backend") {
            // build-time only
            std::cerr << "[Config] line " << line_no
                      << ": backend is fixed at build time ("
                      << backend_profile_name(cfg.backend) << "), ignoring\n";
            continue;
        } else {
            std::cerr << "[Config] line " << line_no << ": unknown key '" << key << "'\n";
            continue;
        }

        if (!good) {
            std::cerr << "[Config] line " << line_no << ": bad value '" << value
                      << "' for " << key << "\n";
        }
    }
}

AppCfg load_app_config(const std::string& path)
{
    AppCfg cfg = default_app_config();

    std::ifstream file(path);
    if (!file) {
        std::cout << "[Config] " << path << " not found, using defaults\n";
        return cfg;
    }

    std::stringstream ss;
    ss << file.rdbuf();
    apply_config_text(ss.str(), cfg);
    return cfg;
}
