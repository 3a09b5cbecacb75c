#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

namespace {

constexpr const char* APP_DIR = "/handsfree";

// An empty XDG variable counts as unset.
std::string xdg_dir(const char* var, const char* home_fallback) {
    const char* xdg = std::getenv(var);
    if (xdg && *xdg) return std::string(xdg) + APP_DIR;
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + home_fallback + APP_DIR;
}

} // namespace

std::string config_dir() {
    return xdg_dir("XDG_CONFIG_HOME", "/.config");
}

std::string data_dir() {
    return xdg_dir("XDG_DATA_HOME", "/.local/share");
}

} // namespace platform
