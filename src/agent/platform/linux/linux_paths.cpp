#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

namespace {

constexpr const char* APP = "room-transcriber";

// XDG base directories must be absolute; empty or relative values are
// treated as unset.
const char* xdg_var(const char* name) {
    const char* v = std::getenv(name);
    return (v && v[0] == '/') ? v : nullptr;
}

std::string xdg_app_dir(const char* var, const char* home_relative) {
    if (const char* xdg = xdg_var(var)) return std::string(xdg) + "/" + APP;
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + "/" + home_relative + "/" + APP;
}

std::string runtime_dir() {
    const char* xdg = xdg_var("XDG_RUNTIME_DIR");
    return xdg ? std::string(xdg) : std::string("/tmp");
}

} // namespace

std::string config_dir() {
    return xdg_app_dir("XDG_CONFIG_HOME", ".config");
}

std::string data_dir() {
    return xdg_app_dir("XDG_DATA_HOME", ".local/share");
}

std::string bridge_endpoint() {
    return runtime_dir() + "/room-gateway.sock";
}

std::string status_endpoint() {
    return runtime_dir() + "/" + APP + ".sock";
}

} // namespace platform
