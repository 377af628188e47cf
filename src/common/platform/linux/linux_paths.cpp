#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <print>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/nirius";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/nirius";
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (!xdg) std::println(stderr, "paths: XDG_RUNTIME_DIR not set, using /tmp");
    const char* display = std::getenv("WAYLAND_DISPLAY");
    if (!display) std::println(stderr, "paths: WAYLAND_DISPLAY not set");

    return std::string(xdg ? xdg : "/tmp") + "/nirius-" +
           (display ? display : "unknown") + ".sock";
}

std::string niri_socket() {
    const char* sock = std::getenv("NIRI_SOCKET");
    return sock ? sock : "";
}

} // namespace platform
