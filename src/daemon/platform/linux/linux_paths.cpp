#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/nsticky";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/nsticky";
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg) return std::string(xdg) + "/nsticky.sock";
    return "/tmp/niri_sticky_cli.sock";
}

std::string niri_socket() {
    const char* sock = std::getenv("NIRI_SOCKET");
    return sock ? std::string(sock) : std::string{};
}

} // namespace platform
