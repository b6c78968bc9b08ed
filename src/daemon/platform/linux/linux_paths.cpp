#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/tabdock";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/tabdock";
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg) return std::string(xdg) + "/tabdock.sock";
    return "/tmp/tabdock.sock";
}

} // namespace platform
