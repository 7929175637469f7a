#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/fortis";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/fortis";
}

std::string data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/fortis";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.local/share/fortis";
}

std::string log_path() {
    auto dir = data_dir();
    if (dir.empty()) return "/tmp/fortis.log";
    return dir + "/fortis.log";
}

} // namespace platform
