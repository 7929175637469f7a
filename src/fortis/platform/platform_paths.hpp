#pragma once

#include <string>

namespace platform {

// Empty string when no home directory can be determined.
std::string config_dir();
std::string data_dir();
std::string log_path();

} // namespace platform
