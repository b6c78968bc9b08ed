#pragma once

#include <string>

namespace platform {

// Empty when no home directory can be determined.
std::string config_dir();
std::string ipc_endpoint();

} // namespace platform
