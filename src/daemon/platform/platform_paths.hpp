#pragma once

#include <string>

namespace platform {

std::string config_dir();
std::string ipc_endpoint();
std::string niri_socket();

} // namespace platform
