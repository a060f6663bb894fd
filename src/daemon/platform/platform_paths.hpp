#pragma once

#include <string>

namespace platform {

// Per-user directories; empty when neither XDG nor HOME is set.
std::string config_dir();
std::string data_dir();

std::string ipc_endpoint();

} // namespace platform
