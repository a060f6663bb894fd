#pragma once

#include <expected>
#include <string>

namespace platform {

// Detaches from the terminal: double fork, new session, working directory "/",
// private umask, stdio to /dev/null. Only the original process sees an error.
std::expected<void, std::string> daemonize();

} // namespace platform
