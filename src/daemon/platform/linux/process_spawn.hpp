#pragma once

#include <expected>
#include <string>
#include <vector>

namespace platform {

// Runs argv[0] from PATH, optionally feeding stdin_text, and waits for it.
// Fails on spawn errors and non-zero exit status.
std::expected<void, std::string> run_process(const std::vector<std::string>& argv,
                                             const std::string* stdin_text = nullptr);

} // namespace platform
