#include "config.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"

#include <filesystem>
#include <print>
#include <string>

int main(int argc, char* argv[]) {
    bool foreground = false;
    bool verbose = false;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: voicerelayd [options]");
            std::println("Options:");
            std::println("  -f, --foreground    Run in foreground (don't daemonize)");
            std::println("  -v, --verbose       Enable verbose logging");
            std::println("  -c, --config PATH   Config file path");
            std::println("  -h, --help          Show this help");
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            return 1;
        }
    }

    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
        config_path = Config::default_path();
    }

    // The provider section is re-read from this path after the chdir below.
    if (!config_path.empty()) config_path = std::filesystem::absolute(config_path).string();

    if (!foreground) {
        if (auto res = platform::daemonize(); !res) {
            std::println(stderr, "Failed to daemonize: {}", res.error());
            return 1;
        }
    }

    if (verbose && foreground) {
        std::println(stderr, "[voicerelay] Starting (primary: {}, fallback: {}, timeout: {:.0f}s)",
                     config.providers.primary,
                     config.providers.fallback.empty() ? "none" : config.providers.fallback,
                     config.providers.timeout_seconds);
    }

    LinuxEventLoop loop(std::move(config), config_path, verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize event loop");
        return 1;
    }

    loop.run();
    return 0;
}
