#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

void read_entry(const json& j, Config::ProviderEntry& e) {
    if (j.contains("api_key")) e.api_key = j["api_key"].get<std::string>();
    if (j.contains("api_key_env")) e.api_key_env = j["api_key_env"].get<std::string>();
    if (j.contains("model")) e.model = j["model"].get<std::string>();
    if (j.contains("language")) e.language = j["language"].get<std::string>();
    if (j.contains("url")) e.url = j["url"].get<std::string>();
    if (j.contains("api_format")) e.api_format = j["api_format"].get<std::string>();
}

} // namespace

const Config::ProviderEntry& Config::Providers::entry(const std::string& name) const {
    static const ProviderEntry defaults;
    auto it = entries.find(name);
    return it != entries.end() ? it->second : defaults;
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("providers")) {
            auto& p = j["providers"];
            if (p.contains("primary")) cfg.providers.primary = p["primary"].get<std::string>();
            if (p.contains("fallback")) cfg.providers.fallback = p["fallback"].get<std::string>();
            if (p.contains("timeout_seconds")) {
                cfg.providers.timeout_seconds = p["timeout_seconds"].get<double>();
            }
            for (auto& [key, value] : p.items()) {
                if (value.is_object()) read_entry(value, cfg.providers.entries[key]);
            }
        }

        if (j.contains("capture")) {
            auto& c = j["capture"];
            if (c.contains("sample_rate")) cfg.capture.sample_rate = c["sample_rate"].get<uint32_t>();
            if (c.contains("max_seconds")) cfg.capture.max_seconds = c["max_seconds"].get<uint32_t>();
            if (c.contains("min_seconds")) cfg.capture.min_seconds = c["min_seconds"].get<double>();
        }

        if (j.contains("output")) {
            auto& o = j["output"];
            if (o.contains("default")) cfg.output.default_method = o["default"].get<std::string>();
            if (o.contains("paste_keys")) cfg.output.paste_keys = o["paste_keys"].get<std::string>();
        }

        if (j.contains("history")) {
            auto& h = j["history"];
            if (h.contains("enabled")) cfg.history.enabled = h["enabled"].get<bool>();
            if (h.contains("retention_days")) {
                cfg.history.retention_days = h["retention_days"].get<int>();
            }
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    if (!(cfg.providers.timeout_seconds > 0)) {
        std::println(stderr, "config: providers.timeout_seconds must be positive, using 20");
        cfg.providers.timeout_seconds = 20.0;
    } else if (cfg.providers.timeout_seconds > max_timeout_seconds) {
        std::println(stderr, "config: providers.timeout_seconds capped at {:.0f}",
                     max_timeout_seconds);
        cfg.providers.timeout_seconds = max_timeout_seconds;
    }

    return cfg;
}

std::string Config::default_path() {
    auto dir = platform::config_dir();
    if (dir.empty()) return {};
    return (fs::path(dir) / "config.json").string();
}

Config Config::load_default() {
    auto config_path = default_path();
    if (!config_path.empty() && fs::exists(config_path)) {
        return load(config_path);
    }
    return Config{};
}
