#pragma once

#include <cstdint>
#include <map>
#include <string>

struct Config {
    static constexpr double max_timeout_seconds = 600.0;

    struct ProviderEntry {
        std::string api_key;
        std::string api_key_env; // overrides the provider's conventional variable
        std::string model;
        std::string language = "auto";
        std::string url;
        std::string api_format = "whisper.cpp"; // lan: "whisper.cpp" or "openai"
    };

    struct Providers {
        std::string primary = "groq";
        std::string fallback; // empty = no fallback
        double timeout_seconds = 20.0; // per attempt, at most max_timeout_seconds
        std::map<std::string, ProviderEntry> entries; // keyed by provider name

        const ProviderEntry& entry(const std::string& name) const;
    } providers;

    struct Capture {
        uint32_t sample_rate = 16000;
        uint32_t max_seconds = 120;
        double min_seconds = 0.5;

        // Computed from max_seconds and sample_rate (no independent config key).
        size_t ring_buffer_samples() const {
            return static_cast<size_t>(max_seconds) * sample_rate;
        }
    } capture;

    struct Output {
        std::string default_method = "clipboard"; // "clipboard" or "paste"
        std::string paste_keys = "ctrl+v";
    } output;

    struct History {
        bool enabled = true;
        int retention_days = 30;
    } history;

    static Config load(const std::string& path);
    static Config load_default();
    // Path load_default() reads; empty when no config dir can be determined.
    static std::string default_path();
};
