#pragma once

#include "../audio_clip.hpp"
#include "provider_catalog.hpp"
#include "provider_error.hpp"

#include <expected>
#include <stop_token>
#include <string>
#include <string_view>

struct TranscriptResult {
    std::string text;
    double duration_s = 0.0;
    double processing_s = 0.0;
};

// Per-call settings, resolved from config by the registry for each session.
struct ProviderSettings {
    std::string api_key;
    std::string model;
    std::string language = "auto";
    std::string url;        // lan only
    std::string api_format; // lan only: "whisper.cpp" or "openai"
    long timeout_s = 20;
};

// One remote speech-to-text service. Implementations must report every
// failure as a classified ProviderError and should abort their transport
// promptly once stop is requested.
class ProviderClient {
public:
    virtual ~ProviderClient() = default;

    virtual ProviderKind kind() const = 0;

    virtual std::expected<TranscriptResult, ProviderError>
        transcribe(const AudioClip& audio, const ProviderSettings& settings,
                   std::stop_token stop) = 0;
};

// Strips surrounding whitespace from a transcript.
inline std::string trim_transcript(std::string_view text) {
    auto first = text.find_first_not_of(" \t\n\r");
    if (first == std::string_view::npos) return {};
    auto last = text.find_last_not_of(" \t\n\r");
    return std::string(text.substr(first, last - first + 1));
}
