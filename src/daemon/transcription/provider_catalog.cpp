#include "provider_catalog.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace catalog {

namespace {

constexpr std::array<ProviderKind, 5> kinds = {
    ProviderKind::Lan, ProviderKind::Groq, ProviderKind::Deepgram,
    ProviderKind::ElevenLabs, ProviderKind::Sarvam,
};

constexpr std::array<std::string_view, 1> groq_models = {"whisper-large-v3"};
constexpr std::array<std::string_view, 3> deepgram_models = {"nova-3", "nova-2", "flux"};
constexpr std::array<std::string_view, 2> elevenlabs_models = {"scribe_v2", "scribe_v1"};
constexpr std::array<std::string_view, 2> sarvam_models = {"saaras:v3", "saaras:v2.5"};

constexpr std::array<std::string_view, 11> sarvam_languages = {
    "hi-IN", "bn-IN", "kn-IN", "ml-IN", "mr-IN", "od-IN",
    "pa-IN", "ta-IN", "te-IN", "gu-IN", "en-IN",
};

std::string lowercase(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_language_code(std::string_view s) {
    if (s.empty() || s.size() > 16) return false;
    return std::ranges::all_of(s, [](unsigned char c) { return std::isalnum(c) || c == '-'; });
}

} // namespace

std::span<const ProviderKind> all_providers() {
    return kinds;
}

std::string_view name(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::Lan: return "lan";
        case ProviderKind::Groq: return "groq";
        case ProviderKind::Deepgram: return "deepgram";
        case ProviderKind::ElevenLabs: return "elevenlabs";
        case ProviderKind::Sarvam: return "sarvam";
    }
    return "unknown";
}

std::string_view display_name(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::Lan: return "Local server";
        case ProviderKind::Groq: return "Groq";
        case ProviderKind::Deepgram: return "Deepgram";
        case ProviderKind::ElevenLabs: return "ElevenLabs";
        case ProviderKind::Sarvam: return "Sarvam AI";
    }
    return "Unknown";
}

std::optional<ProviderKind> parse(std::string_view value) {
    auto lower = lowercase(value);
    for (auto kind : kinds) {
        if (lower == name(kind)) return kind;
    }
    return std::nullopt;
}

std::string_view credential_env_var(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::Lan: return "";
        case ProviderKind::Groq: return "GROQ_API_KEY";
        case ProviderKind::Deepgram: return "DEEPGRAM_API_KEY";
        case ProviderKind::ElevenLabs: return "ELEVENLABS_API_KEY";
        case ProviderKind::Sarvam: return "SARVAM_API_KEY";
    }
    return "";
}

bool requires_credential(ProviderKind kind) {
    return kind != ProviderKind::Lan;
}

std::string_view default_model(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::Lan: return "whisper-1";
        case ProviderKind::Groq: return "whisper-large-v3";
        case ProviderKind::Deepgram: return "nova-3";
        case ProviderKind::ElevenLabs: return "scribe_v2";
        case ProviderKind::Sarvam: return "saaras:v3";
    }
    return "";
}

std::span<const std::string_view> model_options(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::Lan: return {};
        case ProviderKind::Groq: return groq_models;
        case ProviderKind::Deepgram: return deepgram_models;
        case ProviderKind::ElevenLabs: return elevenlabs_models;
        case ProviderKind::Sarvam: return sarvam_models;
    }
    return {};
}

std::string resolve_model(ProviderKind kind, std::string_view requested) {
    auto options = model_options(kind);
    if (options.empty()) {
        return requested.empty() ? std::string(default_model(kind)) : std::string(requested);
    }
    if (std::ranges::find(options, requested) != options.end()) {
        return std::string(requested);
    }
    return std::string(default_model(kind));
}

std::string api_model_id(ProviderKind kind, std::string_view model) {
    if (kind == ProviderKind::Deepgram && model == "flux") return "flux-general-en";
    return std::string(model);
}

std::string default_language(ProviderKind kind, std::string_view model) {
    if (kind == ProviderKind::Deepgram && model == "flux") return "en";
    return std::string(auto_language);
}

bool accepts_language(ProviderKind kind, std::string_view model, std::string_view language) {
    if (kind == ProviderKind::Deepgram && model == "flux") return language == "en";
    if (language == auto_language) return true;
    if (kind == ProviderKind::Sarvam) {
        return std::ranges::find(sarvam_languages, language) != sarvam_languages.end();
    }
    return is_language_code(language);
}

std::string resolve_language(ProviderKind kind, std::string_view model,
                             std::string_view requested) {
    if (!requested.empty() && accepts_language(kind, model, requested)) {
        return std::string(requested);
    }
    return default_language(kind, model);
}

} // namespace catalog
