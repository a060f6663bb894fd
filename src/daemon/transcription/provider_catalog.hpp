#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

enum class ProviderKind { Lan, Groq, Deepgram, ElevenLabs, Sarvam };

// Static facts about each remote speech-to-text service.
namespace catalog {

inline constexpr std::string_view auto_language = "auto";

std::span<const ProviderKind> all_providers();

// Config/wire name: "lan", "groq", "deepgram", "elevenlabs", "sarvam".
std::string_view name(ProviderKind kind);
std::string_view display_name(ProviderKind kind);
std::optional<ProviderKind> parse(std::string_view name);

// Conventional environment variable holding the API key; empty for lan.
std::string_view credential_env_var(ProviderKind kind);
bool requires_credential(ProviderKind kind);

std::string_view default_model(ProviderKind kind);
// Empty span: any model name is accepted (lan).
std::span<const std::string_view> model_options(ProviderKind kind);
std::string resolve_model(ProviderKind kind, std::string_view requested);
// Name sent on the wire, which can differ from the user-facing id.
std::string api_model_id(ProviderKind kind, std::string_view model);

std::string default_language(ProviderKind kind, std::string_view model);
bool accepts_language(ProviderKind kind, std::string_view model, std::string_view language);
std::string resolve_language(ProviderKind kind, std::string_view model,
                             std::string_view requested);

} // namespace catalog
