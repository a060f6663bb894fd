#pragma once

#include "http_transport.hpp"
#include "provider_client.hpp"
#include "provider_error.hpp"

#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>

// Shared response handling for the provider clients.
namespace response {

// Non-200 -> classified status error; unparseable body -> InvalidResponse.
std::expected<nlohmann::json, ProviderError> json_body(const HttpResponse& resp);

// Trims the transcript; blank text is EmptyTranscription.
std::expected<std::string, ProviderError> transcript(std::string_view raw);

ProviderError invalid(std::string message);

using RequestBuilder = HttpRequest (*)(const ProviderSettings&, std::span<const uint8_t>);
using ResponseParser = std::expected<std::string, ProviderError> (*)(const HttpResponse&);

// Encodes the clip as WAV, posts the request built for it and parses the reply.
// Credential checks are left to the caller.
std::expected<TranscriptResult, ProviderError>
    post_clip(const HttpTransport& http, const AudioClip& audio, const ProviderSettings& settings,
              std::stop_token stop, RequestBuilder build, ResponseParser parse);

} // namespace response
