#pragma once

#include "http_transport.hpp"
#include "provider_client.hpp"

// Groq's OpenAI-compatible Whisper endpoint.
class GroqClient : public ProviderClient {
public:
    static constexpr const char* default_endpoint =
        "https://api.groq.com/openai/v1/audio/transcriptions";

    ProviderKind kind() const override { return ProviderKind::Groq; }

    std::expected<TranscriptResult, ProviderError>
        transcribe(const AudioClip& audio, const ProviderSettings& settings,
                   std::stop_token stop) override;

    static HttpRequest build_request(const ProviderSettings& settings,
                                     std::span<const uint8_t> wav_data);
    static std::expected<std::string, ProviderError> parse_response(const HttpResponse& resp);

private:
    HttpTransport http_;
};
