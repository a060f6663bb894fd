#pragma once

#include "http_transport.hpp"
#include "provider_client.hpp"

class ElevenLabsClient : public ProviderClient {
public:
    static constexpr const char* default_endpoint = "https://api.elevenlabs.io/v1/speech-to-text";

    ProviderKind kind() const override { return ProviderKind::ElevenLabs; }

    std::expected<TranscriptResult, ProviderError>
        transcribe(const AudioClip& audio, const ProviderSettings& settings,
                   std::stop_token stop) override;

    static HttpRequest build_request(const ProviderSettings& settings,
                                     std::span<const uint8_t> wav_data);
    // Prefers "text"; older responses only carry "words".
    static std::expected<std::string, ProviderError> parse_response(const HttpResponse& resp);

private:
    HttpTransport http_;
};
