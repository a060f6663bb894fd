#pragma once

#include "http_transport.hpp"
#include "provider_client.hpp"

// Self-hosted server: whisper.cpp "/inference" or an OpenAI-compatible
// "/v1/audio/transcriptions" endpoint, selected by settings.api_format.
class LanClient : public ProviderClient {
public:
    ProviderKind kind() const override { return ProviderKind::Lan; }

    std::expected<TranscriptResult, ProviderError>
        transcribe(const AudioClip& audio, const ProviderSettings& settings,
                   std::stop_token stop) override;

    static HttpRequest build_request(const ProviderSettings& settings,
                                     std::span<const uint8_t> wav_data);
    static std::expected<std::string, ProviderError> parse_response(const HttpResponse& resp);

private:
    HttpTransport http_;
};
