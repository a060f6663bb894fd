#pragma once

#include "http_transport.hpp"
#include "provider_client.hpp"

// Deepgram pre-recorded /v1/listen; the WAV is the raw request body.
class DeepgramClient : public ProviderClient {
public:
    static constexpr const char* default_endpoint = "https://api.deepgram.com/v1/listen";

    ProviderKind kind() const override { return ProviderKind::Deepgram; }

    std::expected<TranscriptResult, ProviderError>
        transcribe(const AudioClip& audio, const ProviderSettings& settings,
                   std::stop_token stop) override;

    static HttpRequest build_request(const ProviderSettings& settings,
                                     std::span<const uint8_t> wav_data);
    static std::expected<std::string, ProviderError> parse_response(const HttpResponse& resp);

private:
    HttpTransport http_;
};
