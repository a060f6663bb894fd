#include "response_utils.hpp"

#include "../wav_encoder.hpp"

namespace response {

std::expected<nlohmann::json, ProviderError> json_body(const HttpResponse& resp) {
    if (resp.status != 200) {
        return std::unexpected(
            ProviderError::from_http_status(static_cast<int>(resp.status), resp.body));
    }
    try {
        return nlohmann::json::parse(resp.body);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(invalid(std::string("JSON parse error: ") + e.what()));
    }
}

std::expected<std::string, ProviderError> transcript(std::string_view raw) {
    auto text = trim_transcript(raw);
    if (text.empty()) {
        return std::unexpected(ProviderError{
            .kind = ProviderErrorKind::EmptyTranscription,
            .message = "transcription returned empty text"});
    }
    return text;
}

ProviderError invalid(std::string message) {
    return ProviderError{.kind = ProviderErrorKind::InvalidResponse, .message = std::move(message)};
}

std::expected<TranscriptResult, ProviderError>
post_clip(const HttpTransport& http, const AudioClip& audio, const ProviderSettings& settings,
          std::stop_token stop, RequestBuilder build, ResponseParser parse) {
    auto wav_data = wav::encode(audio);
    auto resp = http.post(build(settings, wav_data), stop);
    if (!resp) return std::unexpected(resp.error());

    auto text = parse(*resp);
    if (!text) return std::unexpected(text.error());

    return TranscriptResult{
        .text = std::move(*text),
        .duration_s = audio.duration_s(),
        .processing_s = resp->elapsed_s,
    };
}

} // namespace response
