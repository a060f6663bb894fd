#include "sarvam_client.hpp"

#include "response_utils.hpp"

HttpRequest SarvamClient::build_request(const ProviderSettings& settings,
                                        std::span<const uint8_t> wav_data) {
    HttpRequest req;
    req.url = settings.url.empty() ? default_endpoint : settings.url;
    req.timeout_s = settings.timeout_s;
    req.headers.push_back("api-subscription-key: " + settings.api_key);

    // The API wants "unknown" for auto-detection; language_code is never omitted.
    std::string language = settings.language.empty() || settings.language == catalog::auto_language
                               ? "unknown"
                               : settings.language;

    req.form.push_back({.name = "file", .filename = "audio.wav",
                        .content_type = "application/octet-stream", .file_data = wav_data});
    req.form.push_back({.name = "model",
                        .value = catalog::api_model_id(ProviderKind::Sarvam, settings.model)});
    req.form.push_back({.name = "language_code", .value = std::move(language)});
    return req;
}

std::expected<std::string, ProviderError> SarvamClient::parse_response(const HttpResponse& resp) {
    auto body = response::json_body(resp);
    if (!body) return std::unexpected(body.error());

    if (!body->contains("transcript") || !(*body)["transcript"].is_string()) {
        return std::unexpected(response::invalid("missing \"transcript\" in response"));
    }
    return response::transcript((*body)["transcript"].get<std::string>());
}

std::expected<TranscriptResult, ProviderError>
SarvamClient::transcribe(const AudioClip& audio, const ProviderSettings& settings,
                         std::stop_token stop) {
    if (settings.api_key.empty()) {
        return std::unexpected(ProviderError{
            .kind = ProviderErrorKind::MissingCredential,
            .message = "Sarvam API key not configured"});
    }

    return response::post_clip(http_, audio, settings, stop, build_request, parse_response);
}
