#include "groq_client.hpp"

#include "response_utils.hpp"

HttpRequest GroqClient::build_request(const ProviderSettings& settings,
                                      std::span<const uint8_t> wav_data) {
    HttpRequest req;
    req.url = settings.url.empty() ? default_endpoint : settings.url;
    req.timeout_s = settings.timeout_s;
    req.headers.push_back("Authorization: Bearer " + settings.api_key);

    req.form.push_back({.name = "file", .filename = "audio.wav",
                        .content_type = "audio/wav", .file_data = wav_data});
    req.form.push_back({.name = "model",
                        .value = catalog::api_model_id(ProviderKind::Groq, settings.model)});
    if (!settings.language.empty() && settings.language != catalog::auto_language) {
        req.form.push_back({.name = "language", .value = settings.language});
    }
    req.form.push_back({.name = "response_format", .value = "json"});
    return req;
}

std::expected<std::string, ProviderError> GroqClient::parse_response(const HttpResponse& resp) {
    auto body = response::json_body(resp);
    if (!body) return std::unexpected(body.error());

    if (!body->contains("text") || !(*body)["text"].is_string()) {
        return std::unexpected(response::invalid("missing \"text\" in response"));
    }
    return response::transcript((*body)["text"].get<std::string>());
}

std::expected<TranscriptResult, ProviderError>
GroqClient::transcribe(const AudioClip& audio, const ProviderSettings& settings,
                       std::stop_token stop) {
    if (settings.api_key.empty()) {
        return std::unexpected(ProviderError{
            .kind = ProviderErrorKind::MissingCredential, .message = "Groq API key not configured"});
    }

    return response::post_clip(http_, audio, settings, stop, build_request, parse_response);
}
