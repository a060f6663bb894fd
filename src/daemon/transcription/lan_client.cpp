#include "lan_client.hpp"

#include "response_utils.hpp"

HttpRequest LanClient::build_request(const ProviderSettings& settings,
                                     std::span<const uint8_t> wav_data) {
    HttpRequest req;
    req.timeout_s = settings.timeout_s;

    FormField file{.name = "file", .filename = "audio.wav",
                   .content_type = "audio/wav", .file_data = wav_data};
    bool send_language = !settings.language.empty() && settings.language != catalog::auto_language;

    if (settings.api_format == "openai") {
        req.url = settings.url + "/v1/audio/transcriptions";
        req.form.push_back(file);
        req.form.push_back({.name = "model",
                            .value = settings.model.empty() ? "whisper-1" : settings.model});
        if (send_language) req.form.push_back({.name = "language", .value = settings.language});
        req.form.push_back({.name = "response_format", .value = "json"});
    } else {
        // whisper.cpp server format
        req.url = settings.url + "/inference";
        req.form.push_back(file);
        req.form.push_back({.name = "temperature", .value = "0.0"});
        req.form.push_back({.name = "response_format", .value = "json"});
        if (send_language) req.form.push_back({.name = "language", .value = settings.language});
    }

    if (!settings.api_key.empty()) {
        req.headers.push_back("Authorization: Bearer " + settings.api_key);
    }
    return req;
}

std::expected<std::string, ProviderError> LanClient::parse_response(const HttpResponse& resp) {
    auto body = response::json_body(resp);
    if (!body) return std::unexpected(body.error());

    auto& j = *body;
    if (j.contains("text") && j["text"].is_string()) {
        return response::transcript(j["text"].get<std::string>());
    }
    if (j.contains("error")) {
        auto msg = j["error"].is_string() ? j["error"].get<std::string>() : j["error"].dump();
        return std::unexpected(ProviderError{
            .kind = ProviderErrorKind::ServerError,
            .status_code = static_cast<int>(resp.status),
            .message = "server error: " + msg});
    }
    return std::unexpected(response::invalid("unexpected response: " + resp.body));
}

std::expected<TranscriptResult, ProviderError>
LanClient::transcribe(const AudioClip& audio, const ProviderSettings& settings,
                      std::stop_token stop) {
    if (settings.url.empty()) {
        return std::unexpected(ProviderError{
            .kind = ProviderErrorKind::MissingCredential, .message = "no server URL configured"});
    }

    return response::post_clip(http_, audio, settings, stop, build_request, parse_response);
}
