#include "elevenlabs_client.hpp"

#include "response_utils.hpp"

HttpRequest ElevenLabsClient::build_request(const ProviderSettings& settings,
                                            std::span<const uint8_t> wav_data) {
    HttpRequest req;
    req.url = settings.url.empty() ? default_endpoint : settings.url;
    req.timeout_s = settings.timeout_s;
    req.headers.push_back("Accept: application/json");
    req.headers.push_back("xi-api-key: " + settings.api_key);

    req.form.push_back({.name = "file", .filename = "audio.wav",
                        .content_type = "audio/wav", .file_data = wav_data});
    req.form.push_back({.name = "model_id",
                        .value = catalog::api_model_id(ProviderKind::ElevenLabs, settings.model)});
    // Omitting language_code lets the service detect it.
    if (!settings.language.empty() && settings.language != catalog::auto_language) {
        req.form.push_back({.name = "language_code", .value = settings.language});
    }
    req.form.push_back({.name = "tag_audio_events", .value = "true"});
    return req;
}

std::expected<std::string, ProviderError>
ElevenLabsClient::parse_response(const HttpResponse& resp) {
    auto body = response::json_body(resp);
    if (!body) return std::unexpected(body.error());

    const auto& j = *body;
    if (j.contains("text") && j["text"].is_string()) {
        return response::transcript(j["text"].get<std::string>());
    }
    if (j.contains("words") && j["words"].is_array()) {
        std::string joined;
        for (const auto& w : j["words"]) {
            if (!w.is_object()) continue;
            auto type = w.find("type");
            if (type != w.end() && *type == "spacing") continue;
            auto piece_it = w.find("text");
            if (piece_it == w.end() || !piece_it->is_string()) continue;
            auto piece = piece_it->get<std::string>();
            if (piece.empty()) continue;
            if (!joined.empty()) joined += ' ';
            joined += piece;
        }
        return response::transcript(joined);
    }
    return std::unexpected(response::invalid("missing \"text\" and \"words\" in response"));
}

std::expected<TranscriptResult, ProviderError>
ElevenLabsClient::transcribe(const AudioClip& audio, const ProviderSettings& settings,
                             std::stop_token stop) {
    if (settings.api_key.empty()) {
        return std::unexpected(ProviderError{
            .kind = ProviderErrorKind::MissingCredential,
            .message = "ElevenLabs API key not configured"});
    }

    return response::post_clip(http_, audio, settings, stop, build_request, parse_response);
}
