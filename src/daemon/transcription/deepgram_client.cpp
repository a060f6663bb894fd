#include "deepgram_client.hpp"

#include "response_utils.hpp"

HttpRequest DeepgramClient::build_request(const ProviderSettings& settings,
                                          std::span<const uint8_t> wav_data) {
    HttpRequest req;
    std::string base = settings.url.empty() ? default_endpoint : settings.url;
    std::string query = "model=" + HttpTransport::url_encode(
        catalog::api_model_id(ProviderKind::Deepgram, settings.model));
    query += "&smart_format=true&punctuate=true";
    if (settings.language.empty() || settings.language == catalog::auto_language) {
        query += "&detect_language=true";
    } else {
        query += "&language=" + HttpTransport::url_encode(settings.language);
    }

    req.url = base + "?" + query;
    req.timeout_s = settings.timeout_s;
    req.headers.push_back("Authorization: Token " + settings.api_key);
    req.content_type = "audio/wav";
    req.body = wav_data;
    return req;
}

std::expected<std::string, ProviderError>
DeepgramClient::parse_response(const HttpResponse& resp) {
    auto body = response::json_body(resp);
    if (!body) return std::unexpected(body.error());

    // results.channels[0].alternatives[0].transcript
    const auto& j = *body;
    auto results = j.find("results");
    if (results == j.end() || !results->is_object()) {
        return std::unexpected(response::invalid("missing \"results\" in response"));
    }
    auto channels = results->find("channels");
    if (channels == results->end() || !channels->is_array() || channels->empty()) {
        return response::transcript("");
    }
    const auto& channel = channels->front();
    auto alternatives = channel.find("alternatives");
    if (alternatives == channel.end() || !alternatives->is_array() || alternatives->empty() ||
        !alternatives->front().is_object()) {
        return response::transcript("");
    }
    const auto& best = alternatives->front();
    auto transcript = best.find("transcript");
    if (transcript == best.end() || !transcript->is_string()) {
        return std::unexpected(response::invalid("missing \"transcript\" in alternative"));
    }
    return response::transcript(transcript->get<std::string>());
}

std::expected<TranscriptResult, ProviderError>
DeepgramClient::transcribe(const AudioClip& audio, const ProviderSettings& settings,
                           std::stop_token stop) {
    if (settings.api_key.empty()) {
        return std::unexpected(ProviderError{
            .kind = ProviderErrorKind::MissingCredential,
            .message = "Deepgram API key not configured"});
    }

    return response::post_clip(http_, audio, settings, stop, build_request, parse_response);
}
