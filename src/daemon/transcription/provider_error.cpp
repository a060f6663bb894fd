#include "provider_error.hpp"

#include <format>

bool ProviderError::is_transient() const {
    switch (kind) {
        case ProviderErrorKind::RateLimited:
        case ProviderErrorKind::ServerError:
        case ProviderErrorKind::NetworkError:
        case ProviderErrorKind::Timeout:
        case ProviderErrorKind::InvalidResponse:
            return true;
        case ProviderErrorKind::MissingCredential:
        case ProviderErrorKind::InvalidRequest:
        case ProviderErrorKind::EmptyTranscription:
            return false;
    }
    return false;
}

std::string ProviderError::describe(std::string_view provider) const {
    std::string who = provider.empty() ? std::string("Provider") : std::string(provider);
    switch (kind) {
        case ProviderErrorKind::MissingCredential:
            return std::format("{} API key missing or rejected", who);
        case ProviderErrorKind::InvalidRequest:
            return std::format("{} rejected the request ({})", who, status_code);
        case ProviderErrorKind::InvalidResponse:
            return std::format("Invalid response from {}", who);
        case ProviderErrorKind::EmptyTranscription:
            return "No speech recognized";
        case ProviderErrorKind::RateLimited:
            return std::format("{} is rate limiting requests", who);
        case ProviderErrorKind::ServerError:
            return std::format("{} server error ({})", who, status_code);
        case ProviderErrorKind::NetworkError:
            return std::format("Network error reaching {}", who);
        case ProviderErrorKind::Timeout:
            return std::format("{} did not respond in time", who);
    }
    return "Transcription failed";
}

ProviderError ProviderError::from_http_status(int status, std::string body) {
    ProviderErrorKind kind;
    if (status == 401 || status == 403) {
        kind = ProviderErrorKind::MissingCredential;
    } else if (status == 408) {
        kind = ProviderErrorKind::Timeout;
    } else if (status == 429) {
        kind = ProviderErrorKind::RateLimited;
    } else if (status >= 500) {
        kind = ProviderErrorKind::ServerError;
    } else {
        kind = ProviderErrorKind::InvalidRequest;
    }
    return ProviderError{.kind = kind, .status_code = status, .message = std::move(body)};
}

std::string_view to_string(ProviderErrorKind kind) {
    switch (kind) {
        case ProviderErrorKind::MissingCredential: return "missing_credential";
        case ProviderErrorKind::InvalidRequest: return "invalid_request";
        case ProviderErrorKind::InvalidResponse: return "invalid_response";
        case ProviderErrorKind::EmptyTranscription: return "empty_transcription";
        case ProviderErrorKind::RateLimited: return "rate_limited";
        case ProviderErrorKind::ServerError: return "server_error";
        case ProviderErrorKind::NetworkError: return "network_error";
        case ProviderErrorKind::Timeout: return "timeout";
    }
    return "unknown";
}
