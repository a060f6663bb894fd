#pragma once

#include <string>
#include <string_view>

enum class ProviderErrorKind {
    MissingCredential,
    InvalidRequest,
    InvalidResponse,
    EmptyTranscription,
    RateLimited,
    ServerError,
    NetworkError,
    Timeout,
};

// Classified provider failure. The orchestrator only ever looks at kind;
// message and status_code are for logs and the user-facing line.
struct ProviderError {
    ProviderErrorKind kind = ProviderErrorKind::NetworkError;
    int status_code = 0;
    std::string message;

    // Transient errors may be resolved by asking a different provider.
    bool is_transient() const;

    // One human-readable line, e.g. "Groq is rate limiting requests".
    std::string describe(std::string_view provider = {}) const;

    // Classifies a non-200 HTTP status. body is kept as the message.
    static ProviderError from_http_status(int status, std::string body);
};

std::string_view to_string(ProviderErrorKind kind);
