#include "session.hpp"

#include <format>

std::string_view to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Capturing: return "capturing";
        case SessionState::AwaitingPrimary: return "awaiting_primary";
        case SessionState::AwaitingFallback: return "awaiting_fallback";
        case SessionState::Delivering: return "delivering";
        case SessionState::Cancelled: return "cancelled";
        case SessionState::Failed: return "failed";
    }
    return "unknown";
}

std::string_view to_string(ActivationMode mode) {
    return mode == ActivationMode::Toggle ? "toggle" : "hold";
}

std::string_view to_string(FailureCause cause) {
    switch (cause) {
        case FailureCause::CaptureError: return "capture_error";
        case FailureCause::EmptyAudio: return "empty_audio";
        case FailureCause::ProviderError: return "provider_error";
        case FailureCause::DeliveryError: return "delivery_error";
    }
    return "unknown";
}

std::optional<ActivationMode> parse_activation_mode(std::string_view value) {
    if (value == "toggle") return ActivationMode::Toggle;
    if (value == "hold") return ActivationMode::HoldToRecord;
    return std::nullopt;
}

bool is_terminal(SessionState state) {
    return state == SessionState::Cancelled || state == SessionState::Failed;
}

std::string_view SessionFailure::code() const {
    if (cause == FailureCause::ProviderError && provider_error) {
        return to_string(provider_error->kind);
    }
    return to_string(cause);
}

std::string SessionFailure::user_message() const {
    switch (cause) {
        case FailureCause::CaptureError:
            return detail.empty() ? "Microphone unavailable"
                                  : std::format("Microphone unavailable: {}", detail);
        case FailureCause::EmptyAudio:
            return "Recording too short, nothing was sent";
        case FailureCause::ProviderError:
            if (provider_error) {
                return provider_error->describe(provider ? catalog::display_name(*provider)
                                                         : std::string_view{});
            }
            return "Transcription failed";
        case FailureCause::DeliveryError:
            return detail.empty() ? "Could not deliver text"
                                  : std::format("Could not deliver text: {}", detail);
    }
    return "Transcription failed";
}

std::string SessionOutcome::user_message() const {
    if (final_state != SessionState::Failed || !failure) return {};
    return failure->user_message();
}
