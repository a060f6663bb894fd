#pragma once

#include "audio_clip.hpp"
#include "cancellation_token.hpp"
#include "platform/audio_capture.hpp"
#include "transcription/provider_registry.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class SessionState {
    Idle,
    Capturing,
    AwaitingPrimary,
    AwaitingFallback,
    Delivering,
    Cancelled,
    Failed,
};

// Fixed for a session's lifetime; decides which stop signal ends capture.
enum class ActivationMode { Toggle, HoldToRecord };

enum class FailureCause { CaptureError, EmptyAudio, ProviderError, DeliveryError };

using SteadyTime = std::chrono::steady_clock::time_point;

std::string_view to_string(SessionState state);
std::string_view to_string(ActivationMode mode);
std::string_view to_string(FailureCause cause);
std::optional<ActivationMode> parse_activation_mode(std::string_view value);

// Cancelled and Failed end a session; Delivering ends it by returning to Idle.
bool is_terminal(SessionState state);

struct SessionFailure {
    FailureCause cause = FailureCause::CaptureError;
    std::optional<ProviderError> provider_error;
    std::optional<ProviderKind> provider;
    std::string detail;

    // Machine-readable code: the provider error kind, or the cause.
    std::string_view code() const;
    std::string user_message() const;
};

// One invocation of a provider within a session.
struct ProviderAttempt {
    uint64_t id = 0;
    ProviderRole role = ProviderRole::Primary;
    ProviderKind provider = ProviderKind::Groq;
    CancellationToken token; // child of the session token
    SteadyTime started_at;
    SteadyTime deadline;
    std::optional<std::expected<TranscriptResult, ProviderError>> outcome; // empty while pending

    bool pending() const { return !outcome.has_value(); }
    bool succeeded() const { return outcome && outcome->has_value(); }
    bool transient_failure() const {
        return outcome && !outcome->has_value() && outcome->error().is_transient();
    }
    bool fatal_failure() const {
        return outcome && !outcome->has_value() && !outcome->error().is_transient();
    }
};

// The unit of work for one utterance. Only the orchestrator touches it.
struct Session {
    uint64_t id = 0;
    ActivationMode mode = ActivationMode::Toggle;
    SessionState state = SessionState::Idle;
    CancellationToken token;
    std::unique_ptr<CaptureHandle> capture;
    SteadyTime started_at;
    std::string output_method;

    std::shared_ptr<const AudioClip> audio;
    ProviderSelection providers;
    std::vector<ProviderAttempt> attempts;

    ProviderAttempt* current_attempt() {
        return attempts.empty() ? nullptr : &attempts.back();
    }
};

struct StateTransition {
    uint64_t session_id = 0;
    SessionState from = SessionState::Idle;
    SessionState to = SessionState::Idle;
    std::string detail;
};

// Terminal bookkeeping for a finished session.
struct SessionOutcome {
    uint64_t session_id = 0;
    SessionState final_state = SessionState::Idle; // Idle after a successful delivery
    ActivationMode mode = ActivationMode::Toggle;
    std::string text;
    std::optional<SessionFailure> failure;
    std::optional<ProviderKind> provider;
    bool used_fallback = false;
    double audio_seconds = 0.0;
    double processing_seconds = 0.0;
    std::string output_method;

    bool delivered() const { return final_state == SessionState::Idle; }
    bool cancelled() const { return final_state == SessionState::Cancelled; }
    // Empty unless the session failed; a cancel is silent.
    std::string user_message() const;
};
