#include "orchestrator.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <print>

using namespace std::chrono;

TranscriptionOrchestrator::TranscriptionOrchestrator(Options options, AudioCapture& audio,
                                                     ProviderRegistry& registry,
                                                     SinkFactory sink_factory,
                                                     NotifyCallback notify, Clock clock)
    : options_(options), audio_(audio), registry_(registry),
      sink_factory_(std::move(sink_factory)), notify_(std::move(notify)),
      clock_(std::move(clock)) {
    if (!clock_) clock_ = [] { return steady_clock::now(); };
}

TranscriptionOrchestrator::~TranscriptionOrchestrator() {
    // Observers may already be gone; tear down without emitting anything.
    if (session_) {
        session_->token.cancel();
        session_.reset();
    }
    workers_.clear();
}

std::expected<uint64_t, std::string>
TranscriptionOrchestrator::activate(ActivationMode mode, std::string output_method) {
    if (session_) {
        log(std::format("Activate rejected: session {} is {}", session_->id,
                        to_string(session_->state)));
        return std::unexpected(std::format("busy ({})", to_string(session_->state)));
    }

    auto_stopped_.reset();
    session_.emplace();
    session_->id = next_session_id_++;
    session_->mode = mode;
    session_->started_at = clock_();
    session_->output_method = std::move(output_method);
    uint64_t id = session_->id;

    auto handle = audio_.start();
    if (!handle) {
        std::println(stderr, "orchestrator: capture failed to start: {}", handle.error());
        std::string error = handle.error();
        fail(SessionFailure{.cause = FailureCause::CaptureError, .detail = error});
        return std::unexpected(std::format("capture failed: {}", error));
    }
    session_->capture = std::move(*handle);

    transition(SessionState::Capturing, std::string(to_string(mode)));
    return id;
}

std::expected<uint64_t, std::string> TranscriptionOrchestrator::stop(ActivationMode mode) {
    // The user's own stop for a session the capture limit already ended.
    if (auto_stopped_ && auto_stopped_->mode == mode &&
        (!session_ || session_->id == auto_stopped_->session_id)) {
        uint64_t id = auto_stopped_->session_id;
        auto_stopped_.reset();
        log(std::format("Stop matched session {}, already stopped at the capture limit", id));
        return id;
    }
    if (!session_ || session_->state != SessionState::Capturing) {
        log("Stop ignored: not capturing");
        return std::unexpected("not recording");
    }
    if (session_->mode != mode) {
        log(std::format("Stop ignored: session {} is {}, signal was {}", session_->id,
                        to_string(session_->mode), to_string(mode)));
        return std::unexpected(std::format("session was started in {} mode",
                                           to_string(session_->mode)));
    }

    uint64_t id = session_->id;
    end_capture(mode == ActivationMode::Toggle ? "toggle stop" : "key release");
    return id;
}

bool TranscriptionOrchestrator::cancel() {
    if (!session_) {
        log("Cancel ignored: no session");
        return false;
    }

    session_->token.cancel();
    // Discards all buffered audio.
    session_->capture.reset();

    transition(SessionState::Cancelled, "cancelled by user");
    finish(SessionState::Cancelled, std::nullopt);
    return true;
}

void TranscriptionOrchestrator::end_capture(const std::string& reason) {
    auto handle = std::move(session_->capture);
    auto clip = handle->finish();
    handle.reset();

    if (!clip) {
        std::println(stderr, "orchestrator: capture failed: {}", clip.error());
        fail(SessionFailure{.cause = FailureCause::CaptureError, .detail = clip.error()});
        return;
    }

    double duration = clip->duration_s();
    log(std::format("Capture stopped ({}), {:.1f}s audio", reason, duration));

    if (clip->empty() || duration < options_.min_audio_s) {
        fail(SessionFailure{
            .cause = FailureCause::EmptyAudio,
            .detail = std::format("{:.2f}s captured, minimum is {:.2f}s", duration,
                                  options_.min_audio_s),
        });
        return;
    }

    begin_transcription(std::move(*clip));
}

void TranscriptionOrchestrator::begin_transcription(AudioClip clip) {
    session_->audio = std::make_shared<const AudioClip>(std::move(clip));
    session_->providers = registry_.snapshot();

    if (!session_->providers.primary) {
        fail(SessionFailure{
            .cause = FailureCause::ProviderError,
            .provider_error = ProviderError{
                .kind = ProviderErrorKind::MissingCredential,
                .message = "no transcription provider is configured",
            },
        });
        return;
    }

    const auto& primary = *session_->providers.primary;
    transition(SessionState::AwaitingPrimary, std::string(catalog::name(primary.kind)));
    launch_attempt(primary);
}

void TranscriptionOrchestrator::launch_attempt(const ProviderSlot& slot) {
    auto now = clock_();
    ProviderAttempt attempt{
        .id = next_attempt_id_++,
        .role = slot.role,
        .provider = slot.kind,
        .token = session_->token.child(),
        .started_at = now,
        .deadline = now + session_->providers.timeout,
    };

    log(std::format("Sending {:.1f}s audio to {} ({})", session_->audio->duration_s(),
                    catalog::display_name(slot.kind), to_string(slot.role)));

    auto done = std::make_shared<std::atomic<bool>>(false);
    workers_.push_back(Worker{
        .thread = std::jthread([this, client = slot.client, settings = slot.settings,
                                audio = session_->audio, stop = attempt.token.stop_token(),
                                session_id = session_->id, attempt_id = attempt.id, done] {
            std::expected<TranscriptResult, ProviderError> result;
            try {
                result = client->transcribe(*audio, settings, stop);
            } catch (const std::exception& e) {
                result = std::unexpected(ProviderError{
                    .kind = ProviderErrorKind::InvalidResponse,
                    .message = e.what(),
                });
            }
            completions_.post(AttemptCompletion{
                .session_id = session_id,
                .attempt_id = attempt_id,
                .result = std::move(result),
            });
            done->store(true, std::memory_order_release);
            if (notify_) notify_();
        }),
        .done = done,
    });

    session_->attempts.push_back(std::move(attempt));
}

void TranscriptionOrchestrator::process_completions() {
    for (auto& c : completions_.drain()) {
        ProviderAttempt* attempt = nullptr;
        if (session_ && session_->id == c.session_id) {
            attempt = session_->current_attempt();
        }
        if (!attempt || attempt->id != c.attempt_id || !attempt->pending()) {
            log(std::format("Discarding late result of attempt {} (session {})",
                            c.attempt_id, c.session_id));
            continue;
        }
        if (session_->token.is_cancelled()) continue;

        attempt->outcome = std::move(c.result);
        settle_attempt(*attempt);
    }
    reap_workers();
}

void TranscriptionOrchestrator::poll_timers() {
    if (!session_) {
        reap_workers();
        return;
    }
    auto now = clock_();

    if (session_->state == SessionState::Capturing) {
        auto limit = duration<double>(options_.max_capture_s);
        if (options_.max_capture_s > 0 && now - session_->started_at >= limit) {
            log(std::format("Maximum capture of {:.0f}s reached", options_.max_capture_s));
            auto_stopped_ = AutoStopped{.session_id = session_->id, .mode = session_->mode};
            end_capture("maximum duration");
        }
        return;
    }

    auto* attempt = session_->current_attempt();
    if (!attempt || !attempt->pending() || now < attempt->deadline) return;

    // Scoped to this attempt; the session token stays live for a fallback.
    attempt->token.cancel();
    auto waited = duration_cast<milliseconds>(attempt->deadline - attempt->started_at);
    attempt->outcome = std::unexpected(ProviderError{
        .kind = ProviderErrorKind::Timeout,
        .message = std::format("no response within {:.1f}s", waited.count() / 1000.0),
    });
    settle_attempt(*attempt);
}

std::optional<milliseconds> TranscriptionOrchestrator::next_timer() const {
    if (!session_) return std::nullopt;

    std::optional<SteadyTime> deadline;
    if (session_->state == SessionState::Capturing && options_.max_capture_s > 0) {
        deadline = session_->started_at +
                   duration_cast<steady_clock::duration>(duration<double>(options_.max_capture_s));
    } else if (auto& attempts = session_->attempts; !attempts.empty() && attempts.back().pending()) {
        deadline = attempts.back().deadline;
    }
    if (!deadline) return std::nullopt;

    auto left = duration_cast<milliseconds>(*deadline - clock_());
    if (*deadline > clock_() && left.count() == 0) left = milliseconds(1);
    return std::max(left, milliseconds(0));
}

void TranscriptionOrchestrator::settle_attempt(ProviderAttempt& attempt) {
    const auto& outcome = *attempt.outcome;
    if (outcome) {
        log(std::format("{} returned {} chars in {:.2f}s", catalog::display_name(attempt.provider),
                        outcome->text.size(), outcome->processing_s));
        auto result = *outcome;
        deliver(result);
        return;
    }

    const auto& error = outcome.error();
    log(std::format("{} attempt failed: {} ({})", to_string(attempt.role),
                    error.describe(catalog::display_name(attempt.provider)),
                    error.is_transient() ? "transient" : "fatal"));

    if (error.is_transient() && attempt.role == ProviderRole::Primary &&
        session_->providers.fallback) {
        const auto& fallback = *session_->providers.fallback;
        transition(SessionState::AwaitingFallback, std::string(catalog::name(fallback.kind)));
        launch_attempt(fallback);
        return;
    }

    fail(SessionFailure{
        .cause = FailureCause::ProviderError,
        .provider_error = error,
        .provider = attempt.provider,
    });
}

void TranscriptionOrchestrator::deliver(const TranscriptResult& result) {
    transition(SessionState::Delivering, session_->output_method);

    if (session_->token.is_cancelled()) {
        transition(SessionState::Cancelled, "cancelled before delivery");
        finish(SessionState::Cancelled, std::nullopt);
        return;
    }

    auto sink = sink_factory_ ? sink_factory_(session_->output_method) : nullptr;
    if (!sink) {
        fail(SessionFailure{
            .cause = FailureCause::DeliveryError,
            .detail = std::format("unknown output method '{}'", session_->output_method),
        });
        return;
    }

    auto delivered = sink->deliver(result.text);
    if (!delivered) {
        std::println(stderr, "orchestrator: delivery failed: {}", delivered.error());
        transition(SessionState::Failed, "delivery_error");
        finish(SessionState::Failed,
               SessionFailure{.cause = FailureCause::DeliveryError, .detail = delivered.error()},
               result.text);
        return;
    }

    transition(SessionState::Idle, "delivered");
    finish(SessionState::Idle, std::nullopt, result.text);
}

void TranscriptionOrchestrator::transition(SessionState to, std::string detail) {
    StateTransition t{
        .session_id = session_->id,
        .from = session_->state,
        .to = to,
        .detail = std::move(detail),
    };
    session_->state = to;

    log(std::format("Session {}: {} -> {}{}", t.session_id, to_string(t.from), to_string(t.to),
                    t.detail.empty() ? "" : " (" + t.detail + ")"));
    for (auto& observer : transition_observers_) observer(t);
}

void TranscriptionOrchestrator::fail(SessionFailure failure) {
    session_->capture.reset();
    transition(SessionState::Failed, std::string(failure.code()));
    finish(SessionState::Failed, std::move(failure));
}

void TranscriptionOrchestrator::finish(SessionState final_state,
                                       std::optional<SessionFailure> failure, std::string text) {
    auto& s = *session_;

    SessionOutcome outcome{
        .session_id = s.id,
        .final_state = final_state,
        .mode = s.mode,
        .text = std::move(text),
        .failure = std::move(failure),
        .output_method = s.output_method,
    };
    if (s.audio) outcome.audio_seconds = s.audio->duration_s();
    if (!s.attempts.empty()) {
        outcome.provider = s.attempts.back().provider;
        outcome.used_fallback = s.attempts.back().role == ProviderRole::Fallback;
        outcome.processing_seconds =
            duration<double>(clock_() - s.attempts.front().started_at).count();
    }

    if (outcome.final_state == SessionState::Failed) {
        log("Session failed: " + outcome.user_message());
    }

    // Destroyed before observers run so they see an idle orchestrator.
    session_.reset();
    for (auto& observer : outcome_observers_) observer(outcome);
}

SessionState TranscriptionOrchestrator::state() const {
    return session_ ? session_->state : SessionState::Idle;
}

std::optional<uint64_t> TranscriptionOrchestrator::session_id() const {
    if (!session_) return std::nullopt;
    return session_->id;
}

std::optional<ActivationMode> TranscriptionOrchestrator::session_mode() const {
    if (!session_) return std::nullopt;
    return session_->mode;
}

double TranscriptionOrchestrator::capture_duration() const {
    if (!session_ || session_->state != SessionState::Capturing) return 0.0;
    return duration<double>(clock_() - session_->started_at).count();
}

void TranscriptionOrchestrator::on_transition(TransitionObserver observer) {
    transition_observers_.push_back(std::move(observer));
}

void TranscriptionOrchestrator::on_outcome(OutcomeObserver observer) {
    outcome_observers_.push_back(std::move(observer));
}

void TranscriptionOrchestrator::shutdown() {
    if (session_) {
        log("Shutting down, cancelling live session");
        cancel();
    }
    if (!workers_.empty()) {
        log(std::format("Waiting for {} provider call(s) to abort...", workers_.size()));
    }
    workers_.clear();
    // Anything posted by the joined workers belongs to a finished session.
    completions_.drain();
}

void TranscriptionOrchestrator::reap_workers() {
    std::erase_if(workers_, [](const Worker& w) {
        return w.done->load(std::memory_order_acquire);
    });
}

void TranscriptionOrchestrator::log(const std::string& msg) {
    if (options_.verbose) {
        std::println(stderr, "[voicerelay] {}", msg);
    }
}
