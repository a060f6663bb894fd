#pragma once

#include "completion_queue.hpp"
#include "output/output_sink.hpp"
#include "platform/audio_capture.hpp"
#include "session.hpp"
#include "transcription/provider_registry.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Owns the single live Session and drives it from activation to a terminal
// state. Every public method must be called from one thread (the event loop);
// provider calls run on worker threads and only post completions back.
//
// The owner is expected to call process_completions() after notify fires, and
// poll_timers() whenever next_timer() elapses.
class TranscriptionOrchestrator {
public:
    struct Options {
        double min_audio_s = 0.5;
        double max_capture_s = 120.0;
        bool verbose = false;
    };

    using Clock = std::function<SteadyTime()>;
    using SinkFactory = std::function<std::unique_ptr<OutputSink>(const std::string& method)>;
    // Called from a worker thread after it posted a completion.
    using NotifyCallback = std::function<void()>;
    using TransitionObserver = std::function<void(const StateTransition&)>;
    using OutcomeObserver = std::function<void(const SessionOutcome&)>;

    TranscriptionOrchestrator(Options options, AudioCapture& audio, ProviderRegistry& registry,
                              SinkFactory sink_factory, NotifyCallback notify,
                              Clock clock = {});
    ~TranscriptionOrchestrator();

    TranscriptionOrchestrator(const TranscriptionOrchestrator&) = delete;
    TranscriptionOrchestrator& operator=(const TranscriptionOrchestrator&) = delete;

    // Activate. Rejected unless idle; returns the new session id.
    std::expected<uint64_t, std::string> activate(ActivationMode mode, std::string output_method);

    // StopSignal. Only honoured while capturing and only for the session's
    // own mode. Returns the id of the session it stopped, which may already
    // have reached a terminal state when this returns. The first stop after
    // the capture limit ended a session returns that session's id.
    std::expected<uint64_t, std::string> stop(ActivationMode mode);

    // Cancel. Returns false when there is no live session.
    bool cancel();

    void process_completions();
    void poll_timers();
    // Time until the nearest deadline, or nullopt when nothing is pending.
    std::optional<std::chrono::milliseconds> next_timer() const;

    SessionState state() const;
    std::optional<uint64_t> session_id() const;
    std::optional<ActivationMode> session_mode() const;
    double capture_duration() const;
    size_t active_workers() const { return workers_.size(); }

    void on_transition(TransitionObserver observer);
    void on_outcome(OutcomeObserver observer);

    // Cancels any live session and joins every provider worker.
    void shutdown();

private:
    struct AttemptCompletion {
        uint64_t session_id = 0;
        uint64_t attempt_id = 0;
        std::expected<TranscriptResult, ProviderError> result;
    };

    struct AutoStopped {
        uint64_t session_id = 0;
        ActivationMode mode = ActivationMode::Toggle;
    };

    struct Worker {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void end_capture(const std::string& reason);
    void begin_transcription(AudioClip clip);
    void launch_attempt(const ProviderSlot& slot);
    void settle_attempt(ProviderAttempt& attempt);
    void deliver(const TranscriptResult& result);

    void transition(SessionState to, std::string detail = {});
    void fail(SessionFailure failure);
    void finish(SessionState final_state, std::optional<SessionFailure> failure,
                std::string text = {});

    void reap_workers();
    void log(const std::string& msg);

    Options options_;
    AudioCapture& audio_;
    ProviderRegistry& registry_;
    SinkFactory sink_factory_;
    NotifyCallback notify_;
    Clock clock_;

    std::vector<TransitionObserver> transition_observers_;
    std::vector<OutcomeObserver> outcome_observers_;

    std::optional<Session> session_;
    std::optional<AutoStopped> auto_stopped_;
    uint64_t next_session_id_ = 1;
    uint64_t next_attempt_id_ = 1;

    CompletionQueue<AttemptCompletion> completions_;
    // Last member: destroyed (joined) first.
    std::vector<Worker> workers_;
};
