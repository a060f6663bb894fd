#include <catch2/catch_test_macros.hpp>

#include "orchestrator.hpp"
#include "support/fakes.hpp"

#include <chrono>
#include <memory>
#include <random>
#include <set>
#include <vector>

using namespace std::chrono_literals;
using fakes::provider_error;
using fakes::transcript;

namespace {

struct Rig {
    fakes::ManualClock clock;
    fakes::FakeCapture capture;
    fakes::SinkLog sinks;
    fakes::Doorbell bell;
    Config::Providers providers = fakes::two_providers();

    std::shared_ptr<fakes::ScriptedProvider> groq =
        std::make_shared<fakes::ScriptedProvider>(ProviderKind::Groq);
    std::shared_ptr<fakes::ScriptedProvider> deepgram =
        std::make_shared<fakes::ScriptedProvider>(ProviderKind::Deepgram);

    ProviderRegistry registry{[this] { return providers; }, fakes::no_env()};

    std::vector<StateTransition> transitions;
    std::vector<SessionOutcome> outcomes;

    // Last: joins its workers before the fakes above are destroyed.
    TranscriptionOrchestrator orch;

    explicit Rig(TranscriptionOrchestrator::Options options = {})
        : orch(options, capture, registry, sinks.factory(), [this] { bell.ring(); },
               clock.fn()) {
        registry.add(groq);
        registry.add(deepgram);
        orch.on_transition([this](const StateTransition& t) { transitions.push_back(t); });
        orch.on_outcome([this](const SessionOutcome& o) { outcomes.push_back(o); });
    }

    // Waits for the n-th worker completion overall, then applies it.
    void settle(int rings) {
        REQUIRE(bell.wait_for(rings));
        orch.process_completions();
    }

    std::vector<SessionState> states() const {
        std::vector<SessionState> out;
        if (!transitions.empty()) out.push_back(transitions.front().from);
        for (auto& t : transitions) out.push_back(t.to);
        return out;
    }
};

} // namespace

TEST_CASE("Orchestrator scenarios", "[orchestrator]") {

    SECTION("PrimarySuccessDeliversOnce") {
        Rig rig;
        rig.providers.fallback.clear();
        rig.groq->respond(transcript("hello"));

        auto id = rig.orch.activate(ActivationMode::Toggle, "clipboard");
        REQUIRE(id.has_value());
        REQUIRE(rig.orch.state() == SessionState::Capturing);

        REQUIRE(rig.orch.stop(ActivationMode::Toggle) == *id);
        REQUIRE(rig.orch.state() == SessionState::AwaitingPrimary);
        rig.settle(1);

        REQUIRE(rig.sinks.delivered == std::vector<std::string>{"hello"});
        REQUIRE(rig.orch.state() == SessionState::Idle);
        REQUIRE(rig.groq->calls() == 1);
        REQUIRE(rig.deepgram->calls() == 0);

        REQUIRE(rig.outcomes.size() == 1);
        const auto& out = rig.outcomes[0];
        REQUIRE(out.delivered());
        REQUIRE(out.text == "hello");
        REQUIRE(out.provider == ProviderKind::Groq);
        REQUIRE_FALSE(out.used_fallback);
        REQUIRE(out.audio_seconds == 3.0);
        REQUIRE(out.user_message().empty());

        REQUIRE(rig.states() == std::vector<SessionState>{
                                    SessionState::Idle, SessionState::Capturing,
                                    SessionState::AwaitingPrimary, SessionState::Delivering,
                                    SessionState::Idle});
    }

    SECTION("RateLimitedPrimaryFallsBack") {
        Rig rig;
        rig.groq->respond(std::unexpected(provider_error(ProviderErrorKind::RateLimited, 429)));
        rig.deepgram->respond(transcript("world"));

        REQUIRE(rig.orch.activate(ActivationMode::Toggle, "clipboard"));
        REQUIRE(rig.orch.stop(ActivationMode::Toggle));
        rig.settle(1);
        REQUIRE(rig.orch.state() == SessionState::AwaitingFallback);
        rig.settle(2);

        REQUIRE(rig.groq->calls() == 1);
        REQUIRE(rig.deepgram->calls() == 1);
        REQUIRE(rig.sinks.delivered == std::vector<std::string>{"world"});
        REQUIRE(rig.orch.state() == SessionState::Idle);
        REQUIRE(rig.outcomes.at(0).used_fallback);
        REQUIRE(rig.outcomes.at(0).provider == ProviderKind::Deepgram);
    }

    SECTION("CancelWhileCapturingDiscardsAudio") {
        Rig rig;
        REQUIRE(rig.orch.activate(ActivationMode::Toggle, "clipboard"));
        REQUIRE(rig.orch.cancel());

        REQUIRE(rig.capture.discards == 1);
        REQUIRE(rig.capture.finishes == 0);
        REQUIRE_FALSE(rig.capture.is_capturing());
        REQUIRE(rig.groq->calls() == 0);
        REQUIRE(rig.sinks.delivered.empty());

        REQUIRE(rig.transitions.back().to == SessionState::Cancelled);
        REQUIRE(rig.outcomes.size() == 1);
        REQUIRE(rig.outcomes[0].cancelled());
        REQUIRE(rig.outcomes[0].user_message().empty());
        REQUIRE(rig.orch.state() == SessionState::Idle);
    }

    SECTION("SlowPrimaryWithoutFallbackTimesOut") {
        Rig rig;
        rig.providers.fallback.clear();
        rig.groq->hold(transcript("too late"));

        REQUIRE(rig.orch.activate(ActivationMode::Toggle, "clipboard"));
        REQUIRE(rig.orch.stop(ActivationMode::Toggle));
        REQUIRE(rig.groq->wait_for_calls(1));

        rig.clock.advance(19s);
        rig.orch.poll_timers();
        REQUIRE(rig.orch.state() == SessionState::AwaitingPrimary);

        rig.clock.advance(1s);
        rig.orch.poll_timers();

        REQUIRE(rig.outcomes.size() == 1);
        const auto& out = rig.outcomes[0];
        REQUIRE(out.final_state == SessionState::Failed);
        REQUIRE(out.failure->cause == FailureCause::ProviderError);
        REQUIRE(out.failure->provider_error->kind == ProviderErrorKind::Timeout);
        REQUIRE(rig.sinks.delivered.empty());

        // The timed-out call is aborted and its late result ignored.
        rig.settle(1);
        REQUIRE(rig.groq->stops_seen() == 1);
        REQUIRE(rig.sinks.delivered.empty());
        REQUIRE(rig.outcomes.size() == 1);
    }

    SECTION("ActivateWhileAwaitingPrimaryIsRejected") {
        Rig rig;
        rig.groq->hold(transcript("first"));

        auto first = rig.orch.activate(ActivationMode::Toggle, "clipboard");
        REQUIRE(first);
        REQUIRE(rig.orch.stop(ActivationMode::Toggle));
        REQUIRE(rig.orch.state() == SessionState::AwaitingPrimary);

        auto second = rig.orch.activate(ActivationMode::Toggle, "clipboard");
        REQUIRE_FALSE(second.has_value());
        REQUIRE(rig.capture.starts == 1);
        REQUIRE(rig.orch.state() == SessionState::AwaitingPrimary);
        REQUIRE(rig.orch.session_id() == *first);

        rig.groq->open_gate(0);
        rig.settle(1);
        REQUIRE(rig.sinks.delivered == std::vector<std::string>{"first"});
        REQUIRE(rig.outcomes.size() == 1);
        REQUIRE(rig.outcomes[0].session_id == *first);
    }
}

TEST_CASE("Orchestrator fallback policy", "[orchestrator]") {

    SECTION("MissingCredentialNeverFallsBack") {
        Rig rig;
        rig.groq->respond(std::unexpected(provider_error(ProviderErrorKind::MissingCredential, 401)));
        rig.deepgram->respond(transcript("unused"));

        REQUIRE(rig.orch.activate(ActivationMode::Toggle, "clipboard"));
        REQUIRE(rig.orch.stop(ActivationMode::Toggle));
        rig.settle(1);

        REQUIRE(rig.deepgram->calls() == 0);
        REQUIRE(rig.outcomes.at(0).final_state == SessionState::Failed);
        REQUIRE(rig.outcomes[0].failure->code() == "missing_credential");
        REQUIRE(rig.sinks.delivered.empty());
    }

    SECTION("PrimaryTimeoutRunsExactlyOneFallback") {
        Rig rig;
        rig.groq->hold(transcript("slow"));
        rig.deepgram->respond(transcript("fast"));

        REQUIRE(rig.orch.activate(ActivationMode::Toggle, "clipboard"));
        REQUIRE(rig.orch.stop(ActivationMode::Toggle));
        REQUIRE(rig.groq->wait_for_calls(1));

        rig.clock.advance(20s);
        rig.orch.poll_timers();
        REQUIRE(rig.orch.state() == SessionState::AwaitingFallback);

        // Both the aborted primary and the fallback report back.
        rig.settle(2);
        REQUIRE(rig.deepgram->calls() == 1);
        REQUIRE(rig.sinks.delivered == std::vector<std::string>{"fast"});
        REQUIRE(rig.outcomes.at(0).used_fallback);
    }

    SECTION("FallbackFailureReportsFallbackError") {
        Rig rig;
        rig.groq->respond(std::unexpected(provider_error(ProviderErrorKind::ServerError, 503)));
        rig.deepgram->respond(std::unexpected(provider_error(ProviderErrorKind::NetworkError)));

        REQUIRE(rig.orch.activate(ActivationMode::Toggle, "clipboard"));
        REQUIRE(rig.orch.stop(ActivationMode::Toggle));
        rig.settle(1);
        rig.settle(2);

        REQUIRE(rig.groq->calls() == 1);
        REQUIRE(rig.deepgram->calls() == 1);
        const auto& out = rig.outcomes.at(0);
        REQUIRE(out.final_state == SessionState::Failed);
        REQUIRE(out.failure->provider_error->kind == ProviderErrorKind::NetworkError);
        REQUIRE(out.failure->provider == ProviderKind::Deepgram);
        REQUIRE(out.user_message() == "Network error reaching Deepgram");
    }

    SECTION("TransientFailureWithoutFallbackFails") {
        Rig rig;
        rig.providers.fallback.clear();
        rig.groq->respond(std::unexpected(provider_error(ProviderErrorKind::RateLimited, 429)));

        REQUIRE(rig.orch.activate(ActivationMode::Toggle, "clipboard"));
        REQUIRE(rig.orch.stop(ActivationMode::Toggle));
        rig.settle(1);

        REQUIRE(rig.outcomes.at(0).failure->code() == "rate_limited");
        REQUIRE(rig.deepgram->calls() == 0);
    }

    SECTION("FallbackPromotedWhenPrimaryUnconfigured") {
        Rig rig;
        rig.providers.entries["groq"].api_key.clear();
        rig.deepgram->respond(transcript("promoted"));

        REQUIRE(rig.orch.activate(ActivationMode::Toggle, "clipboard"));
        REQUIRE(rig.orch.stop(ActivationMode::Toggle));
        REQUIRE(rig.orch.state() == SessionState::AwaitingPrimary);
        rig.settle(1);

        REQUIRE(rig.groq->calls() == 0);
        REQUIRE(rig.sinks.delivered == std::vector<std::string>{"promoted"});
        REQUIRE_FALSE(rig.outcomes.at(0).used_fallback);
        REQUIRE(rig.outcomes[0].provider == ProviderKind::Deepgram);
    }

    SECTION("NoConfiguredProviderFails") {
        Rig rig;
        rig.providers.entries.clear();

        REQUIRE(rig.orch.activate(ActivationMode::Toggle, "clipboard"));
        REQUIRE(rig.orch.stop(ActivationMode::Toggle));

        REQUIRE(rig.groq->calls() == 0);
        REQUIRE(rig.deepgram->calls() == 0);
        REQUIRE(rig.outcomes.at(0).failure->code() == "missing_credential");
        REQUIRE(rig.orch.state() == SessionState::Idle);
    }

    SECTION("ConfigChangesApplyToNextSession") {
        Rig rig;
        rig.providers.fallback.clear();
        rig.groq->respond(transcript("one"));
        rig.deepgram->respond(transcript("two"));

        REQUIRE(rig.orch.activate(ActivationMode::Toggle, "clipboard"));
        REQUIRE(rig.orch.stop(ActivationMode::Toggle));
        rig.settle(1);

        rig.providers.primary = "deepgram";
        REQUIRE(rig.orch.activate(ActivationMode::Toggle, "clipboard"));
        REQUIRE(rig.orch.stop(ActivationMode::Toggle));
        rig.settle(2);

        REQUIRE(rig.sinks.delivered == std::vector<std::string>{"one", "two"});
    }
}

TEST_CASE("Orchestrator cancellation", "[orchestrator]") {

    SECTION("CancelBeforeResponseNeverDelivers") {
        Rig rig;
        // The provider ignores the stop request and answers anyway.
        rig.groq->hold(transcript("ignored"), /*honor_stop=*/false);

        REQUIRE(rig.orch.activate(ActivationMode::Toggle, "clipboard"));
        REQUIRE(rig.orch.stop(ActivationMode::Toggle));
        REQUIRE(rig.groq->wait_for_calls(1));

        REQUIRE(rig.orch.cancel());
        REQUIRE(rig.orch.state() == SessionState::Idle);

        rig.groq->open_gate(0);
        rig.settle(1);

        REQUIRE(rig.sinks.delivered.empty());
        REQUIRE(rig.deepgram->calls() == 0);
        REQUIRE(rig.outcomes.size() == 1);
        REQUIRE(rig.outcomes[0].cancelled());
    }

    SECTION("CancelAbortsInFlightCall") {
        Rig rig;
        rig.groq->hold(transcript("never"));

        REQUIRE(rig.orch.activate(ActivationMode::HoldToRecord, "paste"));
        REQUIRE(rig.orch.stop(ActivationMode::HoldToRecord));
        REQUIRE(rig.groq->wait_for_calls(1));
        REQUIRE(rig.orch.cancel());

        rig.settle(1);
        REQUIRE(rig.groq->stops_seen() == 1);
        REQUIRE(rig.sinks.delivered.empty());
        REQUIRE(rig.orch.active_workers() == 0);
    }

    SECTION("LateResultNeverLeaksIntoNextSession") {
        Rig rig;
        rig.groq->hold(transcript("stale"), /*honor_stop=*/false);
        rig.groq->hold(transcript("fresh"));

        auto first = rig.orch.activate(ActivationMode::Toggle, "clipboard");
        REQUIRE(rig.orch.stop(ActivationMode::Toggle));
        REQUIRE(rig.groq->wait_for_calls(1));
        REQUIRE(rig.orch.cancel());

        auto second = rig.orch.activate(ActivationMode::Toggle, "clipboard");
        REQUIRE(second);
        REQUIRE(*second != *first);
        REQUIRE(rig.orch.stop(ActivationMode::Toggle));
        REQUIRE(rig.groq->wait_for_calls(2));

        rig.groq->open_gate(0);
        rig.settle(1);
        REQUIRE(rig.sinks.delivered.empty());
        REQUIRE(rig.orch.state() == SessionState::AwaitingPrimary);

        rig.groq->open_gate(1);
        rig.settle(2);
        REQUIRE(rig.sinks.delivered == std::vector<std::string>{"fresh"});
        REQUIRE(rig.outcomes.back().session_id == *second);
    }

    SECTION("CancelWithoutSessionIsNoop") {
        Rig rig;
        REQUIRE_FALSE(rig.orch.cancel());
        REQUIRE(rig.transitions.empty());
        REQUIRE(rig.outcomes.empty());
    }

    SECTION("ShutdownCancelsAndJoins") {
        Rig rig;
        rig.groq->hold(transcript("never"));
        REQUIRE(rig.orch.activate(ActivationMode::Toggle, "clipboard"));
        REQUIRE(rig.orch.stop(ActivationMode::Toggle));
        REQUIRE(rig.groq->wait_for_calls(1));

        rig.orch.shutdown();
        REQUIRE(rig.orch.active_workers() == 0);
        REQUIRE(rig.outcomes.at(0).cancelled());
        REQUIRE(rig.sinks.delivered.empty());
    }
}

TEST_CASE("Orchestrator capture handling", "[orchestrator]") {

    SECTION("ShortAudioNeverReachesProvider") {
        Rig rig;
        rig.capture.next_clip = fakes::clip_of(0.2);

        REQUIRE(rig.orch.activate(ActivationMode::Toggle, "clipboard"));
        REQUIRE(rig.orch.stop(ActivationMode::Toggle));

        REQUIRE(rig.groq->calls() == 0);
        REQUIRE(rig.deepgram->calls() == 0);
        REQUIRE(rig.outcomes.at(0).failure->cause == FailureCause::EmptyAudio);
        REQUIRE(rig.transitions.back().from == SessionState::Capturing);
        REQUIRE(rig.transitions.back().to == SessionState::Failed);
    }

    SECTION("EmptyAudioFails") {
        Rig rig;
        rig.capture.next_clip = AudioClip{};

        REQUIRE(rig.orch.activate(ActivationMode::Toggle, "clipboard"));
        REQUIRE(rig.orch.stop(ActivationMode::Toggle));
        REQUIRE(rig.outcomes.at(0).failure->code() == "empty_audio");
    }

    SECTION("CaptureStartFailure") {
        Rig rig;
        rig.capture.start_error = "no microphone";

        auto id = rig.orch.activate(ActivationMode::Toggle, "clipboard");
        REQUIRE_FALSE(id.has_value());
        REQUIRE(rig.outcomes.at(0).failure->cause == FailureCause::CaptureError);
        REQUIRE(rig.outcomes[0].user_message() == "Microphone unavailable: no microphone");
        REQUIRE(rig.orch.state() == SessionState::Idle);

        rig.capture.start_error.clear();
        REQUIRE(rig.orch.activate(ActivationMode::Toggle, "clipboard"));
    }

    SECTION("CaptureFinishFailure") {
        Rig rig;
        rig.capture.finish_error = "device unplugged";

        REQUIRE(rig.orch.activate(ActivationMode::Toggle, "clipboard"));
        REQUIRE(rig.orch.stop(ActivationMode::Toggle));
        REQUIRE(rig.outcomes.at(0).failure->cause == FailureCause::CaptureError);
        REQUIRE(rig.groq->calls() == 0);
    }

    SECTION("LostMicrophoneIsCaptureErrorNotEmptyAudio") {
        Rig rig;
        rig.capture.next_clip = AudioClip{};
        rig.capture.finish_error = "microphone unavailable: audio source disconnected";

        REQUIRE(rig.orch.activate(ActivationMode::HoldToRecord, "clipboard"));
        REQUIRE(rig.orch.stop(ActivationMode::HoldToRecord));

        const auto& out = rig.outcomes.at(0);
        REQUIRE(out.final_state == SessionState::Failed);
        REQUIRE(out.failure->cause == FailureCause::CaptureError);
        REQUIRE(out.user_message() ==
                "Microphone unavailable: microphone unavailable: audio source disconnected");
        REQUIRE(rig.states() == std::vector<SessionState>{SessionState::Idle,
                                                          SessionState::Capturing,
                                                          SessionState::Failed});
        REQUIRE(rig.groq->calls() == 0);
    }

    SECTION("StopSignalMustMatchMode") {
        Rig rig;
        rig.groq->respond(transcript("held"));

        REQUIRE(rig.orch.activate(ActivationMode::HoldToRecord, "clipboard"));
        REQUIRE_FALSE(rig.orch.stop(ActivationMode::Toggle).has_value());
        REQUIRE(rig.orch.state() == SessionState::Capturing);

        REQUIRE(rig.orch.stop(ActivationMode::HoldToRecord));
        rig.settle(1);
        REQUIRE(rig.sinks.delivered == std::vector<std::string>{"held"});
    }

    SECTION("StopWhenIdleIsIgnored") {
        Rig rig;
        REQUIRE_FALSE(rig.orch.stop(ActivationMode::Toggle).has_value());
        REQUIRE(rig.transitions.empty());
    }

    SECTION("MaxCaptureStopsAutomatically") {
        Rig rig({.min_audio_s = 0.5, .max_capture_s = 120.0});
        rig.groq->respond(transcript("long"));

        REQUIRE(rig.orch.activate(ActivationMode::HoldToRecord, "clipboard"));
        REQUIRE(rig.orch.next_timer() == std::chrono::milliseconds(120'000));

        rig.clock.advance(60s);
        rig.orch.poll_timers();
        REQUIRE(rig.orch.state() == SessionState::Capturing);
        REQUIRE(rig.orch.capture_duration() == 60.0);

        rig.clock.advance(60s);
        rig.orch.poll_timers();
        REQUIRE(rig.orch.state() == SessionState::AwaitingPrimary);
        REQUIRE(rig.capture.finishes == 1);

        rig.settle(1);
        REQUIRE(rig.sinks.delivered == std::vector<std::string>{"long"});
    }

    SECTION("ReleaseAfterCaptureLimitFindsStoppedSession") {
        Rig rig({.min_audio_s = 0.5, .max_capture_s = 10.0});
        rig.groq->hold(transcript("capped"));

        auto id = rig.orch.activate(ActivationMode::HoldToRecord, "clipboard");
        REQUIRE(id.has_value());
        rig.clock.advance(10s);
        rig.orch.poll_timers();
        REQUIRE(rig.orch.state() == SessionState::AwaitingPrimary);

        REQUIRE_FALSE(rig.orch.stop(ActivationMode::Toggle).has_value());
        REQUIRE(rig.orch.stop(ActivationMode::HoldToRecord) == *id);
        // Only the first stop is matched.
        REQUIRE_FALSE(rig.orch.stop(ActivationMode::HoldToRecord).has_value());
        REQUIRE(rig.capture.finishes == 1);

        rig.groq->open_gate(0);
        rig.settle(1);
        REQUIRE(rig.sinks.delivered == std::vector<std::string>{"capped"});
    }

    SECTION("NewSessionForgetsCaptureLimitStop") {
        Rig rig({.min_audio_s = 0.5, .max_capture_s = 10.0});
        rig.groq->respond(transcript("first"));

        REQUIRE(rig.orch.activate(ActivationMode::Toggle, "clipboard"));
        rig.clock.advance(10s);
        rig.orch.poll_timers();
        rig.settle(1);
        REQUIRE(rig.orch.state() == SessionState::Idle);

        REQUIRE(rig.orch.activate(ActivationMode::HoldToRecord, "clipboard"));
        REQUIRE_FALSE(rig.orch.stop(ActivationMode::Toggle).has_value());
        REQUIRE(rig.orch.state() == SessionState::Capturing);
    }

    SECTION("NextTimerTracksAttemptDeadline") {
        Rig rig;
        REQUIRE_FALSE(rig.orch.next_timer().has_value());

        rig.groq->hold(transcript("x"));
        REQUIRE(rig.orch.activate(ActivationMode::Toggle, "clipboard"));
        REQUIRE(rig.orch.stop(ActivationMode::Toggle));
        REQUIRE(rig.orch.next_timer() == std::chrono::milliseconds(20'000));

        rig.clock.advance(5s);
        REQUIRE(rig.orch.next_timer() == std::chrono::milliseconds(15'000));
        REQUIRE(rig.orch.cancel());
        REQUIRE_FALSE(rig.orch.next_timer().has_value());
    }
}

TEST_CASE("Orchestrator delivery", "[orchestrator]") {

    SECTION("DeliveryErrorFailsSessionOnce") {
        Rig rig;
        rig.sinks.fail_with = "wl-copy not found";
        rig.groq->respond(transcript("text"));

        REQUIRE(rig.orch.activate(ActivationMode::Toggle, "paste"));
        REQUIRE(rig.orch.stop(ActivationMode::Toggle));
        rig.settle(1);

        REQUIRE(rig.sinks.delivered.size() == 1);
        REQUIRE(rig.sinks.methods == std::vector<std::string>{"paste"});
        const auto& out = rig.outcomes.at(0);
        REQUIRE(out.final_state == SessionState::Failed);
        REQUIRE(out.failure->cause == FailureCause::DeliveryError);
        REQUIRE(out.text == "text");
        REQUIRE(rig.orch.state() == SessionState::Idle);
    }

    SECTION("UnknownOutputMethodIsDeliveryError") {
        Rig rig;
        rig.groq->respond(transcript("text"));

        REQUIRE(rig.orch.activate(ActivationMode::Toggle, "type"));
        REQUIRE(rig.orch.stop(ActivationMode::Toggle));
        rig.settle(1);

        REQUIRE(rig.sinks.delivered.empty());
        REQUIRE(rig.outcomes.at(0).failure->cause == FailureCause::DeliveryError);
    }

    SECTION("EmptyTranscriptionIsFatal") {
        Rig rig;
        rig.groq->respond(std::unexpected(provider_error(ProviderErrorKind::EmptyTranscription)));

        REQUIRE(rig.orch.activate(ActivationMode::Toggle, "clipboard"));
        REQUIRE(rig.orch.stop(ActivationMode::Toggle));
        rig.settle(1);

        REQUIRE(rig.deepgram->calls() == 0);
        REQUIRE(rig.outcomes.at(0).user_message() == "No speech recognized");
    }
}

TEST_CASE("Orchestrator event sequences", "[orchestrator]") {
    Rig rig;
    rig.groq->set_default(transcript("echo"));
    rig.deepgram->set_default(transcript("echo"));

    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> pick(0, 4);
    int rings = 0;
    std::set<uint64_t> finished;

    for (int step = 0; step < 300; ++step) {
        bool was_idle = rig.orch.state() == SessionState::Idle;
        auto mode = step % 3 == 0 ? ActivationMode::HoldToRecord : ActivationMode::Toggle;

        switch (pick(rng)) {
            case 0:
            case 1: {
                auto id = rig.orch.activate(mode, "clipboard");
                REQUIRE(id.has_value() == was_idle);
                break;
            }
            case 2:
                if (auto m = rig.orch.session_mode()) {
                    bool capturing = rig.orch.state() == SessionState::Capturing;
                    REQUIRE(rig.orch.stop(*m).has_value() == capturing);
                    if (capturing) rig.settle(++rings);
                }
                break;
            case 3:
                REQUIRE(rig.orch.cancel() == !was_idle);
                break;
            case 4:
                rig.orch.poll_timers();
                break;
        }

        // At most one live session, and no session ends twice.
        REQUIRE((rig.orch.state() == SessionState::Idle) == !rig.orch.session_id().has_value());
        for (auto& o : rig.outcomes) finished.insert(o.session_id);
        REQUIRE(finished.size() == rig.outcomes.size());
    }

    // Every delivery belongs to a distinct delivered session.
    size_t delivered = 0;
    for (auto& o : rig.outcomes) delivered += o.delivered() ? 1 : 0;
    REQUIRE(rig.sinks.delivered.size() == delivered);
}
