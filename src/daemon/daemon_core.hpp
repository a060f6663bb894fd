#pragma once

#include "config.hpp"
#include "orchestrator.hpp"
#include "platform/audio_capture.hpp"
#include "platform/ipc_server.hpp"
#include "storage/history_db.hpp"
#include "transcription/provider_registry.hpp"

#include <chrono>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Portable daemon logic: maps control commands onto the orchestrator, replies
// to deferred clients when a session ends, streams transitions to watchers and
// records transcripts in the history database.
class DaemonCore {
public:
    using SinkFactory = TranscriptionOrchestrator::SinkFactory;
    using NotifyCallback = TranscriptionOrchestrator::NotifyCallback;
    using Clock = TranscriptionOrchestrator::Clock;

    DaemonCore(Config config, bool verbose,
               AudioCapture& audio, ProviderRegistry& registry, IpcServer& ipc,
               SinkFactory sink_factory, NotifyCallback notify, Clock clock = {});
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Opens history (at history_path, or the data dir when empty) and prunes it.
    bool init(const std::string& history_path = {});

    // One decoded line from a client. Anything but a JSON object is malformed.
    nlohmann::json handle_request(const nlohmann::json& request);

    // A reply with status "transcribing" is deferred: the caller must register
    // the client with add_waiting_client() and it is answered on completion.
    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    void on_worker_notify();
    void on_timer();
    std::optional<std::chrono::milliseconds> next_timer() const;

    void add_waiting_client(int fd);
    void add_watcher(int fd);
    void remove_client(int fd);

    const std::optional<SessionOutcome>& last_outcome() const { return last_outcome_; }
    HistoryDb& history() { return history_db_; }

    void shutdown();

    static nlohmann::json outcome_to_json(const SessionOutcome& outcome);
    static nlohmann::json transition_to_json(const StateTransition& t);

private:
    nlohmann::json dispatch(const std::string& cmd_str, const nlohmann::json& cmd);
    nlohmann::json handle_start(const nlohmann::json& cmd, ActivationMode mode);
    nlohmann::json handle_stop(ActivationMode mode);
    nlohmann::json handle_toggle(const nlohmann::json& cmd);
    nlohmann::json handle_cancel();
    nlohmann::json handle_status();
    nlohmann::json handle_history(const nlohmann::json& cmd);

    void on_transition(const StateTransition& t);
    void on_outcome(const SessionOutcome& outcome);
    void broadcast(const nlohmann::json& event);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    IpcServer& ipc_;

    HistoryDb history_db_;
    std::optional<SessionOutcome> last_outcome_;
    std::vector<int> waiting_clients_;
    std::vector<int> watchers_;

    // Last: its workers are joined before the members above go away.
    TranscriptionOrchestrator orchestrator_;
};
