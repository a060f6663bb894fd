#include "daemon_core.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <format>
#include <print>

using json = nlohmann::json;

namespace {

bool known_output_method(const std::string& method) {
    return method == "clipboard" || method == "paste";
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose,
                       AudioCapture& audio, ProviderRegistry& registry, IpcServer& ipc,
                       SinkFactory sink_factory, NotifyCallback notify, Clock clock)
    : config_(std::move(config)), verbose_(verbose), ipc_(ipc),
      orchestrator_(
          TranscriptionOrchestrator::Options{
              .min_audio_s = config_.capture.min_seconds,
              .max_capture_s = static_cast<double>(config_.capture.max_seconds),
              .verbose = verbose,
          },
          audio, registry, std::move(sink_factory), std::move(notify), std::move(clock)) {
    orchestrator_.on_transition([this](const StateTransition& t) { on_transition(t); });
    orchestrator_.on_outcome([this](const SessionOutcome& o) { on_outcome(o); });
}

DaemonCore::~DaemonCore() = default;

bool DaemonCore::init(const std::string& history_path) {
    if (!config_.history.enabled) {
        log("History disabled");
        return true;
    }

    std::string db_path = history_path;
    if (db_path.empty()) {
        auto data = platform::data_dir();
        db_path = !data.empty() ? data + "/history.db" : "/tmp/voicerelay/history.db";
    }
    if (!history_db_.open(db_path)) {
        std::println(stderr, "Warning: history DB failed to open, history disabled");
        return true;
    }

    int pruned = history_db_.prune(config_.history.retention_days);
    if (pruned > 0) log(std::format("Pruned {} history entries", pruned));
    return true;
}

json DaemonCore::handle_request(const json& request) {
    if (!request.is_object()) {
        return {{"status", "error"}, {"message", "malformed command"}};
    }
    auto it = request.find("cmd");
    if (it == request.end() || !it->is_string()) {
        return {{"status", "error"}, {"message", "missing cmd"}};
    }
    return handle_command(it->get<std::string>(), request);
}

json DaemonCore::handle_command(const std::string& cmd_str, const json& cmd) {
    try {
        return dispatch(cmd_str, cmd);
    } catch (const json::exception& e) {
        return {{"status", "error"}, {"message", std::format("bad argument: {}", e.what())}};
    }
}

json DaemonCore::dispatch(const std::string& cmd_str, const json& cmd) {
    if (cmd_str == "start") {
        auto mode = parse_activation_mode(cmd.value("mode", "toggle"));
        if (!mode) return {{"status", "error"}, {"message", "mode must be toggle or hold"}};
        return handle_start(cmd, *mode);
    }
    if (cmd_str == "press") return handle_start(cmd, ActivationMode::HoldToRecord);
    if (cmd_str == "release") return handle_stop(ActivationMode::HoldToRecord);
    if (cmd_str == "stop") {
        auto mode = parse_activation_mode(cmd.value("mode", "toggle"));
        if (!mode) return {{"status", "error"}, {"message", "mode must be toggle or hold"}};
        return handle_stop(*mode);
    }
    if (cmd_str == "toggle") return handle_toggle(cmd);
    if (cmd_str == "cancel") return handle_cancel();
    if (cmd_str == "status") return handle_status();
    if (cmd_str == "history") return handle_history(cmd);
    if (cmd_str == "watch") return {{"status", "ok"}, {"watching", true}};
    return {{"status", "error"}, {"message", "unknown command"}};
}

json DaemonCore::handle_start(const json& cmd, ActivationMode mode) {
    std::string output = cmd.value("output", config_.output.default_method);
    if (!known_output_method(output)) {
        return {{"status", "error"}, {"message", "unknown output method: " + output}};
    }

    auto id = orchestrator_.activate(mode, output);
    if (!id) {
        return {{"status", "error"}, {"message", id.error()}};
    }
    return {{"status", "ok"}, {"message", "recording"}, {"session", *id},
            {"mode", to_string(mode)}};
}

json DaemonCore::handle_stop(ActivationMode mode) {
    auto id = orchestrator_.stop(mode);
    if (!id) {
        return {{"status", "error"}, {"message", id.error()}};
    }

    // Short audio or a capture error ends the session inside stop().
    if (last_outcome_ && last_outcome_->session_id == *id) {
        return outcome_to_json(*last_outcome_);
    }
    return {{"status", "transcribing"}, {"session", *id}};
}

json DaemonCore::handle_toggle(const json& cmd) {
    if (orchestrator_.state() == SessionState::Capturing) {
        return handle_stop(ActivationMode::Toggle);
    }
    return handle_start(cmd, ActivationMode::Toggle);
}

json DaemonCore::handle_cancel() {
    bool cancelled = orchestrator_.cancel();
    return {{"status", "ok"}, {"cancelled", cancelled}};
}

json DaemonCore::handle_status() {
    json resp = {{"status", "ok"}, {"state", to_string(orchestrator_.state())}};
    if (auto id = orchestrator_.session_id()) resp["session"] = *id;
    if (auto mode = orchestrator_.session_mode()) resp["mode"] = to_string(*mode);
    if (orchestrator_.state() == SessionState::Capturing) {
        resp["duration"] = orchestrator_.capture_duration();
    }
    return resp;
}

json DaemonCore::handle_history(const json& cmd) {
    if (!history_db_.is_open()) {
        return {{"status", "error"}, {"message", "history is disabled"}};
    }

    if (cmd.value("clear", false)) {
        if (!history_db_.clear()) return {{"status", "error"}, {"message", "clear failed"}};
        return {{"status", "ok"}, {"total", history_db_.count()}};
    }
    if (cmd.contains("remove")) {
        if (!history_db_.remove(cmd["remove"].get<int64_t>())) {
            return {{"status", "error"}, {"message", "no such entry"}};
        }
        return {{"status", "ok"}, {"total", history_db_.count()}};
    }

    int limit = cmd.value("limit", 10);
    std::string query = cmd.value("query", "");
    auto entries = query.empty() ? history_db_.recent(limit) : history_db_.search(query, limit);

    json resp = {{"status", "ok"}, {"total", history_db_.count()},
                 {"entries", json::array()}};
    for (auto& e : entries) {
        resp["entries"].push_back({
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"text", e.text},
            {"audio_duration", e.audio_duration},
            {"processing_time", e.processing_time},
            {"provider", e.provider},
            {"fallback", e.used_fallback},
            {"output", e.output_method},
        });
    }
    return resp;
}

void DaemonCore::on_worker_notify() {
    orchestrator_.process_completions();
}

void DaemonCore::on_timer() {
    orchestrator_.poll_timers();
}

std::optional<std::chrono::milliseconds> DaemonCore::next_timer() const {
    return orchestrator_.next_timer();
}

void DaemonCore::on_transition(const StateTransition& t) {
    broadcast(transition_to_json(t));
}

void DaemonCore::on_outcome(const SessionOutcome& outcome) {
    last_outcome_ = outcome;

    if (!outcome.text.empty() && history_db_.is_open()) {
        std::string provider = outcome.provider ? std::string(catalog::name(*outcome.provider)) : "";
        if (!history_db_.insert(outcome.text, outcome.audio_seconds, outcome.processing_seconds,
                                provider, outcome.used_fallback, outcome.output_method)) {
            std::println(stderr, "Warning: transcript not saved to history");
        }
    }

    auto reply = outcome_to_json(outcome);
    for (int fd : waiting_clients_) {
        if (!ipc_.send_response(fd, reply)) log(std::format("Client {} left before the reply", fd));
    }
    waiting_clients_.clear();

    auto event = reply;
    event["event"] = "outcome";
    broadcast(event);
}

void DaemonCore::broadcast(const json& event) {
    std::erase_if(watchers_, [&](int fd) { return !ipc_.send_response(fd, event); });
}

json DaemonCore::outcome_to_json(const SessionOutcome& outcome) {
    json j = {{"session", outcome.session_id}};
    if (outcome.cancelled()) {
        j["status"] = "cancelled";
        return j;
    }

    if (outcome.delivered()) {
        j["status"] = "ok";
    } else {
        j["status"] = "error";
        j["error"] = outcome.failure ? outcome.failure->code() : "unknown";
        j["message"] = outcome.user_message();
    }
    if (!outcome.text.empty()) j["text"] = outcome.text;
    if (outcome.provider) {
        j["provider"] = catalog::name(*outcome.provider);
        j["fallback"] = outcome.used_fallback;
    }
    j["duration"] = outcome.audio_seconds;
    j["processing_time"] = outcome.processing_seconds;
    return j;
}

json DaemonCore::transition_to_json(const StateTransition& t) {
    json j = {
        {"event", "transition"},
        {"session", t.session_id},
        {"from", to_string(t.from)},
        {"to", to_string(t.to)},
    };
    if (!t.detail.empty()) j["detail"] = t.detail;
    return j;
}

void DaemonCore::add_waiting_client(int fd) {
    waiting_clients_.push_back(fd);
}

void DaemonCore::add_watcher(int fd) {
    watchers_.push_back(fd);
}

void DaemonCore::remove_client(int fd) {
    std::erase(waiting_clients_, fd);
    std::erase(watchers_, fd);
}

void DaemonCore::shutdown() {
    orchestrator_.shutdown();
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[voicerelay] {}", msg);
    }
}
