#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

namespace {

// A deferred reply can take two provider timeouts plus delivery.
constexpr int transcription_timeout_ms = 180'000;

void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  start [--hold] [--output clipboard|paste]  Start recording");
    std::println(stderr, "  stop                               Stop a toggle recording and transcribe");
    std::println(stderr, "  toggle [--output clipboard|paste]  Start, or stop and transcribe");
    std::println(stderr, "  press [--output clipboard|paste]   Start a hold-to-record recording");
    std::println(stderr, "  release                            Stop a hold-to-record recording");
    std::println(stderr, "  cancel                             Abandon the current session");
    std::println(stderr, "  status                             Show daemon status");
    std::println(stderr, "  history [--limit N] [--query TEXT] Show transcription history");
    std::println(stderr, "  history --remove ID | --clear      Edit transcription history");
    std::println(stderr, "  watch                              Stream state transitions");
}

void print_event(const json& event) {
    if (event.value("event", "") == "transition") {
        std::println("session {}: {} -> {}{}", event.value("session", 0),
                     event.value("from", ""), event.value("to", ""),
                     event.contains("detail") ? " (" + event.value("detail", "") + ")" : "");
        return;
    }

    auto status = event.value("status", "");
    if (status == "ok") {
        std::println("session {}: delivered via {}{}", event.value("session", 0),
                     event.value("provider", "?"), event.value("fallback", false) ? " (fallback)" : "");
    } else if (status == "error") {
        std::println("session {}: {}", event.value("session", 0), event.value("message", ""));
    } else if (status == "cancelled") {
        std::println("session {}: cancelled", event.value("session", 0));
    }
}

// Prints a final session reply; returns the process exit code.
int print_outcome(const json& response) {
    auto status = response.value("status", "");
    if (status == "ok") {
        if (response.contains("text")) {
            std::println("{}", response["text"].get<std::string>());
        } else {
            std::println("OK");
        }
        return 0;
    }
    if (status == "cancelled") return 0;
    if (status == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }
    std::println("{}", response.dump(2));
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string output_method;
    std::string query;
    bool hold = false;
    bool clear = false;
    long long remove_id = -1;
    int limit = 10;

    // Parse optional args
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--output" && i + 1 < argc) {
            output_method = argv[++i];
        } else if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else if (arg == "--query" && i + 1 < argc) {
            query = argv[++i];
        } else if (arg == "--remove" && i + 1 < argc) {
            remove_id = std::atoll(argv[++i]);
        } else if (arg == "--clear") {
            clear = true;
        } else if (arg == "--hold") {
            hold = true;
        }
    }

    // Build command JSON
    json cmd;
    if (command == "start" || command == "toggle" || command == "press") {
        cmd = {{"cmd", command}};
        if (command == "start") cmd["mode"] = hold ? "hold" : "toggle";
        if (!output_method.empty()) cmd["output"] = output_method;
    } else if (command == "stop" || command == "release" || command == "cancel" ||
               command == "status" || command == "watch") {
        cmd = {{"cmd", command}};
    } else if (command == "history") {
        cmd = {{"cmd", "history"}, {"limit", limit}};
        if (!query.empty()) cmd["query"] = query;
        if (remove_id >= 0) cmd["remove"] = remove_id;
        if (clear) cmd["clear"] = true;
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    // Connect and send
    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is voicerelayd running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    json response;
    if (!client.recv(response, transcription_timeout_ms)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    auto status = response.value("status", "");

    if (command == "watch") {
        if (status != "ok") return print_outcome(response);
        while (client.recv(response, -1)) {
            print_event(response);
        }
        return 0;
    }

    if (command == "status") {
        std::println("State: {}", response.value("state", "unknown"));
        if (response.contains("session")) {
            std::println("Session: {} ({})", response["session"].get<uint64_t>(),
                         response.value("mode", ""));
        }
        if (response.contains("duration")) {
            std::println("Recording duration: {:.1f}s", response["duration"].get<double>());
        }
        return 0;
    }

    if (command == "history" && status == "ok") {
        if (response.contains("entries")) {
            for (auto& entry : response["entries"]) {
                std::println("#{} [{}] {}", entry.value("id", 0LL), entry.value("timestamp", ""),
                             entry.value("text", ""));
                if (entry.contains("provider") && !entry["provider"].is_null()) {
                    std::println("  via {}{}", entry["provider"].get<std::string>(),
                                 entry.value("fallback", false) ? " (fallback)" : "");
                }
            }
        }
        std::println("{} entries stored", response.value("total", 0LL));
        return 0;
    }

    if (status == "ok" && response.contains("message") && !response.contains("text")) {
        std::println("{}", response["message"].get<std::string>());
        return 0;
    }
    if (command == "cancel" && status == "ok") {
        if (!response.value("cancelled", false)) std::println("Nothing to cancel");
        return 0;
    }

    return print_outcome(response);
}
