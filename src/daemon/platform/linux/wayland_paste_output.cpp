#include "platform/linux/wayland_paste_output.hpp"

#include "platform/linux/process_spawn.hpp"
#include "platform/linux/wayland_clipboard_output.hpp"

#include <unistd.h>

WaylandPasteOutput::WaylandPasteOutput(std::string paste_keys)
    : paste_keys_(std::move(paste_keys)) {}

std::vector<std::string> WaylandPasteOutput::wtype_args(const std::string& keys) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= keys.size()) {
        size_t plus = keys.find('+', start);
        if (plus == std::string::npos) plus = keys.size();
        if (plus > start) parts.push_back(keys.substr(start, plus - start));
        start = plus + 1;
    }
    if (parts.empty()) return {};

    std::vector<std::string> args = {"wtype"};
    for (size_t i = 0; i + 1 < parts.size(); i++) {
        args.push_back("-M");
        args.push_back(parts[i]);
    }
    args.push_back("-k");
    args.push_back(parts.back());
    return args;
}

std::expected<void, std::string> WaylandPasteOutput::deliver(const std::string& text) {
    auto args = wtype_args(paste_keys_);
    if (args.empty()) return std::unexpected("invalid paste keys: " + paste_keys_);

    WaylandClipboardOutput clip;
    auto res = clip.deliver(text);
    if (!res) return res;

    // Give the compositor time to publish the new selection.
    ::usleep(10000);

    return platform::run_process(args);
}
