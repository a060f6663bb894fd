#include "platform/linux/wayland_clipboard_output.hpp"

#include "platform/linux/process_spawn.hpp"

std::expected<void, std::string> WaylandClipboardOutput::deliver(const std::string& text) {
    return platform::run_process({"wl-copy"}, &text);
}
