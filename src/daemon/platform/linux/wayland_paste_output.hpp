#pragma once

#include "output/output_sink.hpp"

#include <string>
#include <vector>

// Copies the transcript to the clipboard, then injects the paste chord with wtype.
class WaylandPasteOutput : public OutputSink {
public:
    explicit WaylandPasteOutput(std::string paste_keys = "ctrl+v");
    std::expected<void, std::string> deliver(const std::string& text) override;

    // "ctrl+shift+v" -> wtype -M ctrl -M shift -k v. Empty when keys has no key.
    static std::vector<std::string> wtype_args(const std::string& keys);

private:
    std::string paste_keys_;
};
