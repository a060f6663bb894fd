#pragma once

#include "output/output_sink.hpp"

// Copies the transcript with wl-copy.
class WaylandClipboardOutput : public OutputSink {
public:
    std::expected<void, std::string> deliver(const std::string& text) override;
};
