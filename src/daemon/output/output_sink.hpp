#pragma once

#include <expected>
#include <string>

// Final destination of a transcript (clipboard, paste injection).
class OutputSink {
public:
    virtual ~OutputSink() = default;
    virtual std::expected<void, std::string> deliver(const std::string& text) = 0;
};
