#pragma once

#include "audio_clip.hpp"

#include <expected>
#include <memory>
#include <string>

// One in-progress microphone capture, owned by the session while capturing.
// Destroying a handle without finish() stops the device and discards every
// buffered sample.
class CaptureHandle {
public:
    virtual ~CaptureHandle() = default;

    // Stops the device and hands over the captured audio. Call at most once.
    virtual std::expected<AudioClip, std::string> finish() = 0;
};

class AudioCapture {
public:
    virtual ~AudioCapture() = default;
    virtual std::expected<std::unique_ptr<CaptureHandle>, std::string> start() = 0;
    virtual bool is_capturing() const = 0;
};
