#pragma once

#include "platform/audio_capture.hpp"
#include "ring_buffer.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>

// Captures S16LE mono from the default PipeWire source into a ring buffer.
// One capture at a time; the returned handle owns the running stream.
class PipeWireCapture : public AudioCapture {
public:
    explicit PipeWireCapture(RingBuffer& ring_buf, uint32_t sample_rate = 16000);
    ~PipeWireCapture() override;

    PipeWireCapture(const PipeWireCapture&) = delete;
    PipeWireCapture& operator=(const PipeWireCapture&) = delete;

    std::expected<std::unique_ptr<CaptureHandle>, std::string> start() override;
    bool is_capturing() const override { return capturing_.load(std::memory_order_relaxed); }

    // What the stream reported while a capture was running.
    struct StreamHealth {
        bool reached_streaming = false;
        std::string error; // set when the stream entered the error state
    };

    // A stream error, or a stream that never delivered audio, means the device
    // was unavailable; the clip is only returned when the stream was healthy.
    static std::expected<AudioClip, std::string> checked_clip(AudioClip clip,
                                                              const StreamHealth& health);

private:
    friend class PipeWireCaptureHandle;

    std::expected<void, std::string> open_stream();
    void close_stream();
    AudioClip take_audio();
    void discard_audio();
    StreamHealth stream_health() const;

    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    RingBuffer& ring_buf_;
    uint32_t sample_rate_;
    std::atomic<bool> capturing_{false};

    // Written from the PipeWire thread in on_state_changed.
    std::atomic<bool> reached_streaming_{false};
    mutable std::mutex error_mutex_;
    std::string stream_error_;

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};
