#include "platform/linux/pipewire_capture.hpp"

#include <format>
#include <print>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>

class PipeWireCaptureHandle : public CaptureHandle {
public:
    explicit PipeWireCaptureHandle(PipeWireCapture& capture) : capture_(capture) {}

    ~PipeWireCaptureHandle() override {
        if (!finished_) {
            capture_.close_stream();
            capture_.discard_audio();
        }
    }

    std::expected<AudioClip, std::string> finish() override {
        if (finished_) return std::unexpected("capture already finished");
        finished_ = true;
        capture_.close_stream();
        return PipeWireCapture::checked_clip(capture_.take_audio(), capture_.stream_health());
    }

private:
    PipeWireCapture& capture_;
    bool finished_ = false;
};

PipeWireCapture::PipeWireCapture(RingBuffer& ring_buf, uint32_t sample_rate)
    : ring_buf_(ring_buf), sample_rate_(sample_rate) {
    pw_init(nullptr, nullptr);
}

PipeWireCapture::~PipeWireCapture() {
    close_stream();
    pw_deinit();
}

std::expected<std::unique_ptr<CaptureHandle>, std::string> PipeWireCapture::start() {
    if (capturing_.load(std::memory_order_relaxed)) {
        return std::unexpected("capture already running");
    }

    ring_buf_.reset();
    reached_streaming_.store(false, std::memory_order_relaxed);
    {
        std::lock_guard lock(error_mutex_);
        stream_error_.clear();
    }
    if (auto opened = open_stream(); !opened) {
        return std::unexpected(opened.error());
    }
    return std::make_unique<PipeWireCaptureHandle>(*this);
}

std::expected<void, std::string> PipeWireCapture::open_stream() {
    loop_ = pw_thread_loop_new("voicerelay", nullptr);
    if (!loop_) {
        std::println(stderr, "audio: failed to create thread loop");
        return std::unexpected("failed to create PipeWire thread loop");
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "voicerelay",
        PW_KEY_APP_NAME, "voicerelay",
        nullptr
    );

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "voicerelay-capture",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        std::println(stderr, "audio: failed to create stream");
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        return std::unexpected("failed to create PipeWire stream");
    }

    // S16_LE, mono, configured rate
    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE,
        .rate = sample_rate_,
        .channels = 1
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS
        ),
        params, 1
    );
    if (ret >= 0) ret = pw_thread_loop_start(loop_);

    if (ret < 0) {
        std::println(stderr, "audio: stream start failed: {}", spa_strerror(ret));
        pw_stream_destroy(stream_);
        stream_ = nullptr;
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        return std::unexpected(std::format("microphone unavailable ({})", spa_strerror(ret)));
    }

    capturing_.store(true, std::memory_order_release);
    return {};
}

void PipeWireCapture::close_stream() {
    capturing_.store(false, std::memory_order_release);

    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

AudioClip PipeWireCapture::take_audio() {
    if (auto dropped = ring_buf_.dropped(); dropped > 0) {
        std::println(stderr, "audio: buffer full, dropped {} samples", dropped);
    }
    AudioClip clip{.samples = ring_buf_.drain_all(), .sample_rate = sample_rate_};
    ring_buf_.reset();
    return clip;
}

void PipeWireCapture::discard_audio() {
    ring_buf_.reset();
}

PipeWireCapture::StreamHealth PipeWireCapture::stream_health() const {
    std::lock_guard lock(error_mutex_);
    return StreamHealth{
        .reached_streaming = reached_streaming_.load(std::memory_order_acquire),
        .error = stream_error_,
    };
}

std::expected<AudioClip, std::string> PipeWireCapture::checked_clip(AudioClip clip,
                                                                    const StreamHealth& health) {
    if (!health.error.empty()) {
        return std::unexpected(std::format("microphone unavailable: {}", health.error));
    }
    // Autoconnect succeeds even without a source node; such a stream never starts.
    if (!health.reached_streaming && clip.empty()) {
        return std::unexpected("microphone unavailable: no audio source connected");
    }
    return clip;
}

void PipeWireCapture::on_process(void* userdata) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (!d->data) {
        pw_stream_queue_buffer(self->stream_, buf);
        return;
    }

    auto* data = static_cast<const uint8_t*>(d->data) + d->chunk->offset;
    size_t size = d->chunk->size;

    if (self->capturing_.load(std::memory_order_relaxed)) {
        self->ring_buf_.push(data, size);
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireCapture::on_state_changed(void* userdata, enum pw_stream_state old,
                                       enum pw_stream_state state, const char* error) {
    auto* self = static_cast<PipeWireCapture*>(userdata);
    if (state == PW_STREAM_STATE_STREAMING) {
        self->reached_streaming_.store(true, std::memory_order_release);
    } else if (state == PW_STREAM_STATE_ERROR) {
        std::lock_guard lock(self->error_mutex_);
        self->stream_error_ = error ? error : "stream error";
    } else if (state == PW_STREAM_STATE_UNCONNECTED && old == PW_STREAM_STATE_STREAMING &&
               self->capturing_.load(std::memory_order_relaxed)) {
        std::lock_guard lock(self->error_mutex_);
        self->stream_error_ = "audio source disconnected";
    }
    if (error) {
        std::println(stderr, "audio: stream state {} -> {}: {}",
                     pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state),
                     error);
    }
}
