#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

// Lock-free single-producer single-consumer ring buffer of PCM samples.
// Producer (PipeWire thread) calls push(). Consumer (event loop) calls drain_all().
// When full, new samples are dropped and counted rather than overwriting old ones.
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity_samples)
        : buf_(capacity_samples), capacity_(capacity_samples) {}

    // Producer: append raw S16LE bytes. A trailing odd byte is ignored.
    // Returns the number of samples stored.
    size_t push(const void* data, size_t len_bytes) {
        size_t count = len_bytes / sizeof(int16_t);
        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);

        size_t space = capacity_ - (w - r);
        size_t to_write = std::min(count, space);
        if (to_write < count) {
            dropped_.fetch_add(count - to_write, std::memory_order_relaxed);
        }
        if (to_write == 0) return 0;

        auto src = static_cast<const uint8_t*>(data);
        size_t offset = w % capacity_;
        size_t first = std::min(to_write, capacity_ - offset);
        std::memcpy(buf_.data() + offset, src, first * sizeof(int16_t));
        if (first < to_write) {
            std::memcpy(buf_.data(), src + first * sizeof(int16_t),
                        (to_write - first) * sizeof(int16_t));
        }

        write_pos_.store(w + to_write, std::memory_order_release);
        return to_write;
    }

    // Consumer: take every buffered sample.
    std::vector<int16_t> drain_all() {
        size_t r = read_pos_.load(std::memory_order_relaxed);
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t avail = w - r;
        if (avail == 0) return {};

        std::vector<int16_t> out(avail);
        size_t offset = r % capacity_;
        size_t first = std::min(avail, capacity_ - offset);
        std::copy_n(buf_.begin() + static_cast<std::ptrdiff_t>(offset), first, out.begin());
        if (first < avail) {
            std::copy_n(buf_.begin(), avail - first,
                        out.begin() + static_cast<std::ptrdiff_t>(first));
        }

        read_pos_.store(r + avail, std::memory_order_release);
        return out;
    }

    size_t available() const {
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t r = read_pos_.load(std::memory_order_acquire);
        return w - r;
    }

    size_t dropped() const { return dropped_.load(std::memory_order_relaxed); }
    size_t capacity() const { return capacity_; }

    // Only call while the producer is stopped.
    void reset() {
        read_pos_.store(0, std::memory_order_relaxed);
        write_pos_.store(0, std::memory_order_relaxed);
        dropped_.store(0, std::memory_order_relaxed);
    }

private:
    std::vector<int16_t> buf_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
    std::atomic<size_t> dropped_{0};
};
