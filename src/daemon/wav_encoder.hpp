#pragma once

#include "audio_clip.hpp"

#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

// In-memory RIFF/WAVE container for the PCM that providers upload.
namespace wav {

constexpr size_t header_size = 44;

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    const uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    const uint16_t block_align = channels * bits_per_sample / 8;
    const auto data_size = static_cast<uint32_t>(samples.size_bytes());

    std::vector<uint8_t> out;
    out.reserve(header_size + data_size);

    auto put = [&out](const void* data, size_t len) {
        auto p = static_cast<const uint8_t*>(data);
        out.insert(out.end(), p, p + len);
    };
    auto put16 = [&put](uint16_t v) { put(&v, sizeof(v)); };
    auto put32 = [&put](uint32_t v) { put(&v, sizeof(v)); };

    put("RIFF", 4);
    put32(36 + data_size);
    put("WAVE", 4);
    put("fmt ", 4);
    put32(16);
    put16(1); // PCM
    put16(channels);
    put32(sample_rate);
    put32(byte_rate);
    put16(block_align);
    put16(bits_per_sample);
    put("data", 4);
    put32(data_size);
    put(samples.data(), data_size);

    return out;
}

inline std::vector<uint8_t> encode(const AudioClip& clip) {
    return encode(clip.samples, clip.sample_rate);
}

} // namespace wav
