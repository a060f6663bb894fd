#pragma once

#include <cstdint>
#include <vector>

// Finished capture: 16-bit mono PCM.
struct AudioClip {
    std::vector<int16_t> samples;
    uint32_t sample_rate = 16000;

    double duration_s() const {
        if (sample_rate == 0) return 0.0;
        return static_cast<double>(samples.size()) / sample_rate;
    }

    bool empty() const { return samples.empty(); }
};
