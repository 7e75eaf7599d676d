#pragma once

#include "rmp_time.h"
#include <cstdint>
#include <memory>
#include <vector>

namespace rmp {

// Mix format: interleaved float32 at `sample_rate`
struct AudioFormat {
    int32_t sample_rate;
    int32_t channels;
};

// What DecodeAudio produces for the AAC encoder
constexpr AudioFormat DEFAULT_AUDIO_FORMAT = {48000, 2};

// A whole decoded soundtrack in memory, interleaved float32.
// Immutable after creation; the mixer and the encoder share it.
class PcmChunk {
public:
    PcmChunk(int32_t sample_rate, int32_t channels, std::vector<float> samples);

    int32_t sample_rate() const { return m_sample_rate; }
    int32_t channels() const { return m_channels; }

    // Sample-frames (samples per channel); a trailing partial frame is ignored
    int64_t frames() const;

    // frames() at sample_rate(), rounded to the nearest microsecond
    TimeUS duration_us() const;

    // frames() * channels() floats
    const float* data_f32() const { return m_samples.data(); }

    static std::shared_ptr<PcmChunk> Create(int32_t sample_rate, int32_t channels,
                                            std::vector<float> samples);

private:
    int32_t m_sample_rate;
    int32_t m_channels;
    std::vector<float> m_samples;
};

} // namespace rmp
