#include <reel_media_platform/rmp_audio.h>

namespace rmp {

PcmChunk::PcmChunk(int32_t sample_rate, int32_t channels, std::vector<float> samples)
    : m_sample_rate(sample_rate)
    , m_channels(channels)
    , m_samples(std::move(samples)) {
}

int64_t PcmChunk::frames() const {
    if (m_channels <= 0) {
        return 0;
    }
    return static_cast<int64_t>(m_samples.size()) / m_channels;
}

TimeUS PcmChunk::duration_us() const {
    if (m_sample_rate <= 0) {
        return 0;
    }
    const int64_t rate = m_sample_rate;
    return (frames() * US_PER_SECOND + rate / 2) / rate;
}

std::shared_ptr<PcmChunk> PcmChunk::Create(int32_t sample_rate, int32_t channels,
                                           std::vector<float> samples) {
    return std::make_shared<PcmChunk>(sample_rate, channels, std::move(samples));
}

} // namespace rmp
