#pragma once

#include "rmp_asset.h"
#include "rmp_audio.h"
#include "rmp_errors.h"
#include "rmp_time.h"
#include <memory>
#include <optional>

namespace rmp {

enum class AudioSpanMode {
    AsIs,   // source already matches the video
    Trim,   // source longer: keep [0, video)
    Loop    // source shorter: repeat loop_count times, then trim to video
};

// How a source of `audio` length is fitted to a video of `video` length
struct AudioSpan {
    AudioSpanMode mode;
    int64_t loop_count;   // copies concatenated before trimming (1 unless Loop)
    TimeUS span_us;       // always the video duration
};

// Pure planning step. Precondition: audio_duration > 0, video_duration > 0.
// Loop count is floor(video / audio) + 1.
AudioSpan plan_audio_span(TimeUS audio_duration, TimeUS video_duration);

// Audio reconciled to a video timeline: decoded PCM plus the span plan.
// duration_us() equals the video duration exactly.
class AudioTrack {
public:
    AudioTrack(MediaAsset source, std::shared_ptr<PcmChunk> pcm, AudioSpan span);

    AudioTrack(const AudioTrack&) = delete;
    AudioTrack& operator=(const AudioTrack&) = delete;

    const MediaAsset& source() const { return m_source; }
    const AudioSpan& span() const { return m_span; }
    TimeUS duration_us() const { return m_span.span_us; }

    int32_t sample_rate() const { return m_pcm->sample_rate(); }
    int32_t channels() const { return m_pcm->channels(); }

    // Sample-frames in the source and in the fitted span
    int64_t source_samples() const { return m_pcm->frames(); }
    int64_t total_samples() const { return m_total_samples; }

    // Copy up to `count` sample-frames of the span starting at `offset` into dst
    // (interleaved, count * channels() floats). Returns frames copied; the tail
    // past total_samples() is left untouched.
    int64_t read_samples(int64_t offset, int64_t count, float* dst) const;

private:
    MediaAsset m_source;
    std::shared_ptr<PcmChunk> m_pcm;
    AudioSpan m_span;
    int64_t m_total_samples;
};

// Reconciles an optional audio asset against the video duration
class AudioTrackMixer {
public:
    // No asset -> nullptr (silent output). Decodes to `format` (float32 stereo).
    static Result<std::shared_ptr<AudioTrack>> Mix(const std::optional<MediaAsset>& audio,
                                                   TimeUS video_duration,
                                                   const AudioFormat& format = DEFAULT_AUDIO_FORMAT);

    // Fit already decoded PCM to the video duration
    static Result<std::shared_ptr<AudioTrack>> FromPcm(const MediaAsset& audio,
                                                       std::shared_ptr<PcmChunk> pcm,
                                                       TimeUS video_duration);
};

} // namespace rmp
