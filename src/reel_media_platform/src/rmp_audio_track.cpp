#include <reel_media_platform/rmp_audio_track.h>
#include <algorithm>
#include <cassert>
#include <cstring>

namespace rmp {

AudioSpan plan_audio_span(TimeUS audio_duration, TimeUS video_duration) {
    assert(audio_duration > 0 && video_duration > 0);

    if (audio_duration > video_duration) {
        return AudioSpan{AudioSpanMode::Trim, 1, video_duration};
    }
    if (audio_duration < video_duration) {
        return AudioSpan{AudioSpanMode::Loop, video_duration / audio_duration + 1, video_duration};
    }
    return AudioSpan{AudioSpanMode::AsIs, 1, video_duration};
}

AudioTrack::AudioTrack(MediaAsset source, std::shared_ptr<PcmChunk> pcm, AudioSpan span)
    : m_source(std::move(source)),
      m_pcm(std::move(pcm)),
      m_span(span) {
    assert(m_pcm && m_pcm->frames() > 0 && "AudioTrack needs decoded samples");
    m_total_samples = sample_count_for(m_span.span_us, m_pcm->sample_rate());
}

int64_t AudioTrack::read_samples(int64_t offset, int64_t count, float* dst) const {
    if (offset < 0 || count <= 0 || offset >= m_total_samples) {
        return 0;
    }
    count = std::min(count, m_total_samples - offset);

    const int64_t src_frames = m_pcm->frames();
    const int channels = m_pcm->channels();
    const float* src = m_pcm->data_f32();

    // Looped content is the source repeated back to back
    int64_t written = 0;
    while (written < count) {
        int64_t src_pos = (offset + written) % src_frames;
        int64_t run = std::min(count - written, src_frames - src_pos);
        std::memcpy(dst + written * channels, src + src_pos * channels,
                    static_cast<size_t>(run * channels) * sizeof(float));
        written += run;
    }
    return written;
}

Result<std::shared_ptr<AudioTrack>> AudioTrackMixer::FromPcm(const MediaAsset& audio,
                                                             std::shared_ptr<PcmChunk> pcm,
                                                             TimeUS video_duration) {
    if (video_duration <= 0) {
        return Error::invalid_arg("Video duration must be positive");
    }
    if (!pcm || pcm->frames() == 0 || pcm->duration_us() <= 0) {
        return Error::unsupported("Audio has zero length: " + audio.path);
    }

    AudioSpan span = plan_audio_span(pcm->duration_us(), video_duration);
    return std::make_shared<AudioTrack>(audio, std::move(pcm), span);
}

Result<std::shared_ptr<AudioTrack>> AudioTrackMixer::Mix(const std::optional<MediaAsset>& audio,
                                                         TimeUS video_duration,
                                                         const AudioFormat& format) {
    if (!audio) {
        return std::shared_ptr<AudioTrack>();
    }
    if (audio->kind != MediaKind::Audio) {
        return Error::invalid_arg("Not an audio asset: " + audio->path);
    }

    auto asset_result = Asset::Open(audio->path);
    if (asset_result.is_error()) {
        return asset_result.error();
    }

    auto pcm_result = asset_result.value()->DecodeAudio(format);
    if (pcm_result.is_error()) {
        return pcm_result.error();
    }

    return FromPcm(*audio, std::move(pcm_result.value()), video_duration);
}

} // namespace rmp
