#include <reel_media_platform/rmp_encoder.h>
#include "impl/ffmpeg_context.h"
#include "impl/ffmpeg_encode.h"
#include "impl/ffmpeg_resample.h"
#include <algorithm>
#include <cassert>
#include <cstdio>
#include <vector>

namespace rmp {

namespace {

// Removes the output file unless the render committed it
class OutputFileGuard {
public:
    explicit OutputFileGuard(std::string path) : m_path(std::move(path)) {}
    ~OutputFileGuard() {
        if (!m_committed) {
            std::remove(m_path.c_str());
        }
    }

    OutputFileGuard(const OutputFileGuard&) = delete;
    OutputFileGuard& operator=(const OutputFileGuard&) = delete;

    void commit() { m_committed = true; }

private:
    std::string m_path;
    bool m_committed = false;
};

// Per-render audio state: source track -> encoder frames
struct AudioStage {
    impl::FFmpegEncoderContext encoder;
    impl::FFmpegResampleContext resample;
    impl::FFmpegFrame frame;
    AVStream* stream = nullptr;
    int frame_size = 0;
    int64_t next_sample = 0;
    std::vector<float> interleaved;
};

Result<void> encode_audio_frame(AudioStage& audio, const AudioTrack& track,
                                AVFormatContext* fmt_ctx, AVPacket* pkt) {
    const int64_t remaining = track.total_samples() - audio.next_sample;
    const int count = static_cast<int>(std::min<int64_t>(audio.frame_size, remaining));
    assert(count > 0);

    AVFrame* frame = audio.frame.get();
    av_frame_unref(frame);
    frame->format = audio.encoder.get()->sample_fmt;
    frame->sample_rate = audio.encoder.get()->sample_rate;
    frame->nb_samples = count;
    int ret = av_channel_layout_copy(&frame->ch_layout, &audio.encoder.get()->ch_layout);
    if (ret < 0) {
        return impl::ffmpeg_error(ret, "av_channel_layout_copy");
    }
    ret = av_frame_get_buffer(frame, 0);
    if (ret < 0) {
        return impl::ffmpeg_error(ret, "av_frame_get_buffer(audio)");
    }

    audio.interleaved.assign(static_cast<size_t>(count) * track.channels(), 0.0f);
    track.read_samples(audio.next_sample, count, audio.interleaved.data());

    const uint8_t* src[1] = { reinterpret_cast<const uint8_t*>(audio.interleaved.data()) };
    auto converted = audio.resample.convert(src, count, frame->extended_data, count);
    if (converted.is_error()) {
        return converted.error();
    }
    if (converted.value() != count) {
        return Error::encode_failed("Audio sample conversion produced " +
                                    std::to_string(converted.value()) + " of " +
                                    std::to_string(count) + " samples");
    }

    frame->pts = audio.next_sample;
    audio.next_sample += count;
    return impl::encode_and_write(audio.encoder.get(), frame, fmt_ctx, audio.stream, pkt);
}

} // namespace

Encoder::Encoder(OutputPathProvider output_path, EncoderSettings settings)
    : m_output_path(std::move(output_path)),
      m_settings(std::move(settings)) {
}

Result<std::string> Encoder::render(const Timeline& timeline, const AudioTrack* audio,
                                    const RenderParameters& params) const {
    impl::init_ffmpeg_logging();

    if (!params.is_valid()) {
        return Error::invalid_arg("Render parameters out of range");
    }
    if (!params.has_even_size()) {
        return Error::invalid_arg("YUV 4:2:0 output needs even dimensions");
    }
    if (timeline.empty() || timeline.duration_us() <= 0) {
        return Error::invalid_arg("Nothing to encode: empty timeline");
    }
    if (audio && audio->sample_rate() != m_settings.audio_sample_rate) {
        return Error::invalid_arg("Audio track rate " + std::to_string(audio->sample_rate()) +
                                  " differs from encoder rate " +
                                  std::to_string(m_settings.audio_sample_rate));
    }
    if (!m_output_path) {
        return Error::invalid_arg("No output path provider");
    }

    const std::string path = m_output_path();
    if (path.empty()) {
        return Error::invalid_arg("Output path provider returned an empty path");
    }

    // Declared before the muxer so the file is closed before it is removed
    OutputFileGuard guard(path);

    impl::FFmpegOutputContext output;
    auto open_result = output.open(path);
    if (open_result.is_error()) {
        return open_result.error();
    }

    // Video stream
    impl::FFmpegEncoderContext video;
    impl::VideoEncodeConfig video_config;
    video_config.codec_name = m_settings.video_codec;
    video_config.width = params.target_width;
    video_config.height = params.target_height;
    video_config.fps = params.fps;
    video_config.crf = m_settings.crf;
    video_config.preset = m_settings.preset;
    video_config.threads = m_settings.threads;
    video_config.global_header = output.needs_global_header();

    auto video_open = video.open_video(video_config);
    if (video_open.is_error()) {
        return video_open.error();
    }
    auto video_stream = output.add_stream();
    if (video_stream.is_error()) {
        return video_stream.error();
    }
    auto video_attach = video.attach(video_stream.value());
    if (video_attach.is_error()) {
        return video_attach.error();
    }

    // Audio stream
    AudioStage audio_stage;
    if (audio) {
        impl::AudioEncodeConfig audio_config;
        audio_config.codec_name = m_settings.audio_codec;
        audio_config.sample_rate = m_settings.audio_sample_rate;
        audio_config.bit_rate = m_settings.audio_bitrate;
        audio_config.global_header = output.needs_global_header();

        auto audio_open = audio_stage.encoder.open_audio(audio_config);
        if (audio_open.is_error()) {
            return audio_open.error();
        }
        auto audio_stream = output.add_stream();
        if (audio_stream.is_error()) {
            return audio_stream.error();
        }
        audio_stage.stream = audio_stream.value();
        auto audio_attach = audio_stage.encoder.attach(audio_stage.stream);
        if (audio_attach.is_error()) {
            return audio_attach.error();
        }

        AVChannelLayout track_layout;
        av_channel_layout_default(&track_layout, audio->channels());
        auto resample_init = audio_stage.resample.init(
            track_layout, AV_SAMPLE_FMT_FLT, audio->sample_rate(),
            audio_stage.encoder.get()->sample_fmt, audio_stage.encoder.get()->sample_rate);
        av_channel_layout_uninit(&track_layout);
        if (resample_init.is_error()) {
            return resample_init.error();
        }

        audio_stage.frame_size = audio_stage.encoder.audio_frame_size();
        if (!audio_stage.frame) {
            return Error::internal("Failed to allocate audio frame");
        }
    }

    auto header_result = output.write_header();
    if (header_result.is_error()) {
        return header_result.error();
    }

    impl::FFmpegPacket pkt;
    impl::FFmpegFrame yuv;
    if (!pkt || !yuv) {
        return Error::internal("Failed to allocate encode packet/frame");
    }
    yuv.get()->format = AV_PIX_FMT_YUV420P;
    yuv.get()->width = params.target_width;
    yuv.get()->height = params.target_height;
    int ret = av_frame_get_buffer(yuv.get(), 32);
    if (ret < 0) {
        return impl::ffmpeg_error(ret, "av_frame_get_buffer(video)");
    }

    impl::FFmpegScaleContext scale;
    const Rate rate{params.fps, 1};
    const int64_t frame_count = frame_count_for(timeline.duration_us(), rate);
    const TimeUS last_time = timeline.duration_us() - 1;

    for (int64_t i = 0; i < frame_count; ++i) {
        const TimeUS t = std::min(FrameTime::from_frame(i, rate).to_us(), last_time);

        // Keep audio ahead of (or level with) the video being written
        while (audio && audio_stage.next_sample < audio->total_samples() &&
               audio_stage.next_sample * US_PER_SECOND <= t * audio->sample_rate()) {
            auto audio_result = encode_audio_frame(audio_stage, *audio, output.get(), pkt.get());
            if (audio_result.is_error()) {
                return audio_result.error();
            }
        }

        auto frame_result = timeline.render_frame(t);
        if (frame_result.is_error()) {
            return frame_result.error();
        }
        const Frame& composed = *frame_result.value();

        // Exact resize to the target on every frame
        auto scale_init = scale.init(composed.width(), composed.height(), AV_PIX_FMT_BGRA,
                                     params.target_width, params.target_height,
                                     AV_PIX_FMT_YUV420P);
        if (scale_init.is_error()) {
            return scale_init.error();
        }

        ret = av_frame_make_writable(yuv.get());
        if (ret < 0) {
            return impl::ffmpeg_error(ret, "av_frame_make_writable");
        }

        const uint8_t* src_planes[4] = {composed.data(), nullptr, nullptr, nullptr};
        const int src_strides[4] = {composed.stride_bytes(), 0, 0, 0};
        auto scaled = scale.scale(src_planes, src_strides, composed.height(),
                                  yuv.get()->data, yuv.get()->linesize);
        if (scaled.is_error()) {
            return scaled.error();
        }

        yuv.get()->pts = i;
        auto write_result = impl::encode_and_write(video.get(), yuv.get(), output.get(),
                                                   video_stream.value(), pkt.get());
        if (write_result.is_error()) {
            return write_result.error();
        }
    }

    auto video_flush = impl::encode_and_write(video.get(), nullptr, output.get(),
                                              video_stream.value(), pkt.get());
    if (video_flush.is_error()) {
        return video_flush.error();
    }

    if (audio) {
        while (audio_stage.next_sample < audio->total_samples()) {
            auto audio_result = encode_audio_frame(audio_stage, *audio, output.get(), pkt.get());
            if (audio_result.is_error()) {
                return audio_result.error();
            }
        }
        auto audio_flush = impl::encode_and_write(audio_stage.encoder.get(), nullptr,
                                                  output.get(), audio_stage.stream, pkt.get());
        if (audio_flush.is_error()) {
            return audio_flush.error();
        }
    }

    auto trailer_result = output.write_trailer();
    if (trailer_result.is_error()) {
        return trailer_result.error();
    }

    guard.commit();
    return path;
}

} // namespace rmp
