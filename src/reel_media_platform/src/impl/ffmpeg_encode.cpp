#include "ffmpeg_encode.h"
#include "ffmpeg_context.h"
#include <cassert>

namespace rmp {
namespace impl {

// FFmpegOutputContext implementation

FFmpegOutputContext::~FFmpegOutputContext() {
    if (m_fmt_ctx) {
        if (!(m_fmt_ctx->oformat->flags & AVFMT_NOFILE) && m_fmt_ctx->pb) {
            avio_closep(&m_fmt_ctx->pb);
        }
        avformat_free_context(m_fmt_ctx);
        m_fmt_ctx = nullptr;
    }
}

Result<void> FFmpegOutputContext::open(const std::string& path) {
    if (path.empty()) {
        return Error::invalid_arg("Empty output path");
    }

    int ret = avformat_alloc_output_context2(&m_fmt_ctx, nullptr, nullptr, path.c_str());
    if (ret < 0 || !m_fmt_ctx) {
        ret = avformat_alloc_output_context2(&m_fmt_ctx, nullptr, "mp4", path.c_str());
    }
    if (ret < 0 || !m_fmt_ctx) {
        return ffmpeg_error(ret, "avformat_alloc_output_context2(" + path + ")");
    }

    if (!(m_fmt_ctx->oformat->flags & AVFMT_NOFILE)) {
        ret = avio_open(&m_fmt_ctx->pb, path.c_str(), AVIO_FLAG_WRITE);
        if (ret < 0) {
            return ffmpeg_error(ret, "avio_open(" + path + ")");
        }
    }
    return Result<void>();
}

Result<AVStream*> FFmpegOutputContext::add_stream() {
    assert(m_fmt_ctx && "Output context not opened");
    AVStream* stream = avformat_new_stream(m_fmt_ctx, nullptr);
    if (!stream) {
        return Error::internal("avformat_new_stream failed");
    }
    return stream;
}

Result<void> FFmpegOutputContext::write_header() {
    int ret = avformat_write_header(m_fmt_ctx, nullptr);
    if (ret < 0) {
        return ffmpeg_error(ret, "avformat_write_header").as(ErrorCode::EncodeFailed);
    }
    m_header_written = true;
    return Result<void>();
}

Result<void> FFmpegOutputContext::write_trailer() {
    if (!m_header_written) {
        return Error::internal("write_trailer before write_header");
    }
    int ret = av_write_trailer(m_fmt_ctx);
    if (ret < 0) {
        return ffmpeg_error(ret, "av_write_trailer").as(ErrorCode::EncodeFailed);
    }
    return Result<void>();
}

bool FFmpegOutputContext::needs_global_header() const {
    return m_fmt_ctx && (m_fmt_ctx->oformat->flags & AVFMT_GLOBALHEADER);
}

// FFmpegEncoderContext implementation

FFmpegEncoderContext::~FFmpegEncoderContext() {
    if (m_codec_ctx) {
        avcodec_free_context(&m_codec_ctx);
    }
}

Result<void> FFmpegEncoderContext::alloc(const AVCodec* codec) {
    if (m_codec_ctx) {
        avcodec_free_context(&m_codec_ctx);
    }
    m_codec_ctx = avcodec_alloc_context3(codec);
    if (!m_codec_ctx) {
        return Error::internal("avcodec_alloc_context3 failed");
    }
    return Result<void>();
}

Result<void> FFmpegEncoderContext::open_video(const VideoEncodeConfig& config) {
    if (config.width <= 0 || config.height <= 0 || config.fps <= 0) {
        return Error::invalid_arg("Video encoder needs positive size and fps");
    }

    const AVCodec* codec = nullptr;
    if (!config.codec_name.empty()) {
        codec = avcodec_find_encoder_by_name(config.codec_name.c_str());
    }
    if (!codec) codec = avcodec_find_encoder(AV_CODEC_ID_H264);
    if (!codec) codec = avcodec_find_encoder(AV_CODEC_ID_MPEG4);
    if (!codec) {
        return Error::unsupported("No H.264 or MPEG-4 video encoder available");
    }

    auto alloc_result = alloc(codec);
    if (alloc_result.is_error()) {
        return alloc_result;
    }

    m_codec_ctx->width = config.width;
    m_codec_ctx->height = config.height;
    m_codec_ctx->time_base = AVRational{1, config.fps};
    m_codec_ctx->framerate = AVRational{config.fps, 1};
    m_codec_ctx->pix_fmt = AV_PIX_FMT_YUV420P;
    m_codec_ctx->gop_size = config.fps * 2;
    if (config.threads > 0) {
        m_codec_ctx->thread_count = config.threads;
    }
    if (config.global_header) {
        m_codec_ctx->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    AVDictionary* opts = nullptr;
    if (codec->id == AV_CODEC_ID_H264) {
        av_dict_set(&opts, "crf", std::to_string(config.crf).c_str(), 0);
        if (!config.preset.empty()) {
            av_dict_set(&opts, "preset", config.preset.c_str(), 0);
        }
    }

    int ret = avcodec_open2(m_codec_ctx, codec, &opts);
    av_dict_free(&opts);
    if (ret < 0) {
        return ffmpeg_error(ret, std::string("avcodec_open2(") + codec->name + ")");
    }
    return Result<void>();
}

Result<void> FFmpegEncoderContext::open_audio(const AudioEncodeConfig& config) {
    if (config.sample_rate <= 0) {
        return Error::invalid_arg("Audio encoder needs a positive sample rate");
    }

    const AVCodec* codec = nullptr;
    if (!config.codec_name.empty()) {
        codec = avcodec_find_encoder_by_name(config.codec_name.c_str());
    }
    if (!codec) codec = avcodec_find_encoder(AV_CODEC_ID_AAC);
    if (!codec) {
        return Error::unsupported("No AAC audio encoder available");
    }

    auto alloc_result = alloc(codec);
    if (alloc_result.is_error()) {
        return alloc_result;
    }

    // Codec's first advertised format (FLTP for the native AAC encoder)
    AVSampleFormat sample_fmt = AV_SAMPLE_FMT_FLTP;
    if (codec->sample_fmts && codec->sample_fmts[0] != AV_SAMPLE_FMT_NONE) {
        sample_fmt = codec->sample_fmts[0];
    }

    m_codec_ctx->sample_fmt = sample_fmt;
    m_codec_ctx->sample_rate = config.sample_rate;
    av_channel_layout_default(&m_codec_ctx->ch_layout, 2);
    m_codec_ctx->bit_rate = config.bit_rate;
    m_codec_ctx->time_base = AVRational{1, config.sample_rate};
    if (config.global_header) {
        m_codec_ctx->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    int ret = avcodec_open2(m_codec_ctx, codec, nullptr);
    if (ret < 0) {
        return ffmpeg_error(ret, std::string("avcodec_open2(") + codec->name + ")");
    }
    return Result<void>();
}

Result<void> FFmpegEncoderContext::attach(AVStream* stream) const {
    assert(m_codec_ctx && stream);
    int ret = avcodec_parameters_from_context(stream->codecpar, m_codec_ctx);
    if (ret < 0) {
        return ffmpeg_error(ret, "avcodec_parameters_from_context");
    }
    stream->time_base = m_codec_ctx->time_base;
    return Result<void>();
}

int FFmpegEncoderContext::audio_frame_size() const {
    assert(m_codec_ctx);
    if (m_codec_ctx->frame_size > 0 &&
        !(m_codec_ctx->codec->capabilities & AV_CODEC_CAP_VARIABLE_FRAME_SIZE)) {
        return m_codec_ctx->frame_size;
    }
    return 1024;
}

Result<void> encode_and_write(AVCodecContext* codec_ctx, AVFrame* frame,
                              AVFormatContext* fmt_ctx, AVStream* stream, AVPacket* pkt) {
    int ret = avcodec_send_frame(codec_ctx, frame);
    if (ret < 0 && ret != AVERROR_EOF) {
        return ffmpeg_error(ret, "avcodec_send_frame").as(ErrorCode::EncodeFailed);
    }

    while (true) {
        ret = avcodec_receive_packet(codec_ctx, pkt);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
            return Result<void>();
        }
        if (ret < 0) {
            return ffmpeg_error(ret, "avcodec_receive_packet").as(ErrorCode::EncodeFailed);
        }

        av_packet_rescale_ts(pkt, codec_ctx->time_base, stream->time_base);
        pkt->stream_index = stream->index;

        // Takes ownership of the packet payload
        ret = av_interleaved_write_frame(fmt_ctx, pkt);
        if (ret < 0) {
            return ffmpeg_error(ret, "av_interleaved_write_frame").as(ErrorCode::EncodeFailed);
        }
    }
}

} // namespace impl
} // namespace rmp
