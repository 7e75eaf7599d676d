#include "ffmpeg_context.h"
#include <mutex>

namespace rmp {
namespace impl {

Error ffmpeg_error(int errnum, const std::string& what) {
    char reason[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(errnum, reason, sizeof(reason));
    const std::string message = what + ": " + reason;

    if (errnum == AVERROR(ENOENT) || errnum == AVERROR(EACCES)) {
        return {ErrorCode::FileNotFound, message};
    }
    if (errnum == AVERROR_INVALIDDATA || errnum == AVERROR(EINVAL) ||
        errnum == AVERROR_DECODER_NOT_FOUND || errnum == AVERROR_DEMUXER_NOT_FOUND ||
        errnum == AVERROR_ENCODER_NOT_FOUND || errnum == AVERROR_MUXER_NOT_FOUND) {
        return {ErrorCode::Unsupported, message};
    }
    if (errnum == AVERROR(ENOMEM)) {
        return {ErrorCode::Internal, message};
    }
    if (errnum == AVERROR(EIO) || errnum == AVERROR(ENOSPC)) {
        return {ErrorCode::EncodeFailed, message};
    }
    return {ErrorCode::Internal, message};
}

void init_ffmpeg_logging() {
    static std::once_flag s_ffmpeg_log_init;
    std::call_once(s_ffmpeg_log_init, [] {
        av_log_set_level(AV_LOG_ERROR);
    });
}

// FFmpegInput

FFmpegInput::~FFmpegInput() {
    close();
}

void FFmpegInput::close() {
    if (m_fmt_ctx) {
        avformat_close_input(&m_fmt_ctx);
    }
    m_image_idx = -1;
    m_audio_idx = -1;
}

Result<void> FFmpegInput::open(const std::string& path) {
    if (path.empty()) {
        return Error::invalid_arg("Empty media path");
    }
    close();
    m_path = path;

    int ret = avformat_open_input(&m_fmt_ctx, path.c_str(), nullptr, nullptr);
    if (ret == AVERROR(ENOENT)) {
        return Error::file_not_found(path);
    }
    if (ret < 0) {
        return ffmpeg_error(ret, "avformat_open_input(" + path + ")");
    }

    ret = avformat_find_stream_info(m_fmt_ctx, nullptr);
    if (ret < 0) {
        return ffmpeg_error(ret, "avformat_find_stream_info(" + path + ")");
    }

    // Image decoders (png, mjpeg, webp) surface as a one-frame video stream
    m_image_idx = av_find_best_stream(m_fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    m_audio_idx = av_find_best_stream(m_fmt_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (m_image_idx < 0 && m_audio_idx < 0) {
        return Error::unsupported("No image or audio stream in " + path);
    }
    return Result<void>();
}

Result<void> FFmpegInput::reopen() {
    const std::string path = m_path;
    return open(path);
}

AVStream* FFmpegInput::image_stream() const {
    return m_image_idx >= 0 ? m_fmt_ctx->streams[m_image_idx] : nullptr;
}

AVStream* FFmpegInput::audio_stream() const {
    return m_audio_idx >= 0 ? m_fmt_ctx->streams[m_audio_idx] : nullptr;
}

TimeUS FFmpegInput::duration_us() const {
    if (!m_fmt_ctx) {
        return 0;
    }
    // AV_TIME_BASE is microseconds
    if (m_fmt_ctx->duration != AV_NOPTS_VALUE && m_fmt_ctx->duration > 0) {
        return m_fmt_ctx->duration;
    }
    const AVStream* audio = audio_stream();
    if (audio && audio->duration != AV_NOPTS_VALUE && audio->duration > 0) {
        return av_rescale_q(audio->duration, audio->time_base, AVRational{1, 1000000});
    }
    return 0;
}

// FFmpegDecoder

FFmpegDecoder::~FFmpegDecoder() {
    if (m_codec_ctx) {
        avcodec_free_context(&m_codec_ctx);
    }
}

Result<void> FFmpegDecoder::open(const AVStream* stream) {
    if (!stream) {
        return Error::invalid_arg("No stream to decode");
    }
    const AVCodecParameters* params = stream->codecpar;

    const AVCodec* codec = avcodec_find_decoder(params->codec_id);
    if (!codec) {
        return Error::unsupported(std::string("No decoder for ") + avcodec_get_name(params->codec_id));
    }

    m_codec_ctx = avcodec_alloc_context3(codec);
    if (!m_codec_ctx) {
        return Error::internal("Failed to allocate decoder context");
    }

    int ret = avcodec_parameters_to_context(m_codec_ctx, params);
    if (ret < 0) {
        return ffmpeg_error(ret, "avcodec_parameters_to_context");
    }
    ret = avcodec_open2(m_codec_ctx, codec, nullptr);
    if (ret < 0) {
        return ffmpeg_error(ret, std::string("avcodec_open2(") + codec->name + ")");
    }

    m_stream_idx = stream->index;
    return Result<void>();
}

// FFmpegScaleContext

static std::string pix_fmt_name(AVPixelFormat fmt) {
    const char* name = av_get_pix_fmt_name(fmt);
    return name ? name : "unknown";
}

FFmpegScaleContext::~FFmpegScaleContext() {
    if (m_sws_ctx) {
        sws_freeContext(m_sws_ctx);
    }
}

Result<void> FFmpegScaleContext::init(int src_width, int src_height, AVPixelFormat src_fmt,
                                       int dst_width, int dst_height, AVPixelFormat dst_fmt) {
    if (src_width <= 0 || src_height <= 0 || dst_width <= 0 || dst_height <= 0) {
        return Error::invalid_arg("swscale dimensions must be positive");
    }

    m_sws_ctx = sws_getCachedContext(m_sws_ctx,
                                     src_width, src_height, src_fmt,
                                     dst_width, dst_height, dst_fmt,
                                     SWS_BICUBIC, nullptr, nullptr, nullptr);
    if (!m_sws_ctx) {
        return Error::unsupported("swscale cannot convert " + pix_fmt_name(src_fmt) + " to " +
                                  pix_fmt_name(dst_fmt));
    }
    m_dst_height = dst_height;
    return Result<void>();
}

Result<void> FFmpegScaleContext::scale(const uint8_t* const src_planes[], const int src_strides[],
                                       int src_height,
                                       uint8_t* const dst_planes[], const int dst_strides[]) {
    if (!m_sws_ctx) {
        return Error::internal("swscale used before init");
    }

    int rows = sws_scale(m_sws_ctx, src_planes, src_strides, 0, src_height,
                         dst_planes, dst_strides);
    if (rows < 0) {
        return ffmpeg_error(rows, "sws_scale");
    }
    if (rows != m_dst_height) {
        return Error::internal("sws_scale wrote " + std::to_string(rows) + " of " +
                               std::to_string(m_dst_height) + " rows");
    }
    return Result<void>();
}

Result<void> FFmpegScaleContext::scale_to_packed(const AVFrame* src, uint8_t* dst_data, int dst_stride) {
    uint8_t* const dst_planes[4] = {dst_data, nullptr, nullptr, nullptr};
    const int dst_strides[4] = {dst_stride, 0, 0, 0};
    return scale(src->data, src->linesize, src->height, dst_planes, dst_strides);
}

} // namespace impl
} // namespace rmp
