#pragma once

// FFmpeg headers - ONLY allowed in impl/ directory
extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
#include <libavutil/imgutils.h>
#include <libavutil/pixdesc.h>
#include <libswscale/swscale.h>
}

#include <reel_media_platform/rmp_errors.h>
#include <reel_media_platform/rmp_time.h>
#include <string>

namespace rmp {
namespace impl {

// Map an AVERROR onto an RMP error; `what` names the failing call
Error ffmpeg_error(int errnum, const std::string& what);

// Lower FFmpeg's stderr chatter once per process
void init_ffmpeg_logging();

// Opened input file with its best image (video) and audio streams located.
// Inputs are read front to back once; reopen() starts a fresh pass.
class FFmpegInput {
public:
    FFmpegInput() = default;
    ~FFmpegInput();

    FFmpegInput(const FFmpegInput&) = delete;
    FFmpegInput& operator=(const FFmpegInput&) = delete;

    // Open and probe; a file with neither stream is Unsupported
    Result<void> open(const std::string& path);

    // Close and open the same path again
    Result<void> reopen();

    AVFormatContext* get() const { return m_fmt_ctx; }

    // nullptr when the file has no such stream
    AVStream* image_stream() const;
    AVStream* audio_stream() const;

    // Container duration, falling back to the audio stream's own (0 if unknown)
    TimeUS duration_us() const;

private:
    void close();

    std::string m_path;
    AVFormatContext* m_fmt_ctx = nullptr;
    int m_image_idx = -1;
    int m_audio_idx = -1;
};

// Opened decoder for one input stream
class FFmpegDecoder {
public:
    FFmpegDecoder() = default;
    ~FFmpegDecoder();

    FFmpegDecoder(const FFmpegDecoder&) = delete;
    FFmpegDecoder& operator=(const FFmpegDecoder&) = delete;

    Result<void> open(const AVStream* stream);

    AVCodecContext* get() const { return m_codec_ctx; }
    int stream_index() const { return m_stream_idx; }

private:
    AVCodecContext* m_codec_ctx = nullptr;
    int m_stream_idx = -1;
};

// swscale wrapper; re-init is cheap when the geometry is unchanged
class FFmpegScaleContext {
public:
    FFmpegScaleContext() = default;
    ~FFmpegScaleContext();

    FFmpegScaleContext(const FFmpegScaleContext&) = delete;
    FFmpegScaleContext& operator=(const FFmpegScaleContext&) = delete;

    Result<void> init(int src_width, int src_height, AVPixelFormat src_fmt,
                      int dst_width, int dst_height,
                      AVPixelFormat dst_fmt = AV_PIX_FMT_BGRA);

    // Scale src_height source rows into the destination planes
    Result<void> scale(const uint8_t* const src_planes[], const int src_strides[], int src_height,
                       uint8_t* const dst_planes[], const int dst_strides[]);

    // Scale a decoded frame into one packed destination plane
    Result<void> scale_to_packed(const AVFrame* src, uint8_t* dst_data, int dst_stride);

private:
    SwsContext* m_sws_ctx = nullptr;
    int m_dst_height = 0;
};

// Owning AVPacket handle
class FFmpegPacket {
public:
    FFmpegPacket() : m_pkt(av_packet_alloc()) {}
    ~FFmpegPacket() { av_packet_free(&m_pkt); }

    FFmpegPacket(const FFmpegPacket&) = delete;
    FFmpegPacket& operator=(const FFmpegPacket&) = delete;

    AVPacket* get() const { return m_pkt; }
    explicit operator bool() const { return m_pkt != nullptr; }

private:
    AVPacket* m_pkt;
};

// Owning AVFrame handle
class FFmpegFrame {
public:
    FFmpegFrame() : m_frame(av_frame_alloc()) {}
    ~FFmpegFrame() { av_frame_free(&m_frame); }

    FFmpegFrame(const FFmpegFrame&) = delete;
    FFmpegFrame& operator=(const FFmpegFrame&) = delete;

    AVFrame* get() const { return m_frame; }
    explicit operator bool() const { return m_frame != nullptr; }

private:
    AVFrame* m_frame;
};

} // namespace impl
} // namespace rmp
