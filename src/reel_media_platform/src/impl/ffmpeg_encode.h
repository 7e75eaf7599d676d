#pragma once

// FFmpeg headers - ONLY allowed in impl/ directory
extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/opt.h>
}

#include <reel_media_platform/rmp_errors.h>
#include <string>

namespace rmp {
namespace impl {

// Muxer wrapper: output AVFormatContext plus its AVIO handle
class FFmpegOutputContext {
public:
    FFmpegOutputContext() = default;
    ~FFmpegOutputContext();

    // Non-copyable
    FFmpegOutputContext(const FFmpegOutputContext&) = delete;
    FFmpegOutputContext& operator=(const FFmpegOutputContext&) = delete;

    // Allocate the muxer (format guessed from the extension, MP4 otherwise) and open the file
    Result<void> open(const std::string& path);

    // New stream; time base and parameters are filled from the encoder later
    Result<AVStream*> add_stream();

    Result<void> write_header();
    Result<void> write_trailer();

    // Encoders must emit extradata instead of in-band headers
    bool needs_global_header() const;

    AVFormatContext* get() const { return m_fmt_ctx; }

private:
    AVFormatContext* m_fmt_ctx = nullptr;
    bool m_header_written = false;
};

struct VideoEncodeConfig {
    std::string codec_name;   // tried first; H.264 then MPEG-4 are fallbacks
    int width = 0;
    int height = 0;
    int fps = 0;
    int crf = 23;
    std::string preset;
    int threads = 0;
    bool global_header = false;
};

struct AudioEncodeConfig {
    std::string codec_name;
    int sample_rate = 0;
    int64_t bit_rate = 0;
    bool global_header = false;
};

// Encoder context wrapper
class FFmpegEncoderContext {
public:
    FFmpegEncoderContext() = default;
    ~FFmpegEncoderContext();

    // Non-copyable
    FFmpegEncoderContext(const FFmpegEncoderContext&) = delete;
    FFmpegEncoderContext& operator=(const FFmpegEncoderContext&) = delete;

    // YUV420P video encoder, time base 1/fps
    Result<void> open_video(const VideoEncodeConfig& config);

    // Stereo audio encoder in the codec's preferred sample format, time base 1/rate
    Result<void> open_audio(const AudioEncodeConfig& config);

    // Copy encoder parameters to the stream
    Result<void> attach(AVStream* stream) const;

    AVCodecContext* get() const { return m_codec_ctx; }

    // Samples per audio frame; codecs with variable frame size get 1024
    int audio_frame_size() const;

private:
    Result<void> alloc(const AVCodec* codec);

    AVCodecContext* m_codec_ctx = nullptr;
};

// Send one frame (nullptr flushes) and write every packet it yields to `stream`
Result<void> encode_and_write(AVCodecContext* codec_ctx, AVFrame* frame,
                              AVFormatContext* fmt_ctx, AVStream* stream, AVPacket* pkt);

} // namespace impl
} // namespace rmp
