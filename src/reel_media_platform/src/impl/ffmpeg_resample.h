#pragma once

// FFmpeg headers - ONLY allowed in impl/ directory
extern "C" {
#include <libswresample/swresample.h>
#include <libavutil/channel_layout.h>
#include <libavutil/frame.h>
#include <libavutil/samplefmt.h>
}

#include <reel_media_platform/rmp_errors.h>
#include <vector>

namespace rmp {
namespace impl {

// swresample wrapper with a fixed stereo output. Two directions are used:
//  - decode: any source layout, format and rate -> interleaved float32 at the mix rate
//  - encode: interleaved float32 -> the audio encoder's sample format (planar for AAC)
class FFmpegResampleContext {
public:
    FFmpegResampleContext() = default;
    ~FFmpegResampleContext();

    FFmpegResampleContext(const FFmpegResampleContext&) = delete;
    FFmpegResampleContext& operator=(const FFmpegResampleContext&) = delete;

    // A source layout with unspecified order gets the default for its channel count
    Result<void> init(const AVChannelLayout& src_layout, AVSampleFormat src_fmt, int src_rate,
                      AVSampleFormat dst_fmt, int dst_rate);

    // Convert src_samples per channel into dst; returns samples written per channel.
    // src == nullptr drains what the resampler still buffers.
    Result<int> convert(const uint8_t* const* src, int src_samples,
                        uint8_t* const* dst, int dst_capacity);

    // Append one decoded frame (or, for nullptr, the drained tail) to an
    // interleaved float32 stereo buffer. Returns the sample-frames appended.
    Result<int64_t> append_interleaved(const AVFrame* frame, std::vector<float>& pcm);

private:
    SwrContext* m_swr_ctx = nullptr;
};

} // namespace impl
} // namespace rmp
