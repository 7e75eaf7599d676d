#include "ffmpeg_resample.h"
#include "ffmpeg_context.h"

namespace rmp {
namespace impl {

namespace {
constexpr int kStereo = 2;
constexpr int kDrainChunk = 4096;
}

FFmpegResampleContext::~FFmpegResampleContext() {
    swr_free(&m_swr_ctx);
}

Result<void> FFmpegResampleContext::init(const AVChannelLayout& src_layout, AVSampleFormat src_fmt,
                                         int src_rate, AVSampleFormat dst_fmt, int dst_rate) {
    if (src_rate <= 0 || dst_rate <= 0 || src_layout.nb_channels <= 0) {
        return Error::invalid_arg("Resampler needs positive rates and at least one channel");
    }
    swr_free(&m_swr_ctx);

    // Raw PCM and some WAVs declare a channel count but no order
    AVChannelLayout source;
    if (src_layout.order == AV_CHANNEL_ORDER_UNSPEC) {
        av_channel_layout_default(&source, src_layout.nb_channels);
    } else {
        int ret = av_channel_layout_copy(&source, &src_layout);
        if (ret < 0) {
            return ffmpeg_error(ret, "av_channel_layout_copy");
        }
    }

    AVChannelLayout stereo;
    av_channel_layout_default(&stereo, kStereo);

    int ret = swr_alloc_set_opts2(&m_swr_ctx, &stereo, dst_fmt, dst_rate,
                                  &source, src_fmt, src_rate, 0, nullptr);
    av_channel_layout_uninit(&source);
    av_channel_layout_uninit(&stereo);
    if (ret < 0) {
        return ffmpeg_error(ret, "swr_alloc_set_opts2");
    }

    ret = swr_init(m_swr_ctx);
    if (ret < 0) {
        swr_free(&m_swr_ctx);
        return ffmpeg_error(ret, "swr_init");
    }
    return Result<void>();
}

Result<int> FFmpegResampleContext::convert(const uint8_t* const* src, int src_samples,
                                           uint8_t* const* dst, int dst_capacity) {
    if (!m_swr_ctx) {
        return Error::internal("Resampler used before init");
    }
    int written = swr_convert(m_swr_ctx, dst, dst_capacity, src, src ? src_samples : 0);
    if (written < 0) {
        return ffmpeg_error(written, "swr_convert");
    }
    return written;
}

Result<int64_t> FFmpegResampleContext::append_interleaved(const AVFrame* frame,
                                                          std::vector<float>& pcm) {
    if (!m_swr_ctx) {
        return Error::internal("Resampler used before init");
    }

    const int capacity = frame ? swr_get_out_samples(m_swr_ctx, frame->nb_samples) : kDrainChunk;
    if (capacity < 0) {
        return ffmpeg_error(capacity, "swr_get_out_samples");
    }

    const size_t offset = pcm.size();
    pcm.resize(offset + static_cast<size_t>(capacity) * kStereo);
    uint8_t* const dst[1] = {reinterpret_cast<uint8_t*>(pcm.data() + offset)};

    auto written = frame ? convert(frame->extended_data, frame->nb_samples, dst, capacity)
                         : convert(nullptr, 0, dst, capacity);
    if (written.is_error()) {
        pcm.resize(offset);
        return written.error();
    }
    pcm.resize(offset + static_cast<size_t>(written.value()) * kStereo);
    return static_cast<int64_t>(written.value());
}

} // namespace impl
} // namespace rmp
