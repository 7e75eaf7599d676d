#include <reel_media_platform/rmp_asset.h>
#include "impl/asset_impl.h"
#include "impl/ffmpeg_decode.h"
#include "impl/ffmpeg_resample.h"
#include <cassert>

namespace rmp {

Asset::Asset(std::unique_ptr<AssetImpl> impl, AssetInfo info)
    : m_impl(std::move(impl)), m_info(std::move(info)) {
    assert(m_impl && "Asset impl cannot be null");
}

Asset::~Asset() = default;

const AssetInfo& Asset::info() const {
    return m_info;
}

Result<std::shared_ptr<Asset>> Asset::Open(const std::string& path) {
    impl::init_ffmpeg_logging();

    auto impl = std::make_unique<AssetImpl>();
    auto open_result = impl->input.open(path);
    if (open_result.is_error()) {
        return open_result.error();
    }

    AssetInfo info;
    info.path = path;
    info.duration_us = impl->input.duration_us();

    if (const AVStream* image = impl->input.image_stream()) {
        info.has_video = true;
        info.video_width = image->codecpar->width;
        info.video_height = image->codecpar->height;
    }
    if (const AVStream* audio = impl->input.audio_stream()) {
        info.has_audio = true;
        info.audio_sample_rate = audio->codecpar->sample_rate;
        info.audio_channels = audio->codecpar->ch_layout.nb_channels;
    }

    return std::make_shared<Asset>(std::move(impl), std::move(info));
}

Result<void> Asset::rewind() {
    if (!m_impl->consumed) {
        return Result<void>();
    }
    auto reopen_result = m_impl->input.reopen();
    if (reopen_result.is_error()) {
        return reopen_result.error();
    }
    m_impl->consumed = false;
    return Result<void>();
}

Result<std::shared_ptr<Frame>> Asset::DecodeStill() {
    if (!m_info.has_video) {
        return Error::unsupported("No image stream in " + m_info.path);
    }

    auto rewind_result = rewind();
    if (rewind_result.is_error()) {
        return rewind_result.error();
    }

    impl::FFmpegDecoder decoder;
    auto open_result = decoder.open(m_impl->input.image_stream());
    if (open_result.is_error()) {
        return open_result.error();
    }

    impl::FFmpegPacket pkt;
    impl::FFmpegFrame decoded;
    if (!pkt || !decoded) {
        return Error::internal("Failed to allocate decode packet/frame");
    }

    m_impl->consumed = true;
    auto frame_result = impl::decode_next_frame(m_impl->input, decoder, pkt.get(), decoded.get());
    if (frame_result.is_error()) {
        return frame_result.error();
    }
    const AVFrame* src = frame_result.value();
    if (!src) {
        return Error::decode_failed("No frame decoded from " + m_info.path);
    }
    if (src->width <= 0 || src->height <= 0) {
        return Error::decode_failed("Decoded frame has no dimensions: " + m_info.path);
    }

    impl::FFmpegScaleContext scale;
    auto scale_init = scale.init(src->width, src->height, static_cast<AVPixelFormat>(src->format),
                                 src->width, src->height);
    if (scale_init.is_error()) {
        return scale_init.error();
    }

    int stride = 0;
    std::vector<uint8_t> buffer = Frame::AllocateBuffer(src->width, src->height, &stride);
    auto scaled = scale.scale_to_packed(src, buffer.data(), stride);
    if (scaled.is_error()) {
        return scaled.error();
    }

    // A still has no position of its own; the clip places it
    return Frame::CreateCPU(src->width, src->height, stride, 0, std::move(buffer));
}

Result<std::shared_ptr<PcmChunk>> Asset::DecodeAudio(const AudioFormat& out) {
    if (!m_info.has_audio) {
        return Error::unsupported("No audio stream in " + m_info.path);
    }
    if (out.sample_rate <= 0 || out.channels != 2) {
        return Error::invalid_arg("DecodeAudio: output must be stereo with a positive rate");
    }

    auto rewind_result = rewind();
    if (rewind_result.is_error()) {
        return rewind_result.error();
    }

    impl::FFmpegDecoder decoder;
    auto open_result = decoder.open(m_impl->input.audio_stream());
    if (open_result.is_error()) {
        return open_result.error();
    }

    const AVCodecContext* codec = decoder.get();
    impl::FFmpegResampleContext resample;
    auto resample_result = resample.init(codec->ch_layout, codec->sample_fmt, codec->sample_rate,
                                         AV_SAMPLE_FMT_FLT, out.sample_rate);
    if (resample_result.is_error()) {
        return resample_result.error();
    }

    std::vector<float> pcm;
    if (m_info.duration_us > 0) {
        pcm.reserve(static_cast<size_t>(sample_count_for(m_info.duration_us, out.sample_rate) + 4096) * 2);
    }

    m_impl->consumed = true;
    auto decode_result = impl::decode_audio_stream(m_impl->input, decoder, resample, pcm);
    if (decode_result.is_error()) {
        return decode_result.error();
    }
    if (decode_result.value() == 0) {
        return Error::unsupported("Audio stream decoded to zero samples: " + m_info.path);
    }

    return PcmChunk::Create(out.sample_rate, out.channels, std::move(pcm));
}

} // namespace rmp
