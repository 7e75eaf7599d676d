#include "ffmpeg_decode.h"

namespace rmp {
namespace impl {

Result<AVFrame*> decode_next_frame(FFmpegInput& input, FFmpegDecoder& decoder,
                                   AVPacket* pkt, AVFrame* frame) {
    AVCodecContext* codec_ctx = decoder.get();
    bool draining = false;

    while (true) {
        int ret = avcodec_receive_frame(codec_ctx, frame);
        if (ret == 0) {
            return frame;
        }
        if (ret == AVERROR_EOF) {
            return static_cast<AVFrame*>(nullptr);
        }
        if (ret != AVERROR(EAGAIN)) {
            return ffmpeg_error(ret, "avcodec_receive_frame").as(ErrorCode::DecodeFailed);
        }
        if (draining) {
            return static_cast<AVFrame*>(nullptr);
        }

        // Feed the next packet of our stream; at end of file enter drain mode
        ret = av_read_frame(input.get(), pkt);
        while (ret >= 0 && pkt->stream_index != decoder.stream_index()) {
            av_packet_unref(pkt);
            ret = av_read_frame(input.get(), pkt);
        }
        if (ret == AVERROR_EOF) {
            draining = true;
            ret = avcodec_send_packet(codec_ctx, nullptr);
        } else if (ret < 0) {
            return ffmpeg_error(ret, "av_read_frame");
        } else {
            ret = avcodec_send_packet(codec_ctx, pkt);
            av_packet_unref(pkt);
        }

        if (ret < 0 && ret != AVERROR(EAGAIN) && ret != AVERROR_EOF) {
            return ffmpeg_error(ret, "avcodec_send_packet").as(ErrorCode::DecodeFailed);
        }
    }
}

Result<int64_t> decode_audio_stream(FFmpegInput& input, FFmpegDecoder& decoder,
                                    FFmpegResampleContext& resample,
                                    std::vector<float>& pcm_out) {
    FFmpegPacket pkt;
    FFmpegFrame frame;
    if (!pkt || !frame) {
        return Error::internal("Failed to allocate audio packet/frame");
    }

    int64_t total = 0;
    while (true) {
        auto decoded = decode_next_frame(input, decoder, pkt.get(), frame.get());
        if (decoded.is_error()) {
            return decoded.error();
        }
        if (!decoded.value()) {
            break;
        }
        auto appended = resample.append_interleaved(decoded.value(), pcm_out);
        av_frame_unref(frame.get());
        if (appended.is_error()) {
            return appended.error();
        }
        total += appended.value();
    }

    // Samples still buffered inside the resampler
    while (true) {
        auto drained = resample.append_interleaved(nullptr, pcm_out);
        if (drained.is_error()) {
            return drained.error();
        }
        total += drained.value();
        if (drained.value() == 0) {
            break;
        }
    }
    return total;
}

} // namespace impl
} // namespace rmp
