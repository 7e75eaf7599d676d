#pragma once

#include "ffmpeg_context.h"
#include "ffmpeg_resample.h"
#include <vector>

namespace rmp {
namespace impl {

// Pull the next decoded frame of the decoder's stream into `frame`.
// Returns nullptr once the stream is exhausted and the decoder drained.
Result<AVFrame*> decode_next_frame(FFmpegInput& input, FFmpegDecoder& decoder,
                                   AVPacket* pkt, AVFrame* frame);

// Decode the whole audio stream through `resample` into interleaved
// float32 stereo. Returns the number of sample-frames appended to pcm_out.
Result<int64_t> decode_audio_stream(FFmpegInput& input, FFmpegDecoder& decoder,
                                    FFmpegResampleContext& resample,
                                    std::vector<float>& pcm_out);

} // namespace impl
} // namespace rmp
