#pragma once

#include "rmp_audio_track.h"
#include "rmp_errors.h"
#include "rmp_render_params.h"
#include "rmp_timeline.h"
#include <cstdint>
#include <functional>
#include <string>

namespace rmp {

// Codec choices for the output file (H.264 + AAC in MP4)
struct EncoderSettings {
    std::string video_codec = "libx264";
    std::string preset = "medium";
    int crf = 23;
    std::string audio_codec = "aac";
    int64_t audio_bitrate = 128000;
    int32_t audio_sample_rate = 48000;
    int threads = 4;
};

// Hands out a fresh, unique output file path per render
using OutputPathProvider = std::function<std::string()>;

// Renders a Timeline (plus optional AudioTrack) into one video file.
// Every FFmpeg resource is scoped to a single render() call; a failed render
// leaves no output file behind.
class Encoder {
public:
    explicit Encoder(OutputPathProvider output_path, EncoderSettings settings = EncoderSettings());

    const EncoderSettings& settings() const { return m_settings; }

    // Returns the written file path. fps comes from params; every frame is scaled to
    // exactly target_width x target_height; frame count is round(duration * fps).
    Result<std::string> render(const Timeline& timeline, const AudioTrack* audio,
                               const RenderParameters& params) const;

private:
    OutputPathProvider m_output_path;
    EncoderSettings m_settings;
};

} // namespace rmp
