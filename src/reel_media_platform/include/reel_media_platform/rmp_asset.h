#pragma once

#include "rmp_audio.h"
#include "rmp_errors.h"
#include "rmp_frame.h"
#include "rmp_time.h"
#include <memory>
#include <string>

namespace rmp {

// Forward declaration for implementation
class AssetImpl;

enum class MediaKind {
    Image,
    Audio
};

// Input asset reference carried by a render request
struct MediaAsset {
    std::string path;
    MediaKind kind;

    static MediaAsset image(std::string path) { return {std::move(path), MediaKind::Image}; }
    static MediaAsset audio(std::string path) { return {std::move(path), MediaKind::Audio}; }
};

// Information about an opened media file
struct AssetInfo {
    // Container duration in microseconds (0 for stills / unknown)
    TimeUS duration_us = 0;

    // Video stream info (still images report a single-frame video stream)
    bool has_video = false;
    int video_width = 0;
    int video_height = 0;

    // Audio stream info
    bool has_audio = false;
    int32_t audio_sample_rate = 0;  // Source sample rate (e.g., 44100)
    int32_t audio_channels = 0;     // Source channel count

    // Original file path
    std::string path;
};

// Media file handle (opened, demuxer probed)
class Asset {
public:
    ~Asset();

    // Open and probe a media file. Succeeds for files with a video or an audio stream.
    static Result<std::shared_ptr<Asset>> Open(const std::string& path);

    const AssetInfo& info() const;

    // Decode the first video frame to BGRA32 at native resolution
    Result<std::shared_ptr<Frame>> DecodeStill();

    // Decode the whole audio stream, resampled to `out` (float32 stereo)
    Result<std::shared_ptr<PcmChunk>> DecodeAudio(const AudioFormat& out);

    // Internal: Constructor is public but AssetImpl is opaque, so only RMP can create Assets
    explicit Asset(std::unique_ptr<AssetImpl> impl, AssetInfo info);

private:
    // Decoding consumes the demuxer; rewinds (reopens) it for a second decode
    Result<void> rewind();

    std::unique_ptr<AssetImpl> m_impl;
    AssetInfo m_info;
};

} // namespace rmp
