#pragma once

// Internal header - defines AssetImpl
// FFmpeg headers allowed here (we're in impl/)

#include "ffmpeg_context.h"

namespace rmp {

// AssetImpl owns the opened input for an Asset
class AssetImpl {
public:
    impl::FFmpegInput input;

    // Set once a decode has read packets; the next decode reopens the file
    bool consumed = false;
};

} // namespace rmp
