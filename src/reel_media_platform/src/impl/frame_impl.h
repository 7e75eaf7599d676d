#pragma once

// Internal header - defines FrameImpl (CPU buffer only)

#include <reel_media_platform/rmp_time.h>
#include <cassert>
#include <cstdint>
#include <vector>

namespace rmp {

class FrameImpl {
public:
    FrameImpl(int w, int h, int stride, TimeUS pts, std::vector<uint8_t> data)
        : m_width(w), m_height(h), m_stride(stride), m_pts_us(pts),
          m_buffer(std::move(data))
    {
        // FAIL-FAST: Validate inputs
        assert(w > 0 && "FrameImpl: width must be > 0");
        assert(h > 0 && "FrameImpl: height must be > 0");
        assert(stride >= w * 4 && "FrameImpl: stride must be >= width*4 (BGRA32)");
        assert(m_buffer.size() >= static_cast<size_t>(stride) * h &&
               "FrameImpl: buffer too small for dimensions");
    }

    FrameImpl(const FrameImpl&) = delete;
    FrameImpl& operator=(const FrameImpl&) = delete;

    int width() const { return m_width; }
    int height() const { return m_height; }
    int stride() const { return m_stride; }
    TimeUS pts_us() const { return m_pts_us; }
    const uint8_t* data() const { return m_buffer.data(); }

    size_t data_size() const {
        return static_cast<size_t>(m_stride) * m_height;
    }

private:
    int m_width;
    int m_height;
    int m_stride;
    TimeUS m_pts_us;
    std::vector<uint8_t> m_buffer;
};

} // namespace rmp
