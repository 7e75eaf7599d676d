#pragma once

#include "rmp_time.h"
#include <cstdint>
#include <memory>
#include <vector>

namespace rmp {

// Forward declaration for implementation
class FrameImpl;

// Video frame in BGRA32 format
// Memory layout: B, G, R, A for each pixel (matches Qt QImage::Format_ARGB32 on little-endian)
class Frame {
public:
    ~Frame();

    // Frame dimensions
    int width() const;
    int height() const;

    // Bytes per row (may include padding)
    int stride_bytes() const;

    // Presentation timestamp (source pts for decoded frames, timeline time for rendered ones)
    TimeUS pts_us() const;

    // Raw pixel data pointer (BGRA32 format)
    const uint8_t* data() const;

    // Total data size in bytes (stride_bytes * height)
    size_t data_size() const;

    // Pointer to the first byte of row y
    const uint8_t* row(int y) const { return data() + static_cast<size_t>(y) * stride_bytes(); }

    // Create a CPU-backed frame from raw BGRA32 pixel data.
    static std::shared_ptr<Frame> CreateCPU(int w, int h, int stride,
                                            TimeUS pts, std::vector<uint8_t> data);

    // Allocate a BGRA32 buffer with 32-byte aligned stride, zero-filled (opaque black
    // once alpha is set by the writer)
    static std::vector<uint8_t> AllocateBuffer(int w, int h, int* out_stride);

    // Internal: Constructor is public but FrameImpl is opaque, so only RMP can create Frames
    explicit Frame(std::unique_ptr<FrameImpl> impl);

private:
    std::unique_ptr<FrameImpl> m_impl;
};

} // namespace rmp
