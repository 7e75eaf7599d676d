#include <reel_media_platform/rmp_frame.h>
#include "impl/frame_impl.h"
#include <cassert>

namespace rmp {

Frame::Frame(std::unique_ptr<FrameImpl> impl) : m_impl(std::move(impl)) {
    assert(m_impl && "Frame impl cannot be null");
}

Frame::~Frame() = default;

int Frame::width() const { return m_impl->width(); }
int Frame::height() const { return m_impl->height(); }
int Frame::stride_bytes() const { return m_impl->stride(); }
TimeUS Frame::pts_us() const { return m_impl->pts_us(); }
const uint8_t* Frame::data() const { return m_impl->data(); }
size_t Frame::data_size() const { return m_impl->data_size(); }

std::shared_ptr<Frame> Frame::CreateCPU(int w, int h, int stride,
                                        TimeUS pts, std::vector<uint8_t> data) {
    auto impl = std::make_unique<FrameImpl>(w, h, stride, pts, std::move(data));
    return std::make_shared<Frame>(std::move(impl));
}

std::vector<uint8_t> Frame::AllocateBuffer(int w, int h, int* out_stride) {
    // Align stride to 32 bytes for SIMD operations
    int stride = ((w * 4) + 31) & ~31;
    *out_stride = stride;
    return std::vector<uint8_t>(static_cast<size_t>(stride) * h);
}

} // namespace rmp
