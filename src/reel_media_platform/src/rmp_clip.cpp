#include <reel_media_platform/rmp_clip.h>
#include "impl/ffmpeg_context.h"
#include <algorithm>
#include <cassert>
#include <cmath>

namespace rmp {

CoverCrop compute_cover_crop(int src_width, int src_height, int dst_width, int dst_height) {
    assert(src_width > 0 && src_height > 0 && dst_width > 0 && dst_height > 0);

    const double scale = std::max(static_cast<double>(dst_width) / src_width,
                                  static_cast<double>(dst_height) / src_height);

    // The covering dimension uses the whole source extent; the other is cropped
    int crop_w = static_cast<int>(std::lround(dst_width / scale));
    int crop_h = static_cast<int>(std::lround(dst_height / scale));
    crop_w = std::clamp(crop_w, 1, src_width);
    crop_h = std::clamp(crop_h, 1, src_height);

    CoverCrop crop;
    crop.scale = scale;
    crop.crop_width = crop_w;
    crop.crop_height = crop_h;
    crop.crop_x = (src_width - crop_w) / 2;
    crop.crop_y = (src_height - crop_h) / 2;
    return crop;
}

// ============================================================================
// Fades
// ============================================================================

double Fade::gain_at(TimeUS t, TimeUS span_duration) const {
    if (duration <= 0) {
        return 1.0;
    }
    double ramp = 0.0;
    if (direction == FadeDirection::In) {
        ramp = static_cast<double>(t) / static_cast<double>(duration);
    } else {
        ramp = static_cast<double>(span_duration - t) / static_cast<double>(duration);
    }
    return std::clamp(ramp, 0.0, 1.0);
}

double combined_fade_gain(const std::vector<Fade>& fades, TimeUS t, TimeUS span_duration) {
    double gain = 1.0;
    for (const Fade& fade : fades) {
        gain *= fade.gain_at(t, span_duration);
    }
    return gain;
}

// ============================================================================
// Animation
// ============================================================================

FrameTransform animation_transform(AnimationType type, TimeUS t, TimeUS duration,
                                   int width, int height) {
    (void)height;  // every animation is vertically centered
    FrameTransform tf;
    const double t_sec = us_to_seconds(std::max<TimeUS>(t, 0));

    switch (type) {
        case AnimationType::Fade: {
            const TimeUS ramp = seconds_to_us(animation::FADE_SECONDS);
            tf.opacity = Fade{FadeDirection::In, ramp}.gain_at(t, duration) *
                         Fade{FadeDirection::Out, ramp}.gain_at(t, duration);
            break;
        }
        case AnimationType::Zoom:
            tf.scale = 1.0 + animation::ZOOM_PER_SECOND * t_sec;
            break;
        case AnimationType::Pan:
            // Left edge of the pre-scaled frame sits at x = c*t:
            //   W/2 + tx - 1.2*W/2 == c*t
            tf.scale = animation::PAN_PRESCALE;
            tf.translate_x = animation::PAN_PIXELS_PER_SECOND * t_sec +
                             (animation::PAN_PRESCALE - 1.0) * width / 2.0;
            break;
    }
    return tf;
}

// ============================================================================
// Rasterizer
// ============================================================================

static inline uint8_t to_byte(double v) {
    return static_cast<uint8_t>(std::clamp(v + 0.5, 0.0, 255.0));
}

std::shared_ptr<Frame> rasterize(const Frame& base, const FrameTransform& transform,
                                 int width, int height, TimeUS pts) {
    int stride = 0;
    std::vector<uint8_t> out = Frame::AllocateBuffer(width, height, &stride);

    const double gain = std::clamp(transform.opacity, 0.0, 1.0);
    const int bw = base.width();
    const int bh = base.height();

    if (transform.is_identity_geometry() && bw == width && bh == height) {
        for (int y = 0; y < height; ++y) {
            const uint8_t* src = base.row(y);
            uint8_t* dst = out.data() + static_cast<size_t>(y) * stride;
            for (int x = 0; x < width; ++x) {
                dst[x * 4 + 0] = to_byte(src[x * 4 + 0] * gain);
                dst[x * 4 + 1] = to_byte(src[x * 4 + 1] * gain);
                dst[x * 4 + 2] = to_byte(src[x * 4 + 2] * gain);
                dst[x * 4 + 3] = 255;
            }
        }
        return Frame::CreateCPU(width, height, stride, pts, std::move(out));
    }

    // Map output pixel centers back into base coordinates; the transform is
    // axis-aligned so rows and columns are precomputed independently.
    const double inv_scale = 1.0 / transform.scale;
    const double canvas_cx = width / 2.0 + transform.translate_x;
    const double canvas_cy = height / 2.0 + transform.translate_y;

    std::vector<int> col0(width);
    std::vector<double> col_frac(width);
    for (int x = 0; x < width; ++x) {
        double sx = (x + 0.5 - canvas_cx) * inv_scale + bw / 2.0 - 0.5;
        double fl = std::floor(sx);
        col0[x] = static_cast<int>(fl);
        col_frac[x] = sx - fl;
    }

    for (int y = 0; y < height; ++y) {
        double sy = (y + 0.5 - canvas_cy) * inv_scale + bh / 2.0 - 0.5;
        double fl = std::floor(sy);
        const int r0 = static_cast<int>(fl);
        const double fy = sy - fl;

        const uint8_t* rows[2] = {
            (r0 >= 0 && r0 < bh) ? base.row(r0) : nullptr,
            (r0 + 1 >= 0 && r0 + 1 < bh) ? base.row(r0 + 1) : nullptr,
        };
        const double row_w[2] = {1.0 - fy, fy};

        uint8_t* dst = out.data() + static_cast<size_t>(y) * stride;
        for (int x = 0; x < width; ++x) {
            const int c0 = col0[x];
            const double fx = col_frac[x];
            const int cols[2] = {c0, c0 + 1};
            const double col_w[2] = {1.0 - fx, fx};

            double acc[3] = {0.0, 0.0, 0.0};
            for (int r = 0; r < 2; ++r) {
                if (!rows[r] || row_w[r] == 0.0) continue;
                for (int c = 0; c < 2; ++c) {
                    if (cols[c] < 0 || cols[c] >= bw || col_w[c] == 0.0) continue;
                    const uint8_t* px = rows[r] + cols[c] * 4;
                    const double w = row_w[r] * col_w[c];
                    acc[0] += px[0] * w;
                    acc[1] += px[1] * w;
                    acc[2] += px[2] * w;
                }
            }

            dst[x * 4 + 0] = to_byte(acc[0] * gain);
            dst[x * 4 + 1] = to_byte(acc[1] * gain);
            dst[x * 4 + 2] = to_byte(acc[2] * gain);
            dst[x * 4 + 3] = 255;
        }
    }

    return Frame::CreateCPU(width, height, stride, pts, std::move(out));
}

// ============================================================================
// Clip
// ============================================================================

Clip::Clip(MediaAsset source, std::shared_ptr<Frame> base, TimeUS duration,
           AnimationType animation)
    : m_source(std::move(source)),
      m_base(std::move(base)),
      m_duration(duration),
      m_animation(animation) {
    assert(m_base && "Clip base frame cannot be null");
    assert(m_duration > 0 && "Clip duration must be positive");
    m_width = m_base->width();
    m_height = m_base->height();
}

FrameTransform Clip::transform_at(TimeUS t) const {
    t = std::clamp<TimeUS>(t, 0, m_duration - 1);
    FrameTransform tf = animation_transform(m_animation, t, m_duration, m_width, m_height);
    tf.opacity *= combined_fade_gain(m_fades, t, m_duration);
    return tf;
}

Result<std::shared_ptr<Frame>> Clip::render_frame(TimeUS t, double extra_gain, TimeUS pts) const {
    if (!m_base) {
        return Error::internal("Clip already released: " + m_source.path);
    }
    FrameTransform tf = transform_at(t);
    tf.opacity *= extra_gain;
    return rasterize(*m_base, tf, m_width, m_height, pts);
}

void Clip::release() {
    m_base.reset();
}

// ============================================================================
// ClipComposer
// ============================================================================

Result<std::shared_ptr<Frame>> ClipComposer::CoverCropFrame(const Frame& decoded,
                                                            int width, int height) {
    if (width <= 0 || height <= 0) {
        return Error::invalid_arg("Target size must be positive");
    }
    if (decoded.width() <= 0 || decoded.height() <= 0) {
        return Error::invalid_arg("Source frame has no pixels");
    }

    const CoverCrop crop = compute_cover_crop(decoded.width(), decoded.height(), width, height);

    impl::FFmpegScaleContext scale;
    auto init_result = scale.init(crop.crop_width, crop.crop_height, AV_PIX_FMT_BGRA,
                                  width, height, AV_PIX_FMT_BGRA);
    if (init_result.is_error()) {
        return init_result.error();
    }

    const uint8_t* src_planes[4] = {
        decoded.row(crop.crop_y) + static_cast<size_t>(crop.crop_x) * 4,
        nullptr, nullptr, nullptr
    };
    const int src_strides[4] = {decoded.stride_bytes(), 0, 0, 0};

    int stride = 0;
    std::vector<uint8_t> buffer = Frame::AllocateBuffer(width, height, &stride);
    uint8_t* dst_planes[4] = {buffer.data(), nullptr, nullptr, nullptr};
    const int dst_strides[4] = {stride, 0, 0, 0};

    auto scaled = scale.scale(src_planes, src_strides, crop.crop_height, dst_planes, dst_strides);
    if (scaled.is_error()) {
        return scaled.error();
    }

    return Frame::CreateCPU(width, height, stride, decoded.pts_us(), std::move(buffer));
}

Result<std::unique_ptr<Clip>> ClipComposer::ComposeFrame(const MediaAsset& image,
                                                         const Frame& decoded,
                                                         const RenderParameters& params) {
    if (!params.is_valid()) {
        return Error::invalid_arg("Render parameters out of range");
    }

    auto base_result = CoverCropFrame(decoded, params.target_width, params.target_height);
    if (base_result.is_error()) {
        return base_result.error();
    }

    const TimeUS duration = seconds_to_us(params.duration_per_image);
    if (duration <= 0) {
        return Error::invalid_arg("duration_per_image rounds to zero");
    }

    return std::make_unique<Clip>(image, std::move(base_result.value()), duration,
                                  params.animation_type);
}

Result<std::unique_ptr<Clip>> ClipComposer::Compose(const MediaAsset& image,
                                                    const RenderParameters& params) {
    if (image.kind != MediaKind::Image) {
        return Error::invalid_arg("Not an image asset: " + image.path);
    }

    auto asset_result = Asset::Open(image.path);
    if (asset_result.is_error()) {
        return asset_result.error();
    }

    auto frame_result = asset_result.value()->DecodeStill();
    if (frame_result.is_error()) {
        return frame_result.error();
    }

    return ComposeFrame(image, *frame_result.value(), params);
}

} // namespace rmp
