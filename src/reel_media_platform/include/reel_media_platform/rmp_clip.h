#pragma once

#include "rmp_asset.h"
#include "rmp_errors.h"
#include "rmp_frame.h"
#include "rmp_render_params.h"
#include "rmp_time.h"
#include <memory>
#include <vector>

namespace rmp {

// Animation constants shared by every clip of a render
namespace animation {
    constexpr double FADE_SECONDS = 0.5;        // fade animation ramp, also single-clip fades
    constexpr double ZOOM_PER_SECOND = 0.05;    // scale(t) = 1 + k*t
    constexpr double PAN_PRESCALE = 1.2;        // pan frame is 1.2x the target size
    constexpr double PAN_PIXELS_PER_SECOND = 100.0;
}

// Source-space rectangle selected by resize-to-cover + center-crop.
// Scaling the rect by `scale` yields exactly the target size.
struct CoverCrop {
    double scale;
    int crop_x;
    int crop_y;
    int crop_width;
    int crop_height;
};

// scale = max(dst_w/src_w, dst_h/src_h); the crop is centered in the source
CoverCrop compute_cover_crop(int src_width, int src_height, int dst_width, int dst_height);

// Affine placement of a clip's base frame inside the output canvas.
// A base-frame point p maps to  (p - base_center) * scale + canvas_center + translate.
// opacity fades toward black.
struct FrameTransform {
    double scale = 1.0;
    double translate_x = 0.0;
    double translate_y = 0.0;
    double opacity = 1.0;

    bool is_identity_geometry() const {
        return scale == 1.0 && translate_x == 0.0 && translate_y == 0.0;
    }
};

// Pure animation transform for time t within a clip of `duration`,
// on a width x height canvas.
//  Fade: opacity ramps in over the first 0.5s and out over the last 0.5s
//  Zoom: scale 1 + 0.05*t about the canvas center
//  Pan:  1.2x frame whose left edge sits at x = 100*t, vertically centered
FrameTransform animation_transform(AnimationType type, TimeUS t, TimeUS duration,
                                   int width, int height);

enum class FadeDirection {
    In,     // 0 -> 1 over [0, duration)
    Out     // 1 -> 0 over the last `duration` of the clip
};

// Opacity ramp attached to a clip or to a whole timeline; ramps multiply
struct Fade {
    FadeDirection direction;
    TimeUS duration;

    // Gain in [0, 1] at time t of a span `span_duration` long
    double gain_at(TimeUS t, TimeUS span_duration) const;
};

// Product of every fade's gain at t
double combined_fade_gain(const std::vector<Fade>& fades, TimeUS t, TimeUS span_duration);

// One image's timed visual segment.
// Holds the cover-cropped base frame (exactly target size) plus the time-dependent
// transform pipeline; render_frame(t) is defined for t in [0, duration).
class Clip {
public:
    Clip(MediaAsset source, std::shared_ptr<Frame> base, TimeUS duration,
         AnimationType animation);

    Clip(const Clip&) = delete;
    Clip& operator=(const Clip&) = delete;

    const MediaAsset& source() const { return m_source; }
    TimeUS duration_us() const { return m_duration; }
    AnimationType animation() const { return m_animation; }

    // Output dimensions (target size)
    int width() const { return m_width; }
    int height() const { return m_height; }

    void add_fade(Fade fade) { m_fades.push_back(fade); }
    const std::vector<Fade>& fades() const { return m_fades; }

    // Animation transform with the clip's own fades folded into opacity.
    // t is clamped into [0, duration).
    FrameTransform transform_at(TimeUS t) const;

    // Rasterize the clip at t; extra_gain multiplies opacity (timeline-level fades)
    Result<std::shared_ptr<Frame>> render_frame(TimeUS t, double extra_gain = 1.0,
                                                TimeUS pts = 0) const;

    // Drop the decoded base frame; render_frame fails afterwards
    void release();
    bool is_released() const { return m_base == nullptr; }

private:
    MediaAsset m_source;
    std::shared_ptr<Frame> m_base;
    TimeUS m_duration;
    AnimationType m_animation;
    int m_width;
    int m_height;
    std::vector<Fade> m_fades;
};

// Rasterize `base` through `transform` into a new width x height BGRA32 frame.
// Bilinear sampling; pixels outside the transformed image are black.
std::shared_ptr<Frame> rasterize(const Frame& base, const FrameTransform& transform,
                                 int width, int height, TimeUS pts);

// Builds one Clip per image
class ClipComposer {
public:
    // Decode the image and compose it
    static Result<std::unique_ptr<Clip>> Compose(const MediaAsset& image,
                                                 const RenderParameters& params);

    // Compose from an already decoded frame (any size)
    static Result<std::unique_ptr<Clip>> ComposeFrame(const MediaAsset& image,
                                                      const Frame& decoded,
                                                      const RenderParameters& params);

    // Resize-to-cover + center-crop a decoded frame to exactly width x height
    static Result<std::shared_ptr<Frame>> CoverCropFrame(const Frame& decoded,
                                                         int width, int height);
};

} // namespace rmp
