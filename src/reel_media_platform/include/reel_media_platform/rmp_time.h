#pragma once

#include <cmath>
#include <cstdint>
#include <limits>

namespace rmp {

// Internal canonical time unit: microseconds since timeline start
using TimeUS = int64_t;

constexpr TimeUS US_PER_SECOND = 1000000;

// Seconds (as carried by RenderParameters) to microseconds, round-half-away.
// Saturates at the TimeUS range; NaN maps to 0.
inline TimeUS seconds_to_us(double seconds) {
    const double us = seconds * static_cast<double>(US_PER_SECOND);
    if (std::isnan(us)) {
        return 0;
    }
    // 2^63 is exactly representable; anything at or above it does not fit
    constexpr double kLimit = 9223372036854775808.0;
    if (us >= kLimit) {
        return std::numeric_limits<TimeUS>::max();
    }
    if (us <= -kLimit) {
        return std::numeric_limits<TimeUS>::min();
    }
    return static_cast<TimeUS>(std::llround(us));
}

inline double us_to_seconds(TimeUS us) {
    return static_cast<double>(us) / static_cast<double>(US_PER_SECOND);
}

// Frame rate as rational number (fps = num/den)
struct Rate {
    int32_t num;
    int32_t den;

    // Returns fps as double (for display/comparison only)
    double to_fps() const { return static_cast<double>(num) / den; }

    bool operator==(const Rate& other) const {
        return num == other.num && den == other.den;
    }
    bool operator!=(const Rate& other) const { return !(*this == other); }
};

// Frame-first time representation on an output grid
struct FrameTime {
    int64_t frame;
    Rate rate;

    // Convert to microseconds using round-half-up (matches av_rescale_q).
    TimeUS to_us() const {
        int64_t num = frame * 1000000LL * rate.den;
        return (num + rate.num / 2) / rate.num;
    }

    static FrameTime from_frame(int64_t f, Rate r) {
        return FrameTime{f, r};
    }
};

// Number of whole frames needed to cover `duration` at `rate` (rounded to nearest).
// A 3.0s timeline at 24fps is exactly 72 frames.
inline int64_t frame_count_for(TimeUS duration, Rate rate) {
    int64_t scaled = duration * rate.num;
    int64_t denom = US_PER_SECOND * rate.den;
    return (scaled + denom / 2) / denom;
}

// Number of audio sample-frames spanning `duration` at `sample_rate` (rounded to nearest)
inline int64_t sample_count_for(TimeUS duration, int32_t sample_rate) {
    return (duration * sample_rate + US_PER_SECOND / 2) / US_PER_SECOND;
}

} // namespace rmp
