#pragma once

#include "rmp_clip.h"
#include "rmp_errors.h"
#include "rmp_frame.h"
#include "rmp_time.h"
#include <memory>
#include <vector>

namespace rmp {

// Where a timeline time lands
struct ClipPosition {
    size_t index;       // clip index in timeline order
    TimeUS local_time;  // time relative to that clip's start
};

// Ordered, gapless concatenation of clips.
// Transitions are fades inside clip durations, so duration_us() is exactly the
// sum of the clip durations. Owns its clips; move-only.
class Timeline {
public:
    Timeline() = default;

    Timeline(const Timeline&) = delete;
    Timeline& operator=(const Timeline&) = delete;
    Timeline(Timeline&&) = default;
    Timeline& operator=(Timeline&&) = default;

    void append(std::unique_ptr<Clip> clip);

    // Timeline-level fade (applies to the concatenated sequence)
    void add_fade(Fade fade) { m_fades.push_back(fade); }
    const std::vector<Fade>& fades() const { return m_fades; }

    bool empty() const { return m_clips.empty(); }
    size_t clip_count() const { return m_clips.size(); }
    const Clip& clip(size_t index) const { return *m_clips.at(index); }
    TimeUS clip_start(size_t index) const { return m_starts.at(index); }
    TimeUS duration_us() const { return m_duration; }

    // Output size, taken from the first clip (0 when empty)
    int width() const;
    int height() const;

    // Map t in [0, duration) to a clip; InvalidArg outside the range
    Result<ClipPosition> locate(TimeUS t) const;

    // Product of the timeline-level fades at t
    double fade_gain(TimeUS t) const;

    // Clip transform at t with clip and timeline fades multiplied into opacity
    Result<FrameTransform> transform_at(TimeUS t) const;

    // Composite output frame for timeline time t; pts is t
    Result<std::shared_ptr<Frame>> render_frame(TimeUS t) const;

    // Release every clip's decoded frame (after encode)
    void release();

private:
    std::vector<std::unique_ptr<Clip>> m_clips;
    std::vector<TimeUS> m_starts;
    std::vector<Fade> m_fades;
    TimeUS m_duration = 0;
};

// Sequences composed clips into a Timeline with fade transitions
class TransitionScheduler {
public:
    // Fade used on both ends when there is a single clip
    static constexpr double SINGLE_CLIP_FADE_SECONDS = 0.5;

    // One clip: 0.5s fade-in and fade-out on that clip.
    // Several: fade-out of `transition_seconds` on every clip but the last,
    // plus a timeline fade-in of the same length.
    // Errors: empty list, negative transition, transition longer than a faded clip.
    static Result<Timeline> Schedule(std::vector<std::unique_ptr<Clip>> clips,
                                     double transition_seconds);
};

} // namespace rmp
