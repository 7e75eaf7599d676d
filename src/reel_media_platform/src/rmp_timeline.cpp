#include <reel_media_platform/rmp_timeline.h>
#include <algorithm>
#include <cassert>

namespace rmp {

void Timeline::append(std::unique_ptr<Clip> clip) {
    assert(clip && "Timeline::append: null clip");
    m_starts.push_back(m_duration);
    m_duration += clip->duration_us();
    m_clips.push_back(std::move(clip));
}

int Timeline::width() const {
    return m_clips.empty() ? 0 : m_clips.front()->width();
}

int Timeline::height() const {
    return m_clips.empty() ? 0 : m_clips.front()->height();
}

Result<ClipPosition> Timeline::locate(TimeUS t) const {
    if (t < 0 || t >= m_duration) {
        return Error::invalid_arg("Time " + std::to_string(t) + "us outside timeline [0, " +
                                  std::to_string(m_duration) + "us)");
    }
    // Last clip whose start is <= t
    auto it = std::upper_bound(m_starts.begin(), m_starts.end(), t);
    size_t index = static_cast<size_t>(std::distance(m_starts.begin(), it)) - 1;
    return ClipPosition{index, t - m_starts[index]};
}

double Timeline::fade_gain(TimeUS t) const {
    return combined_fade_gain(m_fades, t, m_duration);
}

Result<FrameTransform> Timeline::transform_at(TimeUS t) const {
    auto pos = locate(t);
    if (pos.is_error()) {
        return pos.error();
    }
    FrameTransform tf = m_clips[pos.value().index]->transform_at(pos.value().local_time);
    tf.opacity *= fade_gain(t);
    return tf;
}

Result<std::shared_ptr<Frame>> Timeline::render_frame(TimeUS t) const {
    auto pos = locate(t);
    if (pos.is_error()) {
        return pos.error();
    }
    const Clip& c = *m_clips[pos.value().index];
    return c.render_frame(pos.value().local_time, fade_gain(t), t);
}

void Timeline::release() {
    for (auto& c : m_clips) {
        c->release();
    }
}

Result<Timeline> TransitionScheduler::Schedule(std::vector<std::unique_ptr<Clip>> clips,
                                               double transition_seconds) {
    if (clips.empty()) {
        return Error::invalid_arg("No clips to schedule");
    }
    if (!(transition_seconds >= 0.0)) {
        return Error::invalid_arg("Transition duration must be non-negative");
    }
    for (const auto& c : clips) {
        if (!c) {
            return Error::invalid_arg("Null clip in schedule");
        }
    }

    Timeline timeline;

    if (clips.size() == 1) {
        const TimeUS fade = seconds_to_us(SINGLE_CLIP_FADE_SECONDS);
        clips.front()->add_fade(Fade{FadeDirection::In, fade});
        clips.front()->add_fade(Fade{FadeDirection::Out, fade});
        timeline.append(std::move(clips.front()));
        return std::move(timeline);
    }

    const TimeUS transition = seconds_to_us(transition_seconds);

    // Every clip but the last carries a fade-out; the first also sits under the
    // timeline fade-in. Neither may be longer than the clip.
    for (size_t i = 0; i + 1 < clips.size(); ++i) {
        if (transition > clips[i]->duration_us()) {
            return Error::invalid_arg("Transition of " + std::to_string(transition_seconds) +
                                      "s exceeds clip " + std::to_string(i) + " (" +
                                      clips[i]->source().path + ")");
        }
    }

    for (size_t i = 0; i < clips.size(); ++i) {
        if (transition > 0 && i + 1 < clips.size()) {
            clips[i]->add_fade(Fade{FadeDirection::Out, transition});
        }
        timeline.append(std::move(clips[i]));
    }
    if (transition > 0) {
        timeline.add_fade(Fade{FadeDirection::In, transition});
    }

    return std::move(timeline);
}

} // namespace rmp
