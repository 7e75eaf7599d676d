// Tests for TransitionScheduler and Timeline: durations, lookup, fade placement

#include <QtTest>

#include "common/test_base.h"

#include <reel_media_platform/rmp_timeline.h>

Q_LOGGING_CATEGORY(reelTests, "reel.tests")

class TestTransitionScheduler : public TestBase
{
    Q_OBJECT

private:
    // Zoom keeps the animation's own opacity at 1 so only fades show up
    static std::unique_ptr<rmp::Clip> makeClip(double seconds, const std::string& name = "mem.png") {
        int stride = 0;
        std::vector<uint8_t> buffer = rmp::Frame::AllocateBuffer(16, 16, &stride);
        for (size_t i = 3; i < buffer.size(); i += 4) {
            buffer[i] = 255;
        }
        auto frame = rmp::Frame::CreateCPU(16, 16, stride, 0, std::move(buffer));

        rmp::RenderParameters params;
        params.target_width = 16;
        params.target_height = 16;
        params.duration_per_image = seconds;
        params.animation_type = rmp::AnimationType::Zoom;

        auto result = rmp::ClipComposer::ComposeFrame(rmp::MediaAsset::image(name), *frame, params);
        return result.is_ok() ? std::move(result.value()) : nullptr;
    }

    static std::vector<std::unique_ptr<rmp::Clip>> makeClips(int count, double seconds) {
        std::vector<std::unique_ptr<rmp::Clip>> clips;
        for (int i = 0; i < count; ++i) {
            clips.push_back(makeClip(seconds, "img" + std::to_string(i) + ".png"));
        }
        return clips;
    }

private slots:
    // ========================================================================
    // SCHEDULING
    // ========================================================================

    void test_single_clip_gets_half_second_fades() {
        auto result = rmp::TransitionScheduler::Schedule(makeClips(1, 3.0), 1.0);
        QVERIFY(result.is_ok());
        const rmp::Timeline& timeline = result.value();

        QCOMPARE(timeline.clip_count(), size_t(1));
        QCOMPARE(timeline.duration_us(), rmp::TimeUS(3000000));
        QVERIFY(timeline.fades().empty());

        const auto& fades = timeline.clip(0).fades();
        QCOMPARE(fades.size(), size_t(2));
        QVERIFY(fades[0].direction == rmp::FadeDirection::In);
        QCOMPARE(fades[0].duration, rmp::TimeUS(500000));
        QVERIFY(fades[1].direction == rmp::FadeDirection::Out);
        QCOMPARE(fades[1].duration, rmp::TimeUS(500000));
    }

    void test_multi_clip_duration_is_sum() {
        auto result = rmp::TransitionScheduler::Schedule(makeClips(3, 2.0), 0.5);
        QVERIFY(result.is_ok());
        const rmp::Timeline& timeline = result.value();

        QCOMPARE(timeline.clip_count(), size_t(3));
        QCOMPARE(timeline.duration_us(), rmp::TimeUS(6000000));
        QCOMPARE(timeline.clip_start(0), rmp::TimeUS(0));
        QCOMPARE(timeline.clip_start(1), rmp::TimeUS(2000000));
        QCOMPARE(timeline.clip_start(2), rmp::TimeUS(4000000));
        QCOMPARE(timeline.width(), 16);
        QCOMPARE(timeline.height(), 16);
    }

    void test_multi_clip_fade_placement() {
        auto result = rmp::TransitionScheduler::Schedule(makeClips(3, 2.0), 0.5);
        QVERIFY(result.is_ok());
        const rmp::Timeline& timeline = result.value();

        for (size_t i = 0; i < 2; ++i) {
            const auto& fades = timeline.clip(i).fades();
            QCOMPARE(fades.size(), size_t(1));
            QVERIFY(fades[0].direction == rmp::FadeDirection::Out);
            QCOMPARE(fades[0].duration, rmp::TimeUS(500000));
        }
        QVERIFY(timeline.clip(2).fades().empty());

        QCOMPARE(timeline.fades().size(), size_t(1));
        QVERIFY(timeline.fades()[0].direction == rmp::FadeDirection::In);
    }

    void test_zero_transition_adds_no_fades() {
        auto result = rmp::TransitionScheduler::Schedule(makeClips(2, 1.0), 0.0);
        QVERIFY(result.is_ok());
        const rmp::Timeline& timeline = result.value();
        QVERIFY(timeline.fades().empty());
        QVERIFY(timeline.clip(0).fades().empty());
        QCOMPARE(timeline.duration_us(), rmp::TimeUS(2000000));
    }

    void test_transition_equal_to_clip_is_allowed() {
        auto result = rmp::TransitionScheduler::Schedule(makeClips(2, 1.0), 1.0);
        QVERIFY(result.is_ok());
    }

    // ========================================================================
    // ERRORS
    // ========================================================================

    void test_empty_clip_list_fails() {
        auto result = rmp::TransitionScheduler::Schedule({}, 0.5);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, rmp::ErrorCode::InvalidArg);
    }

    void test_transition_longer_than_clip_fails() {
        auto result = rmp::TransitionScheduler::Schedule(makeClips(2, 2.0), 3.0);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, rmp::ErrorCode::InvalidArg);
        QVERIFY(result.error().message.find("img0.png") != std::string::npos);
    }

    void test_negative_transition_fails() {
        auto result = rmp::TransitionScheduler::Schedule(makeClips(2, 2.0), -0.5);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, rmp::ErrorCode::InvalidArg);
    }

    // ========================================================================
    // TIMELINE LOOKUP AND RENDERING
    // ========================================================================

    void test_locate_maps_to_clip_local_time() {
        auto result = rmp::TransitionScheduler::Schedule(makeClips(3, 2.0), 0.5);
        QVERIFY(result.is_ok());
        const rmp::Timeline& timeline = result.value();

        auto p0 = timeline.locate(0);
        QVERIFY(p0.is_ok());
        QCOMPARE(p0.value().index, size_t(0));
        QCOMPARE(p0.value().local_time, rmp::TimeUS(0));

        auto p1 = timeline.locate(2000000);
        QCOMPARE(p1.value().index, size_t(1));
        QCOMPARE(p1.value().local_time, rmp::TimeUS(0));

        auto last = timeline.locate(5999999);
        QCOMPARE(last.value().index, size_t(2));
        QCOMPARE(last.value().local_time, rmp::TimeUS(1999999));

        QVERIFY(timeline.locate(6000000).is_error());
        QVERIFY(timeline.locate(-1).is_error());
    }

    void test_opacity_across_transitions() {
        auto result = rmp::TransitionScheduler::Schedule(makeClips(3, 2.0), 0.5);
        QVERIFY(result.is_ok());
        const rmp::Timeline& timeline = result.value();

        auto opacity = [&timeline](rmp::TimeUS t) { return timeline.transform_at(t).value().opacity; };
        QCOMPARE(opacity(0), 0.0);                          // timeline fade-in
        QCOMPARE(opacity(250000), 0.5);
        QCOMPARE(opacity(1000000), 1.0);
        QCOMPARE(opacity(1750000), 0.5);                    // clip 0 fading out
        QCOMPARE(opacity(2000000), 1.0);                    // clip 1 starts at full
        QCOMPARE(opacity(3750000), 0.5);                    // clip 1 fading out
        QCOMPARE(opacity(5999999), 1.0);                    // last clip has no fade-out
    }

    void test_single_clip_opacity_ends() {
        auto result = rmp::TransitionScheduler::Schedule(makeClips(1, 2.0), 0.5);
        QVERIFY(result.is_ok());
        const rmp::Timeline& timeline = result.value();
        QCOMPARE(timeline.transform_at(0).value().opacity, 0.0);
        QCOMPARE(timeline.transform_at(1000000).value().opacity, 1.0);
        QVERIFY(timeline.transform_at(1999999).value().opacity < 0.01);
    }

    void test_render_frame_uses_timeline_time() {
        auto result = rmp::TransitionScheduler::Schedule(makeClips(2, 1.0), 0.25);
        QVERIFY(result.is_ok());
        rmp::Timeline timeline = std::move(result.value());

        auto frame = timeline.render_frame(1500000);
        QVERIFY(frame.is_ok());
        QCOMPARE(frame.value()->pts_us(), rmp::TimeUS(1500000));
        QCOMPARE(frame.value()->width(), 16);

        QVERIFY(timeline.render_frame(2000000).is_error());

        timeline.release();
        QVERIFY(timeline.clip(0).is_released());
        QVERIFY(timeline.render_frame(0).is_error());
    }
};

QTEST_GUILESS_MAIN(TestTransitionScheduler)
#include "test_transition_scheduler.moc"
