// Tests for AudioTrackMixer: span planning, looping reads, decoded WAV fitting

#include <QtTest>

#include "common/media_fixtures.h"
#include "common/test_base.h"

#include <reel_media_platform/rmp_audio_track.h>

#include <cstdlib>

Q_LOGGING_CATEGORY(reelTests, "reel.tests")

class TestAudioTrackMixer : public TestBase
{
    Q_OBJECT

private:
    // Stereo ramp: frame i holds (i, -i)
    static std::shared_ptr<rmp::PcmChunk> rampPcm(int64_t frames, int32_t rate = 48000) {
        std::vector<float> data(static_cast<size_t>(frames) * 2);
        for (int64_t i = 0; i < frames; ++i) {
            data[static_cast<size_t>(i) * 2] = static_cast<float>(i);
            data[static_cast<size_t>(i) * 2 + 1] = -static_cast<float>(i);
        }
        return rmp::PcmChunk::Create(rate, 2, std::move(data));
    }

private slots:
    // ========================================================================
    // SPAN PLANNING
    // ========================================================================

    void test_plan_shorter_audio_loops() {
        auto span = rmp::plan_audio_span(2000000, 6000000);
        QVERIFY(span.mode == rmp::AudioSpanMode::Loop);
        QCOMPARE(span.loop_count, int64_t(4));
        QCOMPARE(span.span_us, rmp::TimeUS(6000000));

        span = rmp::plan_audio_span(2500000, 6000000);
        QVERIFY(span.mode == rmp::AudioSpanMode::Loop);
        QCOMPARE(span.loop_count, int64_t(3));
    }

    void test_plan_longer_audio_trims() {
        auto span = rmp::plan_audio_span(10000000, 4000000);
        QVERIFY(span.mode == rmp::AudioSpanMode::Trim);
        QCOMPARE(span.loop_count, int64_t(1));
        QCOMPARE(span.span_us, rmp::TimeUS(4000000));
    }

    void test_plan_equal_audio_as_is() {
        auto span = rmp::plan_audio_span(3000000, 3000000);
        QVERIFY(span.mode == rmp::AudioSpanMode::AsIs);
        QCOMPARE(span.span_us, rmp::TimeUS(3000000));
    }

    // ========================================================================
    // PCM FITTING
    // ========================================================================

    void test_from_pcm_loops_to_video_length() {
        auto result = rmp::AudioTrackMixer::FromPcm(rmp::MediaAsset::audio("ramp.wav"),
                                                    rampPcm(96000), 6000000);
        QVERIFY(result.is_ok());
        const rmp::AudioTrack& track = *result.value();

        QCOMPARE(track.duration_us(), rmp::TimeUS(6000000));
        QCOMPARE(track.source_samples(), int64_t(96000));
        QCOMPARE(track.total_samples(), int64_t(288000));
        QCOMPARE(track.sample_rate(), 48000);
        QCOMPARE(track.channels(), 2);
        QVERIFY(track.span().mode == rmp::AudioSpanMode::Loop);
    }

    void test_read_samples_wraps_at_source_end() {
        auto result = rmp::AudioTrackMixer::FromPcm(rmp::MediaAsset::audio("ramp.wav"),
                                                    rampPcm(96000), 6000000);
        QVERIFY(result.is_ok());
        const rmp::AudioTrack& track = *result.value();

        std::vector<float> out(8 * 2, 0.0f);
        QCOMPARE(track.read_samples(95998, 4, out.data()), int64_t(4));
        QCOMPARE(out[0], 95998.0f);
        QCOMPARE(out[2], 95999.0f);
        QCOMPARE(out[4], 0.0f);
        QCOMPARE(out[6], 1.0f);
        QCOMPARE(out[7], -1.0f);
    }

    void test_read_samples_stops_at_span_end() {
        auto result = rmp::AudioTrackMixer::FromPcm(rmp::MediaAsset::audio("ramp.wav"),
                                                    rampPcm(96000), 6000000);
        QVERIFY(result.is_ok());
        const rmp::AudioTrack& track = *result.value();

        std::vector<float> out(10 * 2, 7.0f);
        QCOMPARE(track.read_samples(287996, 10, out.data()), int64_t(4));
        QCOMPARE(out[0], float(287996 % 96000));
        QCOMPARE(out[8], 7.0f);                     // untouched past the span
        QCOMPARE(track.read_samples(288000, 10, out.data()), int64_t(0));
        QCOMPARE(track.read_samples(-1, 10, out.data()), int64_t(0));
    }

    void test_from_pcm_trims_longer_source() {
        auto result = rmp::AudioTrackMixer::FromPcm(rmp::MediaAsset::audio("ramp.wav"),
                                                    rampPcm(480000), 4000000);
        QVERIFY(result.is_ok());
        QVERIFY(result.value()->span().mode == rmp::AudioSpanMode::Trim);
        QCOMPARE(result.value()->total_samples(), int64_t(192000));
    }

    void test_from_pcm_zero_length_is_unsupported() {
        auto result = rmp::AudioTrackMixer::FromPcm(rmp::MediaAsset::audio("empty.wav"),
                                                    rmp::PcmChunk::Create(48000, 2, {}), 3000000);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, rmp::ErrorCode::Unsupported);
    }

    void test_from_pcm_rejects_empty_video() {
        auto result = rmp::AudioTrackMixer::FromPcm(rmp::MediaAsset::audio("ramp.wav"),
                                                    rampPcm(48000), 0);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, rmp::ErrorCode::InvalidArg);
    }

    // ========================================================================
    // DECODED FILES
    // ========================================================================

    void test_no_audio_is_silent() {
        auto result = rmp::AudioTrackMixer::Mix(std::nullopt, 3000000);
        QVERIFY(result.is_ok());
        QVERIFY(result.value() == nullptr);
    }

    void test_mix_wav_loops_to_video() {
        QString path = testFile("short.wav");
        QVERIFY(fixtures::writeWav(path, 2.0));

        auto result = rmp::AudioTrackMixer::Mix(rmp::MediaAsset::audio(path.toStdString()), 6000000);
        QVERIFY2(result.is_ok(), qPrintable(QString::fromStdString(result.error().describe())));
        const rmp::AudioTrack& track = *result.value();

        QVERIFY(track.span().mode == rmp::AudioSpanMode::Loop);
        QCOMPARE(track.duration_us(), rmp::TimeUS(6000000));
        QCOMPARE(track.total_samples(), int64_t(288000));
        QCOMPARE(track.sample_rate(), 48000);
        QCOMPARE(track.channels(), 2);
        QVERIFY(std::abs(track.source_samples() - 96000) <= 1);
    }

    void test_mix_wav_trims_and_resamples() {
        QString path = testFile("long.wav");
        QVERIFY(fixtures::writeWav(path, 10.0, 44100, 1));

        auto result = rmp::AudioTrackMixer::Mix(rmp::MediaAsset::audio(path.toStdString()), 4000000);
        QVERIFY2(result.is_ok(), qPrintable(QString::fromStdString(result.error().describe())));
        const rmp::AudioTrack& track = *result.value();

        QVERIFY(track.span().mode == rmp::AudioSpanMode::Trim);
        QCOMPARE(track.duration_us(), rmp::TimeUS(4000000));
        QCOMPARE(track.sample_rate(), 48000);
        QCOMPARE(track.channels(), 2);
        QCOMPARE(track.total_samples(), int64_t(192000));
    }

    void test_mix_missing_file() {
        auto result = rmp::AudioTrackMixer::Mix(
            rmp::MediaAsset::audio(testFile("absent.wav").toStdString()), 3000000);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, rmp::ErrorCode::FileNotFound);
    }

    void test_mix_rejects_image_asset() {
        auto result = rmp::AudioTrackMixer::Mix(rmp::MediaAsset::image("/tmp/a.png"), 3000000);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, rmp::ErrorCode::InvalidArg);
    }
};

QTEST_GUILESS_MAIN(TestAudioTrackMixer)
#include "test_audio_track_mixer.moc"
