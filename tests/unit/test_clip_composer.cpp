// Tests for ClipComposer: cover crop geometry, animation transforms, rasterizer

#include <QtTest>

#include "common/media_fixtures.h"
#include "common/test_base.h"

#include <reel_media_platform/rmp_clip.h>

#include <cstdlib>
#include <cstring>

Q_LOGGING_CATEGORY(reelTests, "reel.tests")

namespace {

// BGRA frame whose left half is `left` and right half is `right` (B, G, R)
std::shared_ptr<rmp::Frame> makeFrame(int width, int height,
                                      const uint8_t left[3], const uint8_t right[3])
{
    int stride = 0;
    std::vector<uint8_t> buffer = rmp::Frame::AllocateBuffer(width, height, &stride);
    for (int y = 0; y < height; ++y) {
        uint8_t* row = buffer.data() + static_cast<size_t>(y) * stride;
        for (int x = 0; x < width; ++x) {
            const uint8_t* color = x < width / 2 ? left : right;
            std::memcpy(row + x * 4, color, 3);
            row[x * 4 + 3] = 255;
        }
    }
    return rmp::Frame::CreateCPU(width, height, stride, 0, std::move(buffer));
}

const uint8_t kBlue[3] = {200, 40, 40};
const uint8_t kRed[3] = {40, 40, 200};

bool near(int actual, int expected, int tolerance = 6)
{
    return std::abs(actual - expected) <= tolerance;
}

}

class TestClipComposer : public TestBase
{
    Q_OBJECT

private slots:
    // ========================================================================
    // COVER CROP
    // ========================================================================

    void test_cover_crop_landscape_source() {
        auto crop = rmp::compute_cover_crop(1920, 1080, 720, 1280);
        QVERIFY(qFuzzyCompare(crop.scale, 1280.0 / 1080.0));
        QCOMPARE(crop.crop_height, 1080);
        QCOMPARE(crop.crop_y, 0);
        QVERIFY(crop.crop_width == 607 || crop.crop_width == 608);
        QCOMPARE(crop.crop_x, (1920 - crop.crop_width) / 2);
    }

    void test_cover_crop_tall_source() {
        auto crop = rmp::compute_cover_crop(1000, 4000, 720, 1280);
        QVERIFY(qFuzzyCompare(crop.scale, 0.72));
        QCOMPARE(crop.crop_width, 1000);
        QCOMPARE(crop.crop_x, 0);
        QCOMPARE(crop.crop_height, 1778);
        QCOMPARE(crop.crop_y, (4000 - 1778) / 2);
    }

    void test_cover_crop_matching_aspect_uses_whole_source() {
        auto crop = rmp::compute_cover_crop(360, 640, 720, 1280);
        QVERIFY(qFuzzyCompare(crop.scale, 2.0));
        QCOMPARE(crop.crop_x, 0);
        QCOMPARE(crop.crop_y, 0);
        QCOMPARE(crop.crop_width, 360);
        QCOMPARE(crop.crop_height, 640);
    }

    void test_cover_crop_frame_exact_target_size() {
        const QList<QPair<int, int>> sources = {{400, 300}, {90, 500}, {64, 64}, {50, 40}};
        for (const auto& size : sources) {
            auto source = makeFrame(size.first, size.second, kBlue, kRed);
            auto result = rmp::ClipComposer::CoverCropFrame(*source, 72, 128);
            QVERIFY2(result.is_ok(), qPrintable(QString::fromStdString(result.error().describe())));
            QCOMPARE(result.value()->width(), 72);
            QCOMPARE(result.value()->height(), 128);
        }
    }

    void test_cover_crop_frame_keeps_center() {
        // Landscape source: the center strip survives, both halves stay visible
        auto source = makeFrame(400, 300, kBlue, kRed);
        auto result = rmp::ClipComposer::CoverCropFrame(*source, 72, 128);
        QVERIFY(result.is_ok());
        const rmp::Frame& out = *result.value();

        const uint8_t* left = out.row(64) + 10 * 4;
        const uint8_t* right = out.row(64) + 62 * 4;
        QVERIFY(near(left[0], kBlue[0]) && near(left[2], kBlue[2]));
        QVERIFY(near(right[0], kRed[0]) && near(right[2], kRed[2]));
    }

    void test_cover_crop_frame_rejects_bad_target() {
        auto source = makeFrame(16, 16, kBlue, kRed);
        auto result = rmp::ClipComposer::CoverCropFrame(*source, 0, 128);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, rmp::ErrorCode::InvalidArg);
    }

    // ========================================================================
    // ANIMATION
    // ========================================================================

    void test_fade_animation_ramps() {
        const rmp::TimeUS dur = 3000000;
        auto at = [dur](rmp::TimeUS t) {
            return rmp::animation_transform(rmp::AnimationType::Fade, t, dur, 720, 1280);
        };
        QCOMPARE(at(0).opacity, 0.0);
        QVERIFY(qFuzzyCompare(at(250000).opacity, 0.5));
        QCOMPARE(at(1500000).opacity, 1.0);
        QVERIFY(qFuzzyCompare(at(2750000).opacity, 0.5));
        QVERIFY(at(0).is_identity_geometry());
    }

    void test_zoom_animation_scale() {
        auto tf = rmp::animation_transform(rmp::AnimationType::Zoom, 2000000, 3000000, 720, 1280);
        QVERIFY(qFuzzyCompare(tf.scale, 1.1));
        QCOMPARE(tf.translate_x, 0.0);
        QCOMPARE(tf.translate_y, 0.0);
        QCOMPARE(tf.opacity, 1.0);

        auto start = rmp::animation_transform(rmp::AnimationType::Zoom, 0, 3000000, 720, 1280);
        QCOMPARE(start.scale, 1.0);
    }

    void test_pan_animation_left_edge_moves() {
        auto tf = rmp::animation_transform(rmp::AnimationType::Pan, 1000000, 3000000, 720, 1280);
        QVERIFY(qFuzzyCompare(tf.scale, 1.2));
        QVERIFY(qFuzzyCompare(tf.translate_x, 172.0));
        QCOMPARE(tf.translate_y, 0.0);

        // Left edge of the scaled frame: W/2 + tx - scale*W/2
        double leftEdge = 360.0 + tf.translate_x - 1.2 * 360.0;
        QVERIFY(qFuzzyCompare(leftEdge, 100.0));
    }

    void test_fade_gain_directions() {
        rmp::Fade in{rmp::FadeDirection::In, 1000000};
        rmp::Fade out{rmp::FadeDirection::Out, 1000000};
        QCOMPARE(in.gain_at(0, 4000000), 0.0);
        QCOMPARE(in.gain_at(500000, 4000000), 0.5);
        QCOMPARE(in.gain_at(2000000, 4000000), 1.0);
        QCOMPARE(out.gain_at(2000000, 4000000), 1.0);
        QCOMPARE(out.gain_at(3500000, 4000000), 0.5);

        rmp::Fade none{rmp::FadeDirection::In, 0};
        QCOMPARE(none.gain_at(0, 4000000), 1.0);

        QCOMPARE(rmp::combined_fade_gain({in, out}, 500000, 4000000), 0.5);
    }

    // ========================================================================
    // RASTERIZER
    // ========================================================================

    void test_rasterize_identity_applies_opacity() {
        auto base = makeFrame(8, 4, kBlue, kBlue);
        rmp::FrameTransform tf;
        tf.opacity = 0.5;
        auto out = rmp::rasterize(*base, tf, 8, 4, 777);
        QCOMPARE(out->width(), 8);
        QCOMPARE(out->height(), 4);
        QCOMPARE(out->pts_us(), rmp::TimeUS(777));
        QCOMPARE(int(out->row(2)[5 * 4 + 0]), 100);
        QCOMPARE(int(out->row(2)[5 * 4 + 2]), 20);
        QCOMPARE(int(out->row(2)[5 * 4 + 3]), 255);
    }

    void test_rasterize_shrunk_frame_has_black_border() {
        auto base = makeFrame(40, 40, kRed, kRed);
        rmp::FrameTransform tf;
        tf.scale = 0.5;
        auto out = rmp::rasterize(*base, tf, 40, 40, 0);

        const uint8_t* corner = out->row(0);
        QCOMPARE(int(corner[0]), 0);
        QCOMPARE(int(corner[1]), 0);
        QCOMPARE(int(corner[2]), 0);
        QCOMPARE(int(corner[3]), 255);

        const uint8_t* center = out->row(20) + 20 * 4;
        QCOMPARE(int(center[0]), int(kRed[0]));
        QCOMPARE(int(center[2]), int(kRed[2]));
    }

    // ========================================================================
    // COMPOSE
    // ========================================================================

    void test_compose_png_to_target_size() {
        QString path = testFile("landscape.png");
        QVERIFY(fixtures::writePng(path, 320, 180));

        rmp::RenderParameters params;
        params.target_width = 72;
        params.target_height = 128;
        params.duration_per_image = 2.0;
        params.animation_type = rmp::AnimationType::Zoom;

        auto result = rmp::ClipComposer::Compose(rmp::MediaAsset::image(path.toStdString()), params);
        QVERIFY2(result.is_ok(), qPrintable(QString::fromStdString(result.error().describe())));

        const rmp::Clip& clip = *result.value();
        QCOMPARE(clip.width(), 72);
        QCOMPARE(clip.height(), 128);
        QCOMPARE(clip.duration_us(), rmp::TimeUS(2000000));
        QCOMPARE(clip.animation(), rmp::AnimationType::Zoom);
        QVERIFY(clip.fades().empty());

        auto frame = clip.render_frame(1000000);
        QVERIFY(frame.is_ok());
        QCOMPARE(frame.value()->width(), 72);
        QCOMPARE(frame.value()->height(), 128);
    }

    void test_compose_missing_file() {
        auto result = rmp::ClipComposer::Compose(
            rmp::MediaAsset::image(testFile("absent.png").toStdString()), rmp::RenderParameters());
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, rmp::ErrorCode::FileNotFound);
    }

    void test_compose_rejects_audio_asset() {
        auto result = rmp::ClipComposer::Compose(rmp::MediaAsset::audio("/tmp/x.wav"),
                                                 rmp::RenderParameters());
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, rmp::ErrorCode::InvalidArg);
    }

    void test_compose_frame_rejects_invalid_parameters() {
        auto source = makeFrame(16, 16, kBlue, kRed);
        rmp::RenderParameters params;
        params.fps = 0;
        auto result = rmp::ClipComposer::ComposeFrame(rmp::MediaAsset::image("mem"), *source, params);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, rmp::ErrorCode::InvalidArg);
    }

    void test_clip_fades_and_release() {
        auto source = makeFrame(16, 16, kBlue, kRed);
        rmp::RenderParameters params;
        params.target_width = 16;
        params.target_height = 16;
        params.duration_per_image = 1.0;
        params.animation_type = rmp::AnimationType::Zoom;

        auto result = rmp::ClipComposer::ComposeFrame(rmp::MediaAsset::image("mem"), *source, params);
        QVERIFY(result.is_ok());
        rmp::Clip& clip = *result.value();

        clip.add_fade(rmp::Fade{rmp::FadeDirection::Out, 500000});
        QCOMPARE(clip.transform_at(0).opacity, 1.0);
        QVERIFY(qFuzzyCompare(clip.transform_at(750000).opacity, 0.5));

        clip.release();
        QVERIFY(clip.is_released());
        auto frame = clip.render_frame(0);
        QVERIFY(frame.is_error());
        QCOMPARE(frame.error().code, rmp::ErrorCode::Internal);
    }
};

QTEST_GUILESS_MAIN(TestClipComposer)
#include "test_clip_composer.moc"
