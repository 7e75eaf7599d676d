#include <QtTest>
#include <QDir>
#include <QFile>

#include "common/test_base.h"
#include "core/validation/media_validator.h"

Q_LOGGING_CATEGORY(reelTests, "reel.tests")

class TestMediaValidator : public TestBase
{
    Q_OBJECT

private:
    QString touch(const QString& name) {
        QString path = testFile(name);
        QFile file(path);
        if (file.open(QIODevice::WriteOnly)) {
            file.write("x");
        }
        return path;
    }

private slots:
    void test_existing_images_are_valid() {
        QStringList images = {touch("a.png"), touch("b.jpg"), touch("c.bmp")};
        auto result = reel::MediaValidator::validate(images);
        QVERIFY(result.valid);
        QVERIFY(result.errors.isEmpty());
    }

    void test_existing_images_and_audio_are_valid() {
        auto result = reel::MediaValidator::validate({touch("one.png")}, touch("track.wav"));
        QVERIFY(result.valid);
    }

    void test_empty_image_list_is_invalid() {
        auto result = reel::MediaValidator::validate({});
        QVERIFY(!result.valid);
        QCOMPARE(result.errors.size(), 1);
    }

    void test_missing_image_reported_per_path() {
        QString present = touch("present.png");
        QString missing1 = testFile("missing1.png");
        QString missing2 = testFile("missing2.png");

        auto result = reel::MediaValidator::validate({missing1, present, missing2});
        QVERIFY(!result.valid);
        QCOMPARE(result.errors.size(), 2);
        QVERIFY(result.errors[0].contains(missing1));
        QVERIFY(result.errors[1].contains(missing2));
    }

    void test_directory_is_not_a_regular_file() {
        QString dir = testFile("folder.png");
        QVERIFY(QDir().mkpath(dir));

        auto result = reel::MediaValidator::validate({dir});
        QVERIFY(!result.valid);
        QVERIFY(result.errors[0].startsWith("Not a regular image file"));
    }

    void test_missing_audio_is_invalid() {
        QString audio = testFile("gone.mp3");
        auto result = reel::MediaValidator::validate({touch("img.png")}, audio);
        QVERIFY(!result.valid);
        QCOMPARE(result.errors.size(), 1);
        QVERIFY(result.errors[0].startsWith("Audio file does not exist"));
    }

    void test_empty_list_error_comes_first() {
        auto result = reel::MediaValidator::validate({}, testFile("nope.wav"));
        QVERIFY(!result.valid);
        QCOMPARE(result.errors.size(), 2);
        QCOMPARE(result.errors[0], QString("At least one image is required"));
    }
};

QTEST_GUILESS_MAIN(TestMediaValidator)
#include "test_media_validator.moc"
