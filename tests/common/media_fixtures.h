#pragma once

// Synthesized media for tests: PNG stills through QImage, PCM WAV written by hand

#include <QColor>
#include <QFile>
#include <QImage>
#include <QString>
#include <QtEndian>
#include <cmath>
#include <cstdint>

namespace fixtures {

constexpr double kPi = 3.14159265358979323846;

// Solid image with a distinct left half so crops and pans are observable
inline bool writePng(const QString& path, int width, int height,
                     const QColor& color = QColor(200, 40, 40),
                     const QColor& leftHalf = QColor(40, 40, 200))
{
    QImage image(width, height, QImage::Format_RGB32);
    image.fill(color);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width / 2; ++x) {
            image.setPixelColor(x, y, leftHalf);
        }
    }
    return image.save(path, "PNG");
}

// 16-bit PCM WAV holding a sine tone of `seconds`
inline bool writeWav(const QString& path, double seconds, int sampleRate = 48000,
                     int channels = 2, double frequency = 440.0)
{
    const qint64 frames = static_cast<qint64>(std::llround(seconds * sampleRate));
    const quint32 dataBytes = static_cast<quint32>(frames * channels * 2);

    QByteArray bytes;
    bytes.reserve(static_cast<int>(44 + dataBytes));

    auto put32 = [&bytes](quint32 v) {
        char b[4];
        qToLittleEndian(v, b);
        bytes.append(b, 4);
    };
    auto put16 = [&bytes](quint16 v) {
        char b[2];
        qToLittleEndian(v, b);
        bytes.append(b, 2);
    };

    bytes.append("RIFF", 4);
    put32(36 + dataBytes);
    bytes.append("WAVE", 4);
    bytes.append("fmt ", 4);
    put32(16);                                          // fmt chunk size
    put16(1);                                           // PCM
    put16(static_cast<quint16>(channels));
    put32(static_cast<quint32>(sampleRate));
    put32(static_cast<quint32>(sampleRate * channels * 2));
    put16(static_cast<quint16>(channels * 2));
    put16(16);                                          // bits per sample
    bytes.append("data", 4);
    put32(dataBytes);

    for (qint64 i = 0; i < frames; ++i) {
        double s = std::sin(2.0 * kPi * frequency * static_cast<double>(i) / sampleRate);
        auto sample = static_cast<qint16>(std::lround(s * 16000.0));
        for (int c = 0; c < channels; ++c) {
            put16(static_cast<quint16>(sample));
        }
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    return file.write(bytes) == bytes.size();
}

}
