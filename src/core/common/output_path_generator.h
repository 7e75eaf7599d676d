#pragma once

#include <reel_media_platform/rmp_encoder.h>

#include <QObject>
#include <QString>
#include <QMutex>
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(reelOutput)

namespace reel {

/**
 * Unique output file names for rendered videos
 *
 * Paths look like <outputDirectory>/<prefix><id>.mp4.
 * - Production: random UUID ids
 * - Testing:    seeded, deterministic UUID-shaped ids (replayable)
 * - Debugging:  zero-padded sequence numbers
 *
 * Thread-safe; one instance may serve concurrent renders since it only hands
 * out names. Not a singleton: the owner injects it into the pipeline.
 */
class OutputPathGenerator : public QObject
{
    Q_OBJECT

public:
    enum GenerationMode {
        ProductionMode,
        TestingMode,
        DebuggingMode
    };

    explicit OutputPathGenerator(const QString& outputDirectory,
                                 const QString& prefix = QStringLiteral("reel_"),
                                 QObject* parent = nullptr);

    void setGenerationMode(GenerationMode mode);
    GenerationMode generationMode() const;

    // Seeds Testing mode and restarts its sequence
    void setSeed(quint32 seed);

    QString outputDirectory() const { return m_outputDirectory; }
    QString prefix() const { return m_prefix; }

    // Next unique path; creates the output directory if needed
    QString nextPath();

    int generationCount() const;

    // Adapter for rmp::Encoder. The generator must outlive the returned provider.
    rmp::OutputPathProvider provider();

signals:
    void pathGenerated(const QString& path);

private:
    QString generateId();
    QString generateTestingId() const;

    const QString m_outputDirectory;
    const QString m_prefix;

    GenerationMode m_mode = ProductionMode;
    quint32 m_seed = 12345;
    int m_count = 0;

    mutable QMutex m_mutex;
};

}
