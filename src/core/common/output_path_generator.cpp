#include "output_path_generator.h"

#include <QCryptographicHash>
#include <QDir>
#include <QUuid>

Q_LOGGING_CATEGORY(reelOutput, "reel.core.output")

namespace reel {

OutputPathGenerator::OutputPathGenerator(const QString& outputDirectory, const QString& prefix,
                                         QObject* parent)
    : QObject(parent)
    , m_outputDirectory(QDir::cleanPath(outputDirectory))
    , m_prefix(prefix)
{
    qCDebug(reelOutput, "OutputPathGenerator writing to %s", qPrintable(m_outputDirectory));
}

void OutputPathGenerator::setGenerationMode(GenerationMode mode)
{
    QMutexLocker locker(&m_mutex);
    if (m_mode != mode) {
        qCDebug(reelOutput, "Generation mode changed from %d to %d", m_mode, mode);
        m_mode = mode;
        m_count = 0;
    }
}

OutputPathGenerator::GenerationMode OutputPathGenerator::generationMode() const
{
    QMutexLocker locker(&m_mutex);
    return m_mode;
}

void OutputPathGenerator::setSeed(quint32 seed)
{
    QMutexLocker locker(&m_mutex);
    m_seed = seed;
    m_count = 0;
    qCDebug(reelOutput, "Output path generator seeded with: %u", seed);
}

int OutputPathGenerator::generationCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_count;
}

QString OutputPathGenerator::generateTestingId() const
{
    // SHA-256 of seed and sequence number, formatted as a UUID
    QCryptographicHash hash(QCryptographicHash::Sha256);
    hash.addData(QString("%1-%2").arg(m_seed).arg(m_count).toUtf8());
    QByteArray digest = hash.result();

    return QString("%1-%2-%3-%4-%5")
            .arg(QString::fromLatin1(digest.left(4).toHex()))
            .arg(QString::fromLatin1(digest.mid(4, 2).toHex()))
            .arg(QString::fromLatin1(digest.mid(6, 2).toHex()))
            .arg(QString::fromLatin1(digest.mid(8, 2).toHex()))
            .arg(QString::fromLatin1(digest.mid(10, 6).toHex()));
}

QString OutputPathGenerator::generateId()
{
    QString id;
    switch (m_mode) {
    case ProductionMode:
        id = QUuid::createUuid().toString(QUuid::WithoutBraces);
        break;
    case TestingMode:
        id = generateTestingId();
        break;
    case DebuggingMode:
        id = QString("%1").arg(m_count + 1, 6, 10, QChar('0'));
        break;
    }
    ++m_count;
    return id;
}

QString OutputPathGenerator::nextPath()
{
    QString path;
    {
        QMutexLocker locker(&m_mutex);
        path = QDir(m_outputDirectory).filePath(m_prefix + generateId() + ".mp4");
    }

    if (!QDir().mkpath(m_outputDirectory)) {
        // The encoder reports the failure when it cannot open the file
        qCWarning(reelOutput, "Cannot create output directory %s", qPrintable(m_outputDirectory));
    }

    qCDebug(reelOutput, "Output path: %s", qPrintable(path));
    emit pathGenerated(path);
    return path;
}

rmp::OutputPathProvider OutputPathGenerator::provider()
{
    return [this]() { return nextPath().toStdString(); };
}

}
