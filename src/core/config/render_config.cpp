#include "render_config.h"
#include "core/script/script_parameter_resolver.h"

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

#include <cmath>

Q_LOGGING_CATEGORY(reelConfig, "reel.core.config")

namespace reel {

namespace {

// AAC sample-rate table spans 8kHz to 96kHz
constexpr qint64 kMinSampleRate = 8000;
constexpr qint64 kMaxSampleRate = 96000;
constexpr qint64 kMaxAudioBitrate = 1536000;
constexpr qint64 kMaxThreads = 256;

QString stringField(const QJsonObject& object, const char* key, const QString& fallback)
{
    QJsonValue value = object.value(QLatin1String(key));
    if (value.isUndefined()) {
        return fallback;
    }
    if (!value.isString() || value.toString().trimmed().isEmpty()) {
        qCWarning(reelConfig, "Config %s must be a non-empty string, keeping '%s'",
                  key, qPrintable(fallback));
        return fallback;
    }
    return value.toString().trimmed();
}

// Whole number in [min, max]; anything else keeps the fallback
qint64 integerField(const QJsonObject& object, const char* key, qint64 fallback, qint64 min, qint64 max)
{
    QJsonValue value = object.value(QLatin1String(key));
    if (value.isUndefined()) {
        return fallback;
    }
    double number = value.toDouble(-1.0);
    if (!value.isDouble() || number < static_cast<double>(min) || number > static_cast<double>(max) ||
        number != std::floor(number)) {
        qCWarning(reelConfig, "Config %s must be an integer in [%lld, %lld], keeping %lld",
                  key, static_cast<long long>(min), static_cast<long long>(max),
                  static_cast<long long>(fallback));
        return fallback;
    }
    return static_cast<qint64>(number);
}

}

RenderConfig RenderConfig::builtIn()
{
    RenderConfig config;
    config.outputDirectory = QDir(QStandardPaths::writableLocation(QStandardPaths::TempLocation))
                                 .filePath(QStringLiteral("reel"));
    return config;
}

RenderConfig RenderConfig::fromJson(const QJsonObject& root)
{
    RenderConfig config = builtIn();

    QJsonObject defaults = root.value(QLatin1String("defaults")).toObject();
    if (!defaults.isEmpty()) {
        rmp::RenderParameters parsed = ScriptParameterResolver::parametersFromJson(defaults, config.defaults);
        rmp::RenderParameters clamped = ScriptParameterResolver::clamp(parsed, config.defaults);
        if (clamped != parsed) {
            qCWarning(reelConfig, "Config defaults out of range, using built-in values for those fields");
        }
        config.defaults = clamped;
    }

    QJsonObject encoder = root.value(QLatin1String("encoder")).toObject();
    rmp::EncoderSettings& enc = config.encoder;
    enc.video_codec = stringField(encoder, "video_codec", QString::fromStdString(enc.video_codec)).toStdString();
    enc.preset = stringField(encoder, "preset", QString::fromStdString(enc.preset)).toStdString();
    enc.audio_codec = stringField(encoder, "audio_codec", QString::fromStdString(enc.audio_codec)).toStdString();
    enc.audio_bitrate = integerField(encoder, "audio_bitrate", enc.audio_bitrate, 1, kMaxAudioBitrate);
    enc.audio_sample_rate = static_cast<int32_t>(
        integerField(encoder, "audio_sample_rate", enc.audio_sample_rate, kMinSampleRate, kMaxSampleRate));
    enc.threads = static_cast<int>(integerField(encoder, "threads", enc.threads, 1, kMaxThreads));

    // crf 0 is valid (lossless); 51 is the x264 maximum
    QJsonValue crf = encoder.value(QLatin1String("crf"));
    if (!crf.isUndefined()) {
        int value = crf.toInt(-1);
        if (value >= 0 && value <= 51) {
            enc.crf = value;
        } else {
            qCWarning(reelConfig, "Config crf must be an integer in [0, 51], keeping %d", enc.crf);
        }
    }

    QJsonObject output = root.value(QLatin1String("output")).toObject();
    config.outputDirectory = stringField(output, "directory", config.outputDirectory);
    config.outputPrefix = stringField(output, "prefix", config.outputPrefix);

    return config;
}

RenderConfig RenderConfig::load(const QString& path)
{
    RenderConfig config = builtIn();

    if (!path.isEmpty()) {
        QFile file(path);
        if (!file.exists()) {
            qCInfo(reelConfig, "No config at %s, using built-in defaults", qPrintable(path));
        } else if (!file.open(QIODevice::ReadOnly)) {
            qCWarning(reelConfig, "Cannot read config %s: %s", qPrintable(path),
                      qPrintable(file.errorString()));
        } else {
            QJsonParseError parseError;
            QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
            if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
                qCWarning(reelConfig, "Malformed config %s (%s), using built-in defaults",
                          qPrintable(path), qPrintable(parseError.errorString()));
            } else {
                config = fromJson(doc.object());
                qCDebug(reelConfig, "Loaded config %s", qPrintable(path));
            }
        }
    }

    QString outputOverride = qEnvironmentVariable(OUTPUT_DIR_ENV);
    if (!outputOverride.isEmpty()) {
        qCDebug(reelConfig, "%s overrides output directory: %s", OUTPUT_DIR_ENV, qPrintable(outputOverride));
        config.outputDirectory = outputOverride;
    }
    return config;
}

QString RenderConfig::resolveConfigPath(const QString& explicitPath)
{
    if (!explicitPath.isEmpty()) {
        return explicitPath;
    }
    return qEnvironmentVariable(CONFIG_PATH_ENV);
}

}
