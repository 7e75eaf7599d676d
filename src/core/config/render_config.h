#pragma once

#include <reel_media_platform/rmp_encoder.h>
#include <reel_media_platform/rmp_render_params.h>

#include <QJsonObject>
#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(reelConfig)

namespace reel {

/**
 * Render defaults, encoder settings and output location
 *
 * JSON layout:
 *   { "defaults": { fps, duration_per_image, transition_duration, animation_type,
 *                   target_width, target_height },
 *     "encoder":  { video_codec, preset, crf, audio_codec, audio_bitrate,
 *                   audio_sample_rate, threads },
 *     "output":   { directory, prefix } }
 *
 * Every field is optional; bad values fall back to the built-in value with a warning.
 */
struct RenderConfig
{
    rmp::RenderParameters defaults;
    rmp::EncoderSettings encoder;
    QString outputDirectory;
    QString outputPrefix = QStringLiteral("reel_");

    static constexpr const char* OUTPUT_DIR_ENV = "REEL_OUTPUT_DIR";
    static constexpr const char* CONFIG_PATH_ENV = "REEL_CONFIG";

    // Built-in values; output goes to a "reel" folder under the temp location
    static RenderConfig builtIn();

    // Load from a JSON file (empty path or missing file = built-in), then apply
    // the REEL_OUTPUT_DIR override. Never throws.
    static RenderConfig load(const QString& path);

    static RenderConfig fromJson(const QJsonObject& root);

    // Explicit path if given, else $REEL_CONFIG, else empty
    static QString resolveConfigPath(const QString& explicitPath);
};

}
