#pragma once

#include <reel_media_platform/rmp_render_params.h>

#include <QJsonObject>
#include <QLoggingCategory>
#include <QString>
#include <optional>

Q_DECLARE_LOGGING_CATEGORY(reelScript)

namespace reel {

/**
 * Informational fields a JSON script may carry alongside the parameters.
 * Logged and returned, never used to alter rendering.
 */
struct ScriptMetadata
{
    QString theme;
    QString style;
    std::optional<double> overallDuration;

    bool isEmpty() const { return theme.isEmpty() && style.isEmpty() && !overallDuration; }
};

struct ResolvedScript
{
    rmp::RenderParameters parameters;
    ScriptMetadata metadata;
    bool fromJson = false;          // parameters came from a JSON object
    bool matchedText = false;       // at least one free-text pattern matched
};

/**
 * ScriptParameterResolver - script payload to a fully valid RenderParameters
 *
 * Accepts JSON (optionally wrapped in ```json fences or embedded in prose)
 * or free-form text with keyword/number patterns. Never fails: anything
 * unusable degrades to the caller's defaults, field by field.
 */
class ScriptParameterResolver
{
public:
    static rmp::RenderParameters resolve(const QString& raw, const rmp::RenderParameters& defaults);
    static ResolvedScript resolveScript(const QString& raw, const rmp::RenderParameters& defaults);

    // Read the parameter schema fields of a JSON object; missing or bad fields keep `defaults`
    static rmp::RenderParameters parametersFromJson(const QJsonObject& object,
                                                    const rmp::RenderParameters& defaults);

    // Replace every out-of-domain field with its default (including values above
    // the rmp::MAX_* limits), round odd sizes down to even and cap the transition
    // at duration_per_image
    static rmp::RenderParameters clamp(const rmp::RenderParameters& candidate,
                                       const rmp::RenderParameters& defaults);

    // Strip markdown code fences and collapse runs of blank lines
    static QString cleanResponse(const QString& text);

    // Outermost {...} span of text, or empty
    static QString extractJsonObject(const QString& text);

private:
    static bool extractFromText(const QString& text, rmp::RenderParameters& params);
    static ScriptMetadata metadataFromJson(const QJsonObject& object);
};

}
