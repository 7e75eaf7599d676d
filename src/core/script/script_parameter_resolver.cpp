#include "script_parameter_resolver.h"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QRegularExpression>
#include <cmath>
#include <limits>

Q_LOGGING_CATEGORY(reelScript, "reel.core.script")

namespace reel {

namespace {

// Built-in fallbacks used when the caller's own defaults are out of domain
const rmp::RenderParameters kBuiltInDefaults;

bool isPositiveInteger(double value)
{
    return std::isfinite(value) && value > 0.0 && value == std::floor(value) &&
           value <= static_cast<double>(std::numeric_limits<int>::max());
}

bool fpsInRange(int fps)
{
    return fps > 0 && fps <= rmp::MAX_FPS;
}

bool durationInRange(double seconds)
{
    return std::isfinite(seconds) && seconds > 0.0 && seconds <= rmp::MAX_DURATION_PER_IMAGE;
}

bool transitionInRange(double seconds)
{
    return std::isfinite(seconds) && seconds >= 0.0 && seconds <= rmp::MAX_DURATION_PER_IMAGE;
}

bool dimensionInRange(int size)
{
    return size > 0 && size <= rmp::MAX_TARGET_DIMENSION;
}

// Round down to even, never below 2
int evenSize(int size)
{
    return size > 2 ? size - size % 2 : 2;
}

std::optional<int> positiveIntField(const QJsonObject& object, const char* key)
{
    QJsonValue value = object.value(QLatin1String(key));
    if (!value.isDouble() || !isPositiveInteger(value.toDouble())) {
        if (!value.isUndefined()) {
            qCDebug(reelScript, "Ignoring %s: not a positive integer", key);
        }
        return std::nullopt;
    }
    return static_cast<int>(value.toDouble());
}

std::optional<double> numberField(const QJsonObject& object, const char* key)
{
    QJsonValue value = object.value(QLatin1String(key));
    if (!value.isDouble() || !std::isfinite(value.toDouble())) {
        if (!value.isUndefined()) {
            qCDebug(reelScript, "Ignoring %s: not a number", key);
        }
        return std::nullopt;
    }
    return value.toDouble();
}

}

QString ScriptParameterResolver::cleanResponse(const QString& text)
{
    static const QRegularExpression openFence(QStringLiteral("```(?:json|JSON)?[ \\t]*\\n?"));
    static const QRegularExpression closeFence(QStringLiteral("\\n?```"));
    static const QRegularExpression blankRuns(QStringLiteral("\\n{3,}"));

    QString cleaned = text;
    cleaned.replace(openFence, QString());
    cleaned.replace(closeFence, QString());
    cleaned.replace(blankRuns, QStringLiteral("\n\n"));
    return cleaned.trimmed();
}

QString ScriptParameterResolver::extractJsonObject(const QString& text)
{
    qsizetype first = text.indexOf(QLatin1Char('{'));
    qsizetype last = text.lastIndexOf(QLatin1Char('}'));
    if (first < 0 || last <= first) {
        return QString();
    }
    return text.mid(first, last - first + 1);
}

rmp::RenderParameters ScriptParameterResolver::parametersFromJson(const QJsonObject& object,
                                                                  const rmp::RenderParameters& defaults)
{
    rmp::RenderParameters params = defaults;

    if (object.contains(QLatin1String("fps"))) {
        params.fps = positiveIntField(object, "fps").value_or(defaults.fps);
    }
    if (auto duration = numberField(object, "duration_per_image")) {
        params.duration_per_image = *duration;
    }
    if (auto transition = numberField(object, "transition_duration")) {
        params.transition_duration = *transition;
    }
    if (object.contains(QLatin1String("animation_type"))) {
        QString name = object.value(QLatin1String("animation_type")).toString().trimmed().toLower();
        auto type = rmp::animation_type_from_string(name.toStdString());
        if (type) {
            params.animation_type = *type;
        } else {
            qCDebug(reelScript, "Unknown animation_type '%s'", qPrintable(name));
            params.animation_type = defaults.animation_type;
        }
    }
    if (object.contains(QLatin1String("target_width"))) {
        params.target_width = positiveIntField(object, "target_width").value_or(defaults.target_width);
    }
    if (object.contains(QLatin1String("target_height"))) {
        params.target_height = positiveIntField(object, "target_height").value_or(defaults.target_height);
    }

    // Negative or zero durations pass through here and are replaced by clamp()
    return params;
}

rmp::RenderParameters ScriptParameterResolver::clamp(const rmp::RenderParameters& candidate,
                                                     const rmp::RenderParameters& defaults)
{
    // Defaults must themselves be valid before they can stand in for a bad field
    rmp::RenderParameters fallback = defaults;
    if (!fpsInRange(fallback.fps)) fallback.fps = kBuiltInDefaults.fps;
    if (!durationInRange(fallback.duration_per_image)) {
        fallback.duration_per_image = kBuiltInDefaults.duration_per_image;
    }
    if (!transitionInRange(fallback.transition_duration)) {
        fallback.transition_duration = kBuiltInDefaults.transition_duration;
    }
    if (!dimensionInRange(fallback.target_width)) fallback.target_width = kBuiltInDefaults.target_width;
    if (!dimensionInRange(fallback.target_height)) fallback.target_height = kBuiltInDefaults.target_height;

    rmp::RenderParameters params = candidate;
    if (!fpsInRange(params.fps)) {
        qCDebug(reelScript, "fps %d out of range, using %d", params.fps, fallback.fps);
        params.fps = fallback.fps;
    }
    if (!durationInRange(params.duration_per_image)) {
        qCDebug(reelScript, "duration_per_image %g out of range, using %g",
                params.duration_per_image, fallback.duration_per_image);
        params.duration_per_image = fallback.duration_per_image;
    }
    if (!transitionInRange(params.transition_duration)) {
        qCDebug(reelScript, "transition_duration %g out of range, using %g",
                params.transition_duration, fallback.transition_duration);
        params.transition_duration = fallback.transition_duration;
    }
    if (!dimensionInRange(params.target_width)) params.target_width = fallback.target_width;
    if (!dimensionInRange(params.target_height)) params.target_height = fallback.target_height;

    // The encoder writes YUV 4:2:0, which needs even sizes
    if (params.target_width % 2 != 0 || params.target_height % 2 != 0) {
        qCDebug(reelScript, "target %dx%d rounded down to even",
                params.target_width, params.target_height);
        params.target_width = evenSize(params.target_width);
        params.target_height = evenSize(params.target_height);
    }

    if (params.transition_duration > params.duration_per_image) {
        qCDebug(reelScript, "transition %gs capped at duration_per_image %gs",
                params.transition_duration, params.duration_per_image);
        params.transition_duration = params.duration_per_image;
    }
    return params;
}

ScriptMetadata ScriptParameterResolver::metadataFromJson(const QJsonObject& object)
{
    ScriptMetadata metadata;
    metadata.theme = object.value(QLatin1String("theme")).toString();
    metadata.style = object.value(QLatin1String("style")).toString();
    QJsonValue overall = object.value(QLatin1String("overall_duration"));
    if (overall.isDouble() && std::isfinite(overall.toDouble())) {
        metadata.overallDuration = overall.toDouble();
    }
    return metadata;
}

bool ScriptParameterResolver::extractFromText(const QString& text, rmp::RenderParameters& params)
{
    static const QRegularExpression durationCn(
        QStringLiteral("时长[:：]\\s*(\\d+(?:\\.\\d+)?)\\s*秒"));
    static const QRegularExpression transitionCn(
        QStringLiteral("转场[:：]\\s*(\\d+(?:\\.\\d+)?)\\s*秒"));
    static const QRegularExpression durationEn(
        // "Transition duration: 1s" belongs to the transition pattern below
        QStringLiteral("(?<!transition\\s)(?<!transition-)"
                       "\\bduration\\b[^\\d\\n]{0,20}?(\\d+(?:\\.\\d+)?)\\s*(?:s|sec|secs|seconds)\\b"),
        QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression transitionEn(
        QStringLiteral("\\btransition\\b[^\\d\\n]{0,20}?(\\d+(?:\\.\\d+)?)\\s*(?:s|sec|secs|seconds)\\b"),
        QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression fpsToken(QStringLiteral("(\\d+)\\s*(?:fps|FPS)"));
    static const QRegularExpression zoomEn(QStringLiteral("\\bzoom"), QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression panEn(QStringLiteral("\\bpan(?:s|ning)?\\b"), QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression fadeEn(QStringLiteral("\\bfade"), QRegularExpression::CaseInsensitiveOption);

    bool matched = false;

    QRegularExpressionMatch match = durationCn.match(text);
    if (!match.hasMatch()) match = durationEn.match(text);
    if (match.hasMatch()) {
        params.duration_per_image = match.captured(1).toDouble();
        matched = true;
    }

    match = transitionCn.match(text);
    if (!match.hasMatch()) match = transitionEn.match(text);
    if (match.hasMatch()) {
        params.transition_duration = match.captured(1).toDouble();
        matched = true;
    }

    // Keyword precedence: zoom, then pan, then fade
    if (text.contains(QStringLiteral("缩放")) || text.contains(QStringLiteral("放大")) ||
        text.contains(QStringLiteral("缩小")) || zoomEn.match(text).hasMatch()) {
        params.animation_type = rmp::AnimationType::Zoom;
        matched = true;
    } else if (text.contains(QStringLiteral("平移")) || text.contains(QStringLiteral("移动")) ||
               text.contains(QStringLiteral("摇镜头")) || panEn.match(text).hasMatch()) {
        params.animation_type = rmp::AnimationType::Pan;
        matched = true;
    } else if (text.contains(QStringLiteral("淡入淡出")) || text.contains(QStringLiteral("渐变")) ||
               fadeEn.match(text).hasMatch()) {
        params.animation_type = rmp::AnimationType::Fade;
        matched = true;
    }

    match = fpsToken.match(text);
    if (match.hasMatch()) {
        bool ok = false;
        int fps = match.captured(1).toInt(&ok);
        params.fps = ok ? fps : 0;
        matched = true;
    }

    return matched;
}

ResolvedScript ScriptParameterResolver::resolveScript(const QString& raw,
                                                      const rmp::RenderParameters& defaults)
{
    ResolvedScript resolved;
    const rmp::RenderParameters base = clamp(defaults, kBuiltInDefaults);
    const QString cleaned = cleanResponse(raw);

    QString jsonText = extractJsonObject(cleaned);
    if (!jsonText.isEmpty()) {
        QJsonParseError parseError;
        QJsonDocument doc = QJsonDocument::fromJson(jsonText.toUtf8(), &parseError);
        if (parseError.error == QJsonParseError::NoError && doc.isObject()) {
            QJsonObject object = doc.object();
            resolved.parameters = clamp(parametersFromJson(object, base), base);
            resolved.metadata = metadataFromJson(object);
            resolved.fromJson = true;

            if (!resolved.metadata.isEmpty()) {
                qCInfo(reelScript, "Script theme '%s', style '%s'",
                       qPrintable(resolved.metadata.theme), qPrintable(resolved.metadata.style));
            }
            return resolved;
        }
        qCWarning(reelScript, "Script JSON unparseable (%s), trying text patterns",
                  qPrintable(parseError.errorString()));
    }

    rmp::RenderParameters params = base;
    resolved.matchedText = extractFromText(cleaned, params);
    if (!resolved.matchedText) {
        qCDebug(reelScript, "No parameters recognized in script, using defaults");
    }
    resolved.parameters = clamp(params, base);
    return resolved;
}

rmp::RenderParameters ScriptParameterResolver::resolve(const QString& raw,
                                                       const rmp::RenderParameters& defaults)
{
    return resolveScript(raw, defaults).parameters;
}

}
