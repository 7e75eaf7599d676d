#pragma once

#include <reel_media_platform/rmp_errors.h>

#include <QString>
#include <QStringList>
#include <stdexcept>

namespace reel {

/**
 * Input assets failed pre-flight validation; no work was started
 */
class ValidationError : public std::runtime_error
{
public:
    explicit ValidationError(const QStringList& errors);

    const QStringList& errors() const { return m_errors; }

private:
    QStringList m_errors;
};

/**
 * A render stage failed. Carries the stage name ("script", "compose",
 * "schedule", "mix", "encode") and the originating media-layer error.
 */
class RenderError : public std::runtime_error
{
public:
    RenderError(const QString& stage, const rmp::Error& cause);

    // Failure that did not originate in the media layer
    RenderError(const QString& stage, const QString& message);

    const QString& stage() const { return m_stage; }
    rmp::ErrorCode code() const { return m_cause.code; }
    const rmp::Error& cause() const { return m_cause; }

private:
    QString m_stage;
    rmp::Error m_cause;
};

}
