#include "render_error.h"

namespace reel {

ValidationError::ValidationError(const QStringList& errors)
    : std::runtime_error(("Validation failed: " + errors.join("; ")).toStdString())
    , m_errors(errors)
{
}

RenderError::RenderError(const QString& stage, const rmp::Error& cause)
    : std::runtime_error(QString("[%1] %2").arg(stage, QString::fromStdString(cause.describe())).toStdString())
    , m_stage(stage)
    , m_cause(cause)
{
}

RenderError::RenderError(const QString& stage, const QString& message)
    : RenderError(stage, rmp::Error::internal(message.toStdString()))
{
}

}
