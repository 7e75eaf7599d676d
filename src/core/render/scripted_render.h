#pragma once

#include "render_pipeline.h"
#include "core/script/script_parameter_resolver.h"
#include "core/script/script_source.h"

#include <QString>
#include <QStringList>

namespace reel {

/**
 * Script-driven render: describe images, generate a script, resolve
 * parameters against the configured defaults, then run the pipeline.
 * The ScriptSource and pipeline are borrowed and must outlive this object.
 */
class ScriptedRender
{
public:
    ScriptedRender(ScriptSource& source, const RenderPipeline& pipeline,
                   const rmp::RenderParameters& defaults);

    // Throws ValidationError, or RenderError (stage "script" for source failures)
    QString render(const QStringList& images, const QString& audio = QString());

    // Script and parameters used by the most recent render()
    const QString& lastScript() const { return m_lastScript; }
    const ResolvedScript& lastResolved() const { return m_lastResolved; }

private:
    ScriptSource& m_source;
    const RenderPipeline& m_pipeline;
    rmp::RenderParameters m_defaults;

    QString m_lastScript;
    ResolvedScript m_lastResolved;
};

}
