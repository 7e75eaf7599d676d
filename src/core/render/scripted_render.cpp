#include "scripted_render.h"
#include "render_error.h"
#include "core/validation/media_validator.h"

#include <exception>

namespace reel {

ScriptedRender::ScriptedRender(ScriptSource& source, const RenderPipeline& pipeline,
                               const rmp::RenderParameters& defaults)
    : m_source(source)
    , m_pipeline(pipeline)
    , m_defaults(defaults)
{
}

QString ScriptedRender::render(const QStringList& images, const QString& audio)
{
    // Validate before spending a round trip on the script source
    ValidationResult validation = MediaValidator::validate(images, audio);
    if (!validation.valid) {
        throw ValidationError(validation.errors);
    }

    QString script;
    try {
        qCInfo(reelRender, "Describing %lld image(s)", static_cast<long long>(images.size()));
        QStringList descriptions = m_source.describeImages(images);
        qCInfo(reelRender, "Generating script");
        script = m_source.generateScript(descriptions, audio);
    } catch (const std::exception& e) {
        throw RenderError("script", QString::fromUtf8(e.what()));
    }

    m_lastScript = script;
    qCDebug(reelRender, "Script:\n%s", qPrintable(script));

    m_lastResolved = ScriptParameterResolver::resolveScript(script, m_defaults);
    const rmp::RenderParameters& params = m_lastResolved.parameters;
    qCInfo(reelRender, "Resolved parameters: fps=%d duration=%gs transition=%gs animation=%s",
           params.fps, params.duration_per_image, params.transition_duration,
           rmp::animation_type_to_string(params.animation_type));

    RenderRequest request;
    request.images = images;
    request.audio = audio;
    request.parameters = params;
    return m_pipeline.render(request);
}

}
