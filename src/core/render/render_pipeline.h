#pragma once

#include "render_request.h"
#include <reel_media_platform/rmp_encoder.h>

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(reelRender)

namespace reel {

/**
 * RenderPipeline - validate, compose, schedule, mix, encode
 *
 * Stateless between calls; every render() owns its clips, timeline and
 * audio track. Safe to call concurrently as long as the path provider is.
 */
class RenderPipeline
{
public:
    explicit RenderPipeline(rmp::OutputPathProvider outputPath,
                            rmp::EncoderSettings settings = rmp::EncoderSettings());

    /**
     * Render one request and return the written file path
     * Throws ValidationError before any work if the inputs are unusable,
     * RenderError{stage, cause} if a later stage fails.
     */
    QString render(const RenderRequest& request) const;

    const rmp::EncoderSettings& encoderSettings() const { return m_settings; }

private:
    rmp::OutputPathProvider m_outputPath;
    rmp::EncoderSettings m_settings;
};

}
