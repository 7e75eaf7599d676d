#include "render_pipeline.h"
#include "render_error.h"
#include "core/validation/media_validator.h"

#include <reel_media_platform/rmp_audio_track.h>
#include <reel_media_platform/rmp_clip.h>
#include <reel_media_platform/rmp_timeline.h>

#include <QElapsedTimer>
#include <exception>
#include <optional>

Q_LOGGING_CATEGORY(reelRender, "reel.core.render")

namespace reel {

namespace {

// Run one stage; anything the media layer throws (bad_alloc, a throwing
// path provider) leaves as a RenderError tagged with that stage
template <typename Fn>
auto runStage(const char* stage, Fn&& fn) -> decltype(fn())
{
    try {
        return fn();
    } catch (const RenderError&) {
        throw;
    } catch (const std::exception& e) {
        qCWarning(reelRender, "%s stage threw: %s", stage, e.what());
        throw RenderError(QString::fromLatin1(stage), QString::fromUtf8(e.what()));
    }
}

}

RenderPipeline::RenderPipeline(rmp::OutputPathProvider outputPath, rmp::EncoderSettings settings)
    : m_outputPath(std::move(outputPath))
    , m_settings(std::move(settings))
{
}

QString RenderPipeline::render(const RenderRequest& request) const
{
    ValidationResult validation = MediaValidator::validate(request.images, request.audio);
    if (!validation.valid) {
        throw ValidationError(validation.errors);
    }

    const rmp::RenderParameters& params = request.parameters;
    // Fail before decoding anything the encoder would refuse
    if (!params.is_valid()) {
        throw RenderError("encode", rmp::Error::invalid_arg("Render parameters out of range"));
    }
    if (!params.has_even_size()) {
        throw RenderError("encode", rmp::Error::invalid_arg("YUV 4:2:0 output needs even dimensions"));
    }

    QElapsedTimer timer;
    timer.start();

    qCInfo(reelRender, "Rendering %lld image(s) at %dx%d %dfps, %gs each, %s",
           static_cast<long long>(request.images.size()), params.target_width, params.target_height,
           params.fps, params.duration_per_image, rmp::animation_type_to_string(params.animation_type));

    // Compose
    std::vector<std::unique_ptr<rmp::Clip>> clips;
    clips.reserve(static_cast<size_t>(request.images.size()));
    for (const QString& image : request.images) {
        auto clip = runStage("compose", [&] {
            return rmp::ClipComposer::Compose(rmp::MediaAsset::image(image.toStdString()), params);
        });
        if (clip.is_error()) {
            throw RenderError("compose", clip.error());
        }
        clips.push_back(std::move(clip.value()));
    }
    qCDebug(reelRender, "Composed %zu clip(s)", clips.size());

    // Schedule
    auto scheduled = runStage("schedule", [&] {
        return rmp::TransitionScheduler::Schedule(std::move(clips), params.transition_duration);
    });
    if (scheduled.is_error()) {
        throw RenderError("schedule", scheduled.error());
    }
    rmp::Timeline timeline = std::move(scheduled.value());
    qCDebug(reelRender, "Timeline duration %.3fs", rmp::us_to_seconds(timeline.duration_us()));

    // Mix
    std::optional<rmp::MediaAsset> audioAsset;
    if (!request.audio.isEmpty()) {
        audioAsset = rmp::MediaAsset::audio(request.audio.toStdString());
    }
    rmp::AudioFormat mixFormat = rmp::DEFAULT_AUDIO_FORMAT;
    mixFormat.sample_rate = m_settings.audio_sample_rate;

    auto mixed = runStage("mix", [&] {
        return rmp::AudioTrackMixer::Mix(audioAsset, timeline.duration_us(), mixFormat);
    });
    if (mixed.is_error()) {
        throw RenderError("mix", mixed.error());
    }
    std::shared_ptr<rmp::AudioTrack> audioTrack = mixed.value();
    if (audioTrack) {
        qCDebug(reelRender, "Audio %s, %lld loop(s)",
                audioTrack->span().mode == rmp::AudioSpanMode::Trim ? "trimmed" :
                audioTrack->span().mode == rmp::AudioSpanMode::Loop ? "looped" : "as-is",
                static_cast<long long>(audioTrack->span().loop_count));
    }

    // Encode
    auto encoded = runStage("encode", [&] {
        rmp::Encoder encoder(m_outputPath, m_settings);
        return encoder.render(timeline, audioTrack.get(), params);
    });
    timeline.release();
    if (encoded.is_error()) {
        throw RenderError("encode", encoded.error());
    }

    QString outputPath = QString::fromStdString(encoded.value());
    qCInfo(reelRender, "Rendered %s in %lldms", qPrintable(outputPath),
           static_cast<long long>(timer.elapsed()));
    return outputPath;
}

}
