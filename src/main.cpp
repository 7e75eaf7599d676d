#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFile>
#include <QLoggingCategory>
#include <QTextStream>

#include "core/common/output_path_generator.h"
#include "core/config/render_config.h"
#include "core/render/render_error.h"
#include "core/render/render_pipeline.h"
#include "core/render/scripted_render.h"
#include "core/script/script_parameter_resolver.h"
#include "core/script/script_source.h"

Q_LOGGING_CATEGORY(reelMain, "reel.main")

namespace {

constexpr int EXIT_RENDER_FAILED = 1;
constexpr int EXIT_INVALID_INPUT = 2;

QString readScript(const QString& source, bool* ok)
{
    QFile file;
    bool opened = false;
    if (source == QLatin1String("-")) {
        opened = file.open(stdin, QIODevice::ReadOnly);
    } else {
        file.setFileName(source);
        opened = file.open(QIODevice::ReadOnly);
    }
    *ok = opened;
    if (!opened) {
        qCCritical(reelMain, "Cannot read script %s: %s", qPrintable(source), qPrintable(file.errorString()));
        return QString();
    }
    return QString::fromUtf8(file.readAll());
}

// Apply one numeric command-line override; false on a malformed value
template <typename T, typename Parse>
bool applyOption(const QCommandLineParser& parser, const QString& name, T& target, Parse parse)
{
    if (!parser.isSet(name)) {
        return true;
    }
    bool ok = false;
    T value = parse(parser.value(name), &ok);
    if (!ok) {
        qCCritical(reelMain, "Invalid value for --%s: %s", qPrintable(name), qPrintable(parser.value(name)));
        return false;
    }
    target = value;
    return true;
}

}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("reel-render");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Render a sequence of images and an optional audio track into a video.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOptions({
        {"audio", "Audio track, looped or trimmed to the video length.", "file"},
        {"script", "Script (JSON or text) to derive parameters from; '-' reads stdin.", "file"},
        {"fps", "Output frame rate.", "n"},
        {"duration", "Seconds per image.", "seconds"},
        {"transition", "Transition fade length in seconds.", "seconds"},
        {"animation", "Animation: fade, zoom or pan.", "type"},
        {"width", "Output width in pixels.", "px"},
        {"height", "Output height in pixels.", "px"},
        {"output-dir", "Directory for the rendered file.", "dir"},
        {"config", "JSON config file (default: $REEL_CONFIG).", "file"},
        {"verbose", "Enable debug logging."},
    });
    parser.addPositionalArgument("images", "Images in display order.", "IMAGE...");
    parser.process(app);

    QLoggingCategory::setFilterRules(parser.isSet("verbose") ? "reel.*.debug=true"
                                                             : "reel.*.debug=false");

    reel::RenderConfig config = reel::RenderConfig::load(
        reel::RenderConfig::resolveConfigPath(parser.value("config")));
    if (parser.isSet("output-dir")) {
        config.outputDirectory = parser.value("output-dir");
    }

    // Command-line values override the configured defaults
    rmp::RenderParameters params = config.defaults;
    auto toInt = [](const QString& s, bool* ok) { return s.toInt(ok); };
    auto toDouble = [](const QString& s, bool* ok) { return s.toDouble(ok); };
    if (!applyOption(parser, "fps", params.fps, toInt) ||
        !applyOption(parser, "duration", params.duration_per_image, toDouble) ||
        !applyOption(parser, "transition", params.transition_duration, toDouble) ||
        !applyOption(parser, "width", params.target_width, toInt) ||
        !applyOption(parser, "height", params.target_height, toInt)) {
        return EXIT_INVALID_INPUT;
    }
    if (parser.isSet("animation")) {
        auto type = rmp::animation_type_from_string(parser.value("animation").toStdString());
        if (!type) {
            qCCritical(reelMain, "Unknown animation '%s' (expected fade, zoom or pan)",
                       qPrintable(parser.value("animation")));
            return EXIT_INVALID_INPUT;
        }
        params.animation_type = *type;
    }
    params = reel::ScriptParameterResolver::clamp(params, config.defaults);

    const QStringList images = parser.positionalArguments();
    const QString audio = parser.value("audio");

    reel::OutputPathGenerator outputPaths(config.outputDirectory, config.outputPrefix);
    reel::RenderPipeline pipeline(outputPaths.provider(), config.encoder);

    QTextStream out(stdout);
    QTextStream err(stderr);

    try {
        QString outputPath;
        if (parser.isSet("script")) {
            bool ok = false;
            QString script = readScript(parser.value("script"), &ok);
            if (!ok) {
                return EXIT_INVALID_INPUT;
            }
            reel::StaticScriptSource source(script);
            reel::ScriptedRender scripted(source, pipeline, params);
            outputPath = scripted.render(images, audio);
        } else {
            reel::RenderRequest request;
            request.images = images;
            request.audio = audio;
            request.parameters = params;
            outputPath = pipeline.render(request);
        }
        out << outputPath << Qt::endl;
        return 0;
    } catch (const reel::ValidationError& e) {
        for (const QString& error : e.errors()) {
            err << error << Qt::endl;
        }
        return EXIT_INVALID_INPUT;
    } catch (const reel::RenderError& e) {
        err << "Render failed at stage " << e.stage() << ": "
            << QString::fromStdString(e.cause().describe()) << Qt::endl;
        return EXIT_RENDER_FAILED;
    }
}
