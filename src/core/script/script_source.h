#pragma once

#include <QString>
#include <QStringList>

namespace reel {

/**
 * Content-generation service seen by the render flow
 *
 * Implementations are injected; they may throw std::exception subclasses on
 * failure, which ScriptedRender reports as a RenderError at stage "script".
 */
class ScriptSource
{
public:
    virtual ~ScriptSource() = default;

    // One description per image, same order
    virtual QStringList describeImages(const QStringList& imagePaths) = 0;

    // Script text or JSON for the described images; audioPath may be empty
    virtual QString generateScript(const QStringList& descriptions, const QString& audioPath) = 0;
};

/**
 * ScriptSource serving a fixed, pre-written script (CLI --script)
 * Images are described by their file names.
 */
class StaticScriptSource : public ScriptSource
{
public:
    explicit StaticScriptSource(QString script) : m_script(std::move(script)) {}

    QStringList describeImages(const QStringList& imagePaths) override;
    QString generateScript(const QStringList& descriptions, const QString& audioPath) override;

private:
    QString m_script;
};

}
