#include "script_source.h"
#include <QFileInfo>

namespace reel {

QStringList StaticScriptSource::describeImages(const QStringList& imagePaths)
{
    QStringList descriptions;
    descriptions.reserve(imagePaths.size());
    for (const QString& path : imagePaths) {
        descriptions.append(QFileInfo(path).completeBaseName());
    }
    return descriptions;
}

QString StaticScriptSource::generateScript(const QStringList& descriptions, const QString& audioPath)
{
    Q_UNUSED(descriptions)
    Q_UNUSED(audioPath)
    return m_script;
}

}
