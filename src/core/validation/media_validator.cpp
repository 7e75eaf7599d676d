#include "media_validator.h"
#include <QFileInfo>

Q_LOGGING_CATEGORY(reelValidator, "reel.core.validator")

namespace reel {

QString MediaValidator::checkPath(const QString& path, const QString& what)
{
    QFileInfo info(path);
    if (path.isEmpty() || !info.exists()) {
        return QString("%1 file does not exist: %2").arg(what, path);
    }
    if (!info.isFile()) {
        return QString("Not a regular %1 file: %2").arg(what.toLower(), path);
    }
    return QString();
}

ValidationResult MediaValidator::validate(const QStringList& images, const QString& audio)
{
    ValidationResult result;

    if (images.isEmpty()) {
        result.errors.append("At least one image is required");
    } else {
        for (const QString& image : images) {
            QString error = checkPath(image, "Image");
            if (!error.isEmpty()) {
                result.errors.append(error);
            }
        }
    }

    if (!audio.isEmpty()) {
        QString error = checkPath(audio, "Audio");
        if (!error.isEmpty()) {
            result.errors.append(error);
        }
    }

    result.valid = result.errors.isEmpty();

    if (result.valid) {
        qCDebug(reelValidator, "Validated %lld image(s)%s", static_cast<long long>(images.size()),
                audio.isEmpty() ? "" : " and audio");
    } else {
        for (const QString& error : result.errors) {
            qCWarning(reelValidator, "%s", qPrintable(error));
        }
    }
    return result;
}

}
