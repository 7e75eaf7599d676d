#pragma once

#include <QLoggingCategory>
#include <QString>
#include <QStringList>

Q_DECLARE_LOGGING_CATEGORY(reelValidator)

namespace reel {

struct ValidationResult
{
    bool valid = false;
    QStringList errors;     // one entry per offending input, in input order
};

/**
 * Pre-flight check of the input assets of a render request
 *
 * Runs before any decoding work. Only checks existence and file type;
 * decodability is discovered by the media layer during composition.
 */
class MediaValidator
{
public:
    /**
     * Validate an ordered image list and an optional audio path (empty = none)
     * Never throws. valid is false if the image list is empty or any path is
     * missing or not a regular file.
     */
    static ValidationResult validate(const QStringList& images, const QString& audio = QString());

private:
    static QString checkPath(const QString& path, const QString& what);
};

}
