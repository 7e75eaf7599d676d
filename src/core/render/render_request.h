#pragma once

#include <reel_media_platform/rmp_render_params.h>

#include <QString>
#include <QStringList>

namespace reel {

// One unit of render work: inputs plus resolved parameters
struct RenderRequest
{
    QStringList images;                 // ordered; one clip each
    QString audio;                      // empty = silent output
    rmp::RenderParameters parameters;
};

}
