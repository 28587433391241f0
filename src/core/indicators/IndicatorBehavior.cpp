#include "IndicatorBehavior.hpp"
#include "core/engine/IUsageStateSource.hpp"

namespace ww {

IndicatorBehavior::IndicatorBehavior(const QString& name)
    : name_(name)
{
}

bool IndicatorBehavior::wantsVisible(ShowFilter filter, const IUsageStateSource& source)
{
    switch (filter) {
    case ShowFilter::Camera:
        return source.cameraInUse();
    case ShowFilter::Microphone:
        return source.micInUse();
    case ShowFilter::CameraOrMic:
        break;
    }
    return source.cameraInUse() || source.micInUse();
}

QRect IndicatorBehavior::place(const IndicatorGeometry& geometry, const QRect& screenFrame)
{
    int x = screenFrame.x() + geometry.x;
    if (geometry.x < 0)
        x += screenFrame.width();
    int y = screenFrame.y() + geometry.y;
    if (geometry.y < 0)
        y += screenFrame.height();
    return QRect(x, y, geometry.w, geometry.h);
}

const char* showFilterName(ShowFilter filter)
{
    switch (filter) {
    case ShowFilter::Camera: return "camera";
    case ShowFilter::Microphone: return "microphone";
    case ShowFilter::CameraOrMic: return "any";
    }
    return "any";
}

} // namespace ww
