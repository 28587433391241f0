#include "ui/QtSurfaceFactory.hpp"
#include "ui/OverlaySurface.hpp"
#include "ui/TrayStatusItem.hpp"
#include <QGuiApplication>
#include <QScreen>
#include <QSystemTrayIcon>
#include <boost/log/trivial.hpp>

namespace ww {

std::optional<QRect> QtSurfaceFactory::primaryScreenFrame() const
{
    QScreen* screen = QGuiApplication::primaryScreen();
    if (!screen) {
        BOOST_LOG_TRIVIAL(warning) << "[QtSurfaceFactory] No primary screen";
        return std::nullopt;
    }
    return screen->geometry();
}

std::unique_ptr<IIndicatorSurface> QtSurfaceFactory::createCircle(const QRect& rect, const QColor& fill)
{
    if (!rect.isValid()) {
        BOOST_LOG_TRIVIAL(warning) << "[QtSurfaceFactory] Refusing circle with invalid geometry";
        return nullptr;
    }
    return std::make_unique<OverlaySurface>(OverlaySurface::Shape::Circle, rect, fill);
}

std::unique_ptr<IIndicatorSurface> QtSurfaceFactory::createBorder(const QRect& rect, double widthPercent,
                                                                  const QColor& color)
{
    if (!rect.isValid()) {
        BOOST_LOG_TRIVIAL(warning) << "[QtSurfaceFactory] Refusing border with invalid geometry";
        return nullptr;
    }
    return std::make_unique<OverlaySurface>(OverlaySurface::Shape::Border, rect, color, widthPercent);
}

std::unique_ptr<IStatusItem> QtSurfaceFactory::createStatusItem()
{
    if (!QSystemTrayIcon::isSystemTrayAvailable()) {
        BOOST_LOG_TRIVIAL(warning) << "[QtSurfaceFactory] System tray not available";
        return nullptr;
    }
    return std::make_unique<TrayStatusItem>();
}

} // namespace ww
