#pragma once

#include <QColor>
#include <QList>
#include <QRect>
#include <QString>
#include <functional>
#include <memory>
#include <optional>

namespace ww {

/// A top-level on-screen overlay owned by one indicator.
class IIndicatorSurface {
public:
    virtual ~IIndicatorSurface() = default;

    virtual void show() = 0;
    virtual void hide() = 0;
    virtual bool isShowing() const = 0;

    /// Absolute desktop coordinates.
    virtual void setGeometry(const QRect& rect) = 0;
    virtual QRect geometry() const = 0;
};

struct MenuEntry {
    QString title;
    std::function<void()> action;   // empty for informational rows
};

/// An item in the desktop's status area (system tray / menu bar).
class IStatusItem {
public:
    virtual ~IStatusItem() = default;

    virtual void setTitle(const QString& title) = 0;
    virtual QString title() const = 0;

    virtual void returnToMenuBar() = 0;
    virtual void removeFromMenuBar() = 0;
    virtual bool isInMenuBar() const = 0;

    /// Called each time the menu is about to open.
    virtual void setMenuProvider(std::function<QList<MenuEntry>()> provider) = 0;
};

/// Creates the platform resources behind indicators. Creation returns null
/// when no resource can be allocated (e.g. no screen).
class ISurfaceFactory {
public:
    virtual ~ISurfaceFactory() = default;

    /// Geometry of the primary screen, if there is one.
    virtual std::optional<QRect> primaryScreenFrame() const = 0;

    virtual std::unique_ptr<IIndicatorSurface> createCircle(const QRect& rect, const QColor& fill) = 0;

    /// A frame around rect whose thickness is widthPercent of rect's size.
    virtual std::unique_ptr<IIndicatorSurface> createBorder(const QRect& rect, double widthPercent,
                                                            const QColor& color) = 0;

    virtual std::unique_ptr<IStatusItem> createStatusItem() = 0;
};

} // namespace ww
