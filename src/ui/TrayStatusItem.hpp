#pragma once

#include "core/indicators/IndicatorSurface.hpp"
#include <memory>

class QMenu;
class QSystemTrayIcon;

namespace ww {

/// System tray entry. The title (an emoji) is rendered into the icon and
/// repeated in the tooltip; the context menu is rebuilt every time it opens.
class TrayStatusItem : public IStatusItem {
public:
    TrayStatusItem();
    ~TrayStatusItem() override;

    void setTitle(const QString& title) override;
    QString title() const override { return title_; }

    void returnToMenuBar() override;
    void removeFromMenuBar() override;
    bool isInMenuBar() const override;

    void setMenuProvider(std::function<QList<MenuEntry>()> provider) override;

private:
    void rebuildMenu();

    std::unique_ptr<QMenu> menu_;
    std::unique_ptr<QSystemTrayIcon> tray_;
    std::function<QList<MenuEntry>()> provider_;
    QString title_;
};

} // namespace ww
