#include "ui/TrayStatusItem.hpp"
#include <QAction>
#include <QFont>
#include <QIcon>
#include <QMenu>
#include <QPainter>
#include <QPixmap>
#include <QSystemTrayIcon>
#include <boost/log/trivial.hpp>

namespace ww {

namespace {

QIcon iconForTitle(const QString& title)
{
    QPixmap pixmap(64, 64);
    pixmap.fill(Qt::transparent);
    QPainter p(&pixmap);
    p.setRenderHint(QPainter::TextAntialiasing);
    QFont font = p.font();
    font.setPixelSize(52);
    p.setFont(font);
    p.drawText(pixmap.rect(), Qt::AlignCenter, title);
    p.end();
    return QIcon(pixmap);
}

} // namespace

TrayStatusItem::TrayStatusItem()
    : menu_(std::make_unique<QMenu>())
    , tray_(std::make_unique<QSystemTrayIcon>())
{
    tray_->setContextMenu(menu_.get());
    QObject::connect(menu_.get(), &QMenu::aboutToShow, menu_.get(), [this]() { rebuildMenu(); });
    // Populate once so a click before the first aboutToShow still has entries.
    rebuildMenu();
}

TrayStatusItem::~TrayStatusItem()
{
    tray_->hide();
    tray_->setContextMenu(nullptr);
}

void TrayStatusItem::setTitle(const QString& title)
{
    if (title == title_)
        return;
    title_ = title;
    tray_->setIcon(iconForTitle(title));
    tray_->setToolTip(QStringLiteral("WatcherWatcher %1").arg(title));
}

void TrayStatusItem::returnToMenuBar()
{
    if (!tray_->isVisible())
        tray_->show();
}

void TrayStatusItem::removeFromMenuBar()
{
    if (tray_->isVisible())
        tray_->hide();
}

bool TrayStatusItem::isInMenuBar() const
{
    return tray_->isVisible();
}

void TrayStatusItem::setMenuProvider(std::function<QList<MenuEntry>()> provider)
{
    provider_ = std::move(provider);
    rebuildMenu();
}

void TrayStatusItem::rebuildMenu()
{
    menu_->clear();
    if (!provider_)
        return;

    QList<MenuEntry> entries;
    try {
        entries = provider_();
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "[TrayStatusItem] Menu provider failed: " << e.what();
        return;
    }

    bool first = true;
    for (const auto& entry : entries) {
        QAction* action = menu_->addAction(entry.title);
        if (entry.action) {
            auto callback = entry.action;
            QObject::connect(action, &QAction::triggered, menu_.get(), [callback]() {
                try {
                    callback();
                } catch (const std::exception& e) {
                    BOOST_LOG_TRIVIAL(error) << "[TrayStatusItem] Menu action failed: " << e.what();
                }
            });
        } else {
            action->setEnabled(false);
        }
        if (first) {
            menu_->addSeparator();
            first = false;
        }
    }
}

} // namespace ww
