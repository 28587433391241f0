#include "MenuBarIndicator.hpp"
#include "core/engine/IUsageStateSource.hpp"
#include <boost/log/trivial.hpp>

namespace ww {

std::unique_ptr<MenuBarIndicator> MenuBarIndicator::create(const IUsageStateSource* source,
                                                           ISurfaceFactory* factory,
                                                           MuteToggle toggleMute,
                                                           const MenuBarOptions& options)
{
    auto item = factory->createStatusItem();
    if (!item) {
        BOOST_LOG_TRIVIAL(error) << "[Menubar] Failed to create status item";
        return nullptr;
    }

    std::unique_ptr<MenuBarIndicator> indicator(
        new MenuBarIndicator(source, std::move(toggleMute), options, std::move(item)));
    MenuBarIndicator* raw = indicator.get();
    raw->item_->setMenuProvider([raw]() { return raw->buildMenu(); });
    if (options.showWhenIdle)
        raw->item_->returnToMenuBar();
    else
        raw->item_->removeFromMenuBar();
    raw->update(std::nullopt);
    return indicator;
}

MenuBarIndicator::MenuBarIndicator(const IUsageStateSource* source, MuteToggle toggleMute,
                                   const MenuBarOptions& options,
                                   std::unique_ptr<IStatusItem> item)
    : source_(source)
    , toggleMute_(std::move(toggleMute))
    , options_(options)
    , behavior_(options.name)
    , item_(std::move(item))
{
}

QString MenuBarIndicator::titleFor(DisplayState state) const
{
    const MenuBarTitles& t = options_.titles;
    switch (state) {
    case DisplayState::CameraActive: return t.cameraInUse;
    case DisplayState::MicActive: return t.micInUse;
    case DisplayState::BothActive: return t.cameraAndMicInUse;
    case DisplayState::SuppressedActive: return t.suppressedActive;
    case DisplayState::SuppressedIdle: return t.suppressedIdle;
    case DisplayState::Idle: break;
    }
    return t.nothingInUse;
}

void MenuBarIndicator::update(const Instigator&)
{
    if (behavior_.isDestroyed())
        return;

    DisplayState state = source_->displayState();
    if (behavior_.isMuted() && !isSuppressed(state))
        state = computeDisplayState(source_->cameraInUse(), source_->micInUse(), true);

    BOOST_LOG_TRIVIAL(debug) << "[Menubar] Updating icon: " << displayStateName(state);

    // Return to the menu bar before setting the title, or the title may be lost.
    if (state == DisplayState::Idle && !options_.showWhenIdle) {
        hide();
        return;
    }
    show();
    item_->setTitle(titleFor(state));
}

void MenuBarIndicator::refresh()
{
    BOOST_LOG_TRIVIAL(debug) << "[Menubar] refresh() called - nothing to place";
}

void MenuBarIndicator::mute()
{
    behavior_.setMuted(true);
    update(std::nullopt);
}

void MenuBarIndicator::unmute()
{
    behavior_.setMuted(false);
    update(std::nullopt);
}

void MenuBarIndicator::show()
{
    if (behavior_.isDestroyed() || item_->isInMenuBar())
        return;
    item_->returnToMenuBar();
}

void MenuBarIndicator::hide()
{
    if (behavior_.isDestroyed() || !item_->isInMenuBar())
        return;
    item_->removeFromMenuBar();
}

void MenuBarIndicator::destroy()
{
    if (behavior_.isDestroyed())
        return;
    BOOST_LOG_TRIVIAL(debug) << "[Menubar] Deleting menubar item";
    hide();
    behavior_.markDestroyed();
    item_.reset();
}

bool MenuBarIndicator::isVisible() const
{
    return item_ && item_->isInMenuBar();
}

QString MenuBarIndicator::title() const
{
    return item_ ? item_->title() : QString();
}

QList<MenuEntry> MenuBarIndicator::buildMenu() const
{
    QList<MenuEntry> entries;
    const bool muted = behavior_.isMuted() || source_->userMuted();
    entries.append({muted ? QStringLiteral("Unmute Indicators") : QStringLiteral("Mute Indicators"),
                    toggleMute_});

    for (const auto& cam : source_->camerasInUse())
        entries.append({QString::fromUtf8(kCameraGlyph) + QLatin1Char(' ') + cam.displayName, {}});
    for (const auto& mic : source_->microphonesInUse())
        entries.append({QString::fromUtf8(kMicrophoneGlyph) + QLatin1Char(' ') + mic.displayName, {}});
    return entries;
}

} // namespace ww
