#pragma once

#include "Indicator.hpp"
#include "IndicatorBehavior.hpp"
#include "IndicatorSurface.hpp"
#include "core/DisplayState.hpp"
#include <functional>
#include <memory>

namespace ww {

class IUsageStateSource;

struct MenuBarTitles {
    QString cameraInUse = QStringLiteral("\U0001F534");        // red dot
    QString micInUse = QStringLiteral("\U0001F534");
    QString cameraAndMicInUse = QStringLiteral("\U0001F534");
    QString nothingInUse = QStringLiteral("\U0001F7E2");       // green dot
    QString suppressedActive = QStringLiteral("\U0001F536");   // orange diamond
    QString suppressedIdle = QStringLiteral("\U0001F7E1");     // yellow dot
};

struct MenuBarOptions {
    QString name = QStringLiteral("menubar");
    /// Stay in the menu bar (with the idle title) when nothing is in use.
    bool showWhenIdle = false;
    MenuBarTitles titles;
};

/// Status-area item summarising usage, with an on-demand menu listing the
/// devices in use and a mute toggle.
///
/// Unlike the overlays it stays present while muted, showing the suppressed
/// title, so the user can unmute from its menu.
class MenuBarIndicator : public Indicator {
public:
    static constexpr const char* kCameraGlyph = "\U0001F4F7";
    static constexpr const char* kMicrophoneGlyph = "\U0001F399";

    using MuteToggle = std::function<void()>;

    /// Returns null if the status item cannot be created.
    static std::unique_ptr<MenuBarIndicator> create(const IUsageStateSource* source,
                                                    ISurfaceFactory* factory,
                                                    MuteToggle toggleMute,
                                                    const MenuBarOptions& options = {});

    QString name() const override { return behavior_.name(); }
    void update(const Instigator& instigator) override;
    void refresh() override;
    void mute() override;
    void unmute() override;
    void show() override;
    void hide() override;
    void destroy() override;
    bool isVisible() const override;
    bool isMuted() const override { return behavior_.isMuted(); }

    QString title() const;

    /// Title for a display state under these options.
    QString titleFor(DisplayState state) const;

    /// Menu rows: the mute toggle, then one row per device in use.
    QList<MenuEntry> buildMenu() const;

private:
    MenuBarIndicator(const IUsageStateSource* source, MuteToggle toggleMute,
                     const MenuBarOptions& options, std::unique_ptr<IStatusItem> item);

    const IUsageStateSource* source_;
    MuteToggle toggleMute_;
    const MenuBarOptions options_;
    IndicatorBehavior behavior_;
    std::unique_ptr<IStatusItem> item_;
};

} // namespace ww
