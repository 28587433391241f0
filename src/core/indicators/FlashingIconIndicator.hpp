#pragma once

#include "Indicator.hpp"
#include "IndicatorBehavior.hpp"
#include "IndicatorSurface.hpp"
#include "core/scheduling/IScheduler.hpp"
#include <memory>

namespace ww {

class IUsageStateSource;

struct FlasherOptions {
    QString name = QStringLiteral("flasher");
    IndicatorGeometry geometry{-60, 20, 50, 50};
    QColor fillColor = QColor(255, 0, 0);
    /// Seconds per blink phase. 0 shows a steady icon.
    double blinkInterval = 1.0;
    ShowFilter showFilter = ShowFilter::CameraOrMic;
};

/// A filled circle in a corner of the primary screen, optionally blinking.
///
/// A blinking flasher runs a timer only while shown; show() and hide() start
/// and stop the timer instead of setting the surface directly. A steady
/// flasher has no timer at all.
class FlashingIconIndicator : public Indicator {
public:
    /// Returns null if there is no screen or the overlay cannot be created.
    static std::unique_ptr<FlashingIconIndicator> create(const IUsageStateSource* source,
                                                         ISurfaceFactory* factory,
                                                         IScheduler* scheduler,
                                                         const FlasherOptions& options = {});
    ~FlashingIconIndicator() override;

    QString name() const override { return behavior_.name(); }
    void update(const Instigator& instigator) override;
    void refresh() override;
    void mute() override;
    void unmute() override;
    void show() override;
    void hide() override;
    void destroy() override;
    bool isVisible() const override { return shown_; }
    bool isMuted() const override { return behavior_.isMuted(); }

    bool isBlinking() const { return blinkTimer_ != nullptr; }
    const FlasherOptions& options() const { return options_; }

private:
    FlashingIconIndicator(const IUsageStateSource* source, ISurfaceFactory* factory,
                          IScheduler* scheduler, const FlasherOptions& options,
                          std::unique_ptr<IIndicatorSurface> surface);

    void blink();

    const IUsageStateSource* source_;
    ISurfaceFactory* factory_;
    IScheduler* scheduler_;
    const FlasherOptions options_;
    IndicatorBehavior behavior_;
    std::unique_ptr<IIndicatorSurface> surface_;
    ScheduledTaskPtr blinkTimer_;
    bool shown_ = false;
};

} // namespace ww
