#pragma once

#include "Indicator.hpp"
#include "IndicatorBehavior.hpp"
#include "IndicatorSurface.hpp"
#include <memory>

namespace ww {

class IUsageStateSource;

struct ScreenBorderOptions {
    QString name = QStringLiteral("screen-border");
    /// Border thickness as a percentage of the screen size.
    double widthPercent = 0.5;
    QColor color = QColor(255, 0, 0);
    ShowFilter showFilter = ShowFilter::CameraOrMic;
};

/// A steady coloured frame around the whole primary screen.
class ScreenBorderIndicator : public Indicator {
public:
    /// Returns null if there is no screen or the overlay cannot be created.
    static std::unique_ptr<ScreenBorderIndicator> create(const IUsageStateSource* source,
                                                         ISurfaceFactory* factory,
                                                         const ScreenBorderOptions& options = {});

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

    QRect geometry() const;

private:
    ScreenBorderIndicator(const IUsageStateSource* source, ISurfaceFactory* factory,
                          const ScreenBorderOptions& options,
                          std::unique_ptr<IIndicatorSurface> surface);

    const IUsageStateSource* source_;
    ISurfaceFactory* factory_;
    const ScreenBorderOptions options_;
    IndicatorBehavior behavior_;
    std::unique_ptr<IIndicatorSurface> surface_;
};

} // namespace ww
