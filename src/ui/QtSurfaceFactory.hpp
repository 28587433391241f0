#pragma once

#include "core/indicators/IndicatorSurface.hpp"

namespace ww {

/// Overlay windows and tray items on the primary QScreen.
class QtSurfaceFactory : public ISurfaceFactory {
public:
    std::optional<QRect> primaryScreenFrame() const override;

    std::unique_ptr<IIndicatorSurface> createCircle(const QRect& rect, const QColor& fill) override;
    std::unique_ptr<IIndicatorSurface> createBorder(const QRect& rect, double widthPercent,
                                                    const QColor& color) override;
    std::unique_ptr<IStatusItem> createStatusItem() override;
};

} // namespace ww
