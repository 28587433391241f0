#pragma once

#include "core/indicators/IndicatorSurface.hpp"
#include <memory>

class QWidget;

namespace ww {

/// Frameless, click-through, always-on-top overlay window drawing either a
/// filled circle or a rectangular frame.
class OverlaySurface : public IIndicatorSurface {
public:
    enum class Shape { Circle, Border };

    /// borderPercent is the frame thickness as a percentage of the shorter
    /// side; it scales with the overlay when its geometry changes.
    OverlaySurface(Shape shape, const QRect& rect, const QColor& color, double borderPercent = 0.0);
    ~OverlaySurface() override;

    void show() override;
    void hide() override;
    bool isShowing() const override;
    void setGeometry(const QRect& rect) override;
    QRect geometry() const override;

private:
    std::unique_ptr<QWidget> widget_;
};

} // namespace ww
