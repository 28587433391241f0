#include "ui/OverlaySurface.hpp"
#include <QPaintEvent>
#include <QPainter>
#include <QWidget>

namespace ww {

namespace {

class OverlayWidget : public QWidget {
public:
    OverlayWidget(OverlaySurface::Shape shape, const QColor& color, double borderPercent)
        : QWidget(nullptr, Qt::FramelessWindowHint | Qt::WindowStaysOnTopHint
                               | Qt::Tool | Qt::WindowDoesNotAcceptFocus
                               | Qt::WindowTransparentForInput)
        , shape_(shape)
        , color_(color)
        , borderPercent_(borderPercent)
    {
        setAttribute(Qt::WA_TranslucentBackground);
        setAttribute(Qt::WA_TransparentForMouseEvents);
        setAttribute(Qt::WA_ShowWithoutActivating);
        setAttribute(Qt::WA_NoSystemBackground);
        setFocusPolicy(Qt::NoFocus);
    }

protected:
    void paintEvent(QPaintEvent*) override
    {
        QPainter p(this);
        p.setRenderHint(QPainter::Antialiasing);
        p.setCompositionMode(QPainter::CompositionMode_Source);
        p.fillRect(rect(), Qt::transparent);
        p.setCompositionMode(QPainter::CompositionMode_SourceOver);

        if (shape_ == OverlaySurface::Shape::Circle) {
            p.setPen(Qt::NoPen);
            p.setBrush(color_);
            p.drawEllipse(rect());
            return;
        }

        const int b = qMax(1, qRound(qMin(width(), height()) * borderPercent_ / 100.0));
        const QRect r = rect();
        p.fillRect(QRect(r.left(), r.top(), r.width(), b), color_);
        p.fillRect(QRect(r.left(), r.bottom() - b + 1, r.width(), b), color_);
        p.fillRect(QRect(r.left(), r.top(), b, r.height()), color_);
        p.fillRect(QRect(r.right() - b + 1, r.top(), b, r.height()), color_);
    }

private:
    OverlaySurface::Shape shape_;
    QColor color_;
    double borderPercent_;
};

} // namespace

OverlaySurface::OverlaySurface(Shape shape, const QRect& rect, const QColor& color,
                               double borderPercent)
    : widget_(std::make_unique<OverlayWidget>(shape, color, borderPercent))
{
    widget_->setGeometry(rect);
}

OverlaySurface::~OverlaySurface() = default;

void OverlaySurface::show()
{
    widget_->show();
    widget_->raise();
}

void OverlaySurface::hide()
{
    widget_->hide();
}

bool OverlaySurface::isShowing() const
{
    return widget_->isVisible();
}

void OverlaySurface::setGeometry(const QRect& rect)
{
    widget_->setGeometry(rect);
}

QRect OverlaySurface::geometry() const
{
    return widget_->geometry();
}

} // namespace ww
