#pragma once

#include "core/indicators/IndicatorSurface.hpp"

// Shared record so tests can observe a surface after the indicator took ownership.
struct SurfaceLog {
    bool showing = false;
    int shows = 0;
    int hides = 0;
    QRect geometry;
    QColor color;
    double widthPercent = 0;
    bool destroyed = false;
};

class FakeSurface : public ww::IIndicatorSurface {
public:
    explicit FakeSurface(std::shared_ptr<SurfaceLog> log) : log_(std::move(log)) {}
    ~FakeSurface() override { log_->destroyed = true; }

    void show() override { log_->showing = true; ++log_->shows; }
    void hide() override { log_->showing = false; ++log_->hides; }
    bool isShowing() const override { return log_->showing; }
    void setGeometry(const QRect& rect) override { log_->geometry = rect; }
    QRect geometry() const override { return log_->geometry; }

private:
    std::shared_ptr<SurfaceLog> log_;
};

struct StatusItemLog {
    QString title;
    bool inMenuBar = false;
    std::function<QList<ww::MenuEntry>()> provider;
    bool destroyed = false;
};

class FakeStatusItem : public ww::IStatusItem {
public:
    explicit FakeStatusItem(std::shared_ptr<StatusItemLog> log) : log_(std::move(log)) {}
    ~FakeStatusItem() override { log_->destroyed = true; }

    void setTitle(const QString& title) override { log_->title = title; }
    QString title() const override { return log_->title; }
    void returnToMenuBar() override { log_->inMenuBar = true; }
    void removeFromMenuBar() override { log_->inMenuBar = false; }
    bool isInMenuBar() const override { return log_->inMenuBar; }
    void setMenuProvider(std::function<QList<ww::MenuEntry>()> provider) override
    {
        log_->provider = std::move(provider);
    }

private:
    std::shared_ptr<StatusItemLog> log_;
};

class FakeSurfaceFactory : public ww::ISurfaceFactory {
public:
    std::optional<QRect> frame = QRect(0, 0, 1920, 1080);
    bool failSurfaces = false;

    std::shared_ptr<SurfaceLog> lastSurface;
    std::shared_ptr<StatusItemLog> lastStatusItem;

    std::optional<QRect> primaryScreenFrame() const override { return frame; }

    std::unique_ptr<ww::IIndicatorSurface> createCircle(const QRect& rect, const QColor& fill) override
    {
        if (failSurfaces)
            return nullptr;
        lastSurface = std::make_shared<SurfaceLog>();
        lastSurface->geometry = rect;
        lastSurface->color = fill;
        return std::make_unique<FakeSurface>(lastSurface);
    }

    std::unique_ptr<ww::IIndicatorSurface> createBorder(const QRect& rect, double widthPercent,
                                                        const QColor& color) override
    {
        if (failSurfaces)
            return nullptr;
        lastSurface = std::make_shared<SurfaceLog>();
        lastSurface->geometry = rect;
        lastSurface->color = color;
        lastSurface->widthPercent = widthPercent;
        return std::make_unique<FakeSurface>(lastSurface);
    }

    std::unique_ptr<ww::IStatusItem> createStatusItem() override
    {
        if (failSurfaces)
            return nullptr;
        lastStatusItem = std::make_shared<StatusItemLog>();
        return std::make_unique<FakeStatusItem>(lastStatusItem);
    }
};
