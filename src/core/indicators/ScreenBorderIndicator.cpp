#include "ScreenBorderIndicator.hpp"
#include "core/engine/IUsageStateSource.hpp"
#include <boost/log/trivial.hpp>

namespace ww {

std::unique_ptr<ScreenBorderIndicator> ScreenBorderIndicator::create(const IUsageStateSource* source,
                                                                     ISurfaceFactory* factory,
                                                                     const ScreenBorderOptions& options)
{
    const auto frame = factory->primaryScreenFrame();
    if (!frame) {
        BOOST_LOG_TRIVIAL(error) << "[ScreenBorder] No primary screen, cannot create border";
        return nullptr;
    }

    auto surface = factory->createBorder(*frame, options.widthPercent, options.color);
    if (!surface) {
        BOOST_LOG_TRIVIAL(error) << "[ScreenBorder] Failed to create overlay";
        return nullptr;
    }

    BOOST_LOG_TRIVIAL(debug) << "[ScreenBorder] Created " << frame->width() << "x"
                             << frame->height() << " border, width " << options.widthPercent << "%";
    return std::unique_ptr<ScreenBorderIndicator>(
        new ScreenBorderIndicator(source, factory, options, std::move(surface)));
}

ScreenBorderIndicator::ScreenBorderIndicator(const IUsageStateSource* source,
                                             ISurfaceFactory* factory,
                                             const ScreenBorderOptions& options,
                                             std::unique_ptr<IIndicatorSurface> surface)
    : source_(source)
    , factory_(factory)
    , options_(options)
    , behavior_(options.name)
    , surface_(std::move(surface))
{
}

void ScreenBorderIndicator::update(const Instigator&)
{
    if (behavior_.isDestroyed())
        return;

    if (behavior_.isMuted() || !IndicatorBehavior::wantsVisible(options_.showFilter, *source_))
        hide();
    else
        show();
}

void ScreenBorderIndicator::refresh()
{
    if (behavior_.isDestroyed())
        return;

    // Border always covers the whole screen.
    const auto frame = factory_->primaryScreenFrame();
    if (!frame) {
        BOOST_LOG_TRIVIAL(warning) << "[ScreenBorder] refresh() with no primary screen";
        return;
    }
    surface_->setGeometry(*frame);
}

void ScreenBorderIndicator::mute()
{
    behavior_.setMuted(true);
    hide();
}

void ScreenBorderIndicator::unmute()
{
    behavior_.setMuted(false);
    update(std::nullopt);
}

void ScreenBorderIndicator::show()
{
    if (behavior_.isDestroyed() || surface_->isShowing())
        return;
    BOOST_LOG_TRIVIAL(debug) << "[ScreenBorder] Showing";
    surface_->show();
}

void ScreenBorderIndicator::hide()
{
    if (behavior_.isDestroyed() || !surface_->isShowing())
        return;
    BOOST_LOG_TRIVIAL(debug) << "[ScreenBorder] Hiding";
    surface_->hide();
}

void ScreenBorderIndicator::destroy()
{
    if (behavior_.isDestroyed())
        return;
    hide();
    behavior_.markDestroyed();
    surface_.reset();
}

bool ScreenBorderIndicator::isVisible() const
{
    return surface_ && surface_->isShowing();
}

QRect ScreenBorderIndicator::geometry() const
{
    return surface_ ? surface_->geometry() : QRect();
}

} // namespace ww
