#include "FlashingIconIndicator.hpp"
#include "core/engine/IUsageStateSource.hpp"
#include <boost/log/trivial.hpp>

namespace ww {

std::unique_ptr<FlashingIconIndicator> FlashingIconIndicator::create(const IUsageStateSource* source,
                                                                     ISurfaceFactory* factory,
                                                                     IScheduler* scheduler,
                                                                     const FlasherOptions& options)
{
    const auto frame = factory->primaryScreenFrame();
    if (!frame) {
        BOOST_LOG_TRIVIAL(error) << "[Flasher(" << options.name.toStdString()
                                 << ")] No primary screen, cannot place icon";
        return nullptr;
    }

    const QRect rect = IndicatorBehavior::place(options.geometry, *frame);
    auto surface = factory->createCircle(rect, options.fillColor);
    if (!surface) {
        BOOST_LOG_TRIVIAL(error) << "[Flasher(" << options.name.toStdString()
                                 << ")] Failed to create overlay";
        return nullptr;
    }

    BOOST_LOG_TRIVIAL(debug) << "[Flasher(" << options.name.toStdString() << ")] Placed at "
                             << rect.x() << "," << rect.y() << " filter="
                             << showFilterName(options.showFilter)
                             << " blink=" << options.blinkInterval << "s";

    return std::unique_ptr<FlashingIconIndicator>(
        new FlashingIconIndicator(source, factory, scheduler, options, std::move(surface)));
}

FlashingIconIndicator::FlashingIconIndicator(const IUsageStateSource* source,
                                             ISurfaceFactory* factory,
                                             IScheduler* scheduler,
                                             const FlasherOptions& options,
                                             std::unique_ptr<IIndicatorSurface> surface)
    : source_(source)
    , factory_(factory)
    , scheduler_(scheduler)
    , options_(options)
    , behavior_(options.name)
    , surface_(std::move(surface))
{
}

FlashingIconIndicator::~FlashingIconIndicator()
{
    if (blinkTimer_)
        blinkTimer_->cancel();
}

void FlashingIconIndicator::update(const Instigator&)
{
    if (behavior_.isDestroyed())
        return;

    if (behavior_.isMuted() || !IndicatorBehavior::wantsVisible(options_.showFilter, *source_))
        hide();
    else
        show();
}

void FlashingIconIndicator::refresh()
{
    if (behavior_.isDestroyed())
        return;

    const auto frame = factory_->primaryScreenFrame();
    if (!frame) {
        BOOST_LOG_TRIVIAL(warning) << "[Flasher(" << name().toStdString()
                                   << ")] refresh() with no primary screen";
        return;
    }
    const QRect rect = IndicatorBehavior::place(options_.geometry, *frame);
    BOOST_LOG_TRIVIAL(debug) << "[Flasher(" << name().toStdString() << ")] Refreshing geometry: x = "
                             << rect.x() << " y = " << rect.y();
    surface_->setGeometry(rect);
}

void FlashingIconIndicator::mute()
{
    behavior_.setMuted(true);
    hide();
}

void FlashingIconIndicator::unmute()
{
    behavior_.setMuted(false);
    update(std::nullopt);
}

void FlashingIconIndicator::show()
{
    if (behavior_.isDestroyed() || shown_)
        return;
    shown_ = true;

    if (options_.blinkInterval > 0) {
        BOOST_LOG_TRIVIAL(debug) << "[Flasher(" << name().toStdString() << ")] Starting blinking";
        surface_->show();
        blinkTimer_ = scheduler_->scheduleEvery(options_.blinkInterval, [this]() { blink(); });
    } else {
        BOOST_LOG_TRIVIAL(debug) << "[Flasher(" << name().toStdString() << ")] Showing";
        surface_->show();
    }
}

void FlashingIconIndicator::hide()
{
    if (behavior_.isDestroyed() || !shown_)
        return;
    shown_ = false;

    if (blinkTimer_) {
        BOOST_LOG_TRIVIAL(debug) << "[Flasher(" << name().toStdString() << ")] Stopping blinking";
        blinkTimer_->cancel();
        blinkTimer_.reset();
    }
    surface_->hide();
}

void FlashingIconIndicator::blink()
{
    if (surface_->isShowing())
        surface_->hide();
    else
        surface_->show();
}

void FlashingIconIndicator::destroy()
{
    if (behavior_.isDestroyed())
        return;
    hide();
    behavior_.markDestroyed();
    surface_.reset();
    BOOST_LOG_TRIVIAL(debug) << "[Flasher(" << name().toStdString() << ")] Destroyed";
}

} // namespace ww
