#include "PollingSignalSource.hpp"
#include <boost/log/trivial.hpp>

namespace ww {

PollingSignalSource::PollingSignalSource(IDeviceSnapshotProvider* provider, IScheduler* scheduler,
                                         DeviceKind kind, double intervalSeconds,
                                         QObject* parent)
    : DeviceSignalSource(parent)
    , provider_(provider)
    , scheduler_(scheduler)
    , kind_(kind)
    , intervalSeconds_(intervalSeconds)
{
}

PollingSignalSource::~PollingSignalSource()
{
    stop();
}

bool PollingSignalSource::start()
{
    if (timer_)
        return true;

    // Baseline: devices already present are not reported as changes.
    known_.clear();
    provider_->invalidate();
    for (const auto& dev : provider_->devices(kind_))
        known_.insert(dev.id, dev);

    BOOST_LOG_TRIVIAL(info) << "[PollingSignalSource] Polling " << deviceKindName(kind_)
                            << "s every " << intervalSeconds_ << "s (" << known_.size()
                            << " present)";
    timer_ = scheduler_->scheduleEvery(intervalSeconds_, [this]() { poll(); });
    return true;
}

void PollingSignalSource::stop()
{
    if (!timer_)
        return;
    timer_->cancel();
    timer_.reset();
    known_.clear();
}

void PollingSignalSource::poll()
{
    provider_->invalidate();
    QHash<QString, DeviceHandle> current;
    for (const auto& dev : provider_->devices(kind_))
        current.insert(dev.id, dev);

    // Handlers may stop() this source, so work on copies.
    const QHash<QString, DeviceHandle> previous = known_;
    known_ = current;

    for (auto it = previous.cbegin(); it != previous.cend(); ++it) {
        if (!current.contains(it.key())) {
            BOOST_LOG_TRIVIAL(debug) << "[PollingSignalSource] Removed "
                                     << it.key().toStdString();
            emit deviceRemoved(it.key());
        }
    }

    for (auto it = current.cbegin(); it != current.cend(); ++it) {
        const DeviceHandle& dev = it.value();
        auto prev = previous.constFind(it.key());
        if (prev == previous.cend()) {
            BOOST_LOG_TRIVIAL(debug) << "[PollingSignalSource] Added "
                                     << dev.displayName.toStdString();
            emit deviceAdded(dev);
            if (dev.inUse)
                emit deviceBecameUsed(dev);
            continue;
        }
        if (dev.inUse && !prev->inUse)
            emit deviceBecameUsed(dev);
        else if (!dev.inUse && prev->inUse)
            emit deviceBecameUnused(dev);
    }
}

} // namespace ww
