#include "DebounceFilter.hpp"
#include <boost/log/trivial.hpp>

namespace ww {

DebounceFilter::DebounceFilter(IDeviceSnapshotProvider* provider, IScheduler* scheduler,
                               double delaySeconds, QObject* parent)
    : QObject(parent)
    , provider_(provider)
    , scheduler_(scheduler)
    , delaySeconds_(delaySeconds)
{
    if (delaySeconds_ < 0) {
        BOOST_LOG_TRIVIAL(warning) << "[DebounceFilter] Negative delay " << delaySeconds_
                                   << "s, debouncing disabled";
        delaySeconds_ = 0;
    }
}

DebounceFilter::~DebounceFilter()
{
    cancelAll();
}

void DebounceFilter::onCameraBecameUsed(const DeviceHandle& device)
{
    BOOST_LOG_TRIVIAL(debug) << "[DebounceFilter] Camera " << device.displayName.toStdString()
                             << " became used";
    emit cameraUsed(device);
}

void DebounceFilter::onCameraBecameUnused(const DeviceHandle& device)
{
    if (delaySeconds_ <= 0) {
        emit cameraUnused(device);
        return;
    }

    auto existing = pending_.find(device.id);
    if (existing != pending_.end()) {
        // Restart the delay from the latest report.
        existing->task->cancel();
        pending_.erase(existing);
    }

    BOOST_LOG_TRIVIAL(debug) << "[DebounceFilter] Delaying unused event from camera "
                             << device.displayName.toStdString() << " for "
                             << delaySeconds_ << "s";

    PendingTransition transition;
    transition.device = device;
    transition.scheduledAt = QDateTime::currentDateTimeUtc();
    transition.delaySeconds = delaySeconds_;
    const QString id = device.id;
    transition.task = scheduler_->scheduleAfter(delaySeconds_, [this, id]() { fire(id); });
    pending_.insert(id, transition);
}

void DebounceFilter::fire(const QString& deviceId)
{
    auto it = pending_.find(deviceId);
    if (it == pending_.end())
        return;
    const PendingTransition transition = it.value();
    pending_.erase(it);

    provider_->invalidate();
    auto live = provider_->findDevice(deviceId);
    if (live && live->inUse) {
        BOOST_LOG_TRIVIAL(debug) << "[DebounceFilter] Camera "
                                 << transition.device.displayName.toStdString()
                                 << " back in use, ignoring spurious unused event";
        return;
    }

    BOOST_LOG_TRIVIAL(debug) << "[DebounceFilter] Camera "
                             << transition.device.displayName.toStdString()
                             << " still unused after "
                             << transition.scheduledAt.msecsTo(QDateTime::currentDateTimeUtc())
                             << "ms";
    emit cameraUnused(live ? *live : transition.device);
}

QList<DeviceHandle> DebounceFilter::pendingDevices() const
{
    QList<DeviceHandle> devices;
    for (const auto& transition : pending_)
        devices.append(transition.device);
    return devices;
}

void DebounceFilter::forget(const QString& deviceId)
{
    auto it = pending_.find(deviceId);
    if (it == pending_.end())
        return;
    it->task->cancel();
    pending_.erase(it);
}

void DebounceFilter::cancelAll()
{
    for (auto& transition : pending_)
        transition.task->cancel();
    pending_.clear();
}

} // namespace ww
