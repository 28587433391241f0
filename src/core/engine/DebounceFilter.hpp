#pragma once

#include "core/devices/DeviceHandle.hpp"
#include "core/devices/IDeviceSnapshotProvider.hpp"
#include "core/scheduling/IScheduler.hpp"
#include <QDateTime>
#include <QHash>
#include <QObject>

namespace ww {

/// A camera-off event waiting out the debounce delay.
struct PendingTransition {
    DeviceHandle device;
    QDateTime scheduledAt;
    double delaySeconds = 0;
    ScheduledTaskPtr task;
};

/// Delays "camera became unused" transitions to filter the spurious
/// off/on blips cameras report around sleep and wake.
///
/// The deferred check re-reads the device from the live snapshot when it
/// fires: still unused emits cameraUnused exactly once, back in use drops the
/// transition without any effect. "Became used" is never delayed.
class DebounceFilter : public QObject {
    Q_OBJECT
public:
    DebounceFilter(IDeviceSnapshotProvider* provider, IScheduler* scheduler,
                   double delaySeconds, QObject* parent = nullptr);
    ~DebounceFilter() override;

    double delaySeconds() const { return delaySeconds_; }

    void onCameraBecameUnused(const DeviceHandle& device);
    void onCameraBecameUsed(const DeviceHandle& device);

    /// Drop any pending transition for a device that has been removed.
    void forget(const QString& deviceId);

    void cancelAll();

    bool hasPendingTransition() const { return !pending_.isEmpty(); }
    bool hasPendingTransition(const QString& deviceId) const { return pending_.contains(deviceId); }
    int pendingCount() const { return pending_.size(); }

    /// Cameras whose off-transition is still waiting out the delay.
    QList<DeviceHandle> pendingDevices() const;

signals:
    void cameraUsed(const ww::DeviceHandle& device);
    void cameraUnused(const ww::DeviceHandle& device);

private:
    void fire(const QString& deviceId);

    IDeviceSnapshotProvider* provider_;
    IScheduler* scheduler_;
    double delaySeconds_;
    QHash<QString, PendingTransition> pending_;
};

} // namespace ww
