#pragma once

#include "DeviceSignalSource.hpp"
#include "IDeviceSnapshotProvider.hpp"
#include "core/scheduling/IScheduler.hpp"
#include <QHash>

namespace ww {

/// Signal source that diffs successive device snapshots on a fixed interval.
/// Used where the platform's push notifications are unreliable (ALSA capture
/// streams change state without any file event).
class PollingSignalSource : public DeviceSignalSource {
    Q_OBJECT
public:
    PollingSignalSource(IDeviceSnapshotProvider* provider, IScheduler* scheduler,
                        DeviceKind kind, double intervalSeconds = 1.0,
                        QObject* parent = nullptr);
    ~PollingSignalSource() override;

    DeviceKind kind() const override { return kind_; }
    bool start() override;
    void stop() override;

    /// Take one snapshot and emit events for every difference from the last one.
    void poll();

private:
    IDeviceSnapshotProvider* provider_;
    IScheduler* scheduler_;
    DeviceKind kind_;
    double intervalSeconds_;
    ScheduledTaskPtr timer_;
    QHash<QString, DeviceHandle> known_;
};

} // namespace ww
