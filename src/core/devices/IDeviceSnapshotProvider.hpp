#pragma once

#include "DeviceHandle.hpp"
#include <QList>
#include <optional>

namespace ww {

/// View of the capture devices present on the system and whether each is
/// currently in use. Implementations may keep one snapshot until invalidate()
/// is called, so every consumer of a single event sees the same state.
class IDeviceSnapshotProvider {
public:
    virtual ~IDeviceSnapshotProvider() = default;

    /// A new event arrived; the next query reads the system again.
    virtual void invalidate() {}

    virtual QList<DeviceHandle> cameras() const = 0;
    virtual QList<DeviceHandle> microphones() const = 0;

    /// Resolve a device id against the current snapshot.
    virtual std::optional<DeviceHandle> findDevice(const QString& id) const = 0;

    QList<DeviceHandle> devices(DeviceKind kind) const
    {
        return kind == DeviceKind::Camera ? cameras() : microphones();
    }

    QList<DeviceHandle> activeCameras() const { return filterInUse(cameras()); }
    QList<DeviceHandle> activeMicrophones() const { return filterInUse(microphones()); }

private:
    static QList<DeviceHandle> filterInUse(const QList<DeviceHandle>& all)
    {
        QList<DeviceHandle> result;
        for (const auto& dev : all) {
            if (dev.inUse)
                result.append(dev);
        }
        return result;
    }
};

} // namespace ww
