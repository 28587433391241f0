#pragma once

#include "DeviceHandle.hpp"
#include <QObject>

namespace ww {

/// Abstract source of device usage events for one device class.
/// Implementations either receive pushed OS notifications or poll the
/// device snapshot; consumers cannot tell which.
class DeviceSignalSource : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    virtual ~DeviceSignalSource() = default;

    virtual DeviceKind kind() const = 0;

    /// Begin delivering events. Returns false if the source could not be set up.
    virtual bool start() = 0;

    virtual void stop() = 0;

signals:
    void deviceAdded(const ww::DeviceHandle& device);
    void deviceRemoved(const QString& deviceId);
    void deviceBecameUsed(const ww::DeviceHandle& device);
    void deviceBecameUnused(const ww::DeviceHandle& device);
};

} // namespace ww
