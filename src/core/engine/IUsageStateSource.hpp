#pragma once

#include "core/DisplayState.hpp"
#include "core/devices/DeviceHandle.hpp"
#include <QList>

namespace ww {

/// Read-only view of the aggregated usage state. Indicators pull from this
/// rather than keeping their own copy of the inputs.
class IUsageStateSource {
public:
    virtual ~IUsageStateSource() = default;

    virtual DisplayState displayState() const = 0;
    virtual bool cameraInUse() const = 0;
    virtual bool micInUse() const = 0;
    virtual bool userMuted() const = 0;

    virtual QList<DeviceHandle> camerasInUse() const = 0;
    virtual QList<DeviceHandle> microphonesInUse() const = 0;
};

} // namespace ww
