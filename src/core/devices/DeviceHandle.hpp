#pragma once

#include <QMetaType>
#include <QString>
#include <optional>

namespace ww {

enum class DeviceKind {
    Camera,
    Microphone
};

struct DeviceHandle {
    QString id;            // stable key, e.g. "/dev/video0" or "/dev/snd/pcmC1D0c"
    DeviceKind kind = DeviceKind::Camera;
    QString displayName;   // e.g. "Integrated Camera"
    bool inUse = false;    // as observed by the snapshot that produced this handle
};

/// The device (if any) whose event caused an update.
using Instigator = std::optional<DeviceHandle>;

inline const char* deviceKindName(DeviceKind kind)
{
    return kind == DeviceKind::Camera ? "camera" : "microphone";
}

} // namespace ww

Q_DECLARE_METATYPE(ww::DeviceHandle)
