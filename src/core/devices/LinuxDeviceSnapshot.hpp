#pragma once

#include "IDeviceSnapshotProvider.hpp"
#include <QSet>
#include <QString>

namespace ww {

/// Device snapshot read from sysfs and procfs.
///
/// Cameras are the primary V4L2 nodes listed under /sys/class/video4linux
/// (index 0); a camera is in use when any process holds an fd on its
/// /dev/videoN node. Microphones are the ALSA capture PCMs under
/// /proc/asound; one is in use when any of its substreams is RUNNING.
/// Device ids are the /dev node paths.
///
/// Both lists are cached after the first read; the /proc/*/fd walk only
/// runs again after invalidate().
class LinuxDeviceSnapshot : public IDeviceSnapshotProvider {
public:
    /// @param rootPath Filesystem root to read from ("/" in production,
    ///                 a fixture directory in tests).
    explicit LinuxDeviceSnapshot(const QString& rootPath = QStringLiteral("/"));

    QList<DeviceHandle> cameras() const override;
    QList<DeviceHandle> microphones() const override;
    std::optional<DeviceHandle> findDevice(const QString& id) const override;
    void invalidate() override;

private:
    QList<DeviceHandle> scanCameras() const;
    QList<DeviceHandle> scanMicrophones() const;
    QString path(const QString& relative) const;
    QSet<QString> openDeviceNodes() const;
    bool captureRunning(const QString& asoundDir) const;
    QString readFirstLine(const QString& relative) const;

    QString root_;
    mutable std::optional<QList<DeviceHandle>> cameras_;
    mutable std::optional<QList<DeviceHandle>> microphones_;
};

} // namespace ww
