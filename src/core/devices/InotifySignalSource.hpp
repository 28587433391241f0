#pragma once

#include "DeviceSignalSource.hpp"
#include "IDeviceSnapshotProvider.hpp"
#include <QHash>
#include <QString>

class QSocketNotifier;

namespace ww {

/// Push-based signal source: watches device nodes with inotify.
///
/// Open/close of a node triggers a re-read of that device from the snapshot
/// and an event if its in-use flag changed. Node creation/deletion in the
/// device directory is reported as add/remove. Cameras are /dev/video*,
/// microphones are /dev/snd/pcmC*D*c.
class InotifySignalSource : public DeviceSignalSource {
    Q_OBJECT
public:
    /// @param deviceDir Directory holding the nodes. Defaults to /dev for
    ///                  cameras and /dev/snd for microphones.
    InotifySignalSource(IDeviceSnapshotProvider* provider, DeviceKind kind,
                        const QString& deviceDir = QString(),
                        QObject* parent = nullptr);
    ~InotifySignalSource() override;

    DeviceKind kind() const override { return kind_; }
    bool start() override;
    void stop() override;

    bool isRunning() const { return fd_ >= 0; }

private:
    void readEvents();
    bool matchesKind(const QString& fileName) const;
    void watchNode(const QString& nodePath);
    void unwatchNode(const QString& nodePath);
    void nodeTouched(const QString& nodePath);
    void nodeCreated(const QString& nodePath);
    void nodeDeleted(const QString& nodePath);

    IDeviceSnapshotProvider* provider_;
    DeviceKind kind_;
    QString deviceDir_;
    int fd_ = -1;
    int dirWatch_ = -1;
    QSocketNotifier* notifier_ = nullptr;
    QHash<int, QString> nodeByWatch_;
    QHash<QString, int> watchByNode_;
    QHash<QString, bool> inUse_;
};

} // namespace ww
