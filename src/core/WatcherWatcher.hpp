#pragma once

#include "core/DisplayState.hpp"
#include "core/WatcherOptions.hpp"
#include "core/devices/DeviceHandle.hpp"
#include <QList>
#include <QMetaObject>
#include <QObject>
#include <memory>

namespace ww {

class AggregationEngine;
class DebounceFilter;
class DeviceSignalSource;
class ExternalAppProbe;
class IDeviceSnapshotProvider;
class IScheduler;
class IUsageStateSource;
class Indicator;
class IndicatorRegistry;
class ZoomMuteMonitor;

/// Wires device signal sources, the camera debounce, the external app mute
/// monitor, the aggregation engine and the indicator registry together.
///
/// Collaborators are not owned; they must outlive this object.
class WatcherWatcher : public QObject {
    Q_OBJECT
public:
    struct Collaborators {
        IDeviceSnapshotProvider* snapshot = nullptr;
        IScheduler* scheduler = nullptr;
        ExternalAppProbe* appProbe = nullptr;            // optional
        DeviceSignalSource* cameraSource = nullptr;      // optional
        DeviceSignalSource* microphoneSource = nullptr;  // optional
    };

    explicit WatcherWatcher(const Collaborators& collaborators,
                            const WatcherOptions& options = {},
                            QObject* parent = nullptr);
    ~WatcherWatcher() override;

    /// Replace the options. Ignored (with a warning) while running.
    void configure(const WatcherOptions& options);
    const WatcherOptions& options() const { return options_; }

    void start();

    /// Stop monitoring and tear down every registered indicator.
    void stop();

    bool isRunning() const { return running_; }

    void mute();
    void unmute();
    void toggleMute();
    bool isMuted() const;

    bool registerIndicator(Indicator* indicator);

    /// Re-place indicators after a screen configuration change.
    void refreshIndicators();

    DisplayState currentDisplayState() const;
    QList<DeviceHandle> camerasInUse() const;
    QList<DeviceHandle> microphonesInUse() const;

    const IUsageStateSource* usageState() const;
    AggregationEngine* engine() const { return engine_; }
    IndicatorRegistry* registry() const { return registry_; }
    DebounceFilter* debounceFilter() const { return debounce_.get(); }
    ZoomMuteMonitor* muteMonitor() const { return muteMonitor_.get(); }

signals:
    void displayStateChanged(ww::DisplayState state);

private:
    void wireCameraSource();
    void wireMicrophoneSource();
    void startMuteMonitor();
    void onDeviceRemoved(const QString& deviceId);

    Collaborators collab_;
    WatcherOptions options_;
    AggregationEngine* engine_;
    IndicatorRegistry* registry_;
    std::unique_ptr<DebounceFilter> debounce_;
    std::unique_ptr<ZoomMuteMonitor> muteMonitor_;
    QList<QMetaObject::Connection> sourceConnections_;
    bool running_ = false;
};

} // namespace ww
