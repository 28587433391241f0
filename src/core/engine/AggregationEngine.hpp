#pragma once

#include "IUsageStateSource.hpp"
#include "core/WatcherOptions.hpp"
#include "core/devices/IDeviceSnapshotProvider.hpp"
#include <QObject>

namespace ww {

class DebounceFilter;

/// Single source of truth for camera/mic usage and the user mute flag.
///
/// Display state is always computed fresh from the snapshot, the pending
/// debounce transitions, the external app mute override and the user mute
/// flag. The cached booleans only serve change detection.
class AggregationEngine : public QObject, public IUsageStateSource {
    Q_OBJECT
public:
    AggregationEngine(IDeviceSnapshotProvider* provider, const WatcherOptions& options,
                      QObject* parent = nullptr);

    void setOptions(const WatcherOptions& options) { options_ = options; }
    const WatcherOptions& options() const { return options_; }

    /// A camera with a pending debounced off-transition still counts as in use.
    void setDebounceFilter(const DebounceFilter* filter) { debounce_ = filter; }

    // IUsageStateSource
    DisplayState displayState() const override;
    bool cameraInUse() const override;
    bool micInUse() const override;
    bool userMuted() const override { return userMuted_; }
    QList<DeviceHandle> camerasInUse() const override;
    QList<DeviceHandle> microphonesInUse() const override;

    /// Recompute the display state and refresh the cached booleans.
    /// Does not broadcast.
    DisplayState recompute(const Instigator& instigator = std::nullopt);

    /// Set the user mute flag, recompute and broadcast.
    void setUserMuted(bool muted);

    /// Cache the external app's mute value; broadcast only if the display
    /// state changes as a result.
    void onExternalMuteChanged(bool muted);

    /// The external app started or stopped running. Its mute value only
    /// applies while it runs.
    void onExternalAppRunningChanged(bool running);

    /// A device changed usage. Unknown devices are logged and ignored.
    void onDeviceUsageChanged(const DeviceHandle& device);

    /// Recompute and broadcast unconditionally (start-up, device removal).
    void reevaluate();

    bool lastCameraInUse() const { return lastCameraInUse_; }
    bool lastMicInUse() const { return lastMicInUse_; }
    bool externalAppMuted() const { return externalAppMuted_; }
    bool externalAppRunning() const { return externalAppRunning_; }
    DisplayState lastBroadcastState() const { return lastBroadcast_; }

signals:
    /// Indicators should update. Emitted in event order, synchronously.
    void broadcastRequested(ww::DisplayState state, const ww::Instigator& instigator);

    void displayStateChanged(ww::DisplayState state);

private:
    bool externalMuteApplies() const;
    void broadcast(DisplayState state, const Instigator& instigator);

    IDeviceSnapshotProvider* provider_;
    WatcherOptions options_;
    const DebounceFilter* debounce_ = nullptr;

    bool userMuted_ = false;
    bool externalAppMuted_ = false;
    bool externalAppRunning_ = false;

    bool lastCameraInUse_ = false;
    bool lastMicInUse_ = false;
    DisplayState lastBroadcast_ = DisplayState::Idle;
    bool broadcastOnce_ = false;
};

} // namespace ww
