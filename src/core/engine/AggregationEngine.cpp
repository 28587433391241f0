#include "AggregationEngine.hpp"
#include "DebounceFilter.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>

namespace ww {

AggregationEngine::AggregationEngine(IDeviceSnapshotProvider* provider,
                                     const WatcherOptions& options, QObject* parent)
    : QObject(parent)
    , provider_(provider)
    , options_(options)
{
}

bool AggregationEngine::externalMuteApplies() const
{
    return options_.honorExternalAppMute && externalAppRunning_ && externalAppMuted_;
}

bool AggregationEngine::cameraInUse() const
{
    if (!options_.monitorCameras)
        return false;
    if (debounce_ && debounce_->hasPendingTransition())
        return true;
    return !provider_->activeCameras().isEmpty();
}

bool AggregationEngine::micInUse() const
{
    if (!options_.monitorMics)
        return false;
    if (externalMuteApplies())
        return false;
    return !provider_->activeMicrophones().isEmpty();
}

DisplayState AggregationEngine::displayState() const
{
    return computeDisplayState(cameraInUse(), micInUse(), userMuted_);
}

QList<DeviceHandle> AggregationEngine::camerasInUse() const
{
    if (!options_.monitorCameras)
        return {};
    QList<DeviceHandle> cameras = provider_->activeCameras();
    if (!debounce_)
        return cameras;

    // Pending cameras keep the camera state active, so they stay listed.
    for (const auto& pending : debounce_->pendingDevices()) {
        const bool listed = std::any_of(cameras.cbegin(), cameras.cend(),
                                        [&pending](const DeviceHandle& d) { return d.id == pending.id; });
        if (!listed)
            cameras.append(pending);
    }
    return cameras;
}

QList<DeviceHandle> AggregationEngine::microphonesInUse() const
{
    if (!options_.monitorMics || externalMuteApplies())
        return {};
    return provider_->activeMicrophones();
}

DisplayState AggregationEngine::recompute(const Instigator& instigator)
{
    lastCameraInUse_ = cameraInUse();
    lastMicInUse_ = micInUse();
    const DisplayState state = computeDisplayState(lastCameraInUse_, lastMicInUse_, userMuted_);

    BOOST_LOG_TRIVIAL(debug) << "[AggregationEngine] camera=" << lastCameraInUse_
                             << " mic=" << lastMicInUse_ << " userMuted=" << userMuted_
                             << " -> " << displayStateName(state)
                             << (instigator ? " (" + instigator->displayName.toStdString() + ")"
                                            : std::string());
    return state;
}

void AggregationEngine::broadcast(DisplayState state, const Instigator& instigator)
{
    const bool changed = !broadcastOnce_ || state != lastBroadcast_;
    lastBroadcast_ = state;
    broadcastOnce_ = true;

    emit broadcastRequested(state, instigator);
    if (changed)
        emit displayStateChanged(state);
}

void AggregationEngine::setUserMuted(bool muted)
{
    BOOST_LOG_TRIVIAL(info) << "[AggregationEngine] User " << (muted ? "muted" : "unmuted")
                            << " indicators";
    userMuted_ = muted;
    broadcast(recompute(), std::nullopt);
}

void AggregationEngine::onExternalMuteChanged(bool muted)
{
    externalAppMuted_ = muted;
    const DisplayState state = recompute();
    if (broadcastOnce_ && state == lastBroadcast_) {
        BOOST_LOG_TRIVIAL(debug) << "[AggregationEngine] External mute " << muted
                                 << " leaves display state unchanged";
        return;
    }
    broadcast(state, std::nullopt);
}

void AggregationEngine::onExternalAppRunningChanged(bool running)
{
    externalAppRunning_ = running;
    const DisplayState state = recompute();
    if (broadcastOnce_ && state == lastBroadcast_)
        return;
    broadcast(state, std::nullopt);
}

void AggregationEngine::onDeviceUsageChanged(const DeviceHandle& device)
{
    if (device.kind == DeviceKind::Camera && !options_.monitorCameras)
        return;
    if (device.kind == DeviceKind::Microphone && !options_.monitorMics)
        return;

    if (!provider_->findDevice(device.id)) {
        BOOST_LOG_TRIVIAL(warning) << "[AggregationEngine] Unknown " << deviceKindName(device.kind)
                                   << " " << device.id.toStdString() << ", ignoring event";
        return;
    }
    broadcast(recompute(device), device);
}

void AggregationEngine::reevaluate()
{
    broadcast(recompute(), std::nullopt);
}

} // namespace ww
