#include "WatcherWatcher.hpp"
#include "core/apps/ZoomMuteMonitor.hpp"
#include "core/devices/DeviceSignalSource.hpp"
#include "core/engine/AggregationEngine.hpp"
#include "core/engine/DebounceFilter.hpp"
#include "core/indicators/IndicatorRegistry.hpp"
#include <boost/log/trivial.hpp>

namespace ww {

WatcherWatcher::WatcherWatcher(const Collaborators& collaborators,
                               const WatcherOptions& options, QObject* parent)
    : QObject(parent)
    , collab_(collaborators)
    , options_(options)
    , engine_(new AggregationEngine(collaborators.snapshot, options, this))
    , registry_(new IndicatorRegistry(this))
{
    connect(engine_, &AggregationEngine::broadcastRequested, registry_,
            [this](DisplayState, const Instigator& instigator) {
                registry_->broadcastUpdate(instigator);
            });
    connect(engine_, &AggregationEngine::displayStateChanged,
            this, &WatcherWatcher::displayStateChanged);
}

WatcherWatcher::~WatcherWatcher()
{
    stop();
}

void WatcherWatcher::configure(const WatcherOptions& options)
{
    if (running_) {
        BOOST_LOG_TRIVIAL(warning) << "[WatcherWatcher] configure() ignored while running";
        return;
    }
    options_ = options;
    engine_->setOptions(options_);
}

void WatcherWatcher::start()
{
    if (running_)
        return;

    BOOST_LOG_TRIVIAL(info) << "[WatcherWatcher] Starting: cameras=" << options_.monitorCameras
                            << " mics=" << options_.monitorMics
                            << " honorExternalAppMute=" << options_.honorExternalAppMute
                            << " debounce=" << options_.cameraOffDebounceSeconds << "s";

    engine_->setOptions(options_);

    debounce_ = std::make_unique<DebounceFilter>(collab_.snapshot, collab_.scheduler,
                                                 options_.cameraOffDebounceSeconds);
    engine_->setDebounceFilter(debounce_.get());
    connect(debounce_.get(), &DebounceFilter::cameraUsed,
            engine_, &AggregationEngine::onDeviceUsageChanged);
    connect(debounce_.get(), &DebounceFilter::cameraUnused,
            engine_, &AggregationEngine::onDeviceUsageChanged);

    if (options_.monitorCameras)
        wireCameraSource();
    if (options_.monitorMics) {
        wireMicrophoneSource();
        if (options_.honorExternalAppMute)
            startMuteMonitor();
    }

    running_ = true;
    collab_.snapshot->invalidate();
    engine_->reevaluate();
}

void WatcherWatcher::wireCameraSource()
{
    DeviceSignalSource* source = collab_.cameraSource;
    if (!source) {
        BOOST_LOG_TRIVIAL(warning) << "[WatcherWatcher] No camera signal source, cameras only "
                                   << "update with other events";
        return;
    }

    BOOST_LOG_TRIVIAL(debug) << "[WatcherWatcher] Starting monitoring of cameras";
    sourceConnections_ << connect(source, &DeviceSignalSource::deviceBecameUsed,
                                  debounce_.get(), &DebounceFilter::onCameraBecameUsed);
    sourceConnections_ << connect(source, &DeviceSignalSource::deviceBecameUnused,
                                  debounce_.get(), &DebounceFilter::onCameraBecameUnused);
    sourceConnections_ << connect(source, &DeviceSignalSource::deviceAdded, this,
                                  [](const DeviceHandle& dev) {
        BOOST_LOG_TRIVIAL(debug) << "[WatcherWatcher] Camera added: " << dev.displayName.toStdString();
    });
    sourceConnections_ << connect(source, &DeviceSignalSource::deviceRemoved,
                                  this, &WatcherWatcher::onDeviceRemoved);

    if (!source->start())
        BOOST_LOG_TRIVIAL(error) << "[WatcherWatcher] Camera signal source failed to start";
}

void WatcherWatcher::wireMicrophoneSource()
{
    DeviceSignalSource* source = collab_.microphoneSource;
    if (!source) {
        BOOST_LOG_TRIVIAL(warning) << "[WatcherWatcher] No microphone signal source, microphones "
                                   << "only update with other events";
        return;
    }

    BOOST_LOG_TRIVIAL(debug) << "[WatcherWatcher] Starting monitoring of microphones";
    sourceConnections_ << connect(source, &DeviceSignalSource::deviceBecameUsed,
                                  engine_, &AggregationEngine::onDeviceUsageChanged);
    sourceConnections_ << connect(source, &DeviceSignalSource::deviceBecameUnused,
                                  engine_, &AggregationEngine::onDeviceUsageChanged);
    sourceConnections_ << connect(source, &DeviceSignalSource::deviceAdded, this,
                                  [](const DeviceHandle& dev) {
        BOOST_LOG_TRIVIAL(debug) << "[WatcherWatcher] Microphone added: " << dev.displayName.toStdString();
    });
    sourceConnections_ << connect(source, &DeviceSignalSource::deviceRemoved,
                                  this, &WatcherWatcher::onDeviceRemoved);

    if (!source->start())
        BOOST_LOG_TRIVIAL(error) << "[WatcherWatcher] Microphone signal source failed to start";
}

void WatcherWatcher::startMuteMonitor()
{
    if (!collab_.appProbe) {
        BOOST_LOG_TRIVIAL(debug) << "[WatcherWatcher] No external app probe, mute override disabled";
        return;
    }

    BOOST_LOG_TRIVIAL(debug) << "[WatcherWatcher] Starting "
                             << options_.externalAppName.toStdString() << " mute monitor";
    muteMonitor_ = std::make_unique<ZoomMuteMonitor>(collab_.appProbe, collab_.scheduler,
                                                     options_.externalAppName,
                                                     options_.appMutePollIntervalSeconds);
    muteMonitor_->setCallback([this](bool muted) { engine_->onExternalMuteChanged(muted); });
    connect(muteMonitor_.get(), &ZoomMuteMonitor::stateChanged, engine_,
            [this](ZoomMuteMonitor::State state) {
                engine_->onExternalAppRunningChanged(state == ZoomMuteMonitor::State::Active);
            });
    muteMonitor_->start();
}

void WatcherWatcher::onDeviceRemoved(const QString& deviceId)
{
    BOOST_LOG_TRIVIAL(debug) << "[WatcherWatcher] Device removed: " << deviceId.toStdString();
    if (debounce_)
        debounce_->forget(deviceId);
    engine_->reevaluate();
}

void WatcherWatcher::stop()
{
    if (!running_)
        return;

    BOOST_LOG_TRIVIAL(info) << "[WatcherWatcher] Stopping";

    for (const auto& conn : sourceConnections_)
        disconnect(conn);
    sourceConnections_.clear();

    if (options_.monitorCameras && collab_.cameraSource)
        collab_.cameraSource->stop();
    if (options_.monitorMics && collab_.microphoneSource)
        collab_.microphoneSource->stop();

    if (muteMonitor_) {
        muteMonitor_->stop();
        muteMonitor_.reset();
    }
    engine_->onExternalAppRunningChanged(false);

    engine_->setDebounceFilter(nullptr);
    debounce_.reset();

    registry_->teardownAll();
    running_ = false;
}

void WatcherWatcher::mute()
{
    BOOST_LOG_TRIVIAL(debug) << "[WatcherWatcher] Muting";
    engine_->setUserMuted(true);
    registry_->broadcastMute();
}

void WatcherWatcher::unmute()
{
    BOOST_LOG_TRIVIAL(debug) << "[WatcherWatcher] Unmuting";
    engine_->setUserMuted(false);
    registry_->broadcastUnmute();
}

void WatcherWatcher::toggleMute()
{
    if (isMuted())
        unmute();
    else
        mute();
}

bool WatcherWatcher::isMuted() const
{
    return engine_->userMuted();
}

bool WatcherWatcher::registerIndicator(Indicator* indicator)
{
    if (!registry_->registerIndicator(indicator))
        return false;
    // Bring the newcomer in line with the current state.
    try {
        if (engine_->userMuted())
            indicator->mute();
        else
            indicator->update(std::nullopt);
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "[WatcherWatcher] Error initialising indicator "
                                 << indicator->name().toStdString() << ": " << e.what();
    }
    return true;
}

void WatcherWatcher::refreshIndicators()
{
    registry_->broadcastRefresh();
}

DisplayState WatcherWatcher::currentDisplayState() const
{
    return engine_->displayState();
}

QList<DeviceHandle> WatcherWatcher::camerasInUse() const
{
    return engine_->camerasInUse();
}

QList<DeviceHandle> WatcherWatcher::microphonesInUse() const
{
    return engine_->microphonesInUse();
}

const IUsageStateSource* WatcherWatcher::usageState() const
{
    return engine_;
}

} // namespace ww
