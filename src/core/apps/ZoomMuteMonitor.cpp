#include "ZoomMuteMonitor.hpp"
#include <boost/log/trivial.hpp>
#include <exception>

namespace ww {

ZoomMuteMonitor::ZoomMuteMonitor(ExternalAppProbe* probe, IScheduler* scheduler,
                                 const QString& appName, double intervalSeconds,
                                 QObject* parent)
    : QObject(parent)
    , probe_(probe)
    , scheduler_(scheduler)
    , appName_(appName)
    , intervalSeconds_(intervalSeconds)
{
    if (intervalSeconds_ <= 0) {
        BOOST_LOG_TRIVIAL(warning) << "[ZoomMuteMonitor] Invalid poll interval " << intervalSeconds_
                                   << "s, using " << kDefaultIntervalSeconds << "s";
        intervalSeconds_ = kDefaultIntervalSeconds;
    }
}

ZoomMuteMonitor::~ZoomMuteMonitor()
{
    stop();
}

void ZoomMuteMonitor::start()
{
    if (started_)
        return;
    started_ = true;

    BOOST_LOG_TRIVIAL(debug) << "[ZoomMuteMonitor] Starting for " << appName_.toStdString();

    launchConn_ = connect(probe_, &ExternalAppProbe::appLaunched,
                          this, &ZoomMuteMonitor::onAppLaunched);
    terminateConn_ = connect(probe_, &ExternalAppProbe::appTerminated,
                             this, &ZoomMuteMonitor::onAppTerminated);
    probe_->watch(appName_);

    if (probe_->isRunning(appName_)) {
        BOOST_LOG_TRIVIAL(debug) << "[ZoomMuteMonitor] " << appName_.toStdString()
                                 << " already running, starting timer";
        activate();
    }
}

void ZoomMuteMonitor::stop()
{
    if (!started_)
        return;
    started_ = false;

    BOOST_LOG_TRIVIAL(debug) << "[ZoomMuteMonitor] Stopping";
    disconnect(launchConn_);
    disconnect(terminateConn_);
    probe_->unwatch(appName_);
    deactivate();
}

void ZoomMuteMonitor::onAppLaunched(const QString& appName)
{
    if (appName.compare(appName_, Qt::CaseInsensitive) != 0)
        return;
    BOOST_LOG_TRIVIAL(debug) << "[ZoomMuteMonitor] Launch detected, starting timer";
    activate();
}

void ZoomMuteMonitor::onAppTerminated(const QString& appName)
{
    if (appName.compare(appName_, Qt::CaseInsensitive) != 0)
        return;
    BOOST_LOG_TRIVIAL(debug) << "[ZoomMuteMonitor] Termination detected, stopping timer";
    deactivate();
}

void ZoomMuteMonitor::activate()
{
    if (state_ == State::Active)
        return;
    state_ = State::Active;
    timer_ = scheduler_->scheduleEvery(intervalSeconds_, [this]() { poll(); });
    poll();  // don't wait for the first interval
    emit stateChanged(state_);
}

void ZoomMuteMonitor::deactivate()
{
    if (timer_) {
        timer_->cancel();
        timer_.reset();
    }
    if (state_ == State::Inactive)
        return;
    state_ = State::Inactive;
    emit stateChanged(state_);
}

void ZoomMuteMonitor::poll()
{
    if (state_ != State::Active)
        return;

    bool muted = false;
    try {
        muted = probe_->isMuted(appName_);
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(warning) << "[ZoomMuteMonitor] Mute query failed: " << e.what();
        return;
    }
    if (lastMuted_.has_value() && *lastMuted_ == muted)
        return;

    BOOST_LOG_TRIVIAL(debug) << "[ZoomMuteMonitor] Mute state changed: " << (muted ? "muted" : "unmuted");
    lastMuted_ = muted;

    if (!callback_)
        return;
    try {
        callback_(muted);
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "[ZoomMuteMonitor] Error calling mute callback: " << e.what();
    } catch (...) {
        BOOST_LOG_TRIVIAL(error) << "[ZoomMuteMonitor] Unknown error calling mute callback";
    }
}

} // namespace ww
