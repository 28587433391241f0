#pragma once

#include "ExternalAppProbe.hpp"
#include "core/scheduling/IScheduler.hpp"
#include <QMetaObject>
#include <functional>
#include <optional>

namespace ww {

/// Tracks a conferencing app's internal mute state.
///
/// The app keeps the microphone open and mutes internally, so the raw device
/// signal reports "in use" while the user is muted in the meeting. While the
/// app runs, its mute control is polled on a fixed interval and the callback
/// fires on every change.
///
/// States: Inactive (app not running, no timer) and Active (app running,
/// polling). The cached value survives termination but is not authoritative
/// while Inactive.
class ZoomMuteMonitor : public QObject {
    Q_OBJECT
public:
    enum class State {
        Inactive,
        Active
    };
    Q_ENUM(State)

    using Callback = std::function<void(bool muted)>;

    static constexpr double kDefaultIntervalSeconds = 5.0;

    ZoomMuteMonitor(ExternalAppProbe* probe, IScheduler* scheduler,
                    const QString& appName = QStringLiteral("zoom"),
                    double intervalSeconds = kDefaultIntervalSeconds,
                    QObject* parent = nullptr);
    ~ZoomMuteMonitor() override;

    void setCallback(Callback callback) { callback_ = std::move(callback); }

    void start();
    void stop();

    State state() const { return state_; }
    bool isStarted() const { return started_; }

    /// Last polled mute value (false if never polled).
    bool muted() const { return lastMuted_.value_or(false); }

    /// True while the app is running and the cached value reflects it.
    bool isAuthoritative() const { return state_ == State::Active && lastMuted_.has_value(); }

    const QString& appName() const { return appName_; }

    /// One poll tick: query the app and fire the callback on change.
    void poll();

signals:
    /// Emitted on Inactive <-> Active transitions; the cached value gains or
    /// loses authority without a mute change.
    void stateChanged(ww::ZoomMuteMonitor::State state);

private:
    void onAppLaunched(const QString& appName);
    void onAppTerminated(const QString& appName);
    void activate();
    void deactivate();

    ExternalAppProbe* probe_;
    IScheduler* scheduler_;
    QString appName_;
    double intervalSeconds_;
    Callback callback_;
    State state_ = State::Inactive;
    bool started_ = false;
    std::optional<bool> lastMuted_;
    ScheduledTaskPtr timer_;
    QMetaObject::Connection launchConn_;
    QMetaObject::Connection terminateConn_;
};

} // namespace ww
