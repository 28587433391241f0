#pragma once

#include <QObject>
#include <QString>

namespace ww {

/// Abstract query/lifecycle interface for a third-party application whose
/// internal mute state overrides the raw microphone signal.
class ExternalAppProbe : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    virtual ~ExternalAppProbe() = default;

    virtual bool isRunning(const QString& appName) const = 0;

    /// Only meaningful while the app is running.
    virtual bool isMuted(const QString& appName) const = 0;

    /// Begin emitting lifecycle signals for the given app.
    virtual void watch(const QString& appName) = 0;
    virtual void unwatch(const QString& appName) = 0;

signals:
    void appLaunched(const QString& appName);
    void appTerminated(const QString& appName);
};

} // namespace ww
