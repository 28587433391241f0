#pragma once

#include "ExternalAppProbe.hpp"
#include "core/scheduling/IScheduler.hpp"
#include <QByteArray>
#include <QHash>
#include <QProcess>
#include <QSet>
#include <QStringList>

namespace ww {

/// Linux probe for a conferencing app.
///
/// Running state comes from /proc/<pid>/comm. Lifecycle transitions are
/// detected by rescanning the process table while at least one app is
/// watched. Mute state is read from the app's PulseAudio (or pipewire-pulse)
/// capture stream via `pactl`: the app is muted when it has capture streams
/// and every one of them is muted. `pactl` runs asynchronously on every scan
/// while a watched app is running; isMuted() answers from the last result.
class ProcAppProbe : public ExternalAppProbe {
    Q_OBJECT
public:
    explicit ProcAppProbe(IScheduler* scheduler,
                          double scanIntervalSeconds = 2.0,
                          const QString& rootPath = QStringLiteral("/"),
                          QObject* parent = nullptr);
    ~ProcAppProbe() override;

    bool isRunning(const QString& appName) const override;
    bool isMuted(const QString& appName) const override;
    void watch(const QString& appName) override;
    void unwatch(const QString& appName) override;

    /// Rescan the process table and emit lifecycle signals for watched apps.
    void scan();

    /// Command that prints the source-outputs JSON. Defaults to
    /// `pactl --format=json list source-outputs`.
    void setMuteQueryCommand(const QString& program, const QStringList& arguments);

    bool muteQueryInFlight() const { return query_ != nullptr; }

    /// Parse `pactl --format=json list source-outputs` output.
    /// Returns true if the app owns at least one stream and all are muted.
    static bool parseSourceOutputsMuted(const QByteArray& json, const QString& appName);

private:
    QSet<QString> runningProcessNames() const;
    void queryMuteState();
    void finishMuteQuery(const QByteArray& output, bool ok);

    IScheduler* scheduler_;
    double scanIntervalSeconds_;
    QString procPath_;
    QStringList watched_;
    QSet<QString> running_;
    ScheduledTaskPtr timer_;

    QString queryProgram_ = QStringLiteral("pactl");
    QStringList queryArguments_ = {QStringLiteral("--format=json"), QStringLiteral("list"),
                                   QStringLiteral("source-outputs")};
    QProcess* query_ = nullptr;
    QHash<QString, bool> muted_;
};

} // namespace ww
