#include "ProcAppProbe.hpp"
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QProcess>
#include <boost/log/trivial.hpp>

namespace ww {

ProcAppProbe::ProcAppProbe(IScheduler* scheduler, double scanIntervalSeconds,
                           const QString& rootPath, QObject* parent)
    : ExternalAppProbe(parent)
    , scheduler_(scheduler)
    , scanIntervalSeconds_(scanIntervalSeconds)
    , procPath_(QDir(rootPath).filePath(QStringLiteral("proc")))
{
}

ProcAppProbe::~ProcAppProbe()
{
    if (timer_)
        timer_->cancel();
    if (query_) {
        query_->disconnect(this);
        query_->kill();
    }
}

QSet<QString> ProcAppProbe::runningProcessNames() const
{
    QSet<QString> names;
    QDir proc(procPath_);
    for (const auto& pid : proc.entryList(QDir::Dirs | QDir::NoDotAndDotDot)) {
        bool numeric = false;
        pid.toInt(&numeric);
        if (!numeric)
            continue;
        QFile comm(proc.filePath(pid + QStringLiteral("/comm")));
        if (!comm.open(QIODevice::ReadOnly | QIODevice::Text))
            continue;
        names.insert(QString::fromUtf8(comm.readLine()).trimmed().toLower());
    }
    return names;
}

bool ProcAppProbe::isRunning(const QString& appName) const
{
    return runningProcessNames().contains(appName.toLower());
}

bool ProcAppProbe::isMuted(const QString& appName) const
{
    return muted_.value(appName.toLower(), false);
}

void ProcAppProbe::setMuteQueryCommand(const QString& program, const QStringList& arguments)
{
    queryProgram_ = program;
    queryArguments_ = arguments;
}

void ProcAppProbe::queryMuteState()
{
    if (query_) {
        // Still running since the previous scan.
        BOOST_LOG_TRIVIAL(warning) << "[ProcAppProbe] " << queryProgram_.toStdString()
                                   << " did not finish, killing it";
        QProcess* stale = query_;
        query_ = nullptr;
        stale->disconnect(this);
        stale->kill();
        connect(stale, qOverload<int, QProcess::ExitStatus>(&QProcess::finished),
                stale, &QObject::deleteLater);
        muted_.clear();
    }

    query_ = new QProcess(this);
    QProcess* process = query_;
    connect(process, qOverload<int, QProcess::ExitStatus>(&QProcess::finished), this,
            [this, process](int exitCode, QProcess::ExitStatus status) {
        if (process != query_)
            return;
        const bool ok = status == QProcess::NormalExit && exitCode == 0;
        if (!ok) {
            BOOST_LOG_TRIVIAL(warning) << "[ProcAppProbe] " << queryProgram_.toStdString()
                                       << " failed with exit code " << exitCode;
        }
        finishMuteQuery(process->readAllStandardOutput(), ok);
    });
    connect(process, &QProcess::errorOccurred, this, [this, process](QProcess::ProcessError error) {
        // Other errors are followed by finished().
        if (error != QProcess::FailedToStart || process != query_)
            return;
        BOOST_LOG_TRIVIAL(warning) << "[ProcAppProbe] Cannot run " << queryProgram_.toStdString()
                                   << ": " << process->errorString().toStdString();
        finishMuteQuery({}, false);
    });
    process->start(queryProgram_, queryArguments_);
}

void ProcAppProbe::finishMuteQuery(const QByteArray& output, bool ok)
{
    QProcess* process = query_;
    query_ = nullptr;
    if (process)
        process->deleteLater();

    for (const auto& app : running_)
        muted_.insert(app, ok && parseSourceOutputsMuted(output, app));
}

bool ProcAppProbe::parseSourceOutputsMuted(const QByteArray& json, const QString& appName)
{
    QJsonParseError error{};
    const QJsonDocument doc = QJsonDocument::fromJson(json, &error);
    if (error.error != QJsonParseError::NoError || !doc.isArray()) {
        BOOST_LOG_TRIVIAL(debug) << "[ProcAppProbe] Unparseable pactl output: "
                                 << error.errorString().toStdString();
        return false;
    }

    const QString wanted = appName.toLower();
    int streams = 0;
    int muted = 0;
    for (const auto& value : doc.array()) {
        const QJsonObject stream = value.toObject();
        const QJsonObject props = stream.value(QStringLiteral("properties")).toObject();
        const QString binary = props.value(QStringLiteral("application.process.binary")).toString().toLower();
        const QString name = props.value(QStringLiteral("application.name")).toString().toLower();
        if (binary != wanted && !name.contains(wanted))
            continue;
        ++streams;
        if (stream.value(QStringLiteral("mute")).toBool())
            ++muted;
    }
    return streams > 0 && muted == streams;
}

void ProcAppProbe::watch(const QString& appName)
{
    const QString name = appName.toLower();
    if (watched_.contains(name))
        return;
    watched_.append(name);

    const bool runningNow = isRunning(name);
    if (runningNow) {
        running_.insert(name);
        queryMuteState();
    }

    if (!timer_) {
        timer_ = scheduler_->scheduleEvery(scanIntervalSeconds_, [this]() { scan(); });
    }
    BOOST_LOG_TRIVIAL(debug) << "[ProcAppProbe] Watching " << name.toStdString()
                             << (runningNow ? " (running)" : "");
}

void ProcAppProbe::unwatch(const QString& appName)
{
    const QString name = appName.toLower();
    watched_.removeAll(name);
    running_.remove(name);
    muted_.remove(name);
    if (watched_.isEmpty() && timer_) {
        timer_->cancel();
        timer_.reset();
    }
}

void ProcAppProbe::scan()
{
    const QSet<QString> names = runningProcessNames();
    const QStringList watched = watched_;

    for (const auto& app : watched) {
        const bool now = names.contains(app);
        const bool before = running_.contains(app);
        if (now == before)
            continue;
        if (now) {
            running_.insert(app);
            BOOST_LOG_TRIVIAL(info) << "[ProcAppProbe] " << app.toStdString() << " launched";
            emit appLaunched(app);
        } else {
            running_.remove(app);
            muted_.remove(app);
            BOOST_LOG_TRIVIAL(info) << "[ProcAppProbe] " << app.toStdString() << " terminated";
            emit appTerminated(app);
        }
    }

    if (!running_.isEmpty())
        queryMuteState();
}

} // namespace ww
