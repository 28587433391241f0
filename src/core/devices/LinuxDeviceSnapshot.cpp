#include "LinuxDeviceSnapshot.hpp"
#include <QDir>
#include <QFile>
#include <QRegularExpression>
#include <QTextStream>
#include <cstring>
#include <limits.h>
#include <unistd.h>

namespace ww {

LinuxDeviceSnapshot::LinuxDeviceSnapshot(const QString& rootPath)
    : root_(QDir::cleanPath(rootPath))
{
}

QString LinuxDeviceSnapshot::path(const QString& relative) const
{
    if (root_ == QLatin1String("/"))
        return QLatin1Char('/') + relative;
    return root_ + QLatin1Char('/') + relative;
}

QString LinuxDeviceSnapshot::readFirstLine(const QString& relative) const
{
    QFile file(path(relative));
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
        return {};
    QTextStream in(&file);
    return in.readLine().trimmed();
}

QSet<QString> LinuxDeviceSnapshot::openDeviceNodes() const
{
    QSet<QString> nodes;
    QDir proc(path(QStringLiteral("proc")));
    const auto pids = proc.entryList(QDir::Dirs | QDir::NoDotAndDotDot);

    for (const auto& pid : pids) {
        bool numeric = false;
        pid.toInt(&numeric);
        if (!numeric)
            continue;

        // Other users' fd directories are unreadable; they simply yield nothing.
        QDir fdDir(proc.filePath(pid + QStringLiteral("/fd")));
        const auto fds = fdDir.entryList(QDir::AllEntries | QDir::System | QDir::NoDotAndDotDot);
        for (const auto& fd : fds) {
            const QByteArray linkPath = fdDir.filePath(fd).toLocal8Bit();
            char target[PATH_MAX];
            ssize_t len = ::readlink(linkPath.constData(), target, sizeof(target) - 1);
            if (len <= 0)
                continue;
            target[len] = '\0';
            if (::strncmp(target, "/dev/", 5) == 0)
                nodes.insert(QString::fromLocal8Bit(target, static_cast<int>(len)));
        }
    }
    return nodes;
}

QList<DeviceHandle> LinuxDeviceSnapshot::scanCameras() const
{
    QList<DeviceHandle> result;
    QDir v4l(path(QStringLiteral("sys/class/video4linux")));
    const auto entries = v4l.entryList(QStringList{QStringLiteral("video*")},
                                       QDir::Dirs | QDir::NoDotAndDotDot | QDir::System,
                                       QDir::Name);
    if (entries.isEmpty())
        return result;

    const QSet<QString> open = openDeviceNodes();

    for (const auto& entry : entries) {
        const QString base = QStringLiteral("sys/class/video4linux/") + entry;

        // Secondary nodes (metadata, etc.) carry a non-zero index.
        const QString index = readFirstLine(base + QStringLiteral("/index"));
        if (!index.isEmpty() && index != QLatin1String("0"))
            continue;

        DeviceHandle dev;
        dev.id = QStringLiteral("/dev/") + entry;
        dev.kind = DeviceKind::Camera;
        dev.displayName = readFirstLine(base + QStringLiteral("/name"));
        if (dev.displayName.isEmpty())
            dev.displayName = entry;
        dev.inUse = open.contains(dev.id);
        result.append(dev);
    }
    return result;
}

bool LinuxDeviceSnapshot::captureRunning(const QString& asoundDir) const
{
    QDir pcm(path(asoundDir));
    const auto subs = pcm.entryList(QStringList{QStringLiteral("sub*")},
                                    QDir::Dirs | QDir::NoDotAndDotDot);
    for (const auto& sub : subs) {
        QFile status(pcm.filePath(sub + QStringLiteral("/status")));
        if (!status.open(QIODevice::ReadOnly | QIODevice::Text))
            continue;
        const QString text = QString::fromUtf8(status.readAll());
        if (text.contains(QLatin1String("state: RUNNING")))
            return true;
    }
    return false;
}

QList<DeviceHandle> LinuxDeviceSnapshot::scanMicrophones() const
{
    static const QRegularExpression cardRe(QStringLiteral("^card(\\d+)$"));
    static const QRegularExpression pcmRe(QStringLiteral("^pcm(\\d+)c$"));

    QList<DeviceHandle> result;
    QDir asound(path(QStringLiteral("proc/asound")));
    const auto cards = asound.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);

    for (const auto& card : cards) {
        auto cardMatch = cardRe.match(card);
        if (!cardMatch.hasMatch())
            continue;

        QDir cardDir(asound.filePath(card));
        const auto pcms = cardDir.entryList(QStringList{QStringLiteral("pcm*c")},
                                            QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
        for (const auto& pcm : pcms) {
            auto pcmMatch = pcmRe.match(pcm);
            if (!pcmMatch.hasMatch())
                continue;

            const QString dir = QStringLiteral("proc/asound/%1/%2").arg(card, pcm);

            DeviceHandle dev;
            dev.id = QStringLiteral("/dev/snd/pcmC%1D%2c")
                         .arg(cardMatch.captured(1), pcmMatch.captured(1));
            dev.kind = DeviceKind::Microphone;

            // info holds "key: value" lines; "name" is the PCM's display name.
            QFile info(path(dir + QStringLiteral("/info")));
            if (info.open(QIODevice::ReadOnly | QIODevice::Text)) {
                QTextStream in(&info);
                while (!in.atEnd()) {
                    const QString line = in.readLine();
                    if (line.startsWith(QLatin1String("name:"))) {
                        dev.displayName = line.mid(5).trimmed();
                        break;
                    }
                }
            }
            if (dev.displayName.isEmpty())
                dev.displayName = readFirstLine(QStringLiteral("proc/asound/%1/id").arg(card));
            if (dev.displayName.isEmpty())
                dev.displayName = dev.id;

            dev.inUse = captureRunning(dir);
            result.append(dev);
        }
    }
    return result;
}

QList<DeviceHandle> LinuxDeviceSnapshot::cameras() const
{
    if (!cameras_)
        cameras_ = scanCameras();
    return *cameras_;
}

QList<DeviceHandle> LinuxDeviceSnapshot::microphones() const
{
    if (!microphones_)
        microphones_ = scanMicrophones();
    return *microphones_;
}

void LinuxDeviceSnapshot::invalidate()
{
    cameras_.reset();
    microphones_.reset();
}

std::optional<DeviceHandle> LinuxDeviceSnapshot::findDevice(const QString& id) const
{
    const auto list = id.startsWith(QLatin1String("/dev/snd/")) ? microphones() : cameras();
    for (const auto& dev : list) {
        if (dev.id == id)
            return dev;
    }
    return std::nullopt;
}

} // namespace ww
