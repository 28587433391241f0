#include "InotifySignalSource.hpp"
#include <QDir>
#include <QFileInfo>
#include <QSocketNotifier>
#include <boost/log/trivial.hpp>
#include <cerrno>
#include <cstring>
#include <sys/inotify.h>
#include <unistd.h>

namespace ww {

namespace {
constexpr uint32_t kNodeMask = IN_OPEN | IN_CLOSE_WRITE | IN_CLOSE_NOWRITE;
constexpr uint32_t kDirMask = IN_CREATE | IN_DELETE;
}

InotifySignalSource::InotifySignalSource(IDeviceSnapshotProvider* provider, DeviceKind kind,
                                         const QString& deviceDir, QObject* parent)
    : DeviceSignalSource(parent)
    , provider_(provider)
    , kind_(kind)
    , deviceDir_(deviceDir)
{
    if (deviceDir_.isEmpty())
        deviceDir_ = kind_ == DeviceKind::Camera ? QStringLiteral("/dev") : QStringLiteral("/dev/snd");
}

InotifySignalSource::~InotifySignalSource()
{
    stop();
}

bool InotifySignalSource::matchesKind(const QString& fileName) const
{
    if (kind_ == DeviceKind::Camera)
        return fileName.startsWith(QLatin1String("video"));
    return fileName.startsWith(QLatin1String("pcmC")) && fileName.endsWith(QLatin1Char('c'));
}

bool InotifySignalSource::start()
{
    if (fd_ >= 0)
        return true;

    fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd_ < 0) {
        BOOST_LOG_TRIVIAL(error) << "[InotifySignalSource] inotify_init1 failed: "
                                 << std::strerror(errno);
        return false;
    }

    dirWatch_ = ::inotify_add_watch(fd_, deviceDir_.toLocal8Bit().constData(), kDirMask);
    if (dirWatch_ < 0) {
        BOOST_LOG_TRIVIAL(error) << "[InotifySignalSource] Cannot watch "
                                 << deviceDir_.toStdString() << ": " << std::strerror(errno);
        ::close(fd_);
        fd_ = -1;
        return false;
    }

    provider_->invalidate();
    const QDir dir(deviceDir_);
    for (const auto& name : dir.entryList(QDir::System | QDir::Files | QDir::NoDotAndDotDot)) {
        if (matchesKind(name))
            watchNode(dir.filePath(name));
    }

    notifier_ = new QSocketNotifier(fd_, QSocketNotifier::Read, this);
    connect(notifier_, &QSocketNotifier::activated, this, &InotifySignalSource::readEvents);

    BOOST_LOG_TRIVIAL(info) << "[InotifySignalSource] Watching " << watchByNode_.size() << " "
                            << deviceKindName(kind_) << " node(s) in " << deviceDir_.toStdString();
    return true;
}

void InotifySignalSource::stop()
{
    if (fd_ < 0)
        return;

    delete notifier_;
    notifier_ = nullptr;
    // Closing the inotify fd drops every watch on it.
    ::close(fd_);
    fd_ = -1;
    dirWatch_ = -1;
    nodeByWatch_.clear();
    watchByNode_.clear();
    inUse_.clear();
}

void InotifySignalSource::watchNode(const QString& nodePath)
{
    if (watchByNode_.contains(nodePath))
        return;

    int wd = ::inotify_add_watch(fd_, nodePath.toLocal8Bit().constData(), kNodeMask);
    if (wd < 0) {
        BOOST_LOG_TRIVIAL(warning) << "[InotifySignalSource] Cannot watch "
                                   << nodePath.toStdString() << ": " << std::strerror(errno);
        return;
    }
    nodeByWatch_.insert(wd, nodePath);
    watchByNode_.insert(nodePath, wd);

    auto dev = provider_->findDevice(nodePath);
    inUse_.insert(nodePath, dev && dev->inUse);
}

void InotifySignalSource::unwatchNode(const QString& nodePath)
{
    auto it = watchByNode_.find(nodePath);
    if (it == watchByNode_.end())
        return;
    // The kernel already removed the watch if the node is gone; ignore failures.
    ::inotify_rm_watch(fd_, it.value());
    nodeByWatch_.remove(it.value());
    watchByNode_.erase(it);
    inUse_.remove(nodePath);
}

void InotifySignalSource::readEvents()
{
    alignas(struct inotify_event) char buffer[4096];

    for (;;) {
        ssize_t len = ::read(fd_, buffer, sizeof(buffer));
        if (len <= 0) {
            if (len < 0 && errno != EAGAIN && errno != EINTR) {
                BOOST_LOG_TRIVIAL(warning) << "[InotifySignalSource] read failed: "
                                           << std::strerror(errno);
            }
            return;
        }

        provider_->invalidate();
        for (char* ptr = buffer; ptr < buffer + len;) {
            // A handler may have stopped the source.
            if (fd_ < 0)
                return;

            const auto* event = reinterpret_cast<const struct inotify_event*>(ptr);
            ptr += sizeof(struct inotify_event) + event->len;

            if (event->wd == dirWatch_ && event->len > 0) {
                const QString name = QString::fromLocal8Bit(event->name);
                if (!matchesKind(name))
                    continue;
                const QString nodePath = QDir(deviceDir_).filePath(name);
                if (event->mask & IN_CREATE)
                    nodeCreated(nodePath);
                else if (event->mask & IN_DELETE)
                    nodeDeleted(nodePath);
                continue;
            }

            auto node = nodeByWatch_.constFind(event->wd);
            if (node == nodeByWatch_.cend())
                continue;
            if (event->mask & IN_IGNORED) {
                // Watch removed by the kernel (node deleted)
                nodeByWatch_.remove(event->wd);
                continue;
            }
            if (event->mask & kNodeMask) {
                const QString nodePath = node.value();
                nodeTouched(nodePath);
            }
        }
        if (fd_ < 0)
            return;
    }
}

void InotifySignalSource::nodeTouched(const QString& nodePath)
{
    auto dev = provider_->findDevice(nodePath);
    if (!dev) {
        BOOST_LOG_TRIVIAL(debug) << "[InotifySignalSource] Event on unknown node "
                                 << nodePath.toStdString();
        return;
    }

    const bool was = inUse_.value(nodePath, false);
    if (dev->inUse == was)
        return;

    inUse_.insert(nodePath, dev->inUse);
    if (dev->inUse)
        emit deviceBecameUsed(*dev);
    else
        emit deviceBecameUnused(*dev);
}

void InotifySignalSource::nodeCreated(const QString& nodePath)
{
    watchNode(nodePath);

    DeviceHandle handle;
    if (auto dev = provider_->findDevice(nodePath)) {
        handle = *dev;
    } else {
        // sysfs may lag behind the node; report what we know.
        handle.id = nodePath;
        handle.kind = kind_;
        handle.displayName = QFileInfo(nodePath).fileName();
    }
    BOOST_LOG_TRIVIAL(info) << "[InotifySignalSource] Added " << handle.displayName.toStdString();
    emit deviceAdded(handle);
}

void InotifySignalSource::nodeDeleted(const QString& nodePath)
{
    if (!watchByNode_.contains(nodePath))
        return;
    unwatchNode(nodePath);
    BOOST_LOG_TRIVIAL(info) << "[InotifySignalSource] Removed " << nodePath.toStdString();
    emit deviceRemoved(nodePath);
}

} // namespace ww
