#include <QtTest>
#include <QTemporaryDir>
#include "core/devices/LinuxDeviceSnapshot.hpp"

namespace {

void writeFile(const QString& path, const QByteArray& content)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile f(path);
    QVERIFY(f.open(QIODevice::WriteOnly | QIODevice::Truncate));
    f.write(content);
}

// A fake filesystem root with two cameras and two capture PCMs.
void buildFixture(const QString& root)
{
    writeFile(root + "/sys/class/video4linux/video0/name", "Integrated Camera: Integrated C\n");
    writeFile(root + "/sys/class/video4linux/video0/index", "0\n");
    writeFile(root + "/sys/class/video4linux/video1/name", "Integrated Camera: Integrated C\n");
    writeFile(root + "/sys/class/video4linux/video1/index", "1\n");
    writeFile(root + "/sys/class/video4linux/video2/name", "USB Webcam\n");
    writeFile(root + "/sys/class/video4linux/video2/index", "0\n");

    writeFile(root + "/proc/asound/card0/id", "PCH\n");
    writeFile(root + "/proc/asound/card0/pcm0c/info", "card: 0\ndevice: 0\nname: ALC257 Analog\n");
    writeFile(root + "/proc/asound/card0/pcm0c/sub0/status", "closed\n");
    writeFile(root + "/proc/asound/card0/pcm0p/sub0/status", "state: RUNNING\n");
    writeFile(root + "/proc/asound/card1/id", "Webcam\n");
    writeFile(root + "/proc/asound/card1/pcm0c/sub0/status", "closed\n");
    writeFile(root + "/proc/asound/cards", " 0 [PCH ]: HDA-Intel\n");

    QDir().mkpath(root + "/proc/1234/fd");
    QDir().mkpath(root + "/proc/self");
}

void openNode(const QString& root, const QString& pid, const QString& fd, const QString& node)
{
    QDir().mkpath(root + "/proc/" + pid + "/fd");
    QVERIFY(QFile::link(node, root + "/proc/" + pid + "/fd/" + fd));
}

} // namespace

class TestLinuxDeviceSnapshot : public QObject {
    Q_OBJECT
private slots:
    void testFindsPrimaryCameraNodes();
    void testCameraInUseWhenFdLinksToNode();
    void testMicrophonesFromCapturePcms();
    void testMicrophoneInUseWhenRunning();
    void testFindDevice();
    void testSnapshotHeldUntilInvalidated();
    void testEmptyRoot();
};

void TestLinuxDeviceSnapshot::testFindsPrimaryCameraNodes()
{
    QTemporaryDir dir;
    buildFixture(dir.path());
    ww::LinuxDeviceSnapshot snapshot(dir.path());

    const auto cams = snapshot.cameras();
    QCOMPARE(cams.size(), 2);
    QCOMPARE(cams[0].id, QString("/dev/video0"));
    QCOMPARE(cams[0].displayName, QString("Integrated Camera: Integrated C"));
    QCOMPARE(cams[0].kind, ww::DeviceKind::Camera);
    QCOMPARE(cams[1].id, QString("/dev/video2"));
    QVERIFY(!cams[0].inUse);
    QVERIFY(snapshot.activeCameras().isEmpty());
}

void TestLinuxDeviceSnapshot::testCameraInUseWhenFdLinksToNode()
{
    QTemporaryDir dir;
    buildFixture(dir.path());
    openNode(dir.path(), "1234", "0", "/dev/null");
    openNode(dir.path(), "1234", "7", "/dev/video2");
    ww::LinuxDeviceSnapshot snapshot(dir.path());

    const auto active = snapshot.activeCameras();
    QCOMPARE(active.size(), 1);
    QCOMPARE(active[0].id, QString("/dev/video2"));
    QCOMPARE(active[0].displayName, QString("USB Webcam"));
}

void TestLinuxDeviceSnapshot::testMicrophonesFromCapturePcms()
{
    QTemporaryDir dir;
    buildFixture(dir.path());
    ww::LinuxDeviceSnapshot snapshot(dir.path());

    const auto mics = snapshot.microphones();
    QCOMPARE(mics.size(), 2);
    QCOMPARE(mics[0].id, QString("/dev/snd/pcmC0D0c"));
    QCOMPARE(mics[0].displayName, QString("ALC257 Analog"));
    QCOMPARE(mics[0].kind, ww::DeviceKind::Microphone);
    QCOMPARE(mics[1].id, QString("/dev/snd/pcmC1D0c"));
    QCOMPARE(mics[1].displayName, QString("Webcam"));

    // The playback stream's RUNNING state does not count.
    QVERIFY(snapshot.activeMicrophones().isEmpty());
}

void TestLinuxDeviceSnapshot::testMicrophoneInUseWhenRunning()
{
    QTemporaryDir dir;
    buildFixture(dir.path());
    writeFile(dir.path() + "/proc/asound/card1/pcm0c/sub0/status",
              "state: RUNNING\nowner_pid   : 4321\n");
    ww::LinuxDeviceSnapshot snapshot(dir.path());

    const auto active = snapshot.activeMicrophones();
    QCOMPARE(active.size(), 1);
    QCOMPARE(active[0].id, QString("/dev/snd/pcmC1D0c"));
}

void TestLinuxDeviceSnapshot::testFindDevice()
{
    QTemporaryDir dir;
    buildFixture(dir.path());
    ww::LinuxDeviceSnapshot snapshot(dir.path());

    auto cam = snapshot.findDevice("/dev/video0");
    QVERIFY(cam.has_value());
    QCOMPARE(cam->kind, ww::DeviceKind::Camera);

    auto mic = snapshot.findDevice("/dev/snd/pcmC0D0c");
    QVERIFY(mic.has_value());
    QCOMPARE(mic->kind, ww::DeviceKind::Microphone);

    QVERIFY(!snapshot.findDevice("/dev/video1").has_value());
    QVERIFY(!snapshot.findDevice("/dev/snd/pcmC9D0c").has_value());
}

void TestLinuxDeviceSnapshot::testSnapshotHeldUntilInvalidated()
{
    QTemporaryDir dir;
    buildFixture(dir.path());
    ww::LinuxDeviceSnapshot snapshot(dir.path());
    QVERIFY(snapshot.activeCameras().isEmpty());
    QVERIFY(snapshot.activeMicrophones().isEmpty());

    openNode(dir.path(), "1234", "3", "/dev/video0");
    writeFile(dir.path() + "/proc/asound/card0/pcm0c/sub0/status", "state: RUNNING\n");

    // Same event: every query sees the state read first.
    QVERIFY(snapshot.activeCameras().isEmpty());
    QVERIFY(!snapshot.findDevice("/dev/video0")->inUse);
    QVERIFY(snapshot.activeMicrophones().isEmpty());

    snapshot.invalidate();
    QCOMPARE(snapshot.activeCameras().size(), 1);
    QVERIFY(snapshot.findDevice("/dev/video0")->inUse);
    QCOMPARE(snapshot.activeMicrophones().size(), 1);
}

void TestLinuxDeviceSnapshot::testEmptyRoot()
{
    QTemporaryDir dir;
    ww::LinuxDeviceSnapshot snapshot(dir.path());
    QVERIFY(snapshot.cameras().isEmpty());
    QVERIFY(snapshot.microphones().isEmpty());
    QVERIFY(!snapshot.findDevice("/dev/video0"));
}

QTEST_MAIN(TestLinuxDeviceSnapshot)
#include "test_linux_device_snapshot.moc"
