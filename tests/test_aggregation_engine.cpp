#include <QTest>
#include <QSignalSpy>
#include "core/engine/AggregationEngine.hpp"
#include "core/engine/DebounceFilter.hpp"
#include "fakes/FakeDeviceSnapshot.hpp"
#include "fakes/FakeScheduler.hpp"

using ww::DisplayState;

class TestAggregationEngine : public QObject {
    Q_OBJECT

private slots:
    void micOnlyBroadcastsMicActiveWithInstigator()
    {
        FakeDeviceSnapshot snapshot;
        snapshot.addCamera("/dev/video0", "Integrated Camera");
        snapshot.addMicrophone("/dev/snd/pcmC0D0c", "Built-in Mic");
        ww::AggregationEngine engine(&snapshot, {});

        QSignalSpy spy(&engine, &ww::AggregationEngine::broadcastRequested);
        auto mic = snapshot.setInUse("/dev/snd/pcmC0D0c", true);
        engine.onDeviceUsageChanged(mic);

        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy.at(0).at(0).value<DisplayState>(), DisplayState::MicActive);
        auto instigator = spy.at(0).at(1).value<ww::Instigator>();
        QVERIFY(instigator.has_value());
        QCOMPARE(instigator->id, QString("/dev/snd/pcmC0D0c"));
        QCOMPARE(engine.displayState(), DisplayState::MicActive);
        QVERIFY(engine.lastMicInUse());
        QVERIFY(!engine.lastCameraInUse());
    }

    void cameraAndMicTogether()
    {
        FakeDeviceSnapshot snapshot;
        snapshot.addCamera("/dev/video0", "Integrated Camera", true);
        snapshot.addMicrophone("/dev/snd/pcmC0D0c", "Built-in Mic", true);
        ww::AggregationEngine engine(&snapshot, {});

        QCOMPARE(engine.displayState(), DisplayState::BothActive);
        QCOMPARE(engine.camerasInUse().size(), 1);
        QCOMPARE(engine.microphonesInUse().size(), 1);
    }

    void unknownDeviceIsIgnored()
    {
        FakeDeviceSnapshot snapshot;
        ww::AggregationEngine engine(&snapshot, {});
        QSignalSpy spy(&engine, &ww::AggregationEngine::broadcastRequested);

        ww::DeviceHandle ghost{"/dev/video9", ww::DeviceKind::Camera, "Unplugged", true};
        engine.onDeviceUsageChanged(ghost);

        QCOMPARE(spy.count(), 0);
        QCOMPARE(engine.displayState(), DisplayState::Idle);
    }

    void disabledDeviceClassIsIgnored()
    {
        FakeDeviceSnapshot snapshot;
        auto cam = snapshot.addCamera("/dev/video0", "Integrated Camera", true);
        ww::WatcherOptions options;
        options.monitorCameras = false;
        ww::AggregationEngine engine(&snapshot, options);
        QSignalSpy spy(&engine, &ww::AggregationEngine::broadcastRequested);

        engine.onDeviceUsageChanged(cam);

        QCOMPARE(spy.count(), 0);
        QVERIFY(!engine.cameraInUse());
        QVERIFY(engine.camerasInUse().isEmpty());
        QCOMPARE(engine.displayState(), DisplayState::Idle);
    }

    void userMuteAlwaysBroadcasts()
    {
        FakeDeviceSnapshot snapshot;
        snapshot.addCamera("/dev/video0", "Integrated Camera", true);
        ww::AggregationEngine engine(&snapshot, {});
        QSignalSpy spy(&engine, &ww::AggregationEngine::broadcastRequested);
        QSignalSpy changed(&engine, &ww::AggregationEngine::displayStateChanged);

        engine.setUserMuted(true);
        engine.setUserMuted(true);

        QCOMPARE(spy.count(), 2);
        QCOMPARE(changed.count(), 1);
        QCOMPARE(engine.lastBroadcastState(), DisplayState::SuppressedActive);

        engine.setUserMuted(false);
        QCOMPARE(engine.lastBroadcastState(), DisplayState::CameraActive);
    }

    void mutedWithNothingInUseIsSuppressedIdle()
    {
        FakeDeviceSnapshot snapshot;
        ww::AggregationEngine engine(&snapshot, {});
        engine.setUserMuted(true);
        QCOMPARE(engine.displayState(), DisplayState::SuppressedIdle);
    }

    void externalAppMuteHidesMicrophone()
    {
        FakeDeviceSnapshot snapshot;
        snapshot.addMicrophone("/dev/snd/pcmC0D0c", "Built-in Mic", true);
        ww::AggregationEngine engine(&snapshot, {});
        engine.reevaluate();
        QCOMPARE(engine.lastBroadcastState(), DisplayState::MicActive);

        engine.onExternalAppRunningChanged(true);
        QCOMPARE(engine.displayState(), DisplayState::MicActive);

        engine.onExternalMuteChanged(true);
        QCOMPARE(engine.displayState(), DisplayState::Idle);
        QCOMPARE(engine.lastBroadcastState(), DisplayState::Idle);
        QVERIFY(engine.microphonesInUse().isEmpty());

        // A terminated app no longer overrides the device signal.
        engine.onExternalAppRunningChanged(false);
        QCOMPARE(engine.displayState(), DisplayState::MicActive);
    }

    void externalAppMuteIgnoredWhenNotHonored()
    {
        FakeDeviceSnapshot snapshot;
        snapshot.addMicrophone("/dev/snd/pcmC0D0c", "Built-in Mic", true);
        ww::WatcherOptions options;
        options.honorExternalAppMute = false;
        ww::AggregationEngine engine(&snapshot, options);

        engine.onExternalAppRunningChanged(true);
        engine.onExternalMuteChanged(true);
        QCOMPARE(engine.displayState(), DisplayState::MicActive);
    }

    void externalMuteWithoutStateChangeDoesNotBroadcast()
    {
        FakeDeviceSnapshot snapshot;
        snapshot.addCamera("/dev/video0", "Integrated Camera", true);
        ww::AggregationEngine engine(&snapshot, {});
        engine.reevaluate();

        QSignalSpy spy(&engine, &ww::AggregationEngine::broadcastRequested);
        engine.onExternalAppRunningChanged(true);
        engine.onExternalMuteChanged(true);
        engine.onExternalMuteChanged(false);

        QCOMPARE(spy.count(), 0);
        QCOMPARE(engine.displayState(), DisplayState::CameraActive);
    }

    void pendingCameraTransitionCountsAsInUse()
    {
        FakeDeviceSnapshot snapshot;
        FakeScheduler scheduler;
        snapshot.addCamera("/dev/video0", "Integrated Camera", true);
        ww::DebounceFilter debounce(&snapshot, &scheduler, 5.0);
        ww::AggregationEngine engine(&snapshot, {});
        engine.setDebounceFilter(&debounce);
        QObject::connect(&debounce, &ww::DebounceFilter::cameraUnused,
                         &engine, &ww::AggregationEngine::onDeviceUsageChanged);

        auto cam = snapshot.setInUse("/dev/video0", false);
        debounce.onCameraBecameUnused(cam);
        QVERIFY(engine.cameraInUse());
        QCOMPARE(engine.displayState(), DisplayState::CameraActive);

        scheduler.advance(5.0);
        QVERIFY(!engine.cameraInUse());
        QCOMPARE(engine.lastBroadcastState(), DisplayState::Idle);
    }
};

QTEST_MAIN(TestAggregationEngine)
#include "test_aggregation_engine.moc"
