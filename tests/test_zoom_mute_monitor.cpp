#include <QTest>
#include <QSignalSpy>
#include <stdexcept>
#include "core/apps/ZoomMuteMonitor.hpp"
#include "fakes/FakeAppProbe.hpp"
#include "fakes/FakeScheduler.hpp"

using ww::ZoomMuteMonitor;

class TestZoomMuteMonitor : public QObject {
    Q_OBJECT

private slots:
    void inactiveUntilLaunch()
    {
        FakeAppProbe probe;
        FakeScheduler scheduler;
        ZoomMuteMonitor monitor(&probe, &scheduler);
        monitor.start();

        QVERIFY(probe.isWatched("zoom"));
        QCOMPARE(monitor.state(), ZoomMuteMonitor::State::Inactive);
        QCOMPARE(scheduler.activeCount(), 0);
        QVERIFY(!monitor.isAuthoritative());
    }

    void alreadyRunningActivatesOnStart()
    {
        FakeAppProbe probe;
        FakeScheduler scheduler;
        probe.launch("zoom");
        probe.setMuted("zoom", true);

        QList<bool> calls;
        ZoomMuteMonitor monitor(&probe, &scheduler);
        monitor.setCallback([&calls](bool muted) { calls << muted; });
        monitor.start();

        QCOMPARE(monitor.state(), ZoomMuteMonitor::State::Active);
        QCOMPARE(calls, QList<bool>{true});
        QVERIFY(monitor.isAuthoritative());
        QVERIFY(monitor.muted());
    }

    void callbackOnlyOnChange()
    {
        FakeAppProbe probe;
        FakeScheduler scheduler;
        QList<bool> calls;
        ZoomMuteMonitor monitor(&probe, &scheduler, "zoom", 5.0);
        monitor.setCallback([&calls](bool muted) { calls << muted; });
        monitor.start();

        probe.launch("zoom");
        QCOMPARE(calls, QList<bool>{false});

        scheduler.advance(5.0);
        scheduler.advance(5.0);
        QCOMPARE(calls.size(), 1);
        QCOMPARE(probe.mutedQueries, 3);

        probe.setMuted("zoom", true);
        scheduler.advance(5.0);
        QCOMPARE(calls, (QList<bool>{false, true}));

        probe.setMuted("zoom", false);
        scheduler.advance(5.0);
        QCOMPARE(calls, (QList<bool>{false, true, false}));
    }

    void keepsPollingAfterThrowingCallback()
    {
        FakeAppProbe probe;
        FakeScheduler scheduler;
        int calls = 0;
        ZoomMuteMonitor monitor(&probe, &scheduler, "zoom", 1.0);
        monitor.setCallback([&calls](bool) {
            ++calls;
            throw std::runtime_error("callback failure");
        });
        monitor.start();
        probe.launch("zoom");
        QCOMPARE(calls, 1);

        probe.setMuted("zoom", true);
        scheduler.advance(1.0);
        QCOMPARE(calls, 2);
        QCOMPARE(monitor.state(), ZoomMuteMonitor::State::Active);
        QCOMPARE(scheduler.activeCount(), 1);
    }

    void failingProbeIsSkipped()
    {
        FakeAppProbe probe;
        FakeScheduler scheduler;
        int calls = 0;
        ZoomMuteMonitor monitor(&probe, &scheduler, "zoom", 1.0);
        monitor.setCallback([&calls](bool) { ++calls; });
        probe.throwOnMuted = true;
        monitor.start();
        probe.launch("zoom");
        QCOMPARE(calls, 0);

        probe.throwOnMuted = false;
        scheduler.advance(1.0);
        QCOMPARE(calls, 1);
    }

    void stopsPollingOnTermination()
    {
        FakeAppProbe probe;
        FakeScheduler scheduler;
        ZoomMuteMonitor monitor(&probe, &scheduler, "zoom", 1.0);
        QSignalSpy states(&monitor, &ZoomMuteMonitor::stateChanged);
        monitor.start();
        probe.launch("zoom");
        QCOMPARE(scheduler.activeCount(), 1);

        probe.terminate("zoom");
        QCOMPARE(monitor.state(), ZoomMuteMonitor::State::Inactive);
        QCOMPARE(scheduler.activeCount(), 0);
        QCOMPARE(states.count(), 2);

        const int queries = probe.mutedQueries;
        scheduler.advance(10.0);
        QCOMPARE(probe.mutedQueries, queries);
        QVERIFY(!monitor.isAuthoritative());
    }

    void otherAppsAreIgnored()
    {
        FakeAppProbe probe;
        FakeScheduler scheduler;
        ZoomMuteMonitor monitor(&probe, &scheduler);
        monitor.start();

        probe.launch("firefox");
        QCOMPARE(monitor.state(), ZoomMuteMonitor::State::Inactive);
    }

    void stopUnwatchesAndDeactivates()
    {
        FakeAppProbe probe;
        FakeScheduler scheduler;
        ZoomMuteMonitor monitor(&probe, &scheduler);
        monitor.start();
        probe.launch("zoom");

        monitor.stop();
        QVERIFY(!probe.isWatched("zoom"));
        QCOMPARE(monitor.state(), ZoomMuteMonitor::State::Inactive);
        QCOMPARE(scheduler.activeCount(), 0);

        // Disconnected: a relaunch no longer activates.
        probe.terminate("zoom");
        probe.launch("zoom");
        QCOMPARE(monitor.state(), ZoomMuteMonitor::State::Inactive);
    }

    void invalidIntervalFallsBackToDefault()
    {
        FakeAppProbe probe;
        FakeScheduler scheduler;
        ZoomMuteMonitor monitor(&probe, &scheduler, "zoom", 0.0);
        monitor.start();
        probe.launch("zoom");
        const int queries = probe.mutedQueries;

        scheduler.advance(4.9);
        QCOMPARE(probe.mutedQueries, queries);
        scheduler.advance(0.1);
        QCOMPARE(probe.mutedQueries, queries + 1);
    }
};

QTEST_MAIN(TestZoomMuteMonitor)
#include "test_zoom_mute_monitor.moc"
