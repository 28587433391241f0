#include <QTest>
#include "core/indicators/FlashingIconIndicator.hpp"
#include "fakes/FakeScheduler.hpp"
#include "fakes/FakeSurfaces.hpp"
#include "fakes/FakeUsageState.hpp"

class TestFlashingIconIndicator : public QObject {
    Q_OBJECT

private slots:
    void defaultPlacementIsTopRight()
    {
        FakeUsageState state;
        FakeSurfaceFactory factory;
        FakeScheduler scheduler;
        auto flasher = ww::FlashingIconIndicator::create(&state, &factory, &scheduler);
        QVERIFY(flasher);
        QCOMPARE(factory.lastSurface->geometry, QRect(1860, 20, 50, 50));
        QCOMPARE(factory.lastSurface->color, QColor(255, 0, 0));
        QVERIFY(!flasher->isVisible());
    }

    void creationFailsWithoutScreen()
    {
        FakeUsageState state;
        FakeSurfaceFactory factory;
        FakeScheduler scheduler;
        factory.frame.reset();
        QVERIFY(!ww::FlashingIconIndicator::create(&state, &factory, &scheduler));

        factory.frame = QRect(0, 0, 800, 600);
        factory.failSurfaces = true;
        QVERIFY(!ww::FlashingIconIndicator::create(&state, &factory, &scheduler));
    }

    void blinksWhileShown()
    {
        FakeUsageState state;
        FakeSurfaceFactory factory;
        FakeScheduler scheduler;
        auto flasher = ww::FlashingIconIndicator::create(&state, &factory, &scheduler);
        auto surface = factory.lastSurface;

        state.camera = true;
        flasher->update(std::nullopt);
        QVERIFY(flasher->isVisible());
        QVERIFY(flasher->isBlinking());
        QVERIFY(surface->showing);

        scheduler.advance(1.0);
        QVERIFY(!surface->showing);
        scheduler.advance(1.0);
        QVERIFY(surface->showing);

        state.camera = false;
        flasher->update(std::nullopt);
        QVERIFY(!flasher->isVisible());
        QVERIFY(!flasher->isBlinking());
        QVERIFY(!surface->showing);
        QCOMPARE(scheduler.activeCount(), 0);

        scheduler.advance(5.0);
        QVERIFY(!surface->showing);
    }

    void steadyFlasherHasNoTimer()
    {
        FakeUsageState state;
        FakeSurfaceFactory factory;
        FakeScheduler scheduler;
        ww::FlasherOptions options;
        options.blinkInterval = 0;
        auto flasher = ww::FlashingIconIndicator::create(&state, &factory, &scheduler, options);

        state.mic = true;
        flasher->update(std::nullopt);
        QVERIFY(flasher->isVisible());
        QVERIFY(!flasher->isBlinking());
        QCOMPARE(scheduler.activeCount(), 0);
    }

    void showAndHideAreIdempotent()
    {
        FakeUsageState state;
        FakeSurfaceFactory factory;
        FakeScheduler scheduler;
        auto flasher = ww::FlashingIconIndicator::create(&state, &factory, &scheduler);

        flasher->show();
        flasher->show();
        QCOMPARE(factory.lastSurface->shows, 1);
        QCOMPARE(scheduler.activeCount(), 1);

        flasher->hide();
        flasher->hide();
        QCOMPARE(factory.lastSurface->hides, 1);
    }

    void showFilterSelectsDevice()
    {
        FakeUsageState state;
        FakeSurfaceFactory factory;
        FakeScheduler scheduler;
        ww::FlasherOptions options;
        options.showFilter = ww::ShowFilter::Microphone;
        auto flasher = ww::FlashingIconIndicator::create(&state, &factory, &scheduler, options);

        state.camera = true;
        flasher->update(std::nullopt);
        QVERIFY(!flasher->isVisible());

        state.mic = true;
        flasher->update(std::nullopt);
        QVERIFY(flasher->isVisible());
    }

    void muteHidesUntilUnmute()
    {
        FakeUsageState state;
        FakeSurfaceFactory factory;
        FakeScheduler scheduler;
        auto flasher = ww::FlashingIconIndicator::create(&state, &factory, &scheduler);
        state.camera = true;
        flasher->update(std::nullopt);

        flasher->mute();
        QVERIFY(flasher->isMuted());
        QVERIFY(!flasher->isVisible());

        flasher->update(std::nullopt);
        QVERIFY(!flasher->isVisible());

        flasher->unmute();
        QVERIFY(!flasher->isMuted());
        QVERIFY(flasher->isVisible());
    }

    void refreshReplacesWithoutChangingVisibility()
    {
        FakeUsageState state;
        FakeSurfaceFactory factory;
        FakeScheduler scheduler;
        auto flasher = ww::FlashingIconIndicator::create(&state, &factory, &scheduler);

        factory.frame = QRect(0, 0, 1280, 720);
        flasher->refresh();
        QCOMPARE(factory.lastSurface->geometry, QRect(1220, 20, 50, 50));
        QVERIFY(!flasher->isVisible());

        state.camera = true;
        flasher->update(std::nullopt);
        factory.frame = QRect(0, 0, 2560, 1440);
        flasher->refresh();
        QVERIFY(flasher->isVisible());
        QCOMPARE(factory.lastSurface->geometry, QRect(2500, 20, 50, 50));
    }

    void destroyReleasesSurface()
    {
        FakeUsageState state;
        FakeSurfaceFactory factory;
        FakeScheduler scheduler;
        auto flasher = ww::FlashingIconIndicator::create(&state, &factory, &scheduler);
        auto surface = factory.lastSurface;
        state.camera = true;
        flasher->update(std::nullopt);

        flasher->destroy();
        QVERIFY(surface->destroyed);
        QCOMPARE(scheduler.activeCount(), 0);

        // Inert afterwards.
        flasher->update(std::nullopt);
        flasher->refresh();
        flasher->show();
        QVERIFY(!flasher->isVisible());
    }
};

QTEST_MAIN(TestFlashingIconIndicator)
#include "test_flashing_icon_indicator.moc"
