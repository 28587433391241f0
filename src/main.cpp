#include <signal.h>
#include <QApplication>
#include <QCommandLineParser>
#include <QScreen>
#include <memory>
#include <vector>
#include <boost/log/trivial.hpp>
#include "core/Logging.hpp"
#include "core/WatcherWatcher.hpp"
#include "core/YamlConfig.hpp"
#include "core/apps/ProcAppProbe.hpp"
#include "core/devices/InotifySignalSource.hpp"
#include "core/devices/LinuxDeviceSnapshot.hpp"
#include "core/devices/PollingSignalSource.hpp"
#include "core/indicators/FlashingIconIndicator.hpp"
#include "core/indicators/MenuBarIndicator.hpp"
#include "core/indicators/ScreenBorderIndicator.hpp"
#include "core/scheduling/QtScheduler.hpp"
#include "ui/QtSurfaceFactory.hpp"

namespace {

std::unique_ptr<ww::DeviceSignalSource> makeSource(ww::SignalSourceKind sourceKind,
                                                   ww::DeviceKind deviceKind,
                                                   ww::IDeviceSnapshotProvider* snapshot,
                                                   ww::IScheduler* scheduler,
                                                   double pollIntervalSeconds)
{
    if (sourceKind == ww::SignalSourceKind::Inotify)
        return std::make_unique<ww::InotifySignalSource>(snapshot, deviceKind);
    return std::make_unique<ww::PollingSignalSource>(snapshot, scheduler, deviceKind,
                                                     pollIntervalSeconds);
}

} // namespace

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    app.setApplicationName("watcherwatcher");
    app.setApplicationVersion("0.1.0");
    app.setQuitOnLastWindowClosed(false);

    QCommandLineParser parser;
    parser.setApplicationDescription("Shows when a camera or microphone is in use");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption("config", "Read configuration from <file>.", "file");
    QCommandLineOption verboseOption("verbose", "Log at debug level.");
    parser.addOption(configOption);
    parser.addOption(verboseOption);
    parser.process(app);

    ww::YamlConfig config;
    const QString configPath = parser.isSet(configOption) ? parser.value(configOption)
                                                          : ww::YamlConfig::defaultPath();
    config.load(configPath);
    ww::initLogging(parser.isSet(verboseOption) ? QStringLiteral("debug") : config.logLevel());

    const ww::WatcherOptions options = config.watcherOptions();

    // --- Platform collaborators ---
    ww::QtScheduler scheduler;
    ww::LinuxDeviceSnapshot snapshot;
    ww::ProcAppProbe appProbe(&scheduler);
    auto cameraSource = makeSource(options.cameraSource, ww::DeviceKind::Camera,
                                   &snapshot, &scheduler, options.devicePollIntervalSeconds);
    auto micSource = makeSource(options.microphoneSource, ww::DeviceKind::Microphone,
                                &snapshot, &scheduler, options.devicePollIntervalSeconds);

    ww::WatcherWatcher::Collaborators collab;
    collab.snapshot = &snapshot;
    collab.scheduler = &scheduler;
    collab.appProbe = &appProbe;
    collab.cameraSource = cameraSource.get();
    collab.microphoneSource = micSource.get();

    ww::WatcherWatcher watcher(collab, options);

    // --- Indicators ---
    ww::QtSurfaceFactory surfaces;
    std::vector<std::unique_ptr<ww::Indicator>> indicators;
    auto add = [&](std::unique_ptr<ww::Indicator> indicator, const char* what) {
        if (!indicator) {
            BOOST_LOG_TRIVIAL(warning) << "[main] Could not create " << what << " indicator";
            return;
        }
        watcher.registerIndicator(indicator.get());
        indicators.push_back(std::move(indicator));
    };

    if (config.menuBarEnabled()) {
        add(ww::MenuBarIndicator::create(watcher.usageState(), &surfaces,
                                         [&watcher]() { watcher.toggleMute(); },
                                         config.menuBarOptions()),
            "menubar");
    }
    if (config.screenBorderEnabled()) {
        add(ww::ScreenBorderIndicator::create(watcher.usageState(), &surfaces,
                                              config.screenBorderOptions()),
            "screen border");
    }
    for (const auto& flasher : config.flasherOptions())
        add(ww::FlashingIconIndicator::create(watcher.usageState(), &surfaces, &scheduler, flasher),
            "flasher");

    // --- Screen changes re-place every overlay ---
    auto watchScreen = [&watcher](QScreen* screen) {
        QObject::connect(screen, &QScreen::geometryChanged, &watcher,
                         [&watcher]() { watcher.refreshIndicators(); });
    };
    for (QScreen* screen : QGuiApplication::screens())
        watchScreen(screen);
    QObject::connect(&app, &QGuiApplication::screenAdded, &watcher,
                     [&watcher, watchScreen](QScreen* screen) {
        watchScreen(screen);
        watcher.refreshIndicators();
    });
    QObject::connect(&app, &QGuiApplication::screenRemoved, &watcher,
                     [&watcher]() { watcher.refreshIndicators(); });
    QObject::connect(&app, &QGuiApplication::primaryScreenChanged, &watcher,
                     [&watcher]() { watcher.refreshIndicators(); });

    QObject::connect(&watcher, &ww::WatcherWatcher::displayStateChanged, &watcher,
                     [](ww::DisplayState state) {
        BOOST_LOG_TRIVIAL(info) << "[main] Display state: " << ww::displayStateName(state);
    });

    watcher.start();

    // SIGUSR1 → toggle mute (from a hotkey daemon or script)
    static ww::WatcherWatcher* g_watcher = &watcher;
    signal(SIGUSR1, [](int) {
        QMetaObject::invokeMethod(g_watcher, [](){ g_watcher->toggleMute(); },
                                   Qt::QueuedConnection);
    });

    int ret = app.exec();

    signal(SIGUSR1, SIG_DFL);
    watcher.stop();
    g_watcher = nullptr;

    return ret;
}
