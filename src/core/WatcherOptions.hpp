#pragma once

#include <QString>

namespace ww {

/// How device usage events are obtained for a device class.
enum class SignalSourceKind {
    Inotify,   // pushed open/close notifications on device nodes
    Poll       // periodic snapshot diff
};

/// Options recognised by WatcherWatcher::configure().
struct WatcherOptions {
    bool monitorCameras = true;
    bool monitorMics = true;

    /// Treat the microphone as unused while the external app reports itself
    /// muted. Only consulted while the app is running.
    bool honorExternalAppMute = true;

    /// Delay before a camera-off transition is believed. 0 disables.
    double cameraOffDebounceSeconds = 5.0;

    double appMutePollIntervalSeconds = 5.0;
    QString externalAppName = QStringLiteral("zoom");

    SignalSourceKind cameraSource = SignalSourceKind::Inotify;
    SignalSourceKind microphoneSource = SignalSourceKind::Poll;
    double devicePollIntervalSeconds = 1.0;
};

} // namespace ww
