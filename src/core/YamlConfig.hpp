#pragma once

#include "core/WatcherOptions.hpp"
#include "core/indicators/FlashingIconIndicator.hpp"
#include "core/indicators/MenuBarIndicator.hpp"
#include "core/indicators/ScreenBorderIndicator.hpp"
#include <QList>
#include <QString>
#include <yaml-cpp/yaml.h>

namespace ww {

/// Read-only YAML configuration. Built-in defaults are merged with the
/// user file; typed accessors clamp out-of-range values back to defaults.
class YamlConfig {
public:
    YamlConfig();

    /// Load and merge a config file. On a missing, unreadable or malformed
    /// file the defaults stay in place and false is returned.
    bool load(const QString& filePath);

    /// $XDG_CONFIG_HOME/watcherwatcher/config.yaml, or ~/.config/... if unset.
    static QString defaultPath();

    // Logging
    QString logLevel() const;

    // Monitoring
    bool monitorCameras() const;
    bool monitorMicrophones() const;
    bool honorExternalAppMute() const;
    double cameraOffDebounceSeconds() const;
    SignalSourceKind cameraSource() const;
    SignalSourceKind microphoneSource() const;
    double devicePollIntervalSeconds() const;

    // External app
    QString externalAppName() const;
    double externalAppPollIntervalSeconds() const;

    WatcherOptions watcherOptions() const;

    // Indicators
    bool menuBarEnabled() const;
    MenuBarOptions menuBarOptions() const;
    bool screenBorderEnabled() const;
    ScreenBorderOptions screenBorderOptions() const;
    QList<FlasherOptions> flasherOptions() const;

private:
    YAML::Node root_;

    void initDefaults();
    SignalSourceKind sourceKind(const char* key, SignalSourceKind fallback) const;
    double positiveSeconds(const YAML::Node& node, double fallback, const char* key) const;
};

/// Parse "camera", "microphone"/"mic" or "any"; unknown values fall back to CameraOrMic.
ShowFilter parseShowFilter(const QString& value);

} // namespace ww
