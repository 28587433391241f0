#include "core/YamlConfig.hpp"
#include <QDir>
#include <QFileInfo>
#include <boost/log/trivial.hpp>

namespace ww {

namespace {

// Nested maps merge key by key. Any other value replaces the default, and
// null values leave the default alone.
void overlayInto(YAML::Node target, const YAML::Node& overlay)
{
    for (const auto& entry : overlay) {
        if (entry.second.IsNull())
            continue;
        const std::string key = entry.first.as<std::string>();
        YAML::Node current = target[key];
        if (current.IsMap() && entry.second.IsMap())
            overlayInto(current, entry.second);
        else
            target[key] = YAML::Clone(entry.second);
    }
}

} // namespace

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["logging"]["level"] = "info";

    root_["monitor"]["cameras"] = true;
    root_["monitor"]["microphones"] = true;
    root_["monitor"]["honor_external_app_mute"] = true;
    root_["monitor"]["camera_off_debounce_seconds"] = 5.0;
    root_["monitor"]["camera_source"] = "inotify";
    root_["monitor"]["microphone_source"] = "poll";
    root_["monitor"]["poll_interval_seconds"] = 1.0;

    root_["external_app"]["name"] = "zoom";
    root_["external_app"]["poll_interval_seconds"] = 5.0;

    root_["indicators"]["menubar"]["enabled"] = true;
    root_["indicators"]["menubar"]["show_when_idle"] = false;
    root_["indicators"]["screen_border"]["enabled"] = true;
    root_["indicators"]["screen_border"]["width_percent"] = 0.5;
    root_["indicators"]["screen_border"]["color"] = "#ff0000";
    root_["indicators"]["flashers"] = YAML::Node(YAML::NodeType::Sequence);
}

bool YamlConfig::load(const QString& filePath)
{
    initDefaults();
    if (!QFileInfo::exists(filePath)) {
        BOOST_LOG_TRIVIAL(info) << "[YamlConfig] No config at " << filePath.toStdString()
                                << ", using defaults";
        return false;
    }

    try {
        const YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
        if (loaded.IsNull()) {
            BOOST_LOG_TRIVIAL(info) << "[YamlConfig] " << filePath.toStdString()
                                    << " is empty, using defaults";
            return true;
        }
        if (!loaded.IsMap()) {
            BOOST_LOG_TRIVIAL(error) << "[YamlConfig] " << filePath.toStdString()
                                     << " is not a mapping, using defaults";
            return false;
        }
        overlayInto(root_, loaded);
    } catch (const YAML::Exception& e) {
        BOOST_LOG_TRIVIAL(error) << "[YamlConfig] Failed to load " << filePath.toStdString()
                                 << ": " << e.what() << ", using defaults";
        initDefaults();
        return false;
    }

    BOOST_LOG_TRIVIAL(info) << "[YamlConfig] Loaded " << filePath.toStdString();
    return true;
}

QString YamlConfig::defaultPath()
{
    QString base = qEnvironmentVariable("XDG_CONFIG_HOME");
    if (base.isEmpty())
        base = QDir::homePath() + QStringLiteral("/.config");
    return base + QStringLiteral("/watcherwatcher/config.yaml");
}

// --- Helpers ---

namespace {

template <typename T>
T scalarOr(const YAML::Node& node, const T& fallback, const char* key)
{
    try {
        return node.as<T>(fallback);
    } catch (const YAML::Exception& e) {
        BOOST_LOG_TRIVIAL(warning) << "[YamlConfig] Bad value for " << key << ": " << e.what();
        return fallback;
    }
}

QColor colorOr(const YAML::Node& node, const QColor& fallback, const char* key)
{
    QColor c(QString::fromStdString(scalarOr<std::string>(node, fallback.name().toStdString(), key)));
    if (!c.isValid()) {
        BOOST_LOG_TRIVIAL(warning) << "[YamlConfig] Invalid color for " << key << ", using "
                                   << fallback.name().toStdString();
        return fallback;
    }
    return c;
}

} // namespace

double YamlConfig::positiveSeconds(const YAML::Node& node, double fallback, const char* key) const
{
    double v = scalarOr<double>(node, fallback, key);
    if (v <= 0.0) {
        BOOST_LOG_TRIVIAL(warning) << "[YamlConfig] " << key << " must be positive, got " << v
                                   << ", using " << fallback;
        return fallback;
    }
    return v;
}

SignalSourceKind YamlConfig::sourceKind(const char* key, SignalSourceKind fallback) const
{
    const auto value = QString::fromStdString(
        scalarOr<std::string>(root_["monitor"][key], std::string(), key)).toLower();
    if (value == QLatin1String("inotify"))
        return SignalSourceKind::Inotify;
    if (value == QLatin1String("poll"))
        return SignalSourceKind::Poll;
    BOOST_LOG_TRIVIAL(warning) << "[YamlConfig] Unknown monitor." << key << " '"
                               << value.toStdString() << "'";
    return fallback;
}

ShowFilter parseShowFilter(const QString& value)
{
    const QString v = value.trimmed().toLower();
    if (v == QLatin1String("camera"))
        return ShowFilter::Camera;
    if (v == QLatin1String("microphone") || v == QLatin1String("mic"))
        return ShowFilter::Microphone;
    if (v != QLatin1String("any") && !v.isEmpty())
        BOOST_LOG_TRIVIAL(warning) << "[YamlConfig] Unknown show filter '" << v.toStdString()
                                   << "', using any";
    return ShowFilter::CameraOrMic;
}

// --- Logging ---

QString YamlConfig::logLevel() const
{
    return QString::fromStdString(scalarOr<std::string>(root_["logging"]["level"], "info", "logging.level"));
}

// --- Monitoring ---

bool YamlConfig::monitorCameras() const
{
    return scalarOr<bool>(root_["monitor"]["cameras"], true, "monitor.cameras");
}

bool YamlConfig::monitorMicrophones() const
{
    return scalarOr<bool>(root_["monitor"]["microphones"], true, "monitor.microphones");
}

bool YamlConfig::honorExternalAppMute() const
{
    return scalarOr<bool>(root_["monitor"]["honor_external_app_mute"], true,
                          "monitor.honor_external_app_mute");
}

double YamlConfig::cameraOffDebounceSeconds() const
{
    double v = scalarOr<double>(root_["monitor"]["camera_off_debounce_seconds"], 5.0,
                                "monitor.camera_off_debounce_seconds");
    if (v < 0.0) {
        BOOST_LOG_TRIVIAL(warning) << "[YamlConfig] Negative camera_off_debounce_seconds " << v
                                   << ", using 5";
        return 5.0;
    }
    return v;
}

SignalSourceKind YamlConfig::cameraSource() const
{
    return sourceKind("camera_source", SignalSourceKind::Inotify);
}

SignalSourceKind YamlConfig::microphoneSource() const
{
    return sourceKind("microphone_source", SignalSourceKind::Poll);
}

double YamlConfig::devicePollIntervalSeconds() const
{
    return positiveSeconds(root_["monitor"]["poll_interval_seconds"], 1.0,
                           "monitor.poll_interval_seconds");
}

// --- External app ---

QString YamlConfig::externalAppName() const
{
    const auto name = QString::fromStdString(
        scalarOr<std::string>(root_["external_app"]["name"], "zoom", "external_app.name")).trimmed();
    return name.isEmpty() ? QStringLiteral("zoom") : name;
}

double YamlConfig::externalAppPollIntervalSeconds() const
{
    return positiveSeconds(root_["external_app"]["poll_interval_seconds"], 5.0,
                           "external_app.poll_interval_seconds");
}

WatcherOptions YamlConfig::watcherOptions() const
{
    WatcherOptions o;
    o.monitorCameras = monitorCameras();
    o.monitorMics = monitorMicrophones();
    o.honorExternalAppMute = honorExternalAppMute();
    o.cameraOffDebounceSeconds = cameraOffDebounceSeconds();
    o.appMutePollIntervalSeconds = externalAppPollIntervalSeconds();
    o.externalAppName = externalAppName();
    o.cameraSource = cameraSource();
    o.microphoneSource = microphoneSource();
    o.devicePollIntervalSeconds = devicePollIntervalSeconds();
    return o;
}

// --- Indicators ---

bool YamlConfig::menuBarEnabled() const
{
    return scalarOr<bool>(root_["indicators"]["menubar"]["enabled"], true,
                          "indicators.menubar.enabled");
}

MenuBarOptions YamlConfig::menuBarOptions() const
{
    MenuBarOptions o;
    o.showWhenIdle = scalarOr<bool>(root_["indicators"]["menubar"]["show_when_idle"], false,
                                    "indicators.menubar.show_when_idle");
    return o;
}

bool YamlConfig::screenBorderEnabled() const
{
    return scalarOr<bool>(root_["indicators"]["screen_border"]["enabled"], true,
                          "indicators.screen_border.enabled");
}

ScreenBorderOptions YamlConfig::screenBorderOptions() const
{
    const YAML::Node node = root_["indicators"]["screen_border"];
    ScreenBorderOptions o;
    double width = scalarOr<double>(node["width_percent"], o.widthPercent,
                                    "indicators.screen_border.width_percent");
    if (width <= 0.0 || width > 50.0) {
        BOOST_LOG_TRIVIAL(warning) << "[YamlConfig] screen_border.width_percent " << width
                                   << " out of range, using " << o.widthPercent;
    } else {
        o.widthPercent = width;
    }
    o.color = colorOr(node["color"], o.color, "indicators.screen_border.color");
    return o;
}

QList<FlasherOptions> YamlConfig::flasherOptions() const
{
    QList<FlasherOptions> result;
    const YAML::Node list = root_["indicators"]["flashers"];
    if (!list.IsSequence())
        return result;

    int index = 0;
    for (const auto& node : list) {
        ++index;
        if (!node.IsMap()) {
            BOOST_LOG_TRIVIAL(warning) << "[YamlConfig] Ignoring flasher #" << index
                                       << ": not a mapping";
            continue;
        }

        FlasherOptions o;
        o.name = QString::fromStdString(scalarOr<std::string>(
            node["name"], QStringLiteral("flasher-%1").arg(index).toStdString(), "flasher.name"));
        o.showFilter = parseShowFilter(QString::fromStdString(
            scalarOr<std::string>(node["show"], "any", "flasher.show")));
        o.geometry.x = scalarOr<int>(node["x"], o.geometry.x, "flasher.x");
        o.geometry.y = scalarOr<int>(node["y"], o.geometry.y, "flasher.y");
        const int w = scalarOr<int>(node["w"], o.geometry.w, "flasher.w");
        const int h = scalarOr<int>(node["h"], o.geometry.h, "flasher.h");
        if (w > 0 && h > 0) {
            o.geometry.w = w;
            o.geometry.h = h;
        } else {
            BOOST_LOG_TRIVIAL(warning) << "[YamlConfig] Flasher " << o.name.toStdString()
                                       << " has non-positive size, using default";
        }
        o.fillColor = colorOr(node["color"], o.fillColor, "flasher.color");
        const double blink = scalarOr<double>(node["blink_interval"], o.blinkInterval,
                                              "flasher.blink_interval");
        if (blink < 0.0) {
            BOOST_LOG_TRIVIAL(warning) << "[YamlConfig] Flasher " << o.name.toStdString()
                                       << " has negative blink_interval, using "
                                       << o.blinkInterval;
        } else {
            o.blinkInterval = blink;
        }
        result.append(o);
    }
    return result;
}

} // namespace ww
