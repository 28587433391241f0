#pragma once

#include <QRect>
#include <QString>

namespace ww {

/// Placement relative to the primary screen. Negative x or y are offsets
/// from the right or bottom edge.
struct IndicatorGeometry {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
};

/// Which usage an indicator reacts to.
enum class ShowFilter {
    CameraOrMic,
    Camera,
    Microphone
};

class IUsageStateSource;

/// Shared indicator bookkeeping, composed by every variant: the muted flag,
/// the destroyed flag, geometry placement and the show filter.
class IndicatorBehavior {
public:
    explicit IndicatorBehavior(const QString& name);

    const QString& name() const { return name_; }

    bool isMuted() const { return muted_; }
    void setMuted(bool muted) { muted_ = muted; }

    bool isDestroyed() const { return destroyed_; }
    void markDestroyed() { destroyed_ = true; }

    /// True if the indicator should be visible for the current usage,
    /// ignoring mute.
    static bool wantsVisible(ShowFilter filter, const IUsageStateSource& source);

    /// Resolve geometry against the screen frame.
    static QRect place(const IndicatorGeometry& geometry, const QRect& screenFrame);

private:
    QString name_;
    bool muted_ = false;
    bool destroyed_ = false;
};

const char* showFilterName(ShowFilter filter);

} // namespace ww
