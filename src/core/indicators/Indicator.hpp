#pragma once

#include "core/devices/DeviceHandle.hpp"
#include <QString>

namespace ww {

/// A visual element driven by the aggregated usage state.
///
/// Per instance there is a Hidden/Visible state and an orthogonal muted flag
/// which forces the non-active presentation until unmute(). show() and hide()
/// are idempotent. Errors may be thrown from any operation; the registry
/// contains them.
class Indicator {
public:
    virtual ~Indicator() = default;

    /// Used in log messages.
    virtual QString name() const = 0;

    /// Pull the current display state and decide visibility and appearance.
    virtual void update(const Instigator& instigator) = 0;

    /// Recompute screen placement after a display configuration change.
    /// Never changes visibility.
    virtual void refresh() = 0;

    virtual void mute() = 0;

    /// Clear the muted flag and re-evaluate.
    virtual void unmute() = 0;

    virtual void show() = 0;
    virtual void hide() = 0;

    /// Release on-screen resources. The indicator is inert afterwards.
    virtual void destroy() = 0;

    virtual bool isVisible() const = 0;
    virtual bool isMuted() const = 0;
};

} // namespace ww
