#pragma once

#include <QMetaType>

namespace ww {

/// Canonical combined usage state consumed by every indicator.
enum class DisplayState {
    Idle,
    CameraActive,
    MicActive,
    BothActive,
    SuppressedActive,   // user muted, camera and/or mic in use
    SuppressedIdle      // user muted, nothing in use
};

/// Pure mapping of the three raw inputs to a DisplayState.
/// Suppression is all-or-nothing: any activity while muted is SuppressedActive.
DisplayState computeDisplayState(bool cameraInUse, bool micInUse, bool userMuted);

const char* displayStateName(DisplayState state);

/// True for CameraActive, MicActive, BothActive and SuppressedActive.
bool isActive(DisplayState state);

bool isSuppressed(DisplayState state);

} // namespace ww

Q_DECLARE_METATYPE(ww::DisplayState)
