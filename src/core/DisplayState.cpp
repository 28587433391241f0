#include "core/DisplayState.hpp"

namespace ww {

DisplayState computeDisplayState(bool cameraInUse, bool micInUse, bool userMuted)
{
    const bool anything = cameraInUse || micInUse;

    if (userMuted)
        return anything ? DisplayState::SuppressedActive : DisplayState::SuppressedIdle;

    if (cameraInUse && micInUse)
        return DisplayState::BothActive;
    if (cameraInUse)
        return DisplayState::CameraActive;
    if (micInUse)
        return DisplayState::MicActive;
    return DisplayState::Idle;
}

const char* displayStateName(DisplayState state)
{
    switch (state) {
    case DisplayState::Idle: return "Idle";
    case DisplayState::CameraActive: return "CameraActive";
    case DisplayState::MicActive: return "MicActive";
    case DisplayState::BothActive: return "BothActive";
    case DisplayState::SuppressedActive: return "SuppressedActive";
    case DisplayState::SuppressedIdle: return "SuppressedIdle";
    }
    return "Unknown";
}

bool isActive(DisplayState state)
{
    return state == DisplayState::CameraActive
        || state == DisplayState::MicActive
        || state == DisplayState::BothActive
        || state == DisplayState::SuppressedActive;
}

bool isSuppressed(DisplayState state)
{
    return state == DisplayState::SuppressedActive
        || state == DisplayState::SuppressedIdle;
}

} // namespace ww
