#pragma once

#include <QString>

namespace ww {

/// Install the global Boost.Log severity filter.
/// level: trace|debug|info|warning|error. Unknown levels fall back to info.
/// Returns false if the level was not recognised.
bool initLogging(const QString& level);

} // namespace ww
