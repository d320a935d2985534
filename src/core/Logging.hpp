#pragma once

#include <QString>

namespace scr {

/// Sets the Boost.Log severity floor. Accepts trace, debug, info, warning,
/// error, fatal; anything else means info.
void initLogging(const QString& level);

} // namespace scr
