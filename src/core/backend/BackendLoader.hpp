#pragma once

#include <QString>

namespace scr {

class ISmartCastBackend;

/// Thin wrapper around QPluginLoader for the device-control backend .so.
class BackendLoader {
public:
    /// Returns nullptr (and logs why) when the file is missing or is not a backend.
    /// Caller does NOT own the returned pointer (QPluginLoader manages it).
    static ISmartCastBackend* load(const QString& soPath);
};

} // namespace scr
