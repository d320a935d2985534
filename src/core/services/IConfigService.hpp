#pragma once

#include <QString>
#include <QVariant>

namespace scr {

class IConfigService {
public:
    virtual ~IConfigService() = default;

    /// Read a config value by dot-notation key (e.g., "discovery.timeout_s").
    /// Returns invalid QVariant if key not found.
    virtual QVariant value(const QString& key) const = 0;

    /// Write a config value. Unknown keys are rejected (returns false).
    /// Must be called from the main thread (single-writer rule).
    virtual bool setValue(const QString& key, const QVariant& value) = 0;

    /// Flush config to disk.
    virtual bool save() = 0;
};

} // namespace scr
