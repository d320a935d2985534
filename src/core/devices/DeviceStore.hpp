#pragma once

#include <QList>
#include <QString>
#include "core/OpResult.hpp"
#include "core/devices/DeviceRecord.hpp"

namespace scr {

/// Flat JSON file holding every saved device. Reads never fail: a missing,
/// unreadable or malformed file reads as an empty list.
class DeviceStore {
public:
    explicit DeviceStore(const QString& filePath);

    QString filePath() const { return filePath_; }

    QList<DeviceRecord> read() const;

    /// Overwrites the file with `records` (whole list, not incremental).
    OpResult write(const QList<DeviceRecord>& records) const;

private:
    QString filePath_;
};

} // namespace scr
