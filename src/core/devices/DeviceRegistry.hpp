#pragma once

#include <QObject>
#include <QList>
#include "core/OpResult.hpp"
#include "core/devices/DeviceRecord.hpp"
#include "core/devices/DeviceStore.hpp"

namespace scr {

/// Saved devices, keyed by (host, port). Owned and mutated by the UI thread only.
///
/// Each mutation is saved in full and then re-read from disk so callers always
/// see the round-tripped state. If the write fails the in-memory list is kept
/// as is and the failure is returned.
class DeviceRegistry : public QObject {
    Q_OBJECT
public:
    explicit DeviceRegistry(const QString& storePath, QObject* parent = nullptr);

    /// Replaces the in-memory list with the store's contents. Never fails.
    void load();
    OpResult save();

    OpResult upsert(const DeviceRecord& record);
    OpResult remove(const QString& host, int port);
    OpResult setFavorites(const QString& host, int port, const FavoritesList& favorites);

    QList<DeviceRecord> devices() const { return devices_; }
    int count() const { return devices_.size(); }
    int indexOf(const QString& host, int port) const;
    DeviceRecord at(int index) const { return devices_.value(index); }
    QString storePath() const { return store_.filePath(); }

signals:
    void devicesChanged();

private:
    OpResult commit(const QString& successMessage);

    DeviceStore store_;
    QList<DeviceRecord> devices_;
};

} // namespace scr
