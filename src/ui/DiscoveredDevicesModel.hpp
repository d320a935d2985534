#pragma once

#include <QAbstractListModel>
#include <QList>
#include "core/devices/DeviceRecord.hpp"

namespace scr {

/// Devices seen by the most recent discovery run. Never persisted.
class DiscoveredDevicesModel : public QAbstractListModel {
    Q_OBJECT
    Q_PROPERTY(int count READ rowCount NOTIFY countChanged)

public:
    enum Roles {
        NameRole = Qt::UserRole + 1,
        AddressRole,
        UdnRole
    };

    explicit DiscoveredDevicesModel(QObject* parent = nullptr);

    int rowCount(const QModelIndex& parent = {}) const override;
    QVariant data(const QModelIndex& index, int role) const override;
    QHash<int, QByteArray> roleNames() const override;

    void setDevices(const QList<DiscoveredDevice>& devices);
    DiscoveredDevice deviceAt(int row) const { return devices_.value(row); }

signals:
    void countChanged();

private:
    QList<DiscoveredDevice> devices_;
};

} // namespace scr
