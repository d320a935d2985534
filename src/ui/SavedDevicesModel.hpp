#pragma once

#include <QAbstractListModel>
#include <QList>
#include "core/devices/DeviceRecord.hpp"

namespace scr {

class SavedDevicesModel : public QAbstractListModel {
    Q_OBJECT
    Q_PROPERTY(int count READ rowCount NOTIFY countChanged)

public:
    enum Roles {
        NameRole = Qt::UserRole + 1,
        AddressRole,
        LabelRole,
        DeviceTypeRole,
        HasAuthRole,
        FavoriteCountRole,
        SavedAtRole
    };

    explicit SavedDevicesModel(QObject* parent = nullptr);

    int rowCount(const QModelIndex& parent = {}) const override;
    QVariant data(const QModelIndex& index, int role) const override;
    QHash<int, QByteArray> roleNames() const override;

    void setDevices(const QList<DeviceRecord>& devices);
    DeviceRecord deviceAt(int row) const { return devices_.value(row); }

signals:
    void countChanged();

private:
    QList<DeviceRecord> devices_;
};

} // namespace scr
