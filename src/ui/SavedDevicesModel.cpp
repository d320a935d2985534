#include "ui/SavedDevicesModel.hpp"

namespace scr {

SavedDevicesModel::SavedDevicesModel(QObject* parent)
    : QAbstractListModel(parent)
{
}

int SavedDevicesModel::rowCount(const QModelIndex& parent) const
{
    if (parent.isValid())
        return 0;
    return devices_.size();
}

QVariant SavedDevicesModel::data(const QModelIndex& index, int role) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= devices_.size())
        return {};

    const auto& dev = devices_[index.row()];
    switch (role) {
    case NameRole:
        return dev.name;
    case AddressRole:
        return dev.address();
    case LabelRole:
    case Qt::DisplayRole:
        return dev.displayName();
    case DeviceTypeRole:
        return deviceClassToString(dev.deviceClass);
    case HasAuthRole:
        return !dev.authToken.isEmpty();
    case FavoriteCountRole:
        return dev.favorites.size();
    case SavedAtRole:
        return dev.savedAt;
    default:
        return {};
    }
}

QHash<int, QByteArray> SavedDevicesModel::roleNames() const
{
    return {
        {NameRole, "name"},
        {AddressRole, "address"},
        {LabelRole, "label"},
        {DeviceTypeRole, "deviceType"},
        {HasAuthRole, "hasAuth"},
        {FavoriteCountRole, "favoriteCount"},
        {SavedAtRole, "savedAt"},
    };
}

void SavedDevicesModel::setDevices(const QList<DeviceRecord>& devices)
{
    beginResetModel();
    devices_ = devices;
    endResetModel();
    emit countChanged();
}

} // namespace scr
