#include "ui/DiscoveredDevicesModel.hpp"

namespace scr {

DiscoveredDevicesModel::DiscoveredDevicesModel(QObject* parent)
    : QAbstractListModel(parent)
{
}

int DiscoveredDevicesModel::rowCount(const QModelIndex& parent) const
{
    if (parent.isValid())
        return 0;
    return devices_.size();
}

QVariant DiscoveredDevicesModel::data(const QModelIndex& index, int role) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= devices_.size())
        return {};

    const auto& dev = devices_[index.row()];
    switch (role) {
    case NameRole:
        return dev.name;
    case AddressRole:
        return dev.address();
    case UdnRole:
        return dev.udn;
    case Qt::DisplayRole:
        return QString("%1 @ %2").arg(dev.name, dev.address());
    default:
        return {};
    }
}

QHash<int, QByteArray> DiscoveredDevicesModel::roleNames() const
{
    return {
        {NameRole, "name"},
        {AddressRole, "address"},
        {UdnRole, "udn"},
    };
}

void DiscoveredDevicesModel::setDevices(const QList<DiscoveredDevice>& devices)
{
    beginResetModel();
    devices_ = devices;
    endResetModel();
    emit countChanged();
}

} // namespace scr
