#include "core/devices/DeviceRegistry.hpp"
#include <boost/log/trivial.hpp>

namespace scr {

DeviceRegistry::DeviceRegistry(const QString& storePath, QObject* parent)
    : QObject(parent)
    , store_(storePath)
{
}

void DeviceRegistry::load()
{
    devices_ = store_.read();
    emit devicesChanged();
}

OpResult DeviceRegistry::save()
{
    return store_.write(devices_);
}

int DeviceRegistry::indexOf(const QString& host, int port) const
{
    for (int i = 0; i < devices_.size(); ++i) {
        if (devices_[i].matches(host, port))
            return i;
    }
    return -1;
}

OpResult DeviceRegistry::upsert(const DeviceRecord& record)
{
    int idx = indexOf(record.host, record.port);
    if (idx >= 0) {
        devices_[idx] = record;
        BOOST_LOG_TRIVIAL(info) << "[DeviceRegistry] Replaced " << record.address().toStdString();
    } else {
        devices_.append(record);
        BOOST_LOG_TRIVIAL(info) << "[DeviceRegistry] Added " << record.address().toStdString();
    }
    return commit("Device saved with auth info (if available)");
}

OpResult DeviceRegistry::remove(const QString& host, int port)
{
    int idx = indexOf(host, port);
    if (idx < 0)
        return OpResult::success("Saved device not found");

    devices_.removeAt(idx);
    BOOST_LOG_TRIVIAL(info) << "[DeviceRegistry] Removed " << hostWithPort(host, port).toStdString();
    return commit("Saved device removed");
}

OpResult DeviceRegistry::setFavorites(const QString& host, int port, const FavoritesList& favorites)
{
    int idx = indexOf(host, port);
    if (idx < 0) {
        return OpResult::failure(ErrorKind::Validation,
                                 QString("%1 is not a saved device").arg(hostWithPort(host, port)));
    }

    devices_[idx].favorites = favorites;
    return commit("Favorites saved");
}

OpResult DeviceRegistry::commit(const QString& successMessage)
{
    OpResult written = save();
    if (!written) {
        // In-memory state stays authoritative; do not reload the stale file
        emit devicesChanged();
        return written;
    }

    load();
    return OpResult::success(successMessage);
}

} // namespace scr
