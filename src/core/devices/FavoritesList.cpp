#include "core/devices/FavoritesList.hpp"

namespace scr {

FavoritesList FavoritesList::fromStringList(const QStringList& names)
{
    FavoritesList list;
    for (const auto& name : names) {
        if (list.isFull())
            break;
        if (name.isEmpty() || list.contains(name))
            continue;
        list.names_.append(name);
    }
    return list;
}

OpResult FavoritesList::add(const QString& appName)
{
    if (appName.isEmpty())
        return OpResult::failure(ErrorKind::Validation, "No app selected to add to favorites");
    if (names_.contains(appName))
        return OpResult::failure(ErrorKind::Validation,
                                 QString("App '%1' already in favorites").arg(appName));
    if (isFull())
        return OpResult::failure(ErrorKind::Validation,
                                 QString("Favorites full (%1). Remove one before adding").arg(kCapacity));

    names_.append(appName);
    return OpResult::success(QString("Added '%1' to favorites").arg(appName));
}

OpResult FavoritesList::remove(const QString& appName)
{
    if (!names_.removeOne(appName))
        return OpResult::failure(ErrorKind::Validation,
                                 QString("App '%1' is not a favorite").arg(appName));
    return OpResult::success(QString("Removed '%1' from favorites").arg(appName));
}

QString FavoritesList::activate(int index) const
{
    if (index < 0 || index >= names_.size())
        return {};
    return names_.at(index);
}

} // namespace scr
