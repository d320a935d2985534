#pragma once

#include <QString>
#include <QStringList>
#include "core/OpResult.hpp"

namespace scr {

/// Ordered app shortcuts for one device. Never holds more than kCapacity
/// entries and never the same name twice. Order is display/activation order.
class FavoritesList {
public:
    static constexpr int kCapacity = 6;

    FavoritesList() = default;

    /// Build from persisted data. Empty names, duplicates and anything past
    /// capacity are dropped.
    static FavoritesList fromStringList(const QStringList& names);

    OpResult add(const QString& appName);
    OpResult remove(const QString& appName);

    /// App name at `index`, or an empty string when out of range.
    QString activate(int index) const;

    bool contains(const QString& appName) const { return names_.contains(appName); }
    bool isFull() const { return names_.size() >= kCapacity; }
    bool isEmpty() const { return names_.isEmpty(); }
    int size() const { return names_.size(); }
    QStringList names() const { return names_; }

    bool operator==(const FavoritesList& other) const { return names_ == other.names_; }
    bool operator!=(const FavoritesList& other) const { return names_ != other.names_; }

private:
    QStringList names_;
};

} // namespace scr
