#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QMetaType>
#include <QString>
#include <QStringList>
#include "core/devices/FavoritesList.hpp"

namespace scr {

enum class DeviceClass {
    Tv,
    Speaker,
    Crave360
};

QString deviceClassToString(DeviceClass deviceClass);

/// Parses "tv", "speaker" or "crave360". Unknown values give Tv and set *ok to false.
DeviceClass deviceClassFromString(const QString& text, bool* ok = nullptr);

QStringList deviceClassNames();

/// "host:port" when a port is known, otherwise just the host.
QString hostWithPort(const QString& host, int port);

/// Best-effort identity, fetched once when a device is saved.
struct DeviceIdentity {
    QString serialNumber;
    QString esn;
    QString version;

    bool isEmpty() const { return serialNumber.isEmpty() && esn.isEmpty() && version.isEmpty(); }
    bool operator==(const DeviceIdentity& o) const
    {
        return serialNumber == o.serialNumber && esn == o.esn && version == o.version;
    }
};

/// Candidate from one discovery run. Never persisted.
struct DiscoveredDevice {
    QString name;
    QString ip;
    int port = 0;       // 0 = not reported
    QString udn;        // only when the transport supplies one
    QString authToken;  // rare; probe, never assume

    QString address() const { return hostWithPort(ip, port); }
    bool sameEndpoint(const DiscoveredDevice& o) const { return ip == o.ip && port == o.port; }
};

/// A saved, addressable device. (host, port) is its identity in the registry.
struct DeviceRecord {
    QString name;
    QString host;
    int port = 0;  // 0 = absent, stored as JSON null
    DeviceClass deviceClass = DeviceClass::Tv;
    QString authToken;
    DeviceIdentity identity;
    QString externalId;
    QDateTime savedAt;
    FavoritesList favorites;

    QString address() const { return hostWithPort(host, port); }
    bool matches(const QString& otherHost, int otherPort) const
    {
        return host == otherHost && port == otherPort;
    }
    QString displayName() const { return QString("%1 (%2)").arg(name, host); }

    QJsonObject toJson() const;
    static DeviceRecord fromJson(const QJsonObject& obj);

    bool operator==(const DeviceRecord& o) const;
    bool operator!=(const DeviceRecord& o) const { return !(*this == o); }
};

} // namespace scr

Q_DECLARE_METATYPE(scr::DiscoveredDevice)
