#include "core/devices/DeviceRecord.hpp"
#include <QJsonArray>
#include <QJsonValue>
#include <boost/log/trivial.hpp>

namespace scr {

QString deviceClassToString(DeviceClass deviceClass)
{
    switch (deviceClass) {
    case DeviceClass::Tv:       return QStringLiteral("tv");
    case DeviceClass::Speaker:  return QStringLiteral("speaker");
    case DeviceClass::Crave360: return QStringLiteral("crave360");
    }
    return QStringLiteral("tv");
}

DeviceClass deviceClassFromString(const QString& text, bool* ok)
{
    const QString t = text.trimmed().toLower();
    if (ok) *ok = true;
    if (t == "tv") return DeviceClass::Tv;
    if (t == "speaker") return DeviceClass::Speaker;
    if (t == "crave360") return DeviceClass::Crave360;
    if (ok) *ok = false;
    return DeviceClass::Tv;
}

QStringList deviceClassNames()
{
    return {"tv", "speaker", "crave360"};
}

QString hostWithPort(const QString& host, int port)
{
    if (port > 0)
        return QString("%1:%2").arg(host).arg(port);
    return host;
}

static int portFromJson(const QJsonValue& value)
{
    if (value.isDouble())
        return value.toInt();
    if (value.isString())
        return value.toString().toInt();  // 0 when not numeric
    return 0;
}

static QDateTime timestampFromJson(const QString& text)
{
    if (text.isEmpty())
        return {};
    QDateTime dt = QDateTime::fromString(text, Qt::ISODateWithMs);
    // Stored timestamps are UTC even when written without a zone designator
    if (dt.isValid() && dt.timeSpec() == Qt::LocalTime)
        dt.setTimeSpec(Qt::UTC);
    return dt;
}

QJsonObject DeviceRecord::toJson() const
{
    QJsonObject obj;
    obj["name"] = name;
    obj["ip"] = host;
    obj["port"] = port > 0 ? QJsonValue(port) : QJsonValue(QJsonValue::Null);
    obj["device_type"] = deviceClassToString(deviceClass);
    obj["auth_token"] = authToken;
    obj["saved_at"] = savedAt.isValid() ? savedAt.toUTC().toString(Qt::ISODateWithMs) : QString();
    obj["favorites"] = QJsonArray::fromStringList(favorites.names());

    if (!identity.serialNumber.isEmpty()) obj["serial_number"] = identity.serialNumber;
    if (!identity.esn.isEmpty()) obj["esn"] = identity.esn;
    if (!identity.version.isEmpty()) obj["version"] = identity.version;
    if (!externalId.isEmpty()) obj["udn"] = externalId;
    return obj;
}

DeviceRecord DeviceRecord::fromJson(const QJsonObject& obj)
{
    DeviceRecord r;
    r.name = obj.value("name").toString();
    r.host = obj.value("ip").toString();
    r.port = portFromJson(obj.value("port"));

    bool known = true;
    const QString type = obj.value("device_type").toString();
    r.deviceClass = deviceClassFromString(type, &known);
    if (!known && !type.isEmpty()) {
        BOOST_LOG_TRIVIAL(warning) << "[DeviceRecord] Unknown device_type '" << type.toStdString()
                                   << "' for " << r.host.toStdString() << ", using tv";
    }

    r.authToken = obj.value("auth_token").toString();
    r.savedAt = timestampFromJson(obj.value("saved_at").toString());

    QStringList favorites;
    for (const auto& v : obj.value("favorites").toArray())
        favorites.append(v.toString());
    r.favorites = FavoritesList::fromStringList(favorites);

    r.identity.serialNumber = obj.value("serial_number").toString();
    r.identity.esn = obj.value("esn").toString();
    r.identity.version = obj.value("version").toString();
    r.externalId = obj.value("udn").toString();
    return r;
}

bool DeviceRecord::operator==(const DeviceRecord& o) const
{
    return name == o.name
        && host == o.host
        && port == o.port
        && deviceClass == o.deviceClass
        && authToken == o.authToken
        && identity == o.identity
        && externalId == o.externalId
        && savedAt == o.savedAt
        && favorites == o.favorites;
}

} // namespace scr
