#include "core/commands/StatusQuery.hpp"
#include "core/backend/ISmartCastClient.hpp"
#include "core/commands/CommandExecutor.hpp"
#include <boost/log/trivial.hpp>
#include <functional>

namespace scr {

namespace {

struct StatusField {
    StatusKind kind;
    const char* name;
    std::function<QVariant(ISmartCastClient&)> read;
};

const QList<StatusField>& fields()
{
    static const QList<StatusField> list = {
        {StatusKind::Power,    "Power",    [](ISmartCastClient& c) { return c.powerState(); }},
        {StatusKind::Volume,   "Volume",   [](ISmartCastClient& c) { return c.currentVolume(); }},
        {StatusKind::Input,    "Input",    [](ISmartCastClient& c) { return c.currentInput(); }},
        {StatusKind::App,      "App",      [](ISmartCastClient& c) { return c.currentApp(); }},
        {StatusKind::Charging, "Charging", [](ISmartCastClient& c) { return c.chargingStatus(); }},
        {StatusKind::Battery,  "Battery",  [](ISmartCastClient& c) { return c.batteryLevel(); }},
        {StatusKind::Version,  "Version",  [](ISmartCastClient& c) { return QVariant(c.version()); }},
        {StatusKind::Esn,      "ESN",      [](ISmartCastClient& c) { return QVariant(c.esn()); }},
        {StatusKind::Serial,   "Serial",   [](ISmartCastClient& c) { return QVariant(c.serialNumber()); }},
    };
    return list;
}

} // namespace

QStringList StatusQuery::kindNames()
{
    QStringList names{QStringLiteral("All")};
    for (const auto& f : fields())
        names.append(QString::fromLatin1(f.name));
    return names;
}

bool StatusQuery::kindFromName(const QString& name, StatusKind* out)
{
    if (name.compare("All", Qt::CaseInsensitive) == 0) {
        *out = StatusKind::All;
        return true;
    }
    for (const auto& f : fields()) {
        if (name.compare(QString::fromLatin1(f.name), Qt::CaseInsensitive) == 0) {
            *out = f.kind;
            return true;
        }
    }
    return false;
}

OpResult StatusQuery::query(ISmartCastClient* client, StatusKind kind, QStringList* lines)
{
    if (!client)
        return OpResult::failure(ErrorKind::Validation, "No device connected");

    QStringList out;
    for (const auto& f : fields()) {
        if (kind != StatusKind::All && kind != f.kind)
            continue;
        try {
            out.append(QString("%1: %2").arg(QString::fromLatin1(f.name),
                                             CommandExecutor::formatValue(f.read(*client))));
        } catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(warning) << "[StatusQuery] " << f.name << " failed: " << e.what();
            return OpResult::failure(ErrorKind::Transport,
                                     QString("Status Error: %1").arg(QString::fromUtf8(e.what())));
        }
    }

    if (lines)
        *lines = out;
    return OpResult::success(out.join('\n'));
}

} // namespace scr
