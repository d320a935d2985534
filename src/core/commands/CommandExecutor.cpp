#include "core/commands/CommandExecutor.hpp"
#include "core/backend/ISmartCastClient.hpp"
#include <boost/log/trivial.hpp>

namespace scr {

QVariant CommandExecutor::invoke(ISmartCastClient& client, const Command& cmd)
{
    const QVariantList& a = cmd.args;
    switch (cmd.id) {
    case CommandId::PowerOn:           return client.powerOn();
    case CommandId::PowerOff:          return client.powerOff();
    case CommandId::PowerToggle:       return client.powerToggle();
    case CommandId::VolumeUp:          return client.volumeUp(a.value(0, 1).toInt());
    case CommandId::VolumeDown:        return client.volumeDown(a.value(0, 1).toInt());
    case CommandId::ChannelUp:         return client.channelUp(a.value(0, 1).toInt());
    case CommandId::ChannelDown:       return client.channelDown(a.value(0, 1).toInt());
    case CommandId::ChannelPrevious:   return client.channelPrevious();
    case CommandId::MuteOn:            return client.muteOn();
    case CommandId::MuteOff:           return client.muteOff();
    case CommandId::MuteToggle:        return client.muteToggle();
    case CommandId::Play:              return client.play();
    case CommandId::Pause:             return client.pause();
    case CommandId::NextInput:         return client.nextInput();
    case CommandId::SetInput:          return client.setInput(a.value(0).toString());
    case CommandId::LaunchApp:         return client.launchApp(a.value(0).toString());
    case CommandId::LaunchAppConfig:
        return client.launchAppConfig(a.value(0).toString(), a.value(1).toInt(), a.value(2).toString());
    case CommandId::RemoteKey:         return client.remoteKey(a.value(0).toString());
    case CommandId::SetAudioSetting:   return client.setAudioSetting(a.value(0).toString(), a.value(1).toInt());
    case CommandId::GetPowerState:     return client.powerState();
    case CommandId::GetCurrentVolume:  return client.currentVolume();
    case CommandId::GetCurrentInput:   return client.currentInput();
    case CommandId::GetCurrentApp:     return client.currentApp();
    case CommandId::GetChargingStatus: return client.chargingStatus();
    case CommandId::GetBatteryLevel:   return client.batteryLevel();
    case CommandId::GetVersion:        return client.version();
    case CommandId::GetEsn:            return client.esn();
    case CommandId::GetSerialNumber:   return client.serialNumber();
    case CommandId::GetInputsList:     return client.inputsList();
    }
    return {};
}

OpResult CommandExecutor::execute(ISmartCastClient* client, const Command& cmd)
{
    if (!client)
        return OpResult::failure(ErrorKind::Validation, "No device connected");

    try {
        QVariant result = invoke(*client, cmd);
        return OpResult::success(QString("> %1 -> %2").arg(cmd.display(), formatValue(result)));
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(warning) << "[CommandExecutor] " << cmd.name.toStdString()
                                   << " failed: " << e.what();
        return OpResult::failure(ErrorKind::Transport,
                                 QString("%1 failed: %2").arg(cmd.name, QString::fromUtf8(e.what())));
    }
}

QString CommandExecutor::formatValue(const QVariant& value)
{
    if (!value.isValid() || value.isNull())
        return QStringLiteral("None");
    if (value.typeId() == QMetaType::Bool)
        return value.toBool() ? QStringLiteral("True") : QStringLiteral("False");
    if (value.typeId() == QMetaType::QStringList)
        return value.toStringList().join(", ");
    return value.toString();
}

} // namespace scr
