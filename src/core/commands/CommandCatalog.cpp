#include "core/commands/CommandCatalog.hpp"
#include <QRegularExpression>
#include <algorithm>

namespace scr {

static ArgSpec steps()
{
    return {QStringLiteral("steps"), ArgType::Int, true, 1};
}

static ArgSpec required(const QString& name, ArgType type)
{
    return {name, type, false, 0};
}

const QList<CommandSpec>& CommandCatalog::all()
{
    static const QList<CommandSpec> specs = {
        {CommandId::PowerOn, "pow_on", {}},
        {CommandId::PowerOff, "pow_off", {}},
        {CommandId::PowerToggle, "pow_toggle", {}},
        {CommandId::VolumeUp, "vol_up", {steps()}},
        {CommandId::VolumeDown, "vol_down", {steps()}},
        {CommandId::ChannelUp, "ch_up", {steps()}},
        {CommandId::ChannelDown, "ch_down", {steps()}},
        {CommandId::ChannelPrevious, "ch_prev", {}},
        {CommandId::MuteOn, "mute_on", {}},
        {CommandId::MuteOff, "mute_off", {}},
        {CommandId::MuteToggle, "mute_toggle", {}},
        {CommandId::Play, "play", {}},
        {CommandId::Pause, "pause", {}},
        {CommandId::NextInput, "input_next", {}},
        {CommandId::SetInput, "set_input", {required("name", ArgType::Text)}},
        {CommandId::LaunchApp, "launch_app", {required("app", ArgType::Text)}},
        {CommandId::LaunchAppConfig, "launch_app_config",
         {required("app_id", ArgType::Word), required("namespace", ArgType::Int),
          required("message", ArgType::Text)}},
        {CommandId::RemoteKey, "remote", {required("key", ArgType::Word)}},
        {CommandId::SetAudioSetting, "set_audio_setting",
         {required("setting", ArgType::Word), required("value", ArgType::Int)}},
        {CommandId::GetPowerState, "get_power_state", {}},
        {CommandId::GetCurrentVolume, "get_current_volume", {}},
        {CommandId::GetCurrentInput, "get_current_input", {}},
        {CommandId::GetCurrentApp, "get_current_app", {}},
        {CommandId::GetChargingStatus, "get_charging_status", {}},
        {CommandId::GetBatteryLevel, "get_battery_level", {}},
        {CommandId::GetVersion, "get_version", {}},
        {CommandId::GetEsn, "get_esn", {}},
        {CommandId::GetSerialNumber, "get_serial_number", {}},
        {CommandId::GetInputsList, "get_inputs_list", {}},
    };
    return specs;
}

const CommandSpec* CommandCatalog::find(const QString& name)
{
    const auto& specs = all();
    auto it = std::find_if(specs.begin(), specs.end(),
                           [&name](const CommandSpec& s) { return s.name == name; });
    return it == specs.end() ? nullptr : &(*it);
}

const CommandSpec* CommandCatalog::find(CommandId id)
{
    const auto& specs = all();
    auto it = std::find_if(specs.begin(), specs.end(),
                           [id](const CommandSpec& s) { return s.id == id; });
    return it == specs.end() ? nullptr : &(*it);
}

QStringList CommandCatalog::names()
{
    QStringList result;
    for (const auto& s : all())
        result.append(s.name);
    result.sort();
    return result;
}

QString CommandSpec::usage() const
{
    QStringList parts{name};
    for (const auto& a : args)
        parts.append(a.optional ? QString("[%1]").arg(a.name) : QString("<%1>").arg(a.name));
    return parts.join(' ');
}

QString Command::display() const
{
    QStringList parts{name};
    for (const auto& a : args)
        parts.append(a.toString());
    return parts.join(' ');
}

OpResult CommandCatalog::parse(const QString& name, const QString& argsText, Command* out)
{
    static const QRegularExpression ws(QStringLiteral("\\s+"));
    QStringList tokens = argsText.trimmed().split(ws, Qt::SkipEmptyParts);

    QString commandName = name.trimmed();
    if (commandName.isEmpty()) {
        if (tokens.isEmpty())
            return OpResult::failure(ErrorKind::Validation, "Enter a command");
        commandName = tokens.takeFirst();
    }

    const CommandSpec* spec = find(commandName);
    if (!spec)
        return OpResult::failure(ErrorKind::Validation, QString("Unknown command: %1").arg(commandName));

    Command cmd;
    cmd.id = spec->id;
    cmd.name = spec->name;

    for (const auto& arg : spec->args) {
        if (tokens.isEmpty()) {
            if (!arg.optional) {
                return OpResult::failure(ErrorKind::Validation,
                                         QString("Missing argument '%1' (usage: %2)")
                                             .arg(arg.name, spec->usage()));
            }
            cmd.args.append(arg.defaultValue);
            continue;
        }

        if (arg.type == ArgType::Text) {
            cmd.args.append(tokens.join(' '));
            tokens.clear();
            continue;
        }

        QString token = tokens.takeFirst();
        if (arg.type == ArgType::Int) {
            bool ok = false;
            int value = token.toInt(&ok);
            if (!ok) {
                return OpResult::failure(ErrorKind::Validation,
                                         QString("Argument '%1' must be an integer, got '%2'")
                                             .arg(arg.name, token));
            }
            cmd.args.append(value);
        } else {
            cmd.args.append(token);
        }
    }

    if (!tokens.isEmpty()) {
        return OpResult::failure(ErrorKind::Validation,
                                 QString("Too many arguments (usage: %1)").arg(spec->usage()));
    }

    if (out)
        *out = cmd;
    return OpResult::success();
}

} // namespace scr
