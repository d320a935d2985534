#pragma once

#include <QList>
#include <QString>
#include <QStringList>
#include <QVariantList>
#include "core/OpResult.hpp"

namespace scr {

/// Every command the generic executor accepts. Anything else is rejected
/// by CommandCatalog::parse().
enum class CommandId {
    PowerOn,
    PowerOff,
    PowerToggle,
    VolumeUp,
    VolumeDown,
    ChannelUp,
    ChannelDown,
    ChannelPrevious,
    MuteOn,
    MuteOff,
    MuteToggle,
    Play,
    Pause,
    NextInput,
    SetInput,
    LaunchApp,
    LaunchAppConfig,
    RemoteKey,
    SetAudioSetting,
    GetPowerState,
    GetCurrentVolume,
    GetCurrentInput,
    GetCurrentApp,
    GetChargingStatus,
    GetBatteryLevel,
    GetVersion,
    GetEsn,
    GetSerialNumber,
    GetInputsList
};

enum class ArgType {
    Int,
    Word,  // one whitespace-free token
    Text   // rest of the line, must be last
};

struct ArgSpec {
    QString name;
    ArgType type = ArgType::Word;
    bool optional = false;
    int defaultValue = 0;  // for optional Int args
};

struct CommandSpec {
    CommandId id;
    QString name;
    QList<ArgSpec> args;

    QString usage() const;
};

/// A validated command: id plus arguments already converted to their
/// declared types (int for Int, QString otherwise).
struct Command {
    CommandId id = CommandId::PowerToggle;
    QString name;
    QVariantList args;

    QString display() const;
};

class CommandCatalog {
public:
    static const QList<CommandSpec>& all();
    static const CommandSpec* find(const QString& name);
    static const CommandSpec* find(CommandId id);
    static QStringList names();

    /// Validates a command line. With `name` empty, the first token of
    /// `argsText` is the command name. On success fills `out`.
    static OpResult parse(const QString& name, const QString& argsText, Command* out);
};

} // namespace scr
