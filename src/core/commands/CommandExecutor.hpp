#pragma once

#include <QVariant>
#include "core/OpResult.hpp"
#include "core/commands/CommandCatalog.hpp"

namespace scr {

class ISmartCastClient;

class CommandExecutor {
public:
    /// Calls the typed client method for `cmd`. Exceptions from the client propagate.
    static QVariant invoke(ISmartCastClient& client, const Command& cmd);

    /// invoke() plus error conversion. Success message is "> <command> -> <result>".
    static OpResult execute(ISmartCastClient* client, const Command& cmd);

    static QString formatValue(const QVariant& value);
};

} // namespace scr
