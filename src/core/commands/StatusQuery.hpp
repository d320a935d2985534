#pragma once

#include <QStringList>
#include "core/OpResult.hpp"

namespace scr {

class ISmartCastClient;

enum class StatusKind {
    All,
    Power,
    Volume,
    Input,
    App,
    Charging,
    Battery,
    Version,
    Esn,
    Serial
};

/// Reads one status field (or all of them, in declaration order) from a
/// connected client. Output lines look like "Volume: 12".
class StatusQuery {
public:
    static QStringList kindNames();
    static bool kindFromName(const QString& name, StatusKind* out);

    /// The first failing query aborts the refresh with a Transport error.
    static OpResult query(ISmartCastClient* client, StatusKind kind, QStringList* lines);
};

} // namespace scr
