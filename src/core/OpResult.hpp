#pragma once

#include <QString>

namespace scr {

enum class ErrorKind {
    None,
    Transport,    // backend discovery / connect / command call failed
    Persistence,  // saved-device store could not be written
    Validation    // bad user input, unknown command, favorites rule
};

/// Outcome of a core operation. The presentation layer renders `message`;
/// core code never drops a failure on the floor.
struct OpResult {
    bool ok = true;
    ErrorKind kind = ErrorKind::None;
    QString message;

    static OpResult success(const QString& message = {})
    {
        return {true, ErrorKind::None, message};
    }

    static OpResult failure(ErrorKind kind, const QString& message)
    {
        return {false, kind, message};
    }

    explicit operator bool() const { return ok; }
};

} // namespace scr
