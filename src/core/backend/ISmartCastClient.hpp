#pragma once

#include <QString>
#include <QStringList>
#include <QVariant>
#include <stdexcept>

namespace scr {

/// Raised by a backend when a device call fails (timeout, HTTP error, rejected
/// auth). Backends may also let other std::exception types through.
class BackendError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct PairingChallenge {
    int challengeType = 0;
    int token = 0;
};

/// One connected device handle, produced by ISmartCastBackend::connect().
/// Every call may block for up to the handle's timeout and may throw.
/// Return values are whatever the device reported (bool, int, string or null).
class ISmartCastClient {
public:
    virtual ~ISmartCastClient() = default;

    // --- Pairing ---
    virtual PairingChallenge startPairing() = 0;
    virtual void stopPairing() = 0;
    /// Returns the issued auth token, or an empty string if the device sent none.
    virtual QString finishPairing(int challengeType, int token, const QString& pin) = 0;
    virtual void setAuthToken(const QString& token) = 0;

    // --- Identity ---
    virtual QString serialNumber() = 0;
    virtual QString esn() = 0;
    virtual QString version() = 0;

    // --- Status ---
    virtual QVariant powerState() = 0;
    virtual QVariant currentVolume() = 0;
    virtual QVariant currentInput() = 0;
    virtual QVariant currentApp() = 0;
    virtual QVariant chargingStatus() = 0;
    virtual QVariant batteryLevel() = 0;
    virtual QStringList inputsList() = 0;

    // --- Commands ---
    virtual QVariant powerOn() = 0;
    virtual QVariant powerOff() = 0;
    virtual QVariant powerToggle() = 0;
    virtual QVariant volumeUp(int steps) = 0;
    virtual QVariant volumeDown(int steps) = 0;
    virtual QVariant channelUp(int steps) = 0;
    virtual QVariant channelDown(int steps) = 0;
    virtual QVariant channelPrevious() = 0;
    virtual QVariant muteOn() = 0;
    virtual QVariant muteOff() = 0;
    virtual QVariant muteToggle() = 0;
    virtual QVariant play() = 0;
    virtual QVariant pause() = 0;
    virtual QVariant nextInput() = 0;
    virtual QVariant setInput(const QString& name) = 0;
    virtual QVariant launchApp(const QString& appName) = 0;
    virtual QVariant launchAppConfig(const QString& appId, int nameSpace, const QString& message) = 0;
    virtual QVariant remoteKey(const QString& key) = 0;
    virtual QVariant setAudioSetting(const QString& setting, int value) = 0;
};

} // namespace scr
