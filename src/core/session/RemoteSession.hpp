#pragma once

#include <QObject>
#include <QStringList>
#include <memory>
#include "core/OpResult.hpp"
#include "core/backend/ISmartCastBackend.hpp"
#include "core/commands/StatusQuery.hpp"
#include "core/devices/DeviceRecord.hpp"
#include "core/devices/FavoritesList.hpp"

namespace scr {

class DeviceRegistry;
class IConfigService;

enum class SelectionSource {
    None,
    Discovered,
    Saved
};

struct SelectedDevice {
    SelectionSource source = SelectionSource::None;
    QString name;
    QString ip;
    int port = 0;
    QString udn;

    QString address() const { return hostWithPort(ip, port); }
    bool isValid() const { return source != SelectionSource::None && !ip.isEmpty(); }
};

/// Pre-filled values for the manual-connect form.
struct ManualFields {
    QString address;
    QString name;
    QString authToken;
};

/// Application state of one remote-control window: the connected client,
/// the selected device, the auth token and device class in use, and the
/// favorites of the current device. All calls happen on the UI thread.
class RemoteSession : public QObject {
    Q_OBJECT
public:
    static constexpr const char* kDefaultManualName = "Manual Vizio";

    /// `backend` may be null (no plugin loaded); registry and config are not owned.
    explicit RemoteSession(ISmartCastBackend* backend, DeviceRegistry* registry,
                           IConfigService* config, QObject* parent = nullptr);
    ~RemoteSession() override;

    // --- State ---
    bool isConnected() const { return client_ != nullptr; }
    ISmartCastClient* client() const { return client_.get(); }
    QString connectedAddress() const { return connectedAddress_; }
    SelectedDevice selection() const { return selection_; }
    ManualFields manualFields() const { return manual_; }
    QString authToken() const { return authToken_; }
    void setAuthToken(const QString& token);
    DeviceClass deviceClass() const { return deviceClass_; }
    void setDeviceClass(DeviceClass deviceClass) { deviceClass_ = deviceClass; }
    bool controlsEnabled() const { return controlsEnabled_; }
    FavoritesList favorites() const { return favorites_; }
    QStringList inputs() const { return inputs_; }
    QStringList apps() const { return apps_; }
    PairingChallenge lastChallenge() const { return lastChallenge_; }

    // --- Selection ---
    void selectDiscovered(const DiscoveredDevice& device);
    void selectSaved(const DeviceRecord& record);
    void clearSelection();

    // --- Connection and pairing ---
    OpResult connectSelected();
    OpResult manualConnect(const QString& addressText, const QString& name, const QString& authToken);
    OpResult startPairing();
    OpResult stopPairing();
    OpResult finishPairing(int challengeType, const QString& tokenText, const QString& pin);

    // --- Saved devices ---
    OpResult saveSelected();
    /// Removing the selected device demotes the selection to an unsaved one;
    /// its favorites stay in memory until it is saved again.
    OpResult removeSaved(const QString& host, int port);

    // --- Favorites ---
    OpResult addFavorite(const QString& appName);
    OpResult removeFavorite(const QString& appName);
    OpResult activateFavorite(int index);

    // --- Commands ---
    OpResult launchApp(const QString& appName);
    OpResult setInput(const QString& inputName);
    OpResult setVolume(int level);
    OpResult sendKey(const QString& key);
    OpResult refreshStatus(StatusKind kind);
    OpResult execute(const QString& commandName, const QString& argsText);

    /// Splits "ip[:port]". Port must be 1-65535 when present.
    static bool parseAddress(const QString& text, QString* host, int* port);
    static QStringList navigationKeys();

signals:
    void selectionChanged();
    void connectionChanged();
    void authTokenChanged();
    void controlsEnabledChanged();
    void favoritesChanged();
    void listsChanged();

private:
    std::unique_ptr<ISmartCastClient> openClient(const QString& address, const QString& name,
                                                 const QString& authToken, int timeoutSeconds,
                                                 OpResult* error);
    void adoptClient(std::unique_ptr<ISmartCastClient> client, const QString& address);
    DeviceIdentity fetchIdentity(ISmartCastClient& client) const;
    void populateLists();
    void setControlsEnabled(bool enabled);
    void replaceFavorites(const FavoritesList& favorites);
    OpResult persistFavorites(const FavoritesList& previous, const OpResult& change);
    OpResult runCommand(CommandId id, const QVariantList& args);
    int configInt(const QString& key, int fallback) const;
    QString clientName() const;

    ISmartCastBackend* backend_;
    DeviceRegistry* registry_;
    IConfigService* config_;

    std::unique_ptr<ISmartCastClient> client_;
    QString connectedAddress_;
    SelectedDevice selection_;
    ManualFields manual_;
    QString authToken_;
    DeviceClass deviceClass_ = DeviceClass::Tv;
    bool controlsEnabled_ = false;
    FavoritesList favorites_;
    QStringList inputs_;
    QStringList apps_;
    PairingChallenge lastChallenge_;
};

} // namespace scr
