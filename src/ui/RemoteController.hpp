#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include "core/OpResult.hpp"

namespace scr {

class DeviceRegistry;
class DiscoveryReconciler;
class DiscoveredDevicesModel;
class RemoteSession;
class SavedDevicesModel;
struct DiscoveryReport;

/// QML facade over RemoteSession, DeviceRegistry and DiscoveryReconciler.
/// Renders every OpResult into the status line and the output log.
class RemoteController : public QObject {
    Q_OBJECT

    Q_PROPERTY(QObject* discoveredDevices READ discoveredDevices CONSTANT)
    Q_PROPERTY(QObject* savedDevices READ savedDevices CONSTANT)
    Q_PROPERTY(QString statusText READ statusText NOTIFY statusTextChanged)
    Q_PROPERTY(QString outputLog READ outputLog NOTIFY outputLogChanged)
    Q_PROPERTY(bool discovering READ discovering NOTIFY discoveringChanged)
    Q_PROPERTY(bool connected READ connected NOTIFY connectedChanged)
    Q_PROPERTY(bool controlsEnabled READ controlsEnabled NOTIFY controlsEnabledChanged)
    Q_PROPERTY(QString authToken READ authToken WRITE setAuthToken NOTIFY authTokenChanged)
    Q_PROPERTY(QString deviceType READ deviceType WRITE setDeviceType NOTIFY deviceTypeChanged)
    Q_PROPERTY(QString manualAddress READ manualAddress NOTIFY selectionChanged)
    Q_PROPERTY(QString manualName READ manualName NOTIFY selectionChanged)
    Q_PROPERTY(QString selectedName READ selectedName NOTIFY selectionChanged)
    Q_PROPERTY(int challengeType READ challengeType NOTIFY challengeChanged)
    Q_PROPERTY(int challengeToken READ challengeToken NOTIFY challengeChanged)
    Q_PROPERTY(QStringList favoriteSlots READ favoriteSlots NOTIFY favoritesChanged)
    Q_PROPERTY(QStringList inputs READ inputs NOTIFY listsChanged)
    Q_PROPERTY(QStringList apps READ apps NOTIFY listsChanged)
    Q_PROPERTY(QStringList commandNames READ commandNames CONSTANT)
    Q_PROPERTY(QStringList statusKinds READ statusKinds CONSTANT)
    Q_PROPERTY(QStringList deviceTypes READ deviceTypes CONSTANT)
    Q_PROPERTY(QStringList navigationKeys READ navigationKeys CONSTANT)

public:
    explicit RemoteController(RemoteSession* session, DeviceRegistry* registry,
                              DiscoveryReconciler* discovery, QObject* parent = nullptr);

    QObject* discoveredDevices() const;
    QObject* savedDevices() const;
    QString statusText() const { return statusText_; }
    QString outputLog() const { return outputLines_.join('\n'); }
    bool discovering() const;
    bool connected() const;
    bool controlsEnabled() const;
    QString authToken() const;
    void setAuthToken(const QString& token);
    QString deviceType() const;
    void setDeviceType(const QString& type);
    QString manualAddress() const;
    QString manualName() const;
    QString selectedName() const;
    int challengeType() const;
    int challengeToken() const;
    QStringList favoriteSlots() const;
    QStringList inputs() const;
    QStringList apps() const;
    QStringList commandNames() const;
    QStringList statusKinds() const;
    QStringList deviceTypes() const;
    QStringList navigationKeys() const;

    // --- Discovery and selection ---
    Q_INVOKABLE void discover();
    Q_INVOKABLE void rediscover();
    Q_INVOKABLE void selectDiscovered(int row);
    Q_INVOKABLE void selectSaved(int row);

    // --- Connection ---
    Q_INVOKABLE void connectSelected();
    Q_INVOKABLE void manualConnect(const QString& address, const QString& name, const QString& authToken);
    Q_INVOKABLE void startPairing();
    Q_INVOKABLE void stopPairing();
    Q_INVOKABLE void finishPairing(int challengeType, const QString& token, const QString& pin);
    Q_INVOKABLE void copyAuthToken();

    // --- Saved devices and favorites ---
    Q_INVOKABLE void saveSelected();
    Q_INVOKABLE void removeSaved(int row);
    Q_INVOKABLE void addFavorite(const QString& appName);
    Q_INVOKABLE void removeFavorite(const QString& appName);
    Q_INVOKABLE void activateFavorite(int index);

    // --- Commands ---
    Q_INVOKABLE void launchApp(const QString& appName);
    Q_INVOKABLE void setInput(const QString& inputName);
    Q_INVOKABLE void setVolume(int level);
    Q_INVOKABLE void sendKey(const QString& key);
    Q_INVOKABLE void refreshStatus(const QString& kindName);
    Q_INVOKABLE void execute(const QString& commandName, const QString& args);
    Q_INVOKABLE void clearOutput();

signals:
    void statusTextChanged();
    void outputLogChanged();
    void discoveringChanged();
    void connectedChanged();
    void controlsEnabledChanged();
    void authTokenChanged();
    void deviceTypeChanged();
    void selectionChanged();
    void challengeChanged();
    void favoritesChanged();
    void listsChanged();
    /// A failure that the view should surface in a dialog.
    void errorRaised(const QString& title, const QString& message);

private:
    void render(const QString& title, const OpResult& result);
    void setStatus(const QString& text);
    void appendOutput(const QString& text);
    void startDiscovery(const QString& label);
    void onDiscoveryFinished(const DiscoveryReport& report);
    void syncSavedDevices();

    RemoteSession* session_;
    DeviceRegistry* registry_;
    DiscoveryReconciler* discovery_;
    DiscoveredDevicesModel* discoveredModel_;
    SavedDevicesModel* savedModel_;
    QString statusText_ = QStringLiteral("Ready");
    QStringList outputLines_;
    QString discoveryLabel_;
};

} // namespace scr
