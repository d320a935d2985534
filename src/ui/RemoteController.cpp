#include "ui/RemoteController.hpp"
#include "core/commands/CommandCatalog.hpp"
#include "core/commands/StatusQuery.hpp"
#include "core/devices/DeviceRegistry.hpp"
#include "core/discovery/DiscoveryReconciler.hpp"
#include "core/session/RemoteSession.hpp"
#include "ui/DiscoveredDevicesModel.hpp"
#include "ui/SavedDevicesModel.hpp"
#include <QClipboard>
#include <QGuiApplication>
#include <boost/log/trivial.hpp>

namespace scr {

RemoteController::RemoteController(RemoteSession* session, DeviceRegistry* registry,
                                   DiscoveryReconciler* discovery, QObject* parent)
    : QObject(parent)
    , session_(session)
    , registry_(registry)
    , discovery_(discovery)
    , discoveredModel_(new DiscoveredDevicesModel(this))
    , savedModel_(new SavedDevicesModel(this))
{
    connect(session_, &RemoteSession::selectionChanged, this, &RemoteController::selectionChanged);
    connect(session_, &RemoteSession::selectionChanged, this, &RemoteController::deviceTypeChanged);
    connect(session_, &RemoteSession::connectionChanged, this, &RemoteController::connectedChanged);
    connect(session_, &RemoteSession::controlsEnabledChanged, this, &RemoteController::controlsEnabledChanged);
    connect(session_, &RemoteSession::authTokenChanged, this, &RemoteController::authTokenChanged);
    connect(session_, &RemoteSession::favoritesChanged, this, &RemoteController::favoritesChanged);
    connect(session_, &RemoteSession::listsChanged, this, &RemoteController::listsChanged);

    connect(registry_, &DeviceRegistry::devicesChanged, this, &RemoteController::syncSavedDevices);

    connect(discovery_, &DiscoveryReconciler::started, this, &RemoteController::discoveringChanged);
    connect(discovery_, &DiscoveryReconciler::finished, this, &RemoteController::onDiscoveryFinished);
    connect(discovery_, &DiscoveryReconciler::visibleDevicesChanged, this, [this]() {
        discoveredModel_->setDevices(discovery_->visibleDevices());
    });

    syncSavedDevices();
}

QObject* RemoteController::discoveredDevices() const { return discoveredModel_; }
QObject* RemoteController::savedDevices() const { return savedModel_; }
bool RemoteController::discovering() const { return discovery_->isRunning(); }
bool RemoteController::connected() const { return session_->isConnected(); }
bool RemoteController::controlsEnabled() const { return session_->controlsEnabled(); }
QString RemoteController::authToken() const { return session_->authToken(); }
QString RemoteController::manualAddress() const { return session_->manualFields().address; }
QString RemoteController::manualName() const { return session_->manualFields().name; }
QString RemoteController::selectedName() const { return session_->selection().name; }
int RemoteController::challengeType() const { return session_->lastChallenge().challengeType; }
int RemoteController::challengeToken() const { return session_->lastChallenge().token; }
QStringList RemoteController::inputs() const { return session_->inputs(); }
QStringList RemoteController::apps() const { return session_->apps(); }
QStringList RemoteController::commandNames() const { return CommandCatalog::names(); }
QStringList RemoteController::statusKinds() const { return StatusQuery::kindNames(); }
QStringList RemoteController::deviceTypes() const { return deviceClassNames(); }
QStringList RemoteController::navigationKeys() const { return RemoteSession::navigationKeys(); }

void RemoteController::setAuthToken(const QString& token)
{
    session_->setAuthToken(token);
}

QString RemoteController::deviceType() const
{
    return deviceClassToString(session_->deviceClass());
}

void RemoteController::setDeviceType(const QString& type)
{
    bool ok = false;
    DeviceClass deviceClass = deviceClassFromString(type, &ok);
    if (!ok || deviceClass == session_->deviceClass())
        return;
    session_->setDeviceClass(deviceClass);
    emit deviceTypeChanged();
}

QStringList RemoteController::favoriteSlots() const
{
    QStringList labels;
    const FavoritesList favorites = session_->favorites();
    for (int i = 0; i < FavoritesList::kCapacity; ++i) {
        QString app = favorites.activate(i);
        labels.append(app.isEmpty() ? QStringLiteral("-") : app);
    }
    return labels;
}

// --- Rendering ---

void RemoteController::setStatus(const QString& text)
{
    if (statusText_ == text)
        return;
    statusText_ = text;
    emit statusTextChanged();
}

void RemoteController::appendOutput(const QString& text)
{
    if (text.isEmpty())
        return;
    outputLines_.append(text);
    emit outputLogChanged();
}

void RemoteController::render(const QString& title, const OpResult& result)
{
    if (result) {
        if (result.message.isEmpty())
            return;
        setStatus(result.message.section('\n', 0, 0));
        appendOutput(result.message);
        return;
    }

    setStatus(QString("%1: %2").arg(title, result.message));
    appendOutput(QString("Error: %1").arg(result.message));
    if (result.kind != ErrorKind::Validation)
        emit errorRaised(title, result.message);
}

void RemoteController::clearOutput()
{
    if (outputLines_.isEmpty())
        return;
    outputLines_.clear();
    emit outputLogChanged();
}

// --- Discovery and selection ---

void RemoteController::startDiscovery(const QString& label)
{
    OpResult result = discovery_->start(label);
    if (result)
        discoveryLabel_ = label;
    render(label, result);
}

void RemoteController::discover()
{
    startDiscovery(QStringLiteral("Discovery"));
}

void RemoteController::rediscover()
{
    startDiscovery(QStringLiteral("Rediscovery"));
}

void RemoteController::onDiscoveryFinished(const DiscoveryReport& report)
{
    emit discoveringChanged();
    for (const auto& line : report.log)
        appendOutput(line);

    if (report.failed()) {
        render(discoveryLabel_, OpResult::failure(ErrorKind::Transport, report.error));
        return;
    }
    setStatus(DiscoveryReconciler::summarize(report, discoveryLabel_).section('\n', 0, 0));
}

void RemoteController::selectDiscovered(int row)
{
    if (row < 0 || row >= discoveredModel_->rowCount()) {
        session_->clearSelection();
        return;
    }
    session_->selectDiscovered(discoveredModel_->deviceAt(row));
    setStatus(QString("Selected %1").arg(session_->selection().name));
}

void RemoteController::selectSaved(int row)
{
    if (row < 0 || row >= savedModel_->rowCount()) {
        session_->clearSelection();
        return;
    }
    session_->selectSaved(savedModel_->deviceAt(row));
    setStatus(QString("Selected saved device %1").arg(session_->selection().name));
}

void RemoteController::syncSavedDevices()
{
    savedModel_->setDevices(registry_->devices());
}

// --- Connection ---

void RemoteController::connectSelected()
{
    OpResult result = session_->connectSelected();
    render("Connection Error", result);
    if (result)
        render("Status Error", session_->refreshStatus(StatusKind::All));
}

void RemoteController::manualConnect(const QString& address, const QString& name, const QString& authToken)
{
    OpResult result = session_->manualConnect(address, name, authToken);
    render("Manual Connect", result);
    if (result)
        render("Status Error", session_->refreshStatus(StatusKind::All));
}

void RemoteController::startPairing()
{
    OpResult result = session_->startPairing();
    if (result)
        emit challengeChanged();
    render("Pair Start Error", result);
}

void RemoteController::stopPairing()
{
    render("Pair Stop Error", session_->stopPairing());
}

void RemoteController::finishPairing(int challengeType, const QString& token, const QString& pin)
{
    render("Pair Finish", session_->finishPairing(challengeType, token, pin));
}

void RemoteController::copyAuthToken()
{
    const QString token = session_->authToken();
    if (token.isEmpty()) {
        render("Copy", OpResult::failure(ErrorKind::Validation, "No auth token to copy"));
        return;
    }
    if (!qobject_cast<QGuiApplication*>(QCoreApplication::instance())) {
        render("Copy failed", OpResult::failure(ErrorKind::Validation, "Clipboard unavailable"));
        return;
    }
    QGuiApplication::clipboard()->setText(token);
    render("Copy", OpResult::success("Auth token copied to clipboard"));
}

// --- Saved devices and favorites ---

void RemoteController::saveSelected()
{
    render("Save Error", session_->saveSelected());
}

void RemoteController::removeSaved(int row)
{
    if (row < 0 || row >= savedModel_->rowCount()) {
        render("Remove", OpResult::failure(ErrorKind::Validation, "No saved device selected"));
        return;
    }
    DeviceRecord record = savedModel_->deviceAt(row);
    render("Remove Error", session_->removeSaved(record.host, record.port));
}

void RemoteController::addFavorite(const QString& appName)
{
    render("Favorites", session_->addFavorite(appName));
}

void RemoteController::removeFavorite(const QString& appName)
{
    render("Favorites", session_->removeFavorite(appName));
}

void RemoteController::activateFavorite(int index)
{
    render("Launch Error", session_->activateFavorite(index));
}

// --- Commands ---

void RemoteController::launchApp(const QString& appName)
{
    render("Launch Error", session_->launchApp(appName));
}

void RemoteController::setInput(const QString& inputName)
{
    render("Input Error", session_->setInput(inputName));
}

void RemoteController::setVolume(int level)
{
    render("Volume Error", session_->setVolume(level));
}

void RemoteController::sendKey(const QString& key)
{
    render("Navigation Error", session_->sendKey(key));
}

void RemoteController::refreshStatus(const QString& kindName)
{
    StatusKind kind = StatusKind::All;
    if (!StatusQuery::kindFromName(kindName, &kind)) {
        render("Status", OpResult::failure(ErrorKind::Validation,
                                           QString("Unknown status kind: %1").arg(kindName)));
        return;
    }
    render("Status Error", session_->refreshStatus(kind));
}

void RemoteController::execute(const QString& commandName, const QString& args)
{
    OpResult result = session_->execute(commandName, args);
    if (!result)
        BOOST_LOG_TRIVIAL(debug) << "[RemoteController] Command rejected: " << result.message.toStdString();
    render("Execute Error", result);
}

} // namespace scr
