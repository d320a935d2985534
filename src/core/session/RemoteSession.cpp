#include "core/session/RemoteSession.hpp"
#include "core/commands/CommandCatalog.hpp"
#include "core/commands/CommandExecutor.hpp"
#include "core/devices/DeviceRegistry.hpp"
#include "core/services/IConfigService.hpp"
#include <QDateTime>
#include <boost/log/trivial.hpp>

namespace scr {

RemoteSession::RemoteSession(ISmartCastBackend* backend, DeviceRegistry* registry,
                             IConfigService* config, QObject* parent)
    : QObject(parent), backend_(backend), registry_(registry), config_(config)
{
}

RemoteSession::~RemoteSession() = default;

QStringList RemoteSession::navigationKeys()
{
    return {"UP", "DOWN", "LEFT", "RIGHT", "OK"};
}

bool RemoteSession::parseAddress(const QString& text, QString* host, int* port)
{
    QString trimmed = text.trimmed();
    if (trimmed.isEmpty())
        return false;

    QString h = trimmed;
    int p = 0;
    int colon = trimmed.lastIndexOf(':');
    if (colon >= 0) {
        h = trimmed.left(colon).trimmed();
        bool ok = false;
        p = trimmed.mid(colon + 1).trimmed().toInt(&ok);
        if (!ok || p < 1 || p > 65535)
            return false;
    }
    if (h.isEmpty())
        return false;

    if (host) *host = h;
    if (port) *port = p;
    return true;
}

int RemoteSession::configInt(const QString& key, int fallback) const
{
    if (!config_)
        return fallback;
    bool ok = false;
    int v = config_->value(key).toInt(&ok);
    return ok && v > 0 ? v : fallback;
}

QString RemoteSession::clientName() const
{
    QString name = config_ ? config_->value("client.name").toString() : QString();
    return name.isEmpty() ? QStringLiteral("smartcast-remote") : name;
}

void RemoteSession::setAuthToken(const QString& token)
{
    QString trimmed = token.trimmed();
    if (trimmed != authToken_) {
        authToken_ = trimmed;
        emit authTokenChanged();
    }
    if (!authToken_.isEmpty())
        setControlsEnabled(true);
}

void RemoteSession::setControlsEnabled(bool enabled)
{
    if (controlsEnabled_ == enabled)
        return;
    controlsEnabled_ = enabled;
    emit controlsEnabledChanged();
}

// --- Selection ---

void RemoteSession::selectDiscovered(const DiscoveredDevice& device)
{
    selection_ = {SelectionSource::Discovered, device.name, device.ip, device.port, device.udn};
    manual_ = {device.address(), device.name, device.authToken};
    if (!device.authToken.isEmpty())
        setAuthToken(device.authToken);

    // Favorites belong to one device: reuse a saved record's list, else start empty
    int idx = registry_ ? registry_->indexOf(device.ip, device.port) : -1;
    replaceFavorites(idx >= 0 ? registry_->at(idx).favorites : FavoritesList());
    emit selectionChanged();
}

void RemoteSession::selectSaved(const DeviceRecord& record)
{
    selection_ = {SelectionSource::Saved, record.name, record.host, record.port, record.externalId};
    manual_ = {record.address(), record.name, record.authToken};
    if (!record.authToken.isEmpty())
        setAuthToken(record.authToken);
    deviceClass_ = record.deviceClass;
    replaceFavorites(record.favorites);
    emit selectionChanged();
}

void RemoteSession::clearSelection()
{
    selection_ = SelectedDevice{};
    setControlsEnabled(false);
    emit selectionChanged();
}

// --- Connection ---

std::unique_ptr<ISmartCastClient> RemoteSession::openClient(const QString& address, const QString& name,
                                                            const QString& authToken, int timeoutSeconds,
                                                            OpResult* error)
{
    if (!backend_) {
        *error = OpResult::failure(ErrorKind::Transport, "No device-control backend loaded");
        return nullptr;
    }

    ConnectParams params;
    params.clientName = clientName();
    params.address = address;
    params.deviceName = name;
    params.authToken = authToken;
    params.deviceClass = deviceClass_;
    params.timeoutSeconds = timeoutSeconds;

    try {
        auto client = backend_->connect(params);
        if (!client) {
            *error = OpResult::failure(ErrorKind::Transport,
                                       QString("Could not connect to %1").arg(address));
        }
        return client;
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(warning) << "[Session] Connect to " << address.toStdString()
                                   << " failed: " << e.what();
        *error = OpResult::failure(ErrorKind::Transport,
                                   QString("Connection Error: %1").arg(QString::fromUtf8(e.what())));
        return nullptr;
    }
}

void RemoteSession::adoptClient(std::unique_ptr<ISmartCastClient> client, const QString& address)
{
    client_ = std::move(client);
    connectedAddress_ = address;
    BOOST_LOG_TRIVIAL(info) << "[Session] Connected to " << address.toStdString();
    emit connectionChanged();
    populateLists();
}

void RemoteSession::populateLists()
{
    if (client_) {
        try {
            inputs_ = client_->inputsList();
        } catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(warning) << "[Session] Could not read inputs: " << e.what();
            inputs_.clear();
        }
    }

    if (backend_) {
        try {
            apps_ = backend_->appsList();
        } catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(warning) << "[Session] Could not read apps: " << e.what();
            apps_.clear();
        }
    }
    emit listsChanged();
}

OpResult RemoteSession::connectSelected()
{
    if (!selection_.isValid())
        return OpResult::failure(ErrorKind::Validation, "No device selected");

    OpResult error;
    auto client = openClient(selection_.address(), selection_.name, authToken_,
                             configInt("connection.timeout_s", 5), &error);
    if (!client)
        return error;

    adoptClient(std::move(client), selection_.address());
    setControlsEnabled(true);
    return OpResult::success(QString("Connected to %1 @ %2").arg(selection_.name, selection_.address()));
}

OpResult RemoteSession::manualConnect(const QString& addressText, const QString& name,
                                      const QString& authToken)
{
    if (addressText.trimmed().isEmpty())
        return OpResult::failure(ErrorKind::Validation, "Enter IP to manually connect");

    QString host;
    int port = 0;
    if (!parseAddress(addressText, &host, &port))
        return OpResult::failure(ErrorKind::Validation,
                                 QString("Invalid address '%1' (expected IP[:PORT], port 1-65535)")
                                     .arg(addressText.trimmed()));

    QString deviceName = name.trimmed().isEmpty() ? QString(kDefaultManualName) : name.trimmed();
    QString token = authToken.trimmed();
    QString address = hostWithPort(host, port);

    OpResult error;
    auto client = openClient(address, deviceName, token, configInt("connection.timeout_s", 5), &error);
    if (!client)
        return error;

    adoptClient(std::move(client), address);
    if (!token.isEmpty())
        setAuthToken(token);
    setControlsEnabled(!token.isEmpty());
    return OpResult::success(QString("Connected to %1").arg(address));
}

// --- Pairing ---

OpResult RemoteSession::startPairing()
{
    if (!selection_.isValid())
        return OpResult::failure(ErrorKind::Validation, "No device selected for pairing");

    OpResult error;
    auto temp = openClient(selection_.address(), selection_.name, QString(),
                           configInt("connection.timeout_s", 5), &error);
    if (!temp)
        return error;

    try {
        lastChallenge_ = temp->startPairing();
    } catch (const std::exception& e) {
        return OpResult::failure(ErrorKind::Transport,
                                 QString("Pair Start Error: %1").arg(QString::fromUtf8(e.what())));
    }

    BOOST_LOG_TRIVIAL(info) << "[Session] Pairing started, challenge type "
                            << lastChallenge_.challengeType;
    return OpResult::success(QString("Pair started: challenge type=%1, token=%2")
                                 .arg(lastChallenge_.challengeType)
                                 .arg(lastChallenge_.token));
}

OpResult RemoteSession::stopPairing()
{
    std::unique_ptr<ISmartCastClient> temp;
    ISmartCastClient* target = client_.get();
    if (!target) {
        if (!selection_.isValid())
            return OpResult::failure(ErrorKind::Validation, "No device selected for pairing");
        OpResult error;
        temp = openClient(selection_.address(), selection_.name, QString(),
                          configInt("connection.timeout_s", 5), &error);
        if (!temp)
            return error;
        target = temp.get();
    }

    try {
        target->stopPairing();
    } catch (const std::exception& e) {
        return OpResult::failure(ErrorKind::Transport,
                                 QString("Pair Stop Error: %1").arg(QString::fromUtf8(e.what())));
    }
    return OpResult::success("Pairing stopped");
}

OpResult RemoteSession::finishPairing(int challengeType, const QString& tokenText, const QString& pin)
{
    int token = 0;
    QString trimmed = tokenText.trimmed();
    if (!trimmed.isEmpty()) {
        bool ok = false;
        token = trimmed.toInt(&ok);
        if (!ok)
            return OpResult::failure(ErrorKind::Validation, "Invalid challenge/token values");
    }

    std::unique_ptr<ISmartCastClient> temp;
    ISmartCastClient* target = client_.get();
    if (!target) {
        if (!selection_.isValid())
            return OpResult::failure(ErrorKind::Validation, "No device selected for pairing");
        OpResult error;
        temp = openClient(selection_.address(), selection_.name, QString(),
                          configInt("connection.timeout_s", 5), &error);
        if (!temp)
            return error;
        target = temp.get();
    }

    QString issued;
    try {
        issued = target->finishPairing(challengeType, token, pin.trimmed());
    } catch (const std::exception& e) {
        return OpResult::failure(ErrorKind::Transport,
                                 QString("Pair Finish Error: %1").arg(QString::fromUtf8(e.what())));
    }

    QString applied = issued.trimmed();
    QString message = "Paired successfully. Auth token set.";
    if (applied.isEmpty()) {
        if (authToken_.isEmpty())
            return OpResult::failure(ErrorKind::Validation, "Pair Finish: No auth token returned");
        applied = authToken_;
        message = "No token returned from device; using manually-entered Auth Token";
    }

    setAuthToken(applied);
    if (client_) {
        try {
            client_->setAuthToken(applied);
        } catch (const std::exception& e) {
            return OpResult::failure(ErrorKind::Transport,
                                     QString("Could not apply auth token: %1").arg(QString::fromUtf8(e.what())));
        }
    }
    setControlsEnabled(true);
    BOOST_LOG_TRIVIAL(info) << "[Session] Pairing finished";
    return OpResult::success(message);
}

// --- Saved devices ---

DeviceIdentity RemoteSession::fetchIdentity(ISmartCastClient& client) const
{
    DeviceIdentity identity;
    try {
        identity.serialNumber = client.serialNumber();
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(debug) << "[Session] Serial number unavailable: " << e.what();
    }
    try {
        identity.esn = client.esn();
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(debug) << "[Session] ESN unavailable: " << e.what();
    }
    try {
        identity.version = client.version();
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(debug) << "[Session] Version unavailable: " << e.what();
    }
    return identity;
}

OpResult RemoteSession::saveSelected()
{
    if (selection_.source != SelectionSource::Discovered)
        return OpResult::failure(ErrorKind::Validation, "No discovered device selected to save");
    if (!registry_)
        return OpResult::failure(ErrorKind::Persistence, "No saved-device store");

    DeviceRecord record;
    record.name = selection_.name;
    record.host = selection_.ip;
    record.port = selection_.port;
    record.deviceClass = deviceClass_;
    record.authToken = authToken_;
    record.externalId = selection_.udn;
    record.savedAt = QDateTime::currentDateTimeUtc();
    record.favorites = favorites_;

    QString connectedHost;
    parseAddress(connectedAddress_, &connectedHost, nullptr);
    if (client_ && connectedHost == selection_.ip) {
        record.identity = fetchIdentity(*client_);
    } else {
        OpResult error;
        auto temp = openClient(selection_.address(), selection_.name, QString(),
                               configInt("connection.enrich_timeout_s", 3), &error);
        if (temp)
            record.identity = fetchIdentity(*temp);
        else
            BOOST_LOG_TRIVIAL(info) << "[Session] Saving without identity: "
                                    << error.message.toStdString();
    }

    return registry_->upsert(record);
}

OpResult RemoteSession::removeSaved(const QString& host, int port)
{
    if (!registry_)
        return OpResult::failure(ErrorKind::Persistence, "No saved-device store");

    OpResult result = registry_->remove(host, port);
    if (result && selection_.source == SelectionSource::Saved
        && selection_.ip == host && selection_.port == port) {
        selection_.source = SelectionSource::Discovered;
        emit selectionChanged();
    }
    return result;
}

// --- Favorites ---

void RemoteSession::replaceFavorites(const FavoritesList& favorites)
{
    if (favorites_ == favorites)
        return;
    favorites_ = favorites;
    emit favoritesChanged();
}

// A failed write keeps the change in memory; any other refusal undoes it.
OpResult RemoteSession::persistFavorites(const FavoritesList& previous, const OpResult& change)
{
    if (selection_.source != SelectionSource::Saved || !registry_) {
        emit favoritesChanged();
        return change;
    }

    OpResult saved = registry_->setFavorites(selection_.ip, selection_.port, favorites_);
    if (!saved && saved.kind != ErrorKind::Persistence) {
        favorites_ = previous;
        return saved;
    }
    emit favoritesChanged();
    return saved ? change : saved;
}

OpResult RemoteSession::addFavorite(const QString& appName)
{
    FavoritesList previous = favorites_;
    OpResult result = favorites_.add(appName);
    if (!result)
        return result;
    return persistFavorites(previous, result);
}

OpResult RemoteSession::removeFavorite(const QString& appName)
{
    FavoritesList previous = favorites_;
    OpResult result = favorites_.remove(appName);
    if (!result)
        return result;
    return persistFavorites(previous, result);
}

OpResult RemoteSession::activateFavorite(int index)
{
    QString app = favorites_.activate(index);
    if (app.isEmpty())
        return OpResult::success();

    if (!client_ && selection_.source == SelectionSource::Saved) {
        OpResult error;
        auto client = openClient(selection_.address(), selection_.name, authToken_,
                                 configInt("connection.timeout_s", 5), &error);
        if (!client)
            return error;
        adoptClient(std::move(client), selection_.address());
        setControlsEnabled(!authToken_.isEmpty());
    }

    OpResult result = runCommand(CommandId::LaunchApp, {app});
    if (!result)
        return result;
    return OpResult::success(QString("Launched favorite app %1").arg(app));
}

// --- Commands ---

OpResult RemoteSession::runCommand(CommandId id, const QVariantList& args)
{
    const CommandSpec* spec = CommandCatalog::find(id);
    Command cmd;
    cmd.id = id;
    cmd.name = spec ? spec->name : QString();
    cmd.args = args;
    return CommandExecutor::execute(client_.get(), cmd);
}

OpResult RemoteSession::launchApp(const QString& appName)
{
    QString app = appName.trimmed();
    if (app.isEmpty())
        return OpResult::failure(ErrorKind::Validation, "No app selected");
    OpResult result = runCommand(CommandId::LaunchApp, {app});
    if (!result)
        return result;
    return OpResult::success(QString("Launched app %1").arg(app));
}

OpResult RemoteSession::setInput(const QString& inputName)
{
    QString input = inputName.trimmed();
    if (input.isEmpty())
        return OpResult::failure(ErrorKind::Validation, "No input selected");
    OpResult result = runCommand(CommandId::SetInput, {input});
    if (!result)
        return result;
    return OpResult::success(QString("Input set to %1").arg(input));
}

OpResult RemoteSession::setVolume(int level)
{
    if (level < 0 || level > 100)
        return OpResult::failure(ErrorKind::Validation,
                                 QString("Volume must be 0-100, got %1").arg(level));
    OpResult result = runCommand(CommandId::SetAudioSetting, {QStringLiteral("volume"), level});
    if (!result)
        return result;
    return OpResult::success(QString("Volume set to %1").arg(level));
}

OpResult RemoteSession::sendKey(const QString& key)
{
    QString upper = key.trimmed().toUpper();
    if (!navigationKeys().contains(upper))
        return OpResult::failure(ErrorKind::Validation, QString("Unknown key: %1").arg(key));
    OpResult result = runCommand(CommandId::RemoteKey, {upper});
    if (!result)
        return result;
    return OpResult::success(QString("> NAV %1").arg(upper));
}

OpResult RemoteSession::refreshStatus(StatusKind kind)
{
    QStringList lines;
    OpResult result = StatusQuery::query(client_.get(), kind, &lines);
    if (!result)
        return result;
    return OpResult::success(lines.join('\n'));
}

OpResult RemoteSession::execute(const QString& commandName, const QString& argsText)
{
    Command cmd;
    OpResult parsed = CommandCatalog::parse(commandName, argsText, &cmd);
    if (!parsed)
        return parsed;
    return CommandExecutor::execute(client_.get(), cmd);
}

} // namespace scr
