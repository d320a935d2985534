#include <QGuiApplication>
#include <QQmlApplicationEngine>
#include <QQmlContext>
#include <QQuickStyle>
#include <QDir>
#include <QFile>
#include <memory>
#include "core/Logging.hpp"
#include "core/YamlConfig.hpp"
#include "core/backend/BackendLoader.hpp"
#include "core/devices/DeviceRegistry.hpp"
#include "core/discovery/DiscoveryReconciler.hpp"
#include "core/services/ConfigService.hpp"
#include "core/session/RemoteSession.hpp"
#include "ui/RemoteController.hpp"

int main(int argc, char *argv[])
{
    QGuiApplication app(argc, argv);
    app.setApplicationName("SmartCast Remote");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("SmartCastRemote");

    // Built-in defaults apply when the file is missing or unreadable
    QString yamlPath = QDir::homePath() + "/.smartcast-remote/config.yaml";
    auto yamlConfig = std::make_shared<scr::YamlConfig>();
    if (QFile::exists(yamlPath) && !yamlConfig->load(yamlPath))
        qWarning() << "Config: could not parse" << yamlPath << "- using defaults";

    scr::initLogging(yamlConfig->logLevel());

    auto configService = std::make_unique<scr::ConfigService>(yamlConfig.get(), yamlPath);

    // --- Device-control backend ---
    QString appDir = QCoreApplication::applicationDirPath();
    QString backendPath = yamlConfig->backendPath();
    if (backendPath.isEmpty())
        backendPath = appDir + "/backends/libsmartcast-backend.so";
    scr::ISmartCastBackend* backend = scr::BackendLoader::load(backendPath);
    if (backend)
        qInfo() << "Backend:" << backend->name() << "from" << backendPath;
    else
        qWarning() << "Backend: none loaded, discovery and control disabled";

    // --- Saved devices ---
    QString devicesPath = yamlConfig->devicesFile();
    if (devicesPath.isEmpty())
        devicesPath = appDir + "/devices.json";
    auto* registry = new scr::DeviceRegistry(devicesPath, &app);
    registry->load();
    qInfo() << "Saved devices:" << registry->count() << "from" << devicesPath;

    // Joined on destruction, so no worker outlives main()
    auto discovery = std::make_unique<scr::DiscoveryReconciler>(
        backend, yamlConfig->discoveryTimeoutSeconds());

    // Owns the connected client; destroyed after the engine, before the registry
    auto session = std::make_unique<scr::RemoteSession>(backend, registry, configService.get());
    bool typeOk = false;
    session->setDeviceClass(scr::deviceClassFromString(yamlConfig->defaultDeviceType(), &typeOk));
    if (!typeOk)
        qWarning() << "Config: unknown default device type" << yamlConfig->defaultDeviceType();

    auto* controller = new scr::RemoteController(session.get(), registry, discovery.get(), &app);

    QQuickStyle::setStyle("Material");

    QQmlApplicationEngine engine;
    engine.rootContext()->setContextProperty("RemoteController", controller);
    engine.rootContext()->setContextProperty("ConfigService", configService.get());
    engine.rootContext()->setContextProperty("DarkTheme", yamlConfig->darkTheme());

    // Qt 6.5+ uses /qt/qml/ prefix, Qt 6.4 uses direct URI prefix
    QUrl url(QStringLiteral("qrc:/SmartCastRemote/main.qml"));
    if (QFile::exists(QStringLiteral(":/qt/qml/SmartCastRemote/main.qml")))
        url = QUrl(QStringLiteral("qrc:/qt/qml/SmartCastRemote/main.qml"));

    engine.load(url);

    if (engine.rootObjects().isEmpty())
        return -1;

    if (yamlConfig->discoveryAutoStart())
        controller->discover();

    return app.exec();
}
