#include <QtTest>
#include <QClipboard>
#include <QGuiApplication>
#include <QSignalSpy>
#include <QTemporaryDir>
#include "core/YamlConfig.hpp"
#include "core/devices/DeviceRegistry.hpp"
#include "core/discovery/DiscoveryReconciler.hpp"
#include "core/services/ConfigService.hpp"
#include "core/session/RemoteSession.hpp"
#include "ui/RemoteController.hpp"
#include "MockSmartCastBackend.hpp"

class TestRemoteController : public QObject {
    Q_OBJECT
private slots:
    void init();
    void cleanup();

    void testFavoriteSlotsPadded();
    void testFailureRendersStatusAndLog();
    void testTransportFailureRaisesError();
    void testValidationFailureDoesNotRaise();
    void testDiscoveryFillsModel();
    void testSelectAndSaveUpdatesSavedModel();
    void testConnectAppendsStatus();
    void testUnknownStatusKind();
    void testDeviceTypeProperty();
    void testClearOutput();
    void testCopyAuthToken();

private:
    QTemporaryDir* dir_ = nullptr;
    scr::YamlConfig* yaml_ = nullptr;
    scr::ConfigService* config_ = nullptr;
    scr::DeviceRegistry* registry_ = nullptr;
    MockSmartCastBackend* backend_ = nullptr;
    scr::DiscoveryReconciler* discovery_ = nullptr;
    scr::RemoteSession* session_ = nullptr;
    scr::RemoteController* controller_ = nullptr;
};

void TestRemoteController::init()
{
    dir_ = new QTemporaryDir;
    yaml_ = new scr::YamlConfig;
    config_ = new scr::ConfigService(yaml_, dir_->path() + "/config.yaml");
    registry_ = new scr::DeviceRegistry(dir_->path() + "/devices.json");
    backend_ = new MockSmartCastBackend;
    discovery_ = new scr::DiscoveryReconciler(backend_, 1);
    session_ = new scr::RemoteSession(backend_, registry_, config_);
    controller_ = new scr::RemoteController(session_, registry_, discovery_);
}

void TestRemoteController::cleanup()
{
    delete controller_;
    delete session_;
    delete discovery_;
    delete backend_;
    delete registry_;
    delete config_;
    delete yaml_;
    delete dir_;
}

void TestRemoteController::testFavoriteSlotsPadded()
{
    QCOMPARE(controller_->favoriteSlots(), QStringList({"-", "-", "-", "-", "-", "-"}));

    QSignalSpy spy(controller_, &scr::RemoteController::favoritesChanged);
    controller_->addFavorite("Netflix");
    controller_->addFavorite("Hulu");
    QCOMPARE(spy.count(), 2);
    QCOMPARE(controller_->favoriteSlots(), QStringList({"Netflix", "Hulu", "-", "-", "-", "-"}));
}

void TestRemoteController::testFailureRendersStatusAndLog()
{
    controller_->addFavorite("Netflix");
    controller_->addFavorite("Netflix");

    QCOMPARE(controller_->statusText(), QString("Favorites: App 'Netflix' already in favorites"));
    QVERIFY(controller_->outputLog().endsWith("Error: App 'Netflix' already in favorites"));
}

void TestRemoteController::testTransportFailureRaisesError()
{
    backend_->failConnect = true;
    controller_->manualConnect("10.0.0.5", "", "");

    QSignalSpy spy(controller_, &scr::RemoteController::errorRaised);
    controller_->manualConnect("10.0.0.5", "", "");
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(1).toString(), QString("Connection Error: device unreachable"));
    QVERIFY(!controller_->connected());
}

void TestRemoteController::testValidationFailureDoesNotRaise()
{
    QSignalSpy spy(controller_, &scr::RemoteController::errorRaised);
    controller_->execute("no_such_command", "");
    QCOMPARE(spy.count(), 0);
    QVERIFY(controller_->statusText().contains("Unknown command: no_such_command"));
}

void TestRemoteController::testDiscoveryFillsModel()
{
    backend_->ssdpResults = {makeDiscovered("TV", "10.0.0.2"), makeDiscovered("Bar", "10.0.0.3")};
    auto* model = qobject_cast<QAbstractItemModel*>(controller_->discoveredDevices());
    QVERIFY(model);

    QSignalSpy finished(discovery_, &scr::DiscoveryReconciler::finished);
    controller_->discover();
    QVERIFY(controller_->discovering());
    QCOMPARE(controller_->statusText(), QString("Discovery: starting..."));

    // A second trigger while running is reported, not started
    controller_->rediscover();
    QVERIFY(controller_->statusText().contains("Discovery already in progress"));

    QVERIFY(finished.wait(5000));
    QVERIFY(!controller_->discovering());
    QCOMPARE(model->rowCount(), 2);
    QCOMPARE(controller_->statusText(), QString("Discovery: found 2 device(s)"));
    QVERIFY(controller_->outputLog().contains("SSDP found 2"));
}

void TestRemoteController::testSelectAndSaveUpdatesSavedModel()
{
    backend_->zeroconfResults = {makeDiscovered("TV", "10.0.0.2")};
    QSignalSpy finished(discovery_, &scr::DiscoveryReconciler::finished);
    controller_->discover();
    QVERIFY(finished.wait(5000));

    auto* saved = qobject_cast<QAbstractItemModel*>(controller_->savedDevices());
    QCOMPARE(saved->rowCount(), 0);

    controller_->selectDiscovered(0);
    QCOMPARE(controller_->selectedName(), QString("TV"));
    QCOMPARE(controller_->manualAddress(), QString("10.0.0.2:7345"));

    controller_->saveSelected();
    QCOMPARE(saved->rowCount(), 1);

    controller_->removeSaved(0);
    QCOMPARE(saved->rowCount(), 0);
}

void TestRemoteController::testConnectAppendsStatus()
{
    controller_->manualConnect("10.0.0.5", "", "tok");
    QVERIFY(controller_->connected());
    QVERIFY(controller_->controlsEnabled());
    QVERIFY(controller_->outputLog().contains("Connected to 10.0.0.5"));
    QVERIFY(controller_->outputLog().contains("Volume: 12"));
    QCOMPARE(controller_->inputs(), backend_->clientState.inputs);
}

void TestRemoteController::testUnknownStatusKind()
{
    controller_->refreshStatus("Temperature");
    QVERIFY(controller_->statusText().contains("Unknown status kind"));
}

void TestRemoteController::testDeviceTypeProperty()
{
    QCOMPARE(controller_->deviceType(), QString("tv"));
    QSignalSpy spy(controller_, &scr::RemoteController::deviceTypeChanged);
    controller_->setDeviceType("speaker");
    QCOMPARE(controller_->deviceType(), QString("speaker"));
    controller_->setDeviceType("toaster");
    QCOMPARE(controller_->deviceType(), QString("speaker"));
    QCOMPARE(spy.count(), 1);
}

void TestRemoteController::testClearOutput()
{
    controller_->addFavorite("Netflix");
    QVERIFY(!controller_->outputLog().isEmpty());
    controller_->clearOutput();
    QVERIFY(controller_->outputLog().isEmpty());
}

void TestRemoteController::testCopyAuthToken()
{
    controller_->copyAuthToken();
    QCOMPARE(controller_->statusText(), QString("Copy: No auth token to copy"));

    controller_->setAuthToken("  secret-token ");
    controller_->copyAuthToken();
    QCOMPARE(QGuiApplication::clipboard()->text(), QString("secret-token"));
    QCOMPARE(controller_->statusText(), QString("Auth token copied to clipboard"));
}

QTEST_MAIN(TestRemoteController)
#include "test_remote_controller.moc"
