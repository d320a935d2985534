#include <QTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include "core/devices/DeviceRegistry.hpp"

namespace {

scr::DeviceRecord makeRecord(const QString& name, const QString& host, int port)
{
    scr::DeviceRecord r;
    r.name = name;
    r.host = host;
    r.port = port;
    r.savedAt = QDateTime(QDate(2024, 5, 1), QTime(12, 0), Qt::UTC);
    return r;
}

} // namespace

class TestDeviceRegistry : public QObject {
    Q_OBJECT

private slots:
    void loadMissingStoreIsEmpty()
    {
        QTemporaryDir dir;
        scr::DeviceRegistry registry(dir.path() + "/devices.json");
        registry.load();
        QCOMPARE(registry.count(), 0);
    }

    void loadCorruptStoreIsEmpty()
    {
        scr::DeviceRegistry registry(QString(TEST_DATA_DIR) + "/devices_corrupt.json");
        registry.load();
        QCOMPARE(registry.count(), 0);
    }

    void upsertAddsAndPersists()
    {
        QTemporaryDir dir;
        QString path = dir.path() + "/devices.json";
        scr::DeviceRegistry registry(path);
        QSignalSpy spy(&registry, &scr::DeviceRegistry::devicesChanged);

        auto result = registry.upsert(makeRecord("TV", "10.0.0.2", 7345));
        QVERIFY(result.ok);
        QCOMPARE(result.message, QString("Device saved with auth info (if available)"));
        QCOMPARE(registry.count(), 1);
        QVERIFY(spy.count() >= 1);

        scr::DeviceRegistry reopened(path);
        reopened.load();
        QCOMPARE(reopened.devices(), registry.devices());
    }

    void upsertIsIdempotentOnIdentity()
    {
        QTemporaryDir dir;
        scr::DeviceRegistry registry(dir.path() + "/devices.json");

        auto record = makeRecord("TV", "10.0.0.2", 7345);
        registry.upsert(record);
        registry.upsert(record);
        QCOMPARE(registry.count(), 1);

        // Same host and port replaces the record in place
        record.name = "Renamed";
        record.authToken = "tok";
        registry.upsert(record);
        QCOMPARE(registry.count(), 1);
        QCOMPARE(registry.at(0).name, QString("Renamed"));
        QCOMPARE(registry.at(0).authToken, QString("tok"));
    }

    void differentPortIsDifferentDevice()
    {
        QTemporaryDir dir;
        scr::DeviceRegistry registry(dir.path() + "/devices.json");
        registry.upsert(makeRecord("TV", "10.0.0.2", 7345));
        registry.upsert(makeRecord("TV", "10.0.0.2", 9000));
        registry.upsert(makeRecord("TV", "10.0.0.2", 0));
        QCOMPARE(registry.count(), 3);
        QCOMPARE(registry.indexOf("10.0.0.2", 9000), 1);
    }

    void removeDeletesMatch()
    {
        QTemporaryDir dir;
        scr::DeviceRegistry registry(dir.path() + "/devices.json");
        registry.upsert(makeRecord("A", "10.0.0.2", 7345));
        registry.upsert(makeRecord("B", "10.0.0.3", 7345));

        auto result = registry.remove("10.0.0.2", 7345);
        QVERIFY(result.ok);
        QCOMPARE(registry.count(), 1);
        QCOMPARE(registry.at(0).name, QString("B"));
    }

    void removeAbsentIsNoOp()
    {
        QTemporaryDir dir;
        scr::DeviceRegistry registry(dir.path() + "/devices.json");
        registry.upsert(makeRecord("A", "10.0.0.2", 7345));

        auto result = registry.remove("10.0.0.9", 7345);
        QVERIFY(result.ok);
        QCOMPARE(registry.count(), 1);
    }

    void setFavoritesWritesThrough()
    {
        QTemporaryDir dir;
        QString path = dir.path() + "/devices.json";
        scr::DeviceRegistry registry(path);
        registry.upsert(makeRecord("TV", "10.0.0.2", 7345));

        auto favorites = scr::FavoritesList::fromStringList({"Netflix", "Hulu"});
        QVERIFY(registry.setFavorites("10.0.0.2", 7345, favorites).ok);

        scr::DeviceRegistry reopened(path);
        reopened.load();
        QCOMPARE(reopened.at(0).favorites, favorites);
    }

    void setFavoritesOnUnsavedDeviceFails()
    {
        QTemporaryDir dir;
        scr::DeviceRegistry registry(dir.path() + "/devices.json");
        auto result = registry.setFavorites("10.0.0.2", 7345, {});
        QVERIFY(!result.ok);
        QCOMPARE(result.kind, scr::ErrorKind::Validation);
    }

    void saveFailureKeepsMemoryState()
    {
        QTemporaryDir dir;
        QString path = dir.path() + "/devices.json";
        QVERIFY(QDir().mkpath(path));  // unwritable: a directory sits at the path
        scr::DeviceRegistry registry(path);

        auto result = registry.upsert(makeRecord("TV", "10.0.0.2", 7345));
        QVERIFY(!result.ok);
        QCOMPARE(result.kind, scr::ErrorKind::Persistence);
        QCOMPARE(registry.count(), 1);
    }

    void roundTripThroughStore()
    {
        QTemporaryDir dir;
        QString path = dir.path() + "/devices.json";
        QVERIFY(QFile::copy(QString(TEST_DATA_DIR) + "/devices_valid.json", path));
        QFile::setPermissions(path, QFile::ReadOwner | QFile::WriteOwner);

        scr::DeviceRegistry registry(path);
        registry.load();
        auto before = registry.devices();
        QVERIFY(registry.save().ok);
        registry.load();
        QCOMPARE(registry.devices(), before);
    }
};

QTEST_MAIN(TestDeviceRegistry)
#include "test_device_registry.moc"
