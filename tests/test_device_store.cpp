#include <QtTest>
#include <QTemporaryDir>
#include "core/devices/DeviceStore.hpp"

class TestDeviceStore : public QObject {
    Q_OBJECT
private slots:
    void testMissingFileIsEmpty();
    void testReadValidFile();
    void testCorruptFileIsEmpty();
    void testNonArrayRootIsEmpty();
    void testNullDocumentIsEmpty();
    void testWriteCreatesDirectories();
    void testLoadSaveLoadIsStable();
    void testWriteFailureIsPersistenceError();
};

void TestDeviceStore::testMissingFileIsEmpty()
{
    QTemporaryDir dir;
    scr::DeviceStore store(dir.path() + "/devices.json");
    QVERIFY(store.read().isEmpty());
}

void TestDeviceStore::testReadValidFile()
{
    scr::DeviceStore store(QString(TEST_DATA_DIR) + "/devices_valid.json");
    auto devices = store.read();

    // The string entry is skipped
    QCOMPARE(devices.size(), 3);

    QCOMPARE(devices[0].name, QString("Living Room"));
    QCOMPARE(devices[0].port, 7345);
    QCOMPARE(devices[0].authToken, QString("Zmx4abc"));
    QCOMPARE(devices[0].identity.serialNumber, QString("LTMSVKAR1234"));
    QCOMPARE(devices[0].externalId, QString("uuid:1a2b3c"));
    QCOMPARE(devices[0].favorites.names(), QStringList({"Netflix", "YouTube"}));

    QCOMPARE(devices[1].port, 0);
    QCOMPARE(devices[1].deviceClass, scr::DeviceClass::Speaker);

    QCOMPARE(devices[2].port, 9000);
    QCOMPARE(devices[2].deviceClass, scr::DeviceClass::Tv);
    QCOMPARE(devices[2].favorites.size(), scr::FavoritesList::kCapacity);
}

void TestDeviceStore::testCorruptFileIsEmpty()
{
    scr::DeviceStore store(QString(TEST_DATA_DIR) + "/devices_corrupt.json");
    QVERIFY(store.read().isEmpty());
}

void TestDeviceStore::testNonArrayRootIsEmpty()
{
    scr::DeviceStore store(QString(TEST_DATA_DIR) + "/devices_not_array.json");
    QVERIFY(store.read().isEmpty());
}

void TestDeviceStore::testNullDocumentIsEmpty()
{
    QTemporaryDir dir;
    QString path = dir.path() + "/devices.json";
    QFile f(path);
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.write("null");
    f.close();

    scr::DeviceStore store(path);
    QVERIFY(store.read().isEmpty());
}

void TestDeviceStore::testWriteCreatesDirectories()
{
    QTemporaryDir dir;
    QString path = dir.path() + "/nested/state/devices.json";
    scr::DeviceStore store(path);

    scr::DeviceRecord r;
    r.name = "TV";
    r.host = "10.0.0.2";
    QVERIFY(store.write({r}).ok);
    QVERIFY(QFile::exists(path));
    QCOMPARE(store.read().size(), 1);
}

void TestDeviceStore::testLoadSaveLoadIsStable()
{
    QTemporaryDir dir;
    QString path = dir.path() + "/devices.json";
    QVERIFY(QFile::copy(QString(TEST_DATA_DIR) + "/devices_valid.json", path));
    QFile::setPermissions(path, QFile::ReadOwner | QFile::WriteOwner);

    scr::DeviceStore store(path);
    auto first = store.read();
    QVERIFY(store.write(first).ok);
    auto second = store.read();
    QCOMPARE(second, first);
}

void TestDeviceStore::testWriteFailureIsPersistenceError()
{
    QTemporaryDir dir;
    // A directory where the file should be makes the commit fail
    QString path = dir.path() + "/devices.json";
    QVERIFY(QDir().mkpath(path));

    scr::DeviceStore store(path);
    auto result = store.write({});
    QVERIFY(!result.ok);
    QCOMPARE(result.kind, scr::ErrorKind::Persistence);
    QVERIFY(result.message.startsWith("Failed to save devices"));
}

QTEST_MAIN(TestDeviceStore)
#include "test_device_store.moc"
