#include <QtTest>
#include "core/commands/StatusQuery.hpp"
#include "MockSmartCastBackend.hpp"

class TestStatusQuery : public QObject {
    Q_OBJECT
private slots:
    void testKindNames();
    void testKindFromName();
    void testSingleField();
    void testAllFieldsInOrder();
    void testFirstFailureAborts();
    void testNoClient();
};

void TestStatusQuery::testKindNames()
{
    QCOMPARE(scr::StatusQuery::kindNames(),
             QStringList({"All", "Power", "Volume", "Input", "App", "Charging",
                          "Battery", "Version", "ESN", "Serial"}));
}

void TestStatusQuery::testKindFromName()
{
    scr::StatusKind kind = scr::StatusKind::All;
    QVERIFY(scr::StatusQuery::kindFromName("volume", &kind));
    QVERIFY(kind == scr::StatusKind::Volume);
    QVERIFY(scr::StatusQuery::kindFromName("esn", &kind));
    QVERIFY(kind == scr::StatusKind::Esn);
    QVERIFY(!scr::StatusQuery::kindFromName("Temperature", &kind));
}

void TestStatusQuery::testSingleField()
{
    MockClientState state;
    MockSmartCastClient client(&state, "10.0.0.2");

    QStringList lines;
    auto result = scr::StatusQuery::query(&client, scr::StatusKind::Volume, &lines);
    QVERIFY(result.ok);
    QCOMPARE(lines, QStringList({"Volume: 12"}));
    QCOMPARE(state.calls, QStringList({"currentVolume"}));
}

void TestStatusQuery::testAllFieldsInOrder()
{
    MockClientState state;
    MockSmartCastClient client(&state, "10.0.0.2");

    QStringList lines;
    QVERIFY(scr::StatusQuery::query(&client, scr::StatusKind::All, &lines).ok);
    QCOMPARE(lines.size(), 9);
    QCOMPARE(lines[0], QString("Power: 1"));
    QCOMPARE(lines[3], QString("App: Netflix"));
    QCOMPARE(lines[4], QString("Charging: None"));
    QCOMPARE(lines[8], QString("Serial: SN-001"));
}

void TestStatusQuery::testFirstFailureAborts()
{
    MockClientState state;
    state.failing.insert("currentInput");
    MockSmartCastClient client(&state, "10.0.0.2");

    QStringList lines{"previous"};
    auto result = scr::StatusQuery::query(&client, scr::StatusKind::All, &lines);
    QVERIFY(!result.ok);
    QCOMPARE(result.kind, scr::ErrorKind::Transport);
    QCOMPARE(result.message, QString("Status Error: currentInput timed out"));
    // Nothing after the failing field was queried
    QCOMPARE(state.calls.last(), QString("currentInput"));
    QCOMPARE(lines, QStringList({"previous"}));
}

void TestStatusQuery::testNoClient()
{
    auto result = scr::StatusQuery::query(nullptr, scr::StatusKind::Power, nullptr);
    QVERIFY(!result.ok);
    QCOMPARE(result.kind, scr::ErrorKind::Validation);
}

QTEST_MAIN(TestStatusQuery)
#include "test_status_query.moc"
