#include <QtTest>
#include "core/commands/CommandExecutor.hpp"
#include "MockSmartCastBackend.hpp"

class TestCommandExecutor : public QObject {
    Q_OBJECT
private slots:
    void testNoClient();
    void testDispatchesTypedCall();
    void testDefaultSteps();
    void testClientExceptionIsTransportError();
    void testFormatValue();
    void testEveryCommandDispatches();
};

static scr::Command parsed(const QString& name, const QString& args = {})
{
    scr::Command cmd;
    scr::CommandCatalog::parse(name, args, &cmd);
    return cmd;
}

void TestCommandExecutor::testNoClient()
{
    auto result = scr::CommandExecutor::execute(nullptr, parsed("pow_on"));
    QVERIFY(!result.ok);
    QCOMPARE(result.kind, scr::ErrorKind::Validation);
    QCOMPARE(result.message, QString("No device connected"));
}

void TestCommandExecutor::testDispatchesTypedCall()
{
    MockClientState state;
    MockSmartCastClient client(&state, "10.0.0.2:7345");

    auto result = scr::CommandExecutor::execute(&client, parsed("set_audio_setting", "volume 25"));
    QVERIFY(result.ok);
    QCOMPARE(result.message, QString("> set_audio_setting volume 25 -> True"));
    QCOMPARE(state.calls, QStringList({"setAudioSetting:volume,25"}));
}

void TestCommandExecutor::testDefaultSteps()
{
    MockClientState state;
    MockSmartCastClient client(&state, "10.0.0.2");
    QVERIFY(scr::CommandExecutor::execute(&client, parsed("ch_down")).ok);
    QCOMPARE(state.calls.last(), QString("channelDown:1"));
}

void TestCommandExecutor::testClientExceptionIsTransportError()
{
    MockClientState state;
    state.failing.insert("powerToggle");
    MockSmartCastClient client(&state, "10.0.0.2");

    auto result = scr::CommandExecutor::execute(&client, parsed("pow_toggle"));
    QVERIFY(!result.ok);
    QCOMPARE(result.kind, scr::ErrorKind::Transport);
    QCOMPARE(result.message, QString("pow_toggle failed: powerToggle timed out"));
}

void TestCommandExecutor::testFormatValue()
{
    QCOMPARE(scr::CommandExecutor::formatValue(QVariant()), QString("None"));
    QCOMPARE(scr::CommandExecutor::formatValue(true), QString("True"));
    QCOMPARE(scr::CommandExecutor::formatValue(false), QString("False"));
    QCOMPARE(scr::CommandExecutor::formatValue(12), QString("12"));
    QCOMPARE(scr::CommandExecutor::formatValue(QStringList({"HDMI-1", "CAST"})), QString("HDMI-1, CAST"));
}

void TestCommandExecutor::testEveryCommandDispatches()
{
    MockClientState state;
    MockSmartCastClient client(&state, "10.0.0.2");

    for (const auto& spec : scr::CommandCatalog::all()) {
        scr::Command cmd;
        cmd.id = spec.id;
        cmd.name = spec.name;
        for (const auto& arg : spec.args)
            cmd.args.append(arg.type == scr::ArgType::Int ? QVariant(1) : QVariant("x"));

        int before = state.calls.size();
        QVERIFY2(scr::CommandExecutor::execute(&client, cmd).ok, qPrintable(spec.name));
        QCOMPARE(state.calls.size(), before + 1);
    }
}

QTEST_MAIN(TestCommandExecutor)
#include "test_command_executor.moc"
