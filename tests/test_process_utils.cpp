#include <QtTest/QtTest>

#include <QElapsedTimer>
#include <QTemporaryDir>

#include <chrono>
#include <csignal>

#include "common/interruption.hpp"
#include "common/process_utils.hpp"

using namespace std::chrono_literals;

class ProcessUtilsTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void init();
    void testCapturesOutput();
    void testNonZeroExit();
    void testMissingProgram();
    void testTimeoutKillsChild();
    void testInterruptionKillsChild();
    void testDefaultLockFilePath();

private:
    QTemporaryDir m_tempDir;
};

void ProcessUtilsTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("SNAPFREEZE_LOG_DIR", m_tempDir.path().toUtf8());
}

void ProcessUtilsTests::init()
{
    snapfreeze::interruption::reset();
}

void ProcessUtilsTests::testCapturesOutput()
{
    const auto result = snapfreeze::runCommand(
        QStringLiteral("/bin/sh"),
        {QStringLiteral("-c"), QStringLiteral("echo out; echo err >&2")},
        5s);

    QVERIFY(result.ok());
    QCOMPARE(result.exitCode, 0);
    QCOMPARE(result.standardOutput.trimmed(), QStringLiteral("out"));
    QCOMPARE(result.standardError.trimmed(), QStringLiteral("err"));
}

void ProcessUtilsTests::testNonZeroExit()
{
    const auto result = snapfreeze::runCommand(
        QStringLiteral("/bin/sh"),
        {QStringLiteral("-c"), QStringLiteral("echo 'An error occurred (UnauthorizedOperation)' >&2; exit 254")},
        5s);

    QVERIFY(!result.ok());
    QCOMPARE(result.exitCode, 254);
    QCOMPARE(result.failureText(QStringLiteral("aws")),
             QStringLiteral("An error occurred (UnauthorizedOperation)"));

    const auto silent = snapfreeze::runCommand(
        QStringLiteral("/bin/sh"), {QStringLiteral("-c"), QStringLiteral("exit 3")}, 5s);
    QCOMPARE(silent.failureText(QStringLiteral("sh")), QStringLiteral("sh exited with status 3"));
}

void ProcessUtilsTests::testMissingProgram()
{
    const auto result = snapfreeze::runCommand(
        m_tempDir.path() + "/no-such-binary", {}, 5s);

    QVERIFY(!result.started);
    QVERIFY(!result.ok());
    QVERIFY(result.failureText(QStringLiteral("aws")).startsWith(QStringLiteral("failed to start")));
}

void ProcessUtilsTests::testTimeoutKillsChild()
{
    QElapsedTimer timer;
    timer.start();

    const auto result = snapfreeze::runCommand(
        QStringLiteral("/bin/sleep"), {QStringLiteral("30")}, 300ms);

    QVERIFY(result.timedOut);
    QVERIFY(!result.ok());
    QVERIFY(timer.elapsed() < 10000);
}

void ProcessUtilsTests::testInterruptionKillsChild()
{
    snapfreeze::interruption::trigger(SIGTERM);
    QElapsedTimer timer;
    timer.start();

    const auto result = snapfreeze::runCommand(
        QStringLiteral("/bin/sleep"), {QStringLiteral("30")}, 60s);

    QVERIFY(result.interrupted);
    QVERIFY(!result.ok());
    QVERIFY(timer.elapsed() < 10000);
    snapfreeze::interruption::reset();
}

void ProcessUtilsTests::testDefaultLockFilePath()
{
    const QByteArray previous = qgetenv("XDG_RUNTIME_DIR");

    qputenv("XDG_RUNTIME_DIR", "/run/user/1000");
    QCOMPARE(snapfreeze::defaultLockFilePath(), QStringLiteral("/run/user/1000/snapfreeze.lock"));

    qunsetenv("XDG_RUNTIME_DIR");
    QCOMPARE(snapfreeze::defaultLockFilePath(), QStringLiteral("/run/snapfreeze.lock"));

    if (!previous.isEmpty()) {
        qputenv("XDG_RUNTIME_DIR", previous);
    }
}

QTEST_MAIN(ProcessUtilsTests)
#include "test_process_utils.moc"
