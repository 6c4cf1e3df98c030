#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QDir>
#include <QFile>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void testLogEventWritesToHome();
    void testLogDirOverride();
    void testDebugOnlyWithTrace();
    void testTraceFileWrites();
    void testCorrelationScope();
    void testHeldOutputWrittenOnRelease();
    void testReleaseSkipsFrozenLogDir();
    void testInvalidUtf8Context();

private:
    QByteArray readFirstLine(const QString &path);

    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void LoggingTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
    qunsetenv("SNAPFREEZE_LOG_DIR");
}

void LoggingTests::init()
{
    qunsetenv("SNAPFREEZE_LOG_DIR");
    snapfreeze::logging::releaseFileOutput();
}

QByteArray LoggingTests::readFirstLine(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readLine().trimmed();
}

void LoggingTests::testLogEventWritesToHome()
{
    snapfreeze::logging::initLogging(QStringLiteral("snapfreeze-test"), false);
    const QString logPath = m_tempDir.path() + "/.local/share/snapfreeze/logs/snapfreeze-test.log";

    snapfreeze::logging::logEvent(snapfreeze::logging::LogLevel::Info,
                                  QStringLiteral("snapfreeze-test"),
                                  QStringLiteral("Test"),
                                  QStringLiteral("testLogEventWritesToHome"),
                                  QStringLiteral("test_log"),
                                  QStringLiteral("unit_test"),
                                  QStringLiteral("direct_call"),
                                  snapfreeze::logging::defaultWho(),
                                  QStringLiteral("run-1"),
                                  nlohmann::json{{"key", "value"}});

    const QByteArray line = readFirstLine(logPath);
    QVERIFY(!line.isEmpty());

    const auto parsed = nlohmann::json::parse(line.toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("run-1"));
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("INFO"));
    QCOMPARE(QString::fromStdString(parsed["context"].value("key", "")), QStringLiteral("value"));
}

void LoggingTests::testLogDirOverride()
{
    const QString dir = m_tempDir.path() + "/override";
    qputenv("SNAPFREEZE_LOG_DIR", dir.toUtf8());
    snapfreeze::logging::initLogging(QStringLiteral("override-test"), false);

    QCOMPARE(snapfreeze::logging::logsDirPath(), dir);
    SFLOG_WARN(QStringLiteral("Test"),
               QStringLiteral("testLogDirOverride"),
               QStringLiteral("override_log"),
               QStringLiteral("unit_test"),
               QStringLiteral("macro"),
               snapfreeze::logging::defaultWho(),
               QString(),
               nlohmann::json::object());

    const QByteArray line = readFirstLine(dir + "/override-test.log");
    QVERIFY(!line.isEmpty());
    const auto parsed = nlohmann::json::parse(line.toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("WARN"));
    QCOMPARE(QString::fromStdString(parsed.value("process", "")), QStringLiteral("override-test"));
}

void LoggingTests::testDebugOnlyWithTrace()
{
    const QString dir = m_tempDir.path() + "/debug-off";
    qputenv("SNAPFREEZE_LOG_DIR", dir.toUtf8());
    snapfreeze::logging::initLogging(QStringLiteral("quiet"), false);

    SFLOG_DEBUG(QStringLiteral("Test"),
                QStringLiteral("testDebugOnlyWithTrace"),
                QStringLiteral("debug_log"),
                QStringLiteral("unit_test"),
                QStringLiteral("macro"),
                snapfreeze::logging::defaultWho(),
                QString(),
                nlohmann::json::object());

    QVERIFY(!QFile::exists(dir + "/quiet.log"));
    QVERIFY(!QFile::exists(dir + "/quiet-trace.log"));
}

void LoggingTests::testTraceFileWrites()
{
    snapfreeze::logging::initLogging(QStringLiteral("snapfreeze-test"), true);
    QVERIFY(snapfreeze::logging::isTraceEnabled());
    const QString tracePath = m_tempDir.path()
        + "/.local/share/snapfreeze/logs/snapfreeze-test-trace.log";

    snapfreeze::logging::logEvent(snapfreeze::logging::LogLevel::Debug,
                                  QStringLiteral("snapfreeze-test"),
                                  QStringLiteral("Test"),
                                  QStringLiteral("testTraceFileWrites"),
                                  QStringLiteral("test_trace"),
                                  QStringLiteral("unit_test"),
                                  QStringLiteral("direct_call"),
                                  snapfreeze::logging::defaultWho(),
                                  QStringLiteral("run-2"),
                                  nlohmann::json::object());

    QVERIFY(!readFirstLine(tracePath).isEmpty());
    snapfreeze::logging::initLogging(QStringLiteral("snapfreeze-test"), false);
}

void LoggingTests::testCorrelationScope()
{
    snapfreeze::logging::setCorrelationId(QStringLiteral("outer"));
    {
        const QString corr = snapfreeze::logging::newCorrelationId();
        QVERIFY(corr.startsWith(QStringLiteral("run-")));
        QCOMPARE(corr.size(), static_cast<qsizetype>(12));

        snapfreeze::logging::CorrelationScope scope(corr);
        QCOMPARE(snapfreeze::logging::currentCorrelationId(), corr);
    }
    QCOMPARE(snapfreeze::logging::currentCorrelationId(), QStringLiteral("outer"));
    snapfreeze::logging::setCorrelationId(QString());
}

void LoggingTests::testHeldOutputWrittenOnRelease()
{
    const QString dir = m_tempDir.path() + "/held";
    qputenv("SNAPFREEZE_LOG_DIR", dir.toUtf8());
    snapfreeze::logging::initLogging(QStringLiteral("held"), false);

    snapfreeze::logging::holdFileOutput();
    QVERIFY(snapfreeze::logging::isFileOutputHeld());
    for (const char *what : {"first", "second"}) {
        SFLOG_INFO(QStringLiteral("Test"),
                   QStringLiteral("testHeldOutputWrittenOnRelease"),
                   QString::fromLatin1(what),
                   QStringLiteral("unit_test"),
                   QStringLiteral("macro"),
                   snapfreeze::logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
    }

    QCOMPARE(snapfreeze::logging::heldEventCount(), static_cast<size_t>(2));
    QVERIFY(!QFile::exists(dir + "/held.log"));
    QVERIFY(!QDir(dir).exists());

    snapfreeze::logging::releaseFileOutput();

    QVERIFY(!snapfreeze::logging::isFileOutputHeld());
    QCOMPARE(snapfreeze::logging::heldEventCount(), static_cast<size_t>(0));
    const auto first = nlohmann::json::parse(readFirstLine(dir + "/held.log").toStdString());
    QCOMPARE(QString::fromStdString(first.value("what", "")), QStringLiteral("first"));

    QFile file(dir + "/held.log");
    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(file.readAll().count('\n'), static_cast<qsizetype>(2));
}

void LoggingTests::testReleaseSkipsFrozenLogDir()
{
    const QString mount = m_tempDir.path() + "/frozen-mount";
    const QString dir = mount + "/logs";
    qputenv("SNAPFREEZE_LOG_DIR", dir.toUtf8());
    snapfreeze::logging::initLogging(QStringLiteral("frozen"), false);

    snapfreeze::logging::holdFileOutput();
    SFLOG_ERROR(QStringLiteral("Test"),
                QStringLiteral("testReleaseSkipsFrozenLogDir"),
                QStringLiteral("while_frozen"),
                QStringLiteral("unit_test"),
                QStringLiteral("macro"),
                snapfreeze::logging::defaultWho(),
                QString(),
                nlohmann::json::object());
    snapfreeze::logging::releaseFileOutput({mount.toStdString()});

    // Neither the held event nor a later one may open a file under the mount.
    SFLOG_ERROR(QStringLiteral("Test"),
                QStringLiteral("testReleaseSkipsFrozenLogDir"),
                QStringLiteral("after_release"),
                QStringLiteral("unit_test"),
                QStringLiteral("macro"),
                snapfreeze::logging::defaultWho(),
                QString(),
                nlohmann::json::object());
    QVERIFY(!QDir(dir).exists());

    // A sibling whose name merely starts with the mount point is unaffected.
    const QString sibling = mount + "-other";
    qputenv("SNAPFREEZE_LOG_DIR", sibling.toUtf8());
    SFLOG_ERROR(QStringLiteral("Test"),
                QStringLiteral("testReleaseSkipsFrozenLogDir"),
                QStringLiteral("sibling"),
                QStringLiteral("unit_test"),
                QStringLiteral("macro"),
                snapfreeze::logging::defaultWho(),
                QString(),
                nlohmann::json::object());
    QVERIFY(!readFirstLine(sibling + "/frozen.log").isEmpty());

    snapfreeze::logging::releaseFileOutput();
}

void LoggingTests::testInvalidUtf8Context()
{
    const QString dir = m_tempDir.path() + "/bytes";
    qputenv("SNAPFREEZE_LOG_DIR", dir.toUtf8());
    snapfreeze::logging::initLogging(QStringLiteral("bytes"), false);

    SFLOG_INFO(QStringLiteral("Test"),
               QStringLiteral("testInvalidUtf8Context"),
               QStringLiteral("raw_mount_point"),
               QStringLiteral("unit_test"),
               QStringLiteral("macro"),
               snapfreeze::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"mountPoint", std::string("/mnt/caf\xe9")}}));

    const QByteArray line = readFirstLine(dir + "/bytes.log");
    QVERIFY(!line.isEmpty());
    const auto parsed = nlohmann::json::parse(line.toStdString());
    QVERIFY(QString::fromStdString(parsed["context"].value("mountPoint", ""))
                .startsWith(QStringLiteral("/mnt/caf")));
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
