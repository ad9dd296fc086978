#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void testLogEventWrites();
    void testDebugSuppressedWithoutTrace();
    void testTraceWrites();
    void testCorrelationScope();
    void testRotatesLargeFile();
    void testLogDirOverride();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString logPath(const QString &suffix) const;
    QList<nlohmann::json> readLines(const QString &path) const;
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
}

void LoggingTests::init()
{
    QFile::remove(logPath(QStringLiteral(".log")));
    QFile::remove(logPath(QStringLiteral("-trace.log")));
}

QString LoggingTests::logPath(const QString &suffix) const
{
    return m_tempDir.path() + QStringLiteral("/.local/share/hoststate/logs/hoststate-test") + suffix;
}

QList<nlohmann::json> LoggingTests::readLines(const QString &path) const
{
    QList<nlohmann::json> lines;
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return lines;
    }
    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        if (!line.isEmpty()) {
            lines.push_back(nlohmann::json::parse(line.toStdString()));
        }
    }
    return lines;
}

void LoggingTests::testLogEventWrites()
{
    hoststate::logging::initLogging(QStringLiteral("hoststate-test"), false);

    hoststate::logging::logEvent(hoststate::logging::LogLevel::Info,
                                 QStringLiteral("hoststate-test"),
                                 QStringLiteral("Test"),
                                 QStringLiteral("testLogEventWrites"),
                                 QStringLiteral("test_log"),
                                 QStringLiteral("unit_test"),
                                 QStringLiteral("direct_call"),
                                 hoststate::logging::defaultWho(),
                                 QStringLiteral("corr-1"),
                                 nlohmann::json{{"key", "value"}});

    const auto lines = readLines(logPath(QStringLiteral(".log")));
    QCOMPARE(lines.size(), 1);
    QCOMPARE(QString::fromStdString(lines[0].value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(lines[0].value("corr", "")), QStringLiteral("corr-1"));
    QCOMPARE(QString::fromStdString(lines[0].value("level", "")), QStringLiteral("INFO"));
    QVERIFY(lines[0]["context"]["key"] == "value");
    QVERIFY(!QFile::exists(logPath(QStringLiteral("-trace.log"))));
}

void LoggingTests::testDebugSuppressedWithoutTrace()
{
    hoststate::logging::initLogging(QStringLiteral("hoststate-test"), false);
    HSLOG_DEBUG(QStringLiteral("Test"),
                QStringLiteral("testDebugSuppressedWithoutTrace"),
                QStringLiteral("debug_line"),
                QStringLiteral("unit_test"),
                QStringLiteral("macro"),
                hoststate::logging::defaultWho(),
                QString(),
                nlohmann::json::object());

    QVERIFY(readLines(logPath(QStringLiteral(".log"))).isEmpty());
}

void LoggingTests::testTraceWrites()
{
    hoststate::logging::initLogging(QStringLiteral("hoststate-test"), true);
    QVERIFY(hoststate::logging::isTraceEnabled());

    HSLOG_DEBUG(QStringLiteral("Test"),
                QStringLiteral("testTraceWrites"),
                QStringLiteral("trace_line"),
                QStringLiteral("unit_test"),
                QStringLiteral("macro"),
                hoststate::logging::defaultWho(),
                QStringLiteral("corr-2"),
                nlohmann::json::object());

    const auto trace = readLines(logPath(QStringLiteral("-trace.log")));
    QCOMPARE(trace.size(), 1);
    QCOMPARE(QString::fromStdString(trace[0].value("level", "")), QStringLiteral("DEBUG"));
    QCOMPARE(readLines(logPath(QStringLiteral(".log"))).size(), 1);

    hoststate::logging::initLogging(QStringLiteral("hoststate-test"), false);
}

void LoggingTests::testCorrelationScope()
{
    hoststate::logging::initLogging(QStringLiteral("hoststate-test"), false);
    QVERIFY(hoststate::logging::currentCorrelationId().isEmpty());
    {
        hoststate::logging::CorrelationScope scope(QStringLiteral("req-42"));
        HSLOG_INFO(QStringLiteral("Test"),
                   QStringLiteral("testCorrelationScope"),
                   QStringLiteral("scoped_line"),
                   QStringLiteral("unit_test"),
                   QStringLiteral("macro"),
                   hoststate::logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
    }
    QVERIFY(hoststate::logging::currentCorrelationId().isEmpty());

    const auto lines = readLines(logPath(QStringLiteral(".log")));
    QCOMPARE(lines.size(), 1);
    QCOMPARE(QString::fromStdString(lines[0].value("corr", "")), QStringLiteral("req-42"));
}

void LoggingTests::testRotatesLargeFile()
{
    hoststate::logging::initLogging(QStringLiteral("hoststate-test"), false);
    QVERIFY(QDir().mkpath(hoststate::logging::logsDirPath()));

    const QString path = logPath(QStringLiteral(".log"));
    QFile::remove(path + QStringLiteral(".1"));
    {
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        QVERIFY(file.resize(6 * 1024 * 1024));
    }

    HSLOG_WARN(QStringLiteral("Test"),
               QStringLiteral("testRotatesLargeFile"),
               QStringLiteral("after_rotation"),
               QStringLiteral("unit_test"),
               QStringLiteral("macro"),
               hoststate::logging::defaultWho(),
               QString(),
               nlohmann::json::object());

    QVERIFY(QFile::exists(path + QStringLiteral(".1")));
    const auto lines = readLines(path);
    QCOMPARE(lines.size(), 1);
    QCOMPARE(QString::fromStdString(lines[0].value("level", "")), QStringLiteral("WARN"));
}

void LoggingTests::testLogDirOverride()
{
    QTemporaryDir logDir;
    QVERIFY(logDir.isValid());
    qputenv("HOSTSTATE_LOG_DIR", logDir.path().toUtf8());
    QCOMPARE(hoststate::logging::logsDirPath(), logDir.path());

    hoststate::logging::initLogging(QStringLiteral("hoststate-test"), false);
    HSLOG_INFO(QStringLiteral("Test"),
               QStringLiteral("testLogDirOverride"),
               QStringLiteral("redirected"),
               QStringLiteral("unit_test"),
               QStringLiteral("macro"),
               hoststate::logging::defaultWho(),
               QString(),
               nlohmann::json::object());
    qunsetenv("HOSTSTATE_LOG_DIR");

    QVERIFY(QFile::exists(logDir.path() + QStringLiteral("/hoststate-test.log")));
    QVERIFY(!QFile::exists(logPath(QStringLiteral(".log"))));
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
