#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <memory>
#include <sstream>

#include <nlohmann/json.hpp>

#include "cli/state_cli.hpp"
#include "common/state_error.hpp"
#include "engine/request_handler.hpp"
#include "engine/state_manager.hpp"
#include "test_support.hpp"

using hoststate::StateCategory;

class StateCliTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    void testBuildRequest();
    void testBuildRequestRejectsBadArguments();
    void testUpdateAndLoad();
    void testExportPrintsBareDocument();
    void testImportFromFile();
    void testFailureExitCode();
    void testRawRequest();

private:
    QTemporaryDir m_homeDir;
    QByteArray m_prevHome;
    std::unique_ptr<QTemporaryDir> m_tempDir;
    std::unique_ptr<hoststate::testing::FakeClock> m_clock;
    std::unique_ptr<hoststate::testing::ScriptedObserver> m_observer;
    std::unique_ptr<hoststate::StateStore> m_store;
    std::unique_ptr<hoststate::TtlCache> m_cache;
    std::unique_ptr<hoststate::StateManager> m_manager;
    std::unique_ptr<hoststate::RequestHandler> m_handler;

    int runCli(const QStringList &args, std::string *out = nullptr, std::string *err = nullptr);
};

void StateCliTests::initTestCase()
{
    QVERIFY(m_homeDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_homeDir.path().toUtf8());
}

void StateCliTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void StateCliTests::init()
{
    m_tempDir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_tempDir->isValid());

    m_clock = std::make_unique<hoststate::testing::FakeClock>();
    m_observer = std::make_unique<hoststate::testing::ScriptedObserver>();
    m_store = std::make_unique<hoststate::StateStore>(
        (m_tempDir->path() + QStringLiteral("/.pi-state.json")).toStdString());
    m_cache = std::make_unique<hoststate::TtlCache>(
        *m_clock, std::map<StateCategory, std::chrono::seconds>{});

    hoststate::ManagerOptions options;
    options.requiredCategories = {StateCategory::System};
    m_manager = std::make_unique<hoststate::StateManager>(*m_store, *m_cache, *m_observer,
                                                          *m_clock, options);
    m_handler = std::make_unique<hoststate::RequestHandler>(*m_manager);
}

void StateCliTests::cleanup()
{
    m_handler.reset();
    m_manager.reset();
    m_cache.reset();
    m_store.reset();
    m_observer.reset();
    m_clock.reset();
    m_tempDir.reset();
}

int StateCliTests::runCli(const QStringList &args, std::string *out, std::string *err)
{
    std::ostringstream outStream;
    std::ostringstream errStream;
    hoststate::StateCli cli(*m_handler, outStream, errStream);
    QStringList fullArgs{QStringLiteral("hoststate")};
    fullArgs.append(args);
    const int code = cli.run(fullArgs);
    if (out) {
        *out = outStream.str();
    }
    if (err) {
        *err = errStream.str();
    }
    return code;
}

void StateCliTests::testBuildRequest()
{
    const auto request = hoststate::StateCli::buildRequest(
        {QStringLiteral("hoststate"), QStringLiteral("update"),
         QStringLiteral("--path"), QStringLiteral("system.cpu_count"),
         QStringLiteral("--value"), QStringLiteral("4")});
    QVERIFY(request["action"] == "update");
    QVERIFY(request["path"] == "system.cpu_count");
    QVERIFY(request["value"] == 4);

    const auto text = hoststate::StateCli::buildRequest(
        {QStringLiteral("hoststate"), QStringLiteral("update"),
         QStringLiteral("--path"), QStringLiteral("system.hostname"),
         QStringLiteral("--value"), QStringLiteral("pi")});
    QVERIFY(text["value"] == "pi");

    const auto save = hoststate::StateCli::buildRequest(
        {QStringLiteral("hoststate"), QStringLiteral("save"),
         QStringLiteral("--force-scan"), QStringLiteral("--timeout-ms"), QStringLiteral("2500")});
    QVERIFY(save["force_scan"] == true);
    QVERIFY(save["timeout_ms"] == 2500);
}

void StateCliTests::testBuildRequestRejectsBadArguments()
{
    QVERIFY_EXCEPTION_THROWN(hoststate::StateCli::buildRequest({QStringLiteral("hoststate")}),
                             hoststate::StateError);
    QVERIFY_EXCEPTION_THROWN(hoststate::StateCli::buildRequest(
                                 {QStringLiteral("hoststate"), QStringLiteral("reboot")}),
                             hoststate::StateError);
    QVERIFY_EXCEPTION_THROWN(hoststate::StateCli::buildRequest(
                                 {QStringLiteral("hoststate"), QStringLiteral("watch"),
                                  QStringLiteral("--path")}),
                             hoststate::StateError);
    QVERIFY_EXCEPTION_THROWN(hoststate::StateCli::buildRequest(
                                 {QStringLiteral("hoststate"), QStringLiteral("save"),
                                  QStringLiteral("--timeout-ms"), QStringLiteral("0")}),
                             hoststate::StateError);
    QVERIFY_EXCEPTION_THROWN(hoststate::StateCli::buildRequest(
                                 {QStringLiteral("hoststate"), QStringLiteral("compare"),
                                  QStringLiteral("--timeout-ms"), QStringLiteral("3000000000")}),
                             hoststate::StateError);

    std::string err;
    QCOMPARE(runCli({QStringLiteral("bogus")}, nullptr, &err), 2);
    QVERIFY(QString::fromStdString(err).contains(QStringLiteral("Usage:")));
}

void StateCliTests::testUpdateAndLoad()
{
    QCOMPARE(runCli({QStringLiteral("update"), QStringLiteral("--path"),
                     QStringLiteral("system.hostname"), QStringLiteral("--value"),
                     QStringLiteral("pi")}),
             0);

    std::string out;
    QCOMPARE(runCli({QStringLiteral("load")}, &out), 0);
    const auto response = nlohmann::json::parse(out);
    QVERIFY(response["result"]["state"]["system"]["hostname"] == "pi");
}

void StateCliTests::testExportPrintsBareDocument()
{
    QCOMPARE(runCli({QStringLiteral("update"), QStringLiteral("--path"),
                     QStringLiteral("notes"), QStringLiteral("--value"),
                     QStringLiteral("[\"fan\"]")}),
             0);

    std::string out;
    QCOMPARE(runCli({QStringLiteral("export")}, &out), 0);
    const auto document = nlohmann::json::parse(out);
    QVERIFY(document["schema_version"] == "2.0");
    QVERIFY(document["notes"][0] == "fan");
    QVERIFY(!document.contains("result"));
}

void StateCliTests::testImportFromFile()
{
    const QString path = m_tempDir->path() + QStringLiteral("/import.json");
    {
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write(R"({"schema_version": "1.0", "system": {"hostname": "old-pi"}})");
    }

    QCOMPARE(runCli({QStringLiteral("import"), QStringLiteral("--document"), path}), 0);

    std::string out;
    QCOMPARE(runCli({QStringLiteral("watch"), QStringLiteral("--path"),
                     QStringLiteral("system.hostname")}, &out), 0);
    QVERIFY(nlohmann::json::parse(out)["result"]["value"] == "old-pi");

    std::string err;
    QCOMPARE(runCli({QStringLiteral("import"), QStringLiteral("--document"),
                     m_tempDir->path() + QStringLiteral("/missing.json")}, nullptr, &err), 2);
}

void StateCliTests::testFailureExitCode()
{
    std::string err;
    QCOMPARE(runCli({QStringLiteral("compare")}, nullptr, &err), 1);
    const auto response = nlohmann::json::parse(err);
    QVERIFY(response["error"]["code"] == "not_found");
}

void StateCliTests::testRawRequest()
{
    std::string out;
    QCOMPARE(runCli({QStringLiteral("request"),
                     QStringLiteral(R"({"action": "update", "path": "a.b", "value": 5, "id": 3})")},
                    &out),
             0);
    const auto response = nlohmann::json::parse(out);
    QVERIFY(response["id"] == 3);
    QVERIFY(response["result"]["value"] == 5);

    QCOMPARE(runCli({QStringLiteral("request"), QStringLiteral("not json")}), 2);
}

QTEST_MAIN(StateCliTests)
#include "test_state_cli.moc"
