#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <csignal>
#include <memory>
#include <sstream>

#include <sys/resource.h>

#include "common/json_utils.hpp"
#include "common/state_error.hpp"
#include "engine/state_document.hpp"
#include "engine/state_manager.hpp"
#include "test_support.hpp"

using hoststate::ErrorCode;
using hoststate::StateCategory;
using hoststate::StateError;

class StateManagerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    void testLoadWithoutState();
    void testUpdateIsVisibleAfterLoad();
    void testUpdateRejectsPathThroughScalar();
    void testUpdateRejectsNullValueAndManagedKeys();
    void testSaveThenDrift();
    void testSaveReusesFreshCache();
    void testSavePreservesUserSections();
    void testCancelledSaveLeavesFileUnchanged();
    void testCancelledCompare();
    void testObserverFailureIsTagged();
    void testNonMappingPayloadIsObserverError();
    void testWriteFailureRollsBack();
    void testImportAndExport();
    void testImportBacksUpCorruptFile();
    void testDiffAgainstSuppliedDocument();
    void testWatchPrefersFreshCache();
    void testCompareWithoutStateIsNotFound();
    void testLockTimeoutDuringUpdate();

private:
    QTemporaryDir m_homeDir;
    QByteArray m_prevHome;
    std::unique_ptr<QTemporaryDir> m_tempDir;
    std::unique_ptr<hoststate::testing::FakeClock> m_clock;
    std::unique_ptr<hoststate::testing::ScriptedObserver> m_observer;
    std::unique_ptr<hoststate::StateStore> m_store;
    std::unique_ptr<hoststate::TtlCache> m_cache;
    std::unique_ptr<hoststate::StateManager> m_manager;

    std::string statePath() const;
    QByteArray fileBytes() const;
    hoststate::ScanOptions scanOptions(const hoststate::CancellationToken *cancel = nullptr) const;
};

void StateManagerTests::initTestCase()
{
    QVERIFY(m_homeDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_homeDir.path().toUtf8());
}

void StateManagerTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void StateManagerTests::init()
{
    m_tempDir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_tempDir->isValid());

    m_clock = std::make_unique<hoststate::testing::FakeClock>();
    m_observer = std::make_unique<hoststate::testing::ScriptedObserver>();
    m_store = std::make_unique<hoststate::StateStore>(statePath());
    m_cache = std::make_unique<hoststate::TtlCache>(
        *m_clock,
        std::map<StateCategory, std::chrono::seconds>{
            {StateCategory::System, std::chrono::seconds(30)},
            {StateCategory::Network, std::chrono::seconds(60)},
        });

    hoststate::ManagerOptions options;
    options.requiredCategories = {StateCategory::System, StateCategory::Network};
    options.lockTimeout = std::chrono::milliseconds(50);
    options.scanTimeout = std::chrono::milliseconds(5000);
    m_manager = std::make_unique<hoststate::StateManager>(*m_store, *m_cache, *m_observer,
                                                          *m_clock, options);
}

void StateManagerTests::cleanup()
{
    m_manager.reset();
    m_cache.reset();
    m_store.reset();
    m_observer.reset();
    m_clock.reset();
    m_tempDir.reset();
}

std::string StateManagerTests::statePath() const
{
    return (m_tempDir->path() + QStringLiteral("/.pi-state.json")).toStdString();
}

QByteArray StateManagerTests::fileBytes() const
{
    QFile file(QString::fromStdString(statePath()));
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    return file.readAll();
}

hoststate::ScanOptions StateManagerTests::scanOptions(const hoststate::CancellationToken *cancel) const
{
    hoststate::ScanOptions options;
    options.timeout = std::chrono::milliseconds(5000);
    options.cancel = cancel;
    return options;
}

void StateManagerTests::testLoadWithoutState()
{
    QVERIFY(!m_manager->load().has_value());
    QVERIFY(!m_manager->current().has_value());
    QVERIFY(!QFile::exists(QString::fromStdString(statePath())));
}

void StateManagerTests::testUpdateIsVisibleAfterLoad()
{
    m_manager->update("a.b", 5);

    const auto loaded = m_manager->load();
    QVERIFY(loaded.has_value());
    const auto value = hoststate::getDocumentField(*loaded, "a.b");
    QVERIFY(value.has_value());
    QCOMPARE(value->get<int>(), 5);

    // Every current section exists even though nothing was scanned.
    QVERIFY(loaded->sections["network"].is_object());
    QVERIFY(loaded->lastUpdated == m_clock->now());

    // A second process sees the same value.
    hoststate::StateStore other(statePath());
    const auto reread = other.read();
    QVERIFY(reread.has_value());
    QCOMPARE(hoststate::getDocumentField(*reread, "a.b")->get<int>(), 5);
}

void StateManagerTests::testUpdateRejectsPathThroughScalar()
{
    m_manager->update("a.b", 3);
    const QByteArray before = fileBytes();
    QVERIFY(!before.isEmpty());

    try {
        m_manager->update("a.b.c", 1);
        QFAIL("expected ValidationError");
    } catch (const StateError &error) {
        QVERIFY(error.code() == ErrorCode::ValidationError);
        QCOMPARE(QString::fromStdString(error.action()), QStringLiteral("update"));
        QCOMPARE(QString::fromStdString(error.path()), QStringLiteral("a.b.c"));
    }

    QCOMPARE(fileBytes(), before);
}

void StateManagerTests::testUpdateRejectsNullValueAndManagedKeys()
{
    QVERIFY_EXCEPTION_THROWN(m_manager->update("system.hostname", nlohmann::json()), StateError);
    QVERIFY_EXCEPTION_THROWN(m_manager->update("schema_version", "3.0"), StateError);
    QVERIFY_EXCEPTION_THROWN(m_manager->update("system/../etc", "x"), StateError);
    QVERIFY_EXCEPTION_THROWN(m_manager->update("system", "flat"), StateError);
    QVERIFY(!QFile::exists(QString::fromStdString(statePath())));
}

void StateManagerTests::testSaveThenDrift()
{
    m_observer->push(StateCategory::System, nlohmann::json{{"hostname", "pi"}});
    m_observer->push(StateCategory::System, nlohmann::json{{"hostname", "pi2"}});

    const auto saved = m_manager->save(true, scanOptions());
    QCOMPARE(QString::fromStdString(saved.sections["system"]["hostname"].get<std::string>()),
             QStringLiteral("pi"));
    const QByteArray persisted = fileBytes();

    const auto diff = m_manager->compare(scanOptions());
    QCOMPARE(diff.changed.size(), static_cast<std::size_t>(1));
    const auto &change = diff.changed.at("system.hostname");
    QCOMPARE(QString::fromStdString(change.before.get<std::string>()), QStringLiteral("pi"));
    QCOMPARE(QString::fromStdString(change.after.get<std::string>()), QStringLiteral("pi2"));
    QVERIFY(diff.added.empty());
    QVERIFY(diff.removed.empty());

    // compare is read-only.
    QCOMPARE(fileBytes(), persisted);
}

void StateManagerTests::testSaveReusesFreshCache()
{
    m_observer->push(StateCategory::System, nlohmann::json{{"hostname", "pi"}});

    m_manager->save(false, scanOptions());
    QCOMPARE(m_observer->calls(StateCategory::System), 1);
    QCOMPARE(m_observer->calls(StateCategory::Network), 1);

    m_clock->advance(std::chrono::seconds(10));
    m_manager->save(false, scanOptions());
    QCOMPARE(m_observer->totalCalls(), 2);

    m_manager->save(true, scanOptions());
    QCOMPARE(m_observer->totalCalls(), 4);

    // System expires after 30s, network only after 60s.
    m_clock->advance(std::chrono::seconds(45));
    m_manager->save(false, scanOptions());
    QCOMPARE(m_observer->calls(StateCategory::System), 3);
    QCOMPARE(m_observer->calls(StateCategory::Network), 2);
}

void StateManagerTests::testSavePreservesUserSections()
{
    m_manager->update("notes", nlohmann::json::array({"replaced SD card"}));
    m_manager->update("custom_configs.retroarch", "overlay=on");
    m_manager->update("system.location", "shelf");
    m_observer->push(StateCategory::System, nlohmann::json{{"hostname", "pi"}});

    const auto saved = m_manager->save(true, scanOptions());
    QCOMPARE(saved.sections["notes"].size(), static_cast<std::size_t>(1));
    QCOMPARE(QString::fromStdString(saved.sections["custom_configs"]["retroarch"].get<std::string>()),
             QStringLiteral("overlay=on"));
    // Scanned sections are replaced wholesale.
    QVERIFY(!saved.sections["system"].contains("location"));
    QVERIFY(saved.sections["system"]["hostname"] == "pi");
}

void StateManagerTests::testCancelledSaveLeavesFileUnchanged()
{
    m_observer->push(StateCategory::System, nlohmann::json{{"hostname", "pi"}});
    m_observer->push(StateCategory::System, nlohmann::json{{"hostname", "pi2"}});
    m_manager->save(true, scanOptions());
    const QByteArray persisted = fileBytes();

    hoststate::CancellationToken token;
    m_observer->cancelDuringScan(&token);
    try {
        m_manager->save(true, scanOptions(&token));
        QFAIL("expected Cancelled");
    } catch (const StateError &error) {
        QVERIFY(error.code() == ErrorCode::Cancelled);
        QCOMPARE(QString::fromStdString(error.action()), QStringLiteral("save"));
    }

    QCOMPARE(fileBytes(), persisted);
    QVERIFY(m_manager->current()->sections["system"]["hostname"] == "pi");
}

void StateManagerTests::testCancelledCompare()
{
    m_manager->update("system.hostname", "pi");

    hoststate::CancellationToken token;
    token.cancel();
    try {
        m_manager->compare(scanOptions(&token));
        QFAIL("expected Cancelled");
    } catch (const StateError &error) {
        QVERIFY(error.code() == ErrorCode::Cancelled);
    }
    QCOMPARE(m_observer->totalCalls(), 0);
}

void StateManagerTests::testObserverFailureIsTagged()
{
    m_manager->update("system.hostname", "pi");
    const QByteArray persisted = fileBytes();

    m_observer->failWith(ErrorCode::ObserverError);
    try {
        m_manager->save(true, scanOptions());
        QFAIL("expected ObserverError");
    } catch (const StateError &error) {
        QVERIFY(error.code() == ErrorCode::ObserverError);
        QCOMPARE(QString::fromStdString(error.action()), QStringLiteral("save"));
        QCOMPARE(QString::fromStdString(error.category()), QStringLiteral("system"));
        QVERIFY(!error.isRetryable());
    }
    QCOMPARE(fileBytes(), persisted);
    QVERIFY(!m_cache->isFresh(StateCategory::System));
}

void StateManagerTests::testNonMappingPayloadIsObserverError()
{
    m_observer->push(StateCategory::Network, nlohmann::json::array({"eth0"}));
    try {
        m_manager->save(true, scanOptions());
        QFAIL("expected ObserverError");
    } catch (const StateError &error) {
        QVERIFY(error.code() == ErrorCode::ObserverError);
        QCOMPARE(QString::fromStdString(error.category()), QStringLiteral("network"));
    }
    QVERIFY(!QFile::exists(QString::fromStdString(statePath())));
}

void StateManagerTests::testWriteFailureRollsBack()
{
    m_observer->push(StateCategory::System, nlohmann::json{{"hostname", "pi"}});
    m_observer->push(StateCategory::System,
                     nlohmann::json{{"hostname", "pi2"}, {"padding", std::string(4096, 'x')}});
    m_manager->save(true, scanOptions());
    const QByteArray persisted = fileBytes();

    // Writes beyond the limit fail with EFBIG instead of raising SIGXFSZ.
    struct rlimit previous {};
    QCOMPARE(::getrlimit(RLIMIT_FSIZE, &previous), 0);
    const auto previousHandler = std::signal(SIGXFSZ, SIG_IGN);
    struct rlimit limited = previous;
    limited.rlim_cur = static_cast<rlim_t>(persisted.size() + 64);
    QCOMPARE(::setrlimit(RLIMIT_FSIZE, &limited), 0);

    bool threw = false;
    try {
        m_manager->save(true, scanOptions());
    } catch (const StateError &error) {
        threw = true;
        QVERIFY(error.code() == ErrorCode::IoError);
    }

    ::setrlimit(RLIMIT_FSIZE, &previous);
    std::signal(SIGXFSZ, previousHandler);

    QVERIFY(threw);
    QCOMPARE(fileBytes(), persisted);
    QVERIFY(m_manager->current()->sections["system"]["hostname"] == "pi");

    const QStringList leftovers = QDir(m_tempDir->path())
                                      .entryList({QStringLiteral(".pi-state.json.tmp.*")},
                                                 QDir::Files | QDir::Hidden);
    QVERIFY(leftovers.isEmpty());
}

void StateManagerTests::testImportAndExport()
{
    const nlohmann::json legacy = {
        {"schema_version", "1.0"},
        {"last_updated", "2024-01-02T03:04:05Z"},
        {"system", {{"hostname", "retropie"}}},
        {"roms", {{"snes", 12}}}
    };

    const auto imported = m_manager->importDocument(legacy);
    QCOMPARE(QString::fromStdString(imported.schemaVersion), QStringLiteral("2.0"));
    QCOMPARE(QString::fromStdString(hoststate::toIso8601Utc(imported.lastUpdated)),
             QStringLiteral("2024-01-02T03:04:05Z"));

    std::ostringstream out;
    m_manager->exportTo(out);
    const auto exported = nlohmann::json::parse(out.str());
    QCOMPARE(QString::fromStdString(exported["schema_version"].get<std::string>()),
             QStringLiteral("2.0"));
    QVERIFY(exported["roms"]["snes"] == 12);
    QVERIFY(exported["network"].is_object());

    // Export then import is lossless.
    const auto reimported = m_manager->importDocument(exported);
    QVERIFY(hoststate::sameDocumentContent(imported, reimported));

    QVERIFY_EXCEPTION_THROWN(m_manager->importDocument(nlohmann::json::array()), StateError);
    QVERIFY_EXCEPTION_THROWN(m_manager->importDocument(nlohmann::json{{"schema_version", "9.0"}}),
                             StateError);
}

void StateManagerTests::testImportBacksUpCorruptFile()
{
    {
        QFile file(QString::fromStdString(statePath()));
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("{ truncated");
    }

    try {
        m_manager->update("system.hostname", "pi");
        QFAIL("expected CorruptionError");
    } catch (const StateError &error) {
        QVERIFY(error.code() == ErrorCode::CorruptionError);
    }
    QVERIFY_EXCEPTION_THROWN(m_manager->save(true, scanOptions()), StateError);
    QCOMPARE(fileBytes(), QByteArrayLiteral("{ truncated"));

    m_manager->importDocument(nlohmann::json{{"schema_version", "2.0"},
                                             {"system", {{"hostname", "pi"}}}});

    const QStringList backups = QDir(m_tempDir->path())
                                    .entryList({QStringLiteral(".pi-state.json.corrupt-*")},
                                               QDir::Files | QDir::Hidden);
    QCOMPARE(backups.size(), 1);
    QFile backup(m_tempDir->path() + QStringLiteral("/") + backups.first());
    QVERIFY(backup.open(QIODevice::ReadOnly));
    QCOMPARE(backup.readAll(), QByteArrayLiteral("{ truncated"));

    const auto loaded = m_manager->load();
    QVERIFY(loaded.has_value());
    QVERIFY(loaded->sections["system"]["hostname"] == "pi");
}

void StateManagerTests::testDiffAgainstSuppliedDocument()
{
    m_manager->update("system.hostname", "pi");
    m_manager->update("notes", nlohmann::json::array({"a"}));

    const auto stored = m_manager->load();
    QVERIFY(stored.has_value());
    QVERIFY(m_manager->diffAgainst(hoststate::documentToJson(*stored)).empty());

    nlohmann::json other = hoststate::documentToJson(*stored);
    other["system"]["hostname"] = "pi2";
    other["notes"].push_back("b");
    const auto diff = m_manager->diffAgainst(other);
    QVERIFY(diff.changed.count("system.hostname") == 1);
    QVERIFY(diff.added.count("notes.1") == 1);

    try {
        m_manager->diffAgainst("not a document");
        QFAIL("expected ValidationError");
    } catch (const StateError &error) {
        QVERIFY(error.code() == ErrorCode::ValidationError);
        QCOMPARE(QString::fromStdString(error.action()), QStringLiteral("diff"));
    }
}

void StateManagerTests::testWatchPrefersFreshCache()
{
    m_observer->push(StateCategory::System, nlohmann::json{{"hostname", "pi"}});
    const auto scannedAt = m_clock->now();
    m_manager->save(true, scanOptions());

    m_clock->advance(std::chrono::seconds(5));
    const auto cached = m_manager->watch("system.hostname");
    QCOMPARE(QString::fromStdString(cached.source), QStringLiteral("cache"));
    QVERIFY(cached.capturedAt == scannedAt);
    QVERIFY(cached.value == "pi");

    m_clock->advance(std::chrono::seconds(60));
    const auto stored = m_manager->watch("system.hostname");
    QCOMPARE(QString::fromStdString(stored.source), QStringLiteral("store"));
    QVERIFY(stored.value == "pi");
    QVERIFY(stored.capturedAt == scannedAt);

    const auto version = m_manager->watch("schema_version");
    QVERIFY(version.value == "2.0");

    try {
        m_manager->watch("system.missing");
        QFAIL("expected NotFound");
    } catch (const StateError &error) {
        QVERIFY(error.code() == ErrorCode::NotFound);
        QCOMPARE(QString::fromStdString(error.path()), QStringLiteral("system.missing"));
    }
    QCOMPARE(m_observer->totalCalls(), 2);
}

void StateManagerTests::testCompareWithoutStateIsNotFound()
{
    try {
        m_manager->compare(scanOptions());
        QFAIL("expected NotFound");
    } catch (const StateError &error) {
        QVERIFY(error.code() == ErrorCode::NotFound);
        QCOMPARE(QString::fromStdString(error.action()), QStringLiteral("compare"));
    }
    QCOMPARE(m_observer->totalCalls(), 0);

    std::ostringstream out;
    QVERIFY_EXCEPTION_THROWN(m_manager->exportTo(out), StateError);
}

void StateManagerTests::testLockTimeoutDuringUpdate()
{
    m_manager->update("system.hostname", "pi");
    const QByteArray persisted = fileBytes();

    hoststate::StateStore otherWriter(statePath());
    const auto lock = otherWriter.acquireLock(std::chrono::milliseconds(100));

    try {
        m_manager->update("system.hostname", "pi2");
        QFAIL("expected LockTimeout");
    } catch (const StateError &error) {
        QVERIFY(error.code() == ErrorCode::LockTimeout);
        QVERIFY(error.isRetryable());
        QCOMPARE(QString::fromStdString(error.action()), QStringLiteral("update"));
    }
    QCOMPARE(fileBytes(), persisted);
}

QTEST_MAIN(StateManagerTests)
#include "test_state_manager.moc"
