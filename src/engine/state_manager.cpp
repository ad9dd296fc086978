#include "engine/state_manager.hpp"

#include <utility>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/state_error.hpp"
#include "engine/field_path.hpp"
#include "engine/state_diff.hpp"
#include "engine/state_document.hpp"

namespace hoststate {

namespace {

StateError notFound(const std::string &message)
{
    return StateError(ErrorCode::NotFound, message);
}

void throwIfCancelled(const ScanOptions &options, StateCategory category)
{
    if (options.cancel && options.cancel->isCancelled()) {
        StateError error(ErrorCode::Cancelled, "Scan was cancelled by the caller");
        error.withCategory(toCategoryString(category));
        throw error;
    }
}

// Runs one action, logging its outcome and tagging any StateError with the
// action name before it propagates.
template <typename Fn>
auto runAction(StateAction action, const nlohmann::json &context, Fn &&fn) -> decltype(fn())
{
    const std::string name = toActionString(action);
    const auto start = std::chrono::steady_clock::now();
    const auto durationMs = [&start]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now() - start)
            .count();
    };

    HSLOG_INFO(QStringLiteral("StateManager"),
               QString::fromStdString(name),
               QStringLiteral("action_started"),
               QStringLiteral("caller_request"),
               QStringLiteral("state_manager"),
               hoststate::logging::defaultWho(),
               hoststate::logging::currentCorrelationId(),
               context);

    try {
        auto result = fn();
        HSLOG_INFO(QStringLiteral("StateManager"),
                   QString::fromStdString(name),
                   QStringLiteral("action_completed"),
                   QStringLiteral("caller_request"),
                   QStringLiteral("state_manager"),
                   hoststate::logging::defaultWho(),
                   hoststate::logging::currentCorrelationId(),
                   (nlohmann::json{{"durationMs", durationMs()}}));
        return result;
    } catch (StateError &error) {
        error.withAction(name);
        const bool expected = error.code() == ErrorCode::NotFound
            || error.code() == ErrorCode::ValidationError
            || error.code() == ErrorCode::Cancelled;
        const nlohmann::json failure{{"code", toErrorCodeString(error.code())},
                                     {"message", error.what()},
                                     {"category", error.category()},
                                     {"durationMs", durationMs()}};
        if (expected) {
            HSLOG_WARN(QStringLiteral("StateManager"),
                       QString::fromStdString(name),
                       QStringLiteral("action_failed"),
                       QString::fromStdString(toErrorCodeString(error.code())),
                       QStringLiteral("state_manager"),
                       hoststate::logging::defaultWho(),
                       hoststate::logging::currentCorrelationId(),
                       failure);
        } else {
            HSLOG_ERROR(QStringLiteral("StateManager"),
                        QString::fromStdString(name),
                        QStringLiteral("action_failed"),
                        QString::fromStdString(toErrorCodeString(error.code())),
                        QStringLiteral("state_manager"),
                        hoststate::logging::defaultWho(),
                        hoststate::logging::currentCorrelationId(),
                        failure);
        }
        throw;
    }
}

} // namespace

StateManager::StateManager(StateStore &store,
                           TtlCache &cache,
                           SystemObserver &observer,
                           const Clock &clock,
                           ManagerOptions options)
    : m_store(store)
    , m_cache(cache)
    , m_observer(observer)
    , m_clock(clock)
    , m_options(std::move(options))
{
}

ScanOptions StateManager::defaultScanOptions() const
{
    ScanOptions options;
    options.timeout = m_options.scanTimeout;
    return options;
}

CacheStats StateManager::cacheStats() const
{
    return m_cache.stats();
}

std::optional<StateDocument> StateManager::load()
{
    return runAction(StateAction::Load, nlohmann::json::object(), [this]() {
        auto document = m_store.read();
        if (document) {
            m_current = document;
        }
        return document;
    });
}

StateDocument StateManager::save(bool forceScan, const ScanOptions &options)
{
    return runAction(StateAction::Save, nlohmann::json{{"forceScan", forceScan}}, [&]() {
        // Nothing is written until every category has been observed, so a
        // failed or cancelled scan leaves the file as it was.
        const auto entries = scanCategories(forceScan, options);

        const auto lock = m_store.acquireLock(m_options.lockTimeout);
        m_store.removeStaleTempFiles();
        const auto existing = m_store.read();

        StateDocument document = existing ? *existing : makeEmptyDocument(m_clock.now());
        for (const auto &entry : entries) {
            document = withSection(document, toCategoryString(entry.category), entry.payload);
        }
        document.lastUpdated = m_clock.now();
        commit(document);
        return document;
    });
}

StateDocument StateManager::update(const std::string &path, const nlohmann::json &value)
{
    return runAction(StateAction::Update, nlohmann::json{{"path", path}}, [&]() {
        if (value.is_null()) {
            StateError error(ErrorCode::ValidationError, "update requires a non-null value");
            error.withPath(path);
            throw error;
        }
        parseFieldPath(path);

        const auto lock = m_store.acquireLock(m_options.lockTimeout);
        m_store.removeStaleTempFiles();
        const auto existing = m_store.read();

        StateDocument document = withDocumentField(
            existing ? *existing : makeEmptyDocument(m_clock.now()), path, value);
        document.lastUpdated = m_clock.now();
        commit(document);
        return document;
    });
}

StateDiff StateManager::compare(const ScanOptions &options)
{
    return runAction(StateAction::Compare, nlohmann::json::object(), [&]() {
        const StateDocument stored = readExisting();
        const auto entries = scanCategories(true, options);

        StateDocument fresh = stored;
        for (const auto &entry : entries) {
            fresh = withSection(fresh, toCategoryString(entry.category), entry.payload);
        }

        StateDiff diff = compareDocuments(stored, fresh);
        HSLOG_INFO(QStringLiteral("StateManager"),
                   QStringLiteral("compare"),
                   QStringLiteral("drift_computed"),
                   QStringLiteral("fresh_scan"),
                   QStringLiteral("positional_diff"),
                   hoststate::logging::defaultWho(),
                   hoststate::logging::currentCorrelationId(),
                   (nlohmann::json{{"added", diff.added.size()},
                                   {"changed", diff.changed.size()},
                                   {"removed", diff.removed.size()}}));
        return diff;
    });
}

StateDocument StateManager::exportTo(std::ostream &out)
{
    return runAction(StateAction::Export, nlohmann::json::object(), [&]() {
        const StateDocument document = readExisting();
        out << serializeDocument(document);
        out.flush();
        if (!out) {
            throw StateError(ErrorCode::IoError, "Failed to write exported document");
        }
        return document;
    });
}

StateDocument StateManager::importDocument(const nlohmann::json &document)
{
    return runAction(StateAction::Import, nlohmann::json::object(), [&]() {
        const StateDocument imported = validateSupplied(document);

        const auto lock = m_store.acquireLock(m_options.lockTimeout);
        m_store.removeStaleTempFiles();
        // Only whether the current file parses matters here.
        try {
            const auto existing = m_store.read();
            static_cast<void>(existing);
        } catch (const StateError &error) {
            if (error.code() != ErrorCode::CorruptionError
                && error.code() != ErrorCode::SchemaError) {
                throw;
            }
            m_store.backupCurrentFile(m_clock.now());
        }

        commit(imported);
        return imported;
    });
}

StateDiff StateManager::diffAgainst(const nlohmann::json &document)
{
    return runAction(StateAction::Diff, nlohmann::json::object(), [&]() {
        const StateDocument other = validateSupplied(document);
        const StateDocument stored = readExisting();
        return compareDocuments(stored, other);
    });
}

WatchResult StateManager::watch(const std::string &path)
{
    return runAction(StateAction::Watch, nlohmann::json{{"path", path}}, [&]() {
        const auto segments = parseFieldPath(path);

        const auto category = parseCategoryString(segments.front());
        if (category) {
            const auto entry = m_cache.peek(*category);
            if (entry) {
                std::optional<nlohmann::json> value;
                if (segments.size() == 1) {
                    value = entry->payload;
                } else {
                    value = getField(entry->payload,
                                     path.substr(segments.front().size() + 1));
                }
                if (value) {
                    return WatchResult{path, *value, entry->capturedAt, "cache"};
                }
            }
        }

        const StateDocument stored = readExisting();
        const auto value = getDocumentField(stored, path);
        if (!value) {
            StateError error(ErrorCode::NotFound, "No value at '" + path + "'");
            error.withPath(path);
            throw error;
        }
        return WatchResult{path, *value, stored.lastUpdated, "store"};
    });
}

StateDocument StateManager::readExisting() const
{
    auto document = m_store.read();
    if (!document) {
        throw notFound("No cached state at '" + m_store.path() + "'");
    }
    return *document;
}

StateDocument StateManager::validateSupplied(const nlohmann::json &document) const
{
    checkSuppliedValues(document);
    return documentFromJson(document);
}

std::vector<CacheEntry> StateManager::scanCategories(bool forceScan,
                                                     const ScanOptions &options)
{
    const auto deadline = std::chrono::steady_clock::now() + boundedTimeout(options.timeout);

    std::vector<CacheEntry> entries;
    entries.reserve(m_options.requiredCategories.size());
    for (const auto category : m_options.requiredCategories) {
        throwIfCancelled(options, category);
        if (forceScan) {
            m_cache.invalidate(category);
        }

        const auto scan = [&]() {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining <= std::chrono::milliseconds(0)) {
                StateError error(ErrorCode::ObserverError,
                                 "Scan timeout of " + std::to_string(options.timeout.count())
                                     + " ms exceeded");
                error.withCategory(toCategoryString(category));
                throw error;
            }

            ScanOptions remainingOptions;
            remainingOptions.timeout = remaining;
            remainingOptions.cancel = options.cancel;

            nlohmann::json payload;
            try {
                payload = m_observer.scan(category, remainingOptions);
            } catch (StateError &error) {
                error.withCategory(toCategoryString(category));
                throw;
            }
            if (!payload.is_object()) {
                StateError error(ErrorCode::ObserverError,
                                 "Observer returned " + jsonKindName(payload)
                                     + " instead of a mapping");
                error.withCategory(toCategoryString(category));
                throw error;
            }
            return payload;
        };

        entries.push_back(m_cache.getOrScan(category, scan));
        throwIfCancelled(options, category);
    }
    return entries;
}

void StateManager::commit(const StateDocument &document)
{
    // m_current keeps the previous document if the write throws.
    m_store.write(document);
    m_current = document;
}

} // namespace hoststate
