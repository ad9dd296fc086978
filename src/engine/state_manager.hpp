#pragma once

#include <chrono>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/clock.hpp"
#include "common/models.hpp"
#include "engine/state_store.hpp"
#include "engine/system_observer.hpp"
#include "engine/ttl_cache.hpp"

namespace hoststate {

struct ManagerOptions {
    std::vector<StateCategory> requiredCategories;
    std::chrono::milliseconds lockTimeout{5000};
    std::chrono::milliseconds scanTimeout{30000};
};

/**
 * StateManager is the operation surface over one host's state file.
 *
 * Every action either succeeds completely or leaves the persisted file as it
 * was. Writes happen under the store lock as a full read-modify-write cycle;
 * the in-memory copy of the document is replaced only once the write has
 * committed. Errors are StateError, tagged with the failing action.
 */
class StateManager {
public:
    StateManager(StateStore &store,
                 TtlCache &cache,
                 SystemObserver &observer,
                 const Clock &clock,
                 ManagerOptions options);

    // std::nullopt when no state has been saved yet.
    std::optional<StateDocument> load();

    // Scans every required category (from cache unless `forceScan`) and
    // replaces those sections; notes and other sections are kept.
    StateDocument save(bool forceScan, const ScanOptions &options);

    StateDocument update(const std::string &path, const nlohmann::json &value);

    // Rescans the required categories and diffs stored -> fresh. Read-only.
    StateDiff compare(const ScanOptions &options);

    // Writes the stored document to `out` as pretty-printed JSON.
    StateDocument exportTo(std::ostream &out);

    // Validates, migrates and persists `document` wholesale.
    StateDocument importDocument(const nlohmann::json &document);

    // Diffs the stored document against a caller-supplied one.
    StateDiff diffAgainst(const nlohmann::json &document);

    WatchResult watch(const std::string &path);

    // Scan options carrying the configured scan timeout.
    ScanOptions defaultScanOptions() const;

    // Last document read or written by this manager.
    const std::optional<StateDocument> &current() const
    {
        return m_current;
    }

    CacheStats cacheStats() const;

    const ManagerOptions &options() const
    {
        return m_options;
    }

private:
    StateDocument readExisting() const;
    StateDocument validateSupplied(const nlohmann::json &document) const;
    std::vector<CacheEntry> scanCategories(bool forceScan, const ScanOptions &options);
    void commit(const StateDocument &document);

    StateStore &m_store;
    TtlCache &m_cache;
    SystemObserver &m_observer;
    const Clock &m_clock;
    ManagerOptions m_options;
    std::optional<StateDocument> m_current;
};

} // namespace hoststate
