#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>

#include <nlohmann/json.hpp>

#include "common/clock.hpp"
#include "common/models.hpp"

namespace hoststate {

// TtlCache memoizes observer scans per category. It is process-local and
// never persisted; an expired or failed scan never yields a stale payload.
class TtlCache {
public:
    using ScanFunction = std::function<nlohmann::json()>;

    TtlCache(const Clock &clock, std::map<StateCategory, std::chrono::seconds> ttls);

    // Returns the cached entry while it is within its TTL, otherwise runs
    // `scan` and caches its result. Exceptions from `scan` propagate and the
    // expired entry is dropped.
    CacheEntry getOrScan(StateCategory category, const ScanFunction &scan);

    // Read-only lookup of a fresh entry; does not touch statistics.
    std::optional<CacheEntry> peek(StateCategory category) const;
    bool isFresh(StateCategory category) const;

    CacheEntry store(StateCategory category, const nlohmann::json &payload);
    void invalidate(StateCategory category);
    void clear();

    std::chrono::seconds ttlFor(StateCategory category) const;
    void setTtl(StateCategory category, std::chrono::seconds ttl);

    CacheStats stats() const;

private:
    bool isExpired(const CacheEntry &entry,
                   std::chrono::system_clock::time_point now) const;

    const Clock &m_clock;
    std::map<StateCategory, std::chrono::seconds> m_ttls;
    std::map<StateCategory, CacheEntry> m_entries;
    int m_hits = 0;
    int m_misses = 0;
    mutable std::mutex m_mutex;
};

} // namespace hoststate
