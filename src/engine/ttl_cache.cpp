#include "engine/ttl_cache.hpp"

#include <utility>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace hoststate {

TtlCache::TtlCache(const Clock &clock, std::map<StateCategory, std::chrono::seconds> ttls)
    : m_clock(clock)
    , m_ttls(std::move(ttls))
{
}

CacheEntry TtlCache::getOrScan(StateCategory category, const ScanFunction &scan)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(category);
        if (it != m_entries.end()) {
            if (!isExpired(it->second, m_clock.now())) {
                ++m_hits;
                return it->second;
            }
            m_entries.erase(it);
        }
        ++m_misses;
    }

    HSLOG_DEBUG(QStringLiteral("TtlCache"),
                QStringLiteral("getOrScan"),
                QStringLiteral("cache_miss"),
                QStringLiteral("expired_or_absent"),
                QStringLiteral("observer_scan"),
                hoststate::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"category", toCategoryString(category)}}));

    // The lock is not held while scanning so that a slow observer does not
    // block lookups of other categories.
    const nlohmann::json payload = scan();
    return store(category, payload);
}

std::optional<CacheEntry> TtlCache::peek(StateCategory category) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(category);
    if (it == m_entries.end() || isExpired(it->second, m_clock.now())) {
        return std::nullopt;
    }
    return it->second;
}

bool TtlCache::isFresh(StateCategory category) const
{
    return peek(category).has_value();
}

CacheEntry TtlCache::store(StateCategory category, const nlohmann::json &payload)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    CacheEntry entry;
    entry.category = category;
    entry.payload = payload;
    entry.capturedAt = m_clock.now();
    auto ttl = m_ttls.find(category);
    entry.ttl = ttl != m_ttls.end() ? ttl->second : std::chrono::seconds(0);
    m_entries[category] = entry;
    return entry;
}

void TtlCache::invalidate(StateCategory category)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.erase(category);
}

void TtlCache::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
    m_hits = 0;
    m_misses = 0;
}

std::chrono::seconds TtlCache::ttlFor(StateCategory category) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_ttls.find(category);
    return it != m_ttls.end() ? it->second : std::chrono::seconds(0);
}

void TtlCache::setTtl(StateCategory category, std::chrono::seconds ttl)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_ttls[category] = ttl;
}

CacheStats TtlCache::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    CacheStats result;
    result.hits = m_hits;
    result.misses = m_misses;
    const auto now = m_clock.now();
    for (const auto &item : m_entries) {
        if (!isExpired(item.second, now)) {
            ++result.entries;
        }
    }
    return result;
}

bool TtlCache::isExpired(const CacheEntry &entry,
                         std::chrono::system_clock::time_point now) const
{
    // A TTL of zero disables caching for the category.
    if (entry.ttl <= std::chrono::seconds(0)) {
        return true;
    }
    return now - entry.capturedAt >= entry.ttl;
}

} // namespace hoststate
