#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace hoststate {

// Versioned snapshot of one managed host. Sections hold every top-level key
// other than the engine-managed schema_version and last_updated.
struct StateDocument {
    std::string schemaVersion;
    std::chrono::system_clock::time_point lastUpdated;
    nlohmann::json sections = nlohmann::json::object();
};

struct CacheEntry {
    StateCategory category;
    nlohmann::json payload;
    std::chrono::system_clock::time_point capturedAt;
    std::chrono::seconds ttl{0};
};

struct CacheStats {
    int hits = 0;
    int misses = 0;
    int entries = 0;
};

struct StateDiff {
    struct Change {
        nlohmann::json before;
        nlohmann::json after;
    };

    std::map<std::string, nlohmann::json> added;
    std::map<std::string, Change> changed;
    std::map<std::string, nlohmann::json> removed;

    bool empty() const
    {
        return added.empty() && changed.empty() && removed.empty();
    }
};

struct WatchResult {
    std::string path;
    nlohmann::json value;
    std::chrono::system_clock::time_point capturedAt;
    std::string source;
};

// Cooperative cancellation flag shared between a caller and a running scan.
class CancellationToken {
public:
    void cancel()
    {
        m_cancelled.store(true);
    }

    bool isCancelled() const
    {
        return m_cancelled.load();
    }

private:
    std::atomic<bool> m_cancelled{false};
};

// Largest timeout accepted from callers or configuration. QProcess waits
// take an int, and the bound keeps steady_clock deadlines from overflowing.
constexpr long long kMaxTimeoutMs = std::numeric_limits<int>::max();

inline std::chrono::milliseconds boundedTimeout(std::chrono::milliseconds timeout)
{
    return std::clamp(timeout, std::chrono::milliseconds(0),
                      std::chrono::milliseconds(kMaxTimeoutMs));
}

struct ScanOptions {
    std::chrono::milliseconds timeout{30000};
    const CancellationToken *cancel = nullptr;
};

} // namespace hoststate
