#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace hoststate {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

// Accepts "YYYY-MM-DDTHH:MM:SS" followed by an optional fraction and an
// optional "Z"; offsets are not interpreted. Documents written by older
// tooling carry naive local timestamps, which are read as UTC.
inline std::optional<std::chrono::system_clock::time_point> fromIso8601Utc(
    const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::nullopt;
    }
#if defined(_WIN32)
    std::time_t time = _mkgmtime(&tm);
#else
    std::time_t time = timegm(&tm);
#endif
    if (time == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(time);
}

inline std::string toCategoryString(StateCategory category)
{
    switch (category) {
    case StateCategory::System:
        return "system";
    case StateCategory::Hardware:
        return "hardware";
    case StateCategory::Network:
        return "network";
    case StateCategory::Software:
        return "software";
    case StateCategory::Services:
        return "services";
    case StateCategory::Gaming:
        return "gaming";
    }
    return "system";
}

inline std::optional<StateCategory> parseCategoryString(const std::string &value)
{
    if (value == "system") {
        return StateCategory::System;
    }
    if (value == "hardware") {
        return StateCategory::Hardware;
    }
    if (value == "network") {
        return StateCategory::Network;
    }
    if (value == "software") {
        return StateCategory::Software;
    }
    if (value == "services") {
        return StateCategory::Services;
    }
    if (value == "gaming") {
        return StateCategory::Gaming;
    }
    return std::nullopt;
}

inline std::string toActionString(StateAction action)
{
    switch (action) {
    case StateAction::Load:
        return "load";
    case StateAction::Save:
        return "save";
    case StateAction::Update:
        return "update";
    case StateAction::Compare:
        return "compare";
    case StateAction::Export:
        return "export";
    case StateAction::Import:
        return "import";
    case StateAction::Diff:
        return "diff";
    case StateAction::Watch:
        return "watch";
    }
    return "load";
}

inline std::optional<StateAction> parseActionString(const std::string &value)
{
    if (value == "load") {
        return StateAction::Load;
    }
    if (value == "save") {
        return StateAction::Save;
    }
    if (value == "update") {
        return StateAction::Update;
    }
    if (value == "compare") {
        return StateAction::Compare;
    }
    if (value == "export") {
        return StateAction::Export;
    }
    if (value == "import") {
        return StateAction::Import;
    }
    if (value == "diff") {
        return StateAction::Diff;
    }
    if (value == "watch") {
        return StateAction::Watch;
    }
    return std::nullopt;
}

inline void to_json(nlohmann::json &j, const StateCategory &category)
{
    j = toCategoryString(category);
}

inline void to_json(nlohmann::json &j, const StateDocument &document)
{
    j = document.sections.is_object() ? document.sections : nlohmann::json::object();
    j["schema_version"] = document.schemaVersion;
    j["last_updated"] = toIso8601Utc(document.lastUpdated);
}

inline void to_json(nlohmann::json &j, const StateDiff::Change &change)
{
    j = nlohmann::json{{"old", change.before}, {"new", change.after}};
}

inline void to_json(nlohmann::json &j, const StateDiff &diff)
{
    j = nlohmann::json{
        {"added", diff.added},
        {"changed", diff.changed},
        {"removed", diff.removed}
    };
}

inline void to_json(nlohmann::json &j, const CacheEntry &entry)
{
    j = nlohmann::json{
        {"category", entry.category},
        {"payload", entry.payload},
        {"captured_at", toIso8601Utc(entry.capturedAt)},
        {"ttl_seconds", entry.ttl.count()}
    };
}

inline void to_json(nlohmann::json &j, const CacheStats &stats)
{
    j = nlohmann::json{
        {"hits", stats.hits},
        {"misses", stats.misses},
        {"entries", stats.entries}
    };
}

inline void to_json(nlohmann::json &j, const WatchResult &result)
{
    j = nlohmann::json{
        {"path", result.path},
        {"value", result.value},
        {"captured_at", toIso8601Utc(result.capturedAt)},
        {"source", result.source}
    };
}

} // namespace hoststate
