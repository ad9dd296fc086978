#include "engine/state_diff.hpp"

#include <algorithm>
#include <set>

#include "engine/field_path.hpp"

namespace hoststate {

namespace {

void compareObjects(const std::string &prefix,
                    const nlohmann::json &before,
                    const nlohmann::json &after,
                    StateDiff &diff)
{
    std::set<std::string> keys;
    for (const auto &item : before.items()) {
        keys.insert(item.key());
    }
    for (const auto &item : after.items()) {
        keys.insert(item.key());
    }

    for (const auto &key : keys) {
        const std::string path = joinFieldPath(prefix, key);
        const auto beforeIt = before.find(key);
        const auto afterIt = after.find(key);
        if (beforeIt == before.end()) {
            diff.added[path] = *afterIt;
        } else if (afterIt == after.end()) {
            diff.removed[path] = *beforeIt;
        } else {
            compareValues(path, *beforeIt, *afterIt, diff);
        }
    }
}

void compareArrays(const std::string &prefix,
                   const nlohmann::json &before,
                   const nlohmann::json &after,
                   StateDiff &diff)
{
    const std::size_t common = std::min(before.size(), after.size());
    for (std::size_t i = 0; i < common; ++i) {
        compareValues(joinFieldPath(prefix, std::to_string(i)), before[i], after[i], diff);
    }
    for (std::size_t i = common; i < after.size(); ++i) {
        diff.added[joinFieldPath(prefix, std::to_string(i))] = after[i];
    }
    for (std::size_t i = common; i < before.size(); ++i) {
        diff.removed[joinFieldPath(prefix, std::to_string(i))] = before[i];
    }
}

} // namespace

void compareValues(const std::string &prefix,
                   const nlohmann::json &before,
                   const nlohmann::json &after,
                   StateDiff &diff)
{
    if (before.is_object() && after.is_object()) {
        compareObjects(prefix, before, after, diff);
        return;
    }
    if (before.is_array() && after.is_array()) {
        compareArrays(prefix, before, after, diff);
        return;
    }
    if (before != after) {
        diff.changed[prefix] = StateDiff::Change{before, after};
    }
}

StateDiff compareDocuments(const StateDocument &before, const StateDocument &after)
{
    StateDiff diff;
    const nlohmann::json emptySections = nlohmann::json::object();
    compareObjects(std::string(),
                   before.sections.is_object() ? before.sections : emptySections,
                   after.sections.is_object() ? after.sections : emptySections,
                   diff);
    return diff;
}

} // namespace hoststate
