#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace hoststate {

/**
 * Structural comparison of two state documents.
 *
 * Both section trees are walked in lock-step. Mappings recurse by key and
 * arrays by position, with the decimal index as the path segment
 * ("notes.2"). A leaf present only in `after` is added, only in `before` is
 * removed, and in both with unequal values is changed. schema_version and
 * last_updated never take part.
 *
 * Keys are joined verbatim. A key that itself contains '.' (possible through
 * import or observer output) yields a path that parseFieldPath splits
 * differently, so such entries cannot be watched or updated by that path.
 */
StateDiff compareDocuments(const StateDocument &before, const StateDocument &after);

// Compares two values rooted at `prefix`; an empty prefix compares roots.
void compareValues(const std::string &prefix,
                   const nlohmann::json &before,
                   const nlohmann::json &after,
                   StateDiff &diff);

} // namespace hoststate
