#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace hoststate {

/**
 * Dotted-path addressing over nested JSON mappings, e.g. "system.hostname".
 *
 * Segments are non-empty and limited to [A-Za-z0-9_-+:@]; anything else
 * (including "..", "/" and shell metacharacters) is a ValidationError.
 */
std::vector<std::string> parseFieldPath(const std::string &path);

std::string joinFieldPath(const std::string &prefix, const std::string &segment);

// Returns std::nullopt when any segment is missing. A numeric segment indexes
// into an array so that positional diff paths can be read back.
std::optional<nlohmann::json> getField(const nlohmann::json &root,
                                       const std::string &path);

// Returns a copy of `root` with `value` stored at `path`. Missing intermediate
// mappings are created; an existing non-mapping intermediate is never
// overwritten and raises StateError(ValidationError).
nlohmann::json setField(const nlohmann::json &root,
                        const std::string &path,
                        const nlohmann::json &value);

std::string jsonKindName(const nlohmann::json &value);

} // namespace hoststate
