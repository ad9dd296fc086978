#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace hoststate {

inline constexpr const char *kCurrentSchemaVersion = "2.0";
inline constexpr const char *kLegacySchemaVersion = "1.0";

// One pure migration step between two adjacent schema versions.
struct MigrationStep {
    std::string fromVersion;
    std::string toVersion;
    StateDocument (*apply)(const StateDocument &document);
};

// Ordered oldest first; the last step ends at kCurrentSchemaVersion.
const std::vector<MigrationStep> &migrationSteps();

StateDocument migrateV1ToV2(const StateDocument &document);

// Applies steps in order until `toVersion` is reached. Downgrades and
// versions without a migration path throw StateError(SchemaError).
StateDocument migrateDocument(const StateDocument &document,
                              const std::string &fromVersion,
                              const std::string &toVersion);

// "2" -> "2.0", "2.0.1" -> "2.0". Returns std::nullopt for anything that is
// not a dotted numeric version.
std::optional<std::string> normalizeSchemaVersion(const std::string &version);
bool isKnownSchemaVersion(const std::string &version);

// Section names every current document carries.
const std::vector<std::string> &currentSectionNames();
bool isEngineManagedKey(const std::string &key);

StateDocument makeEmptyDocument(std::chrono::system_clock::time_point now);

// Validates and migrates a parsed document. Throws SchemaError for unknown,
// newer or malformed versions and for sections of the wrong shape.
StateDocument documentFromJson(const nlohmann::json &json);

// Checks a caller-supplied document before it is imported or diffed: a
// non-object root, a bad last_updated or a section of the wrong kind throws
// StateError(ValidationError). Version problems are left to documentFromJson.
void checkSuppliedValues(const nlohmann::json &json);

// Parses raw bytes; malformed JSON or a non-object root throws
// StateError(CorruptionError).
StateDocument loadDocument(const std::string &raw);

nlohmann::json documentToJson(const StateDocument &document);
std::string serializeDocument(const StateDocument &document);

// Structural equality of schema version and sections; last_updated is ignored.
bool sameDocumentContent(const StateDocument &a, const StateDocument &b);

std::optional<nlohmann::json> getDocumentField(const StateDocument &document,
                                               const std::string &path);

// Returns a new document with `value` at `path`. Engine-managed keys cannot be
// written and a top-level section keeps its shape (mapping, array for notes).
StateDocument withDocumentField(const StateDocument &document,
                                const std::string &path,
                                const nlohmann::json &value);

StateDocument withSection(const StateDocument &document,
                          const std::string &section,
                          const nlohmann::json &payload);

} // namespace hoststate
