#include "engine/state_document.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "common/json_utils.hpp"
#include "common/state_error.hpp"
#include "engine/field_path.hpp"

namespace hoststate {

namespace {

constexpr const char *kSchemaVersionKey = "schema_version";
constexpr const char *kLastUpdatedKey = "last_updated";
constexpr const char *kNotesSection = "notes";

std::optional<std::pair<int, int>> parseVersion(const std::string &version)
{
    std::vector<int> parts;
    std::string current;
    for (char c : version) {
        if (c == '.') {
            if (current.empty()) {
                return std::nullopt;
            }
            parts.push_back(std::stoi(current));
            current.clear();
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c)) || current.size() >= 6) {
            return std::nullopt;
        }
        current.push_back(c);
    }
    if (current.empty()) {
        return std::nullopt;
    }
    parts.push_back(std::stoi(current));

    if (parts.size() > 3) {
        return std::nullopt;
    }
    return std::make_pair(parts[0], parts.size() > 1 ? parts[1] : 0);
}

bool isNewerThanCurrent(const std::string &version)
{
    const auto parsed = parseVersion(version);
    const auto current = parseVersion(kCurrentSchemaVersion);
    return parsed && current && *parsed > *current;
}

nlohmann::json defaultSectionValue(const std::string &name)
{
    if (name == kNotesSection) {
        return nlohmann::json::array();
    }
    return nlohmann::json::object();
}

bool hasExpectedShape(const std::string &name, const nlohmann::json &value)
{
    if (name == kNotesSection) {
        return value.is_array();
    }
    return value.is_object();
}

bool isCurrentSection(const std::string &name)
{
    const auto &names = currentSectionNames();
    return std::find(names.begin(), names.end(), name) != names.end();
}

StateError schemaError(const std::string &message)
{
    return StateError(ErrorCode::SchemaError, message);
}

} // namespace

const std::vector<MigrationStep> &migrationSteps()
{
    static const std::vector<MigrationStep> steps = {
        {"1.0", "2.0", &migrateV1ToV2},
    };
    return steps;
}

StateDocument migrateV1ToV2(const StateDocument &document)
{
    StateDocument migrated = document;
    migrated.schemaVersion = "2.0";
    if (!migrated.sections.is_object()) {
        migrated.sections = nlohmann::json::object();
    }
    for (const auto &name : currentSectionNames()) {
        if (!migrated.sections.contains(name)) {
            migrated.sections[name] = defaultSectionValue(name);
        }
    }
    return migrated;
}

StateDocument migrateDocument(const StateDocument &document,
                              const std::string &fromVersion,
                              const std::string &toVersion)
{
    const auto from = normalizeSchemaVersion(fromVersion);
    const auto to = normalizeSchemaVersion(toVersion);
    if (!from || !isKnownSchemaVersion(*from)) {
        throw schemaError("Unsupported schema version: " + fromVersion);
    }
    if (!to || !isKnownSchemaVersion(*to)) {
        throw schemaError("Unsupported target schema version: " + toVersion);
    }
    if (parseVersion(*from) > parseVersion(*to)) {
        throw schemaError("Cannot downgrade schema from " + *from + " to " + *to);
    }

    StateDocument current = document;
    current.schemaVersion = *from;
    while (current.schemaVersion != *to) {
        const auto &steps = migrationSteps();
        auto step = std::find_if(steps.begin(), steps.end(),
                                 [&current](const MigrationStep &candidate) {
                                     return candidate.fromVersion == current.schemaVersion;
                                 });
        if (step == steps.end()) {
            throw schemaError("No migration path from schema " + current.schemaVersion);
        }
        current = step->apply(current);
        current.schemaVersion = step->toVersion;
    }
    return current;
}

std::optional<std::string> normalizeSchemaVersion(const std::string &version)
{
    const auto parsed = parseVersion(version);
    if (!parsed) {
        return std::nullopt;
    }
    return std::to_string(parsed->first) + "." + std::to_string(parsed->second);
}

bool isKnownSchemaVersion(const std::string &version)
{
    const auto normalized = normalizeSchemaVersion(version);
    if (!normalized) {
        return false;
    }
    if (*normalized == kCurrentSchemaVersion) {
        return true;
    }
    const auto &steps = migrationSteps();
    return std::any_of(steps.begin(), steps.end(), [&normalized](const MigrationStep &step) {
        return step.fromVersion == *normalized;
    });
}

const std::vector<std::string> &currentSectionNames()
{
    static const std::vector<std::string> names = {
        "system",
        "hardware",
        "network",
        "software",
        "services",
        "gaming",
        kNotesSection,
    };
    return names;
}

bool isEngineManagedKey(const std::string &key)
{
    return key == kSchemaVersionKey || key == kLastUpdatedKey;
}

StateDocument makeEmptyDocument(std::chrono::system_clock::time_point now)
{
    StateDocument document;
    document.schemaVersion = kCurrentSchemaVersion;
    document.lastUpdated = now;
    document.sections = nlohmann::json::object();
    for (const auto &name : currentSectionNames()) {
        document.sections[name] = defaultSectionValue(name);
    }
    return document;
}

StateDocument documentFromJson(const nlohmann::json &json)
{
    if (!json.is_object()) {
        throw schemaError("State document must be a JSON object");
    }

    std::string version = kLegacySchemaVersion;
    if (json.contains(kSchemaVersionKey)) {
        const auto &value = json.at(kSchemaVersionKey);
        if (!value.is_string()) {
            throw schemaError("schema_version must be a string");
        }
        version = value.get<std::string>();
    }

    const auto normalized = normalizeSchemaVersion(version);
    if (!normalized) {
        throw schemaError("Unrecognized schema version: '" + version + "'");
    }
    if (isNewerThanCurrent(*normalized)) {
        throw schemaError("Schema version " + *normalized
                          + " is newer than supported version "
                          + kCurrentSchemaVersion);
    }
    if (!isKnownSchemaVersion(*normalized)) {
        throw schemaError("Unrecognized schema version: '" + version + "'");
    }

    StateDocument document;
    document.schemaVersion = *normalized;
    document.lastUpdated = std::chrono::system_clock::time_point{};
    if (json.contains(kLastUpdatedKey)) {
        const auto &value = json.at(kLastUpdatedKey);
        std::optional<std::chrono::system_clock::time_point> parsed;
        if (value.is_string()) {
            parsed = fromIso8601Utc(value.get<std::string>());
        }
        if (!parsed) {
            throw schemaError("last_updated must be an ISO-8601 timestamp");
        }
        document.lastUpdated = *parsed;
    }

    document.sections = json;
    document.sections.erase(kSchemaVersionKey);
    document.sections.erase(kLastUpdatedKey);

    document = migrateDocument(document, *normalized, kCurrentSchemaVersion);

    // Current documents always carry every section, so fill any the source
    // omitted and reject any with the wrong shape.
    for (const auto &name : currentSectionNames()) {
        if (!document.sections.contains(name) || document.sections.at(name).is_null()) {
            document.sections[name] = defaultSectionValue(name);
            continue;
        }
        if (!hasExpectedShape(name, document.sections.at(name))) {
            throw schemaError("Section '" + name + "' must be "
                              + (name == kNotesSection ? "an array" : "a mapping")
                              + ", found " + jsonKindName(document.sections.at(name)));
        }
    }
    return document;
}

void checkSuppliedValues(const nlohmann::json &json)
{
    if (!json.is_object()) {
        throw StateError(ErrorCode::ValidationError,
                         "document must be a JSON object, found " + jsonKindName(json));
    }

    if (json.contains(kLastUpdatedKey)) {
        const auto &value = json.at(kLastUpdatedKey);
        if (!value.is_string() || !fromIso8601Utc(value.get<std::string>())) {
            StateError error(ErrorCode::ValidationError,
                             "last_updated must be an ISO-8601 timestamp");
            error.withPath(kLastUpdatedKey);
            throw error;
        }
    }

    for (const auto &name : currentSectionNames()) {
        if (!json.contains(name) || json.at(name).is_null()) {
            continue;
        }
        if (!hasExpectedShape(name, json.at(name))) {
            StateError error(ErrorCode::ValidationError,
                             "Section '" + name + "' must be "
                                 + (name == kNotesSection ? "an array" : "a mapping")
                                 + ", found " + jsonKindName(json.at(name)));
            error.withPath(name);
            throw error;
        }
    }
}

StateDocument loadDocument(const std::string &raw)
{
    const auto parsed = nlohmann::json::parse(raw, nullptr, false);
    if (parsed.is_discarded()) {
        throw StateError(ErrorCode::CorruptionError, "State data is not valid JSON");
    }
    if (!parsed.is_object()) {
        throw StateError(ErrorCode::CorruptionError, "State data is not a JSON object");
    }
    return documentFromJson(parsed);
}

nlohmann::json documentToJson(const StateDocument &document)
{
    return nlohmann::json(document);
}

std::string serializeDocument(const StateDocument &document)
{
    return documentToJson(document).dump(2) + "\n";
}

bool sameDocumentContent(const StateDocument &a, const StateDocument &b)
{
    return a.schemaVersion == b.schemaVersion && a.sections == b.sections;
}

std::optional<nlohmann::json> getDocumentField(const StateDocument &document,
                                               const std::string &path)
{
    const auto segments = parseFieldPath(path);
    if (segments.size() == 1 && segments.front() == kSchemaVersionKey) {
        return nlohmann::json(document.schemaVersion);
    }
    if (segments.size() == 1 && segments.front() == kLastUpdatedKey) {
        return nlohmann::json(toIso8601Utc(document.lastUpdated));
    }
    return getField(document.sections, path);
}

StateDocument withDocumentField(const StateDocument &document,
                                const std::string &path,
                                const nlohmann::json &value)
{
    const auto segments = parseFieldPath(path);
    const std::string &head = segments.front();
    if (isEngineManagedKey(head)) {
        StateError error(ErrorCode::ValidationError,
                         "'" + head + "' is managed by the engine and cannot be updated");
        error.withPath(path);
        throw error;
    }
    if (segments.size() == 1 && isCurrentSection(head) && !hasExpectedShape(head, value)) {
        StateError error(ErrorCode::ValidationError,
                         "Section '" + head + "' cannot be replaced by a value of type "
                             + jsonKindName(value));
        error.withPath(path);
        throw error;
    }

    StateDocument updated = document;
    updated.sections = setField(document.sections, path, value);
    return updated;
}

StateDocument withSection(const StateDocument &document,
                          const std::string &section,
                          const nlohmann::json &payload)
{
    return withDocumentField(document, section, payload);
}

} // namespace hoststate
