#include "engine/field_path.hpp"

#include <cctype>
#include <cstdio>

#include "common/state_error.hpp"

namespace hoststate {

namespace {

constexpr std::size_t kMaxPathDepth = 32;

bool isSegmentChar(char c)
{
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '_' || c == '-' || c == '+' || c == ':' || c == '@';
}

std::optional<std::size_t> parseIndex(const std::string &segment)
{
    if (segment.empty() || segment.size() > 9) {
        return std::nullopt;
    }
    std::size_t index = 0;
    for (char c : segment) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        index = index * 10 + static_cast<std::size_t>(c - '0');
    }
    return index;
}

// Non-ASCII and control bytes are shown as hex so the message stays valid UTF-8.
std::string describeChar(char c)
{
    const auto uc = static_cast<unsigned char>(c);
    if (uc >= 0x20 && uc < 0x7f) {
        return std::string("character '") + c + "'";
    }
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "byte 0x%02X", static_cast<unsigned>(uc));
    return buffer;
}

StateError invalidPath(const std::string &path, const std::string &reason)
{
    StateError error(ErrorCode::ValidationError,
                     "Invalid path '" + path + "': " + reason);
    error.withPath(path);
    return error;
}

} // namespace

std::vector<std::string> parseFieldPath(const std::string &path)
{
    if (path.empty()) {
        throw invalidPath(path, "path must be a non-empty string");
    }

    std::vector<std::string> segments;
    std::string current;
    for (char c : path) {
        if (c == '.') {
            if (current.empty()) {
                throw invalidPath(path, "empty path segment");
            }
            segments.push_back(current);
            current.clear();
            continue;
        }
        if (!isSegmentChar(c)) {
            throw invalidPath(path, describeChar(c) + " is not allowed");
        }
        current.push_back(c);
    }
    if (current.empty()) {
        throw invalidPath(path, "empty path segment");
    }
    segments.push_back(current);

    if (segments.size() > kMaxPathDepth) {
        throw invalidPath(path, "path is nested too deeply");
    }
    return segments;
}

std::string joinFieldPath(const std::string &prefix, const std::string &segment)
{
    return prefix.empty() ? segment : prefix + "." + segment;
}

std::optional<nlohmann::json> getField(const nlohmann::json &root,
                                       const std::string &path)
{
    const auto segments = parseFieldPath(path);

    const nlohmann::json *node = &root;
    for (const auto &segment : segments) {
        if (node->is_object()) {
            auto it = node->find(segment);
            if (it == node->end()) {
                return std::nullopt;
            }
            node = &(*it);
            continue;
        }
        if (node->is_array()) {
            const auto index = parseIndex(segment);
            if (!index || *index >= node->size()) {
                return std::nullopt;
            }
            node = &(*node)[*index];
            continue;
        }
        return std::nullopt;
    }
    return *node;
}

nlohmann::json setField(const nlohmann::json &root,
                        const std::string &path,
                        const nlohmann::json &value)
{
    const auto segments = parseFieldPath(path);
    if (!root.is_object()) {
        throw invalidPath(path, "document root is not a mapping");
    }

    nlohmann::json updated = root;
    nlohmann::json *node = &updated;
    std::string walked;
    for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
        const std::string &segment = segments[i];
        walked = joinFieldPath(walked, segment);

        auto it = node->find(segment);
        if (it == node->end()) {
            (*node)[segment] = nlohmann::json::object();
            it = node->find(segment);
        } else if (!it->is_object()) {
            throw invalidPath(path, "'" + walked + "' holds a value of type "
                                        + jsonKindName(*it) + ", not a mapping");
        }
        node = &(*it);
    }

    (*node)[segments.back()] = value;
    return updated;
}

std::string jsonKindName(const nlohmann::json &value)
{
    switch (value.type()) {
    case nlohmann::json::value_t::null:
        return "null";
    case nlohmann::json::value_t::boolean:
        return "boolean";
    case nlohmann::json::value_t::number_integer:
    case nlohmann::json::value_t::number_unsigned:
    case nlohmann::json::value_t::number_float:
        return "number";
    case nlohmann::json::value_t::string:
        return "string";
    case nlohmann::json::value_t::array:
        return "array";
    case nlohmann::json::value_t::object:
        return "mapping";
    case nlohmann::json::value_t::binary:
        return "binary";
    case nlohmann::json::value_t::discarded:
        return "discarded";
    }
    return "unknown";
}

} // namespace hoststate
