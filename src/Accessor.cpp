/**
 * @file Accessor.cpp
 * @brief Implementation of path-based JSON access
 */

#include "keypath/Accessor.hpp"
#include "keypath/Errors.hpp"
#include "keypath/PathGrammar.hpp"

#include <optional>

namespace keypath {

std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

namespace {
    /**
     * @brief Tokenize a concrete path (no wildcards allowed)
     */
    Path parse_concrete(const std::string& path) {
        auto parsed = parse_path(path);
        if (!parsed) {
            throw InvalidPathError(path, "malformed path");
        }
        if (parsed->size() > kMaxPathSegments) {
            throw InvalidPathError(path, "more than " + std::to_string(kMaxPathSegments) +
                                         " segments");
        }
        for (const auto& seg : *parsed) {
            if (seg.is_wildcard_index()) {
                throw InvalidPathError(path, "wildcard index in a concrete path");
            }
            if (seg.is_field() && seg.name == kWildcardKey) {
                throw InvalidPathError(path, "wildcard key in a concrete path");
            }
        }
        return *parsed;
    }

    /**
     * @brief Array position a segment stands for at `current`
     *
     * Index segments always do; a field segment does when `current` is an
     * array and the name is a position ("mixed.1").
     */
    std::optional<size_t> position_of(const Segment& seg, const Value& current) {
        if (seg.is_index()) {
            return seg.index;
        }
        if (current.is_array()) {
            return parse_position(seg.name);
        }
        return std::nullopt;
    }

    /**
     * @brief Number of consecutive field segments starting at i
     */
    size_t field_run(const Path& segments, size_t i) {
        size_t n = 0;
        while (i + n < segments.size() && segments[i + n].is_field()) {
            ++n;
        }
        return n;
    }

    /**
     * @brief Join field segments [from, from + count) with dots
     */
    std::string join_fields(const Path& segments, size_t from, size_t count) {
        std::string key = segments[from].name;
        for (size_t k = 1; k < count; ++k) {
            key += kSeparator;
            key += segments[from + k].name;
        }
        return key;
    }

    /**
     * @brief Find the longest run of field segments naming an existing key
     * @return Number of segments the key covers, or 0 if no key matches
     */
    size_t match_key(Value& object, const Path& segments, size_t i, Value*& out) {
        for (size_t n = field_run(segments, i); n >= 1; --n) {
            auto it = object.find(join_fields(segments, i, n));
            if (it != object.end()) {
                out = &*it;
                return n;
            }
        }
        return 0;
    }

    const Value* find_from(const Value& current, const Path& segments, size_t i,
                           const std::string& path) {
        if (i == segments.size()) {
            return &current;
        }
        if (current.is_null()) {
            return nullptr;
        }

        const auto& seg = segments[i];

        if (auto position = position_of(seg, current)) {
            if (!current.is_array()) {
                throw TypeError(path, "array", type_name(current));
            }
            size_t idx = *position;
            if (idx >= current.size()) {
                return nullptr;
            }
            return find_from(current[idx], segments, i + 1, path);
        }

        if (!current.is_object()) {
            throw TypeError(path, "object", type_name(current));
        }

        // Longest literal key first; fall back when it leads nowhere
        for (size_t n = field_run(segments, i); n >= 1; --n) {
            auto it = current.find(join_fields(segments, i, n));
            if (it == current.end()) continue;
            if (const Value* found = find_from(*it, segments, i + n, path)) {
                return found;
            }
        }
        return nullptr;
    }
}

const Value* find_at(const Value& data, const std::string& path) {
    return find_from(data, parse_concrete(path), 0, path);
}

const Value& get_at(const Value& data, const std::string& path) {
    const Value* found = find_at(data, path);
    if (!found) {
        throw KeyError(path, path);
    }
    return *found;
}

bool contains_at(const Value& data, const std::string& path) {
    return find_at(data, path) != nullptr;
}

void set_at(Value& data, const std::string& path, const Value& value) {
    const Path segments = parse_concrete(path);

    Value* current = &data;
    size_t i = 0;

    while (i < segments.size()) {
        const auto& seg = segments[i];

        if (auto position = position_of(seg, *current)) {
            if (current->is_null()) {
                *current = Value::array();
            }
            if (!current->is_array()) {
                throw TypeError(path, "array", type_name(*current));
            }
            size_t idx = *position;
            if (idx > current->size() && idx - current->size() > kMaxArrayPadding) {
                throw InvalidPathError(path, "index " + std::to_string(idx) +
                                             " is too far past the end of an array of " +
                                             std::to_string(current->size()));
            }
            while (current->size() <= idx) {
                current->push_back(nullptr);
            }
            current = &(*current)[idx];
            ++i;
            continue;
        }

        if (current->is_null()) {
            *current = Value::object();
        }
        if (!current->is_object()) {
            throw TypeError(path, "object", type_name(*current));
        }

        Value* next = nullptr;
        size_t consumed = match_key(*current, segments, i, next);
        if (consumed == 0) {
            // Create missing intermediate
            next = &(*current)[seg.name];
            consumed = 1;
        }
        current = next;
        i += consumed;
    }

    *current = value;
}

} // namespace keypath
