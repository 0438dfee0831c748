/**
 * @file Accessor.hpp
 * @brief Reading and writing JSON values through paths
 *
 * A generic accessor for data documents (nlohmann::json) using the same
 * path syntax as the resolver: "users.alice.tags[0]", "[2].name".
 *
 * Behaviour:
 * - find_at() returns nullptr when the value is absent (missing key, index
 *   out of range, or a null met along the way)
 * - a field step into a non-object, or an index step into a non-array,
 *   is a TypeError; a digit field step into an array indexes it ("mixed.1",
 *   but not "mixed.01")
 * - object keys containing dots are matched longest first, like the
 *   resolver's explicit-key rule: with {"a.b": 1, "a": {"b": 2}},
 *   "a.b" reads 1; find_at() falls back to shorter keys when the longer
 *   one leads nowhere, set_at() writes through the longest existing key
 * - malformed paths, paths over kMaxPathSegments segments, and the
 *   wildcards "[*]" and "*" throw InvalidPathError
 *
 * The accessor does not consult any schema; see Document.hpp for the
 * schema-checked variant.
 */

#ifndef KEYPATH_ACCESSOR_HPP
#define KEYPATH_ACCESSOR_HPP

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace keypath {

/// JSON data value
using Value = nlohmann::json;

/// Most nulls set_at() will append to an array to reach an index
inline constexpr std::size_t kMaxArrayPadding = 1024;

/**
 * @brief Get human-readable type name for a Value
 * @return "null", "boolean", "integer", "float", "string", "array" or "object"
 */
std::string type_name(const Value& val);

/**
 * @brief Find the value at a path
 *
 * @return Pointer into data, or nullptr if absent
 * @throws InvalidPathError if the path is malformed or has wildcards
 * @throws TypeError if a step meets a value of the wrong kind
 *
 * Example:
 * ```cpp
 * Value data = {{"items", {{{"id", 1}}}}};
 * find_at(data, "items[0].id");  // → 1
 * find_at(data, "items[5].id");  // → nullptr
 * find_at(data, "items.id");     // throws TypeError (items is an array)
 * ```
 */
const Value* find_at(const Value& data, const std::string& path);

/**
 * @brief Get the value at a path (strict)
 *
 * @throws KeyError if the value is absent
 * @throws InvalidPathError, TypeError as find_at()
 */
const Value& get_at(const Value& data, const std::string& path);

/**
 * @brief Check whether a value is present at a path
 *
 * @throws InvalidPathError, TypeError as find_at()
 */
bool contains_at(const Value& data, const std::string& path);

/**
 * @brief Set the value at a path, creating missing containers
 *
 * Missing or null intermediates become objects (before a field step) or
 * arrays (before an index step); arrays are padded with nulls up to the
 * index.
 *
 * @throws InvalidPathError if the path is malformed or has wildcards, or
 *         an index lies more than kMaxArrayPadding past the end of its array
 * @throws TypeError if an existing intermediate has the wrong kind
 *
 * Example:
 * ```cpp
 * Value data = Value::object();
 * set_at(data, "optional.nested.value", "created");
 * // {"optional": {"nested": {"value": "created"}}}
 * set_at(data, "list[2]", 7);
 * // ... "list": [null, null, 7]
 * ```
 */
void set_at(Value& data, const std::string& path, const Value& value);

} // namespace keypath

#endif // KEYPATH_ACCESSOR_HPP
