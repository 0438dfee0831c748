/**
 * @file Precedence.hpp
 * @brief Interpretation rules shared by the enumerator and the resolver
 *
 * When a path segment could mean more than one thing, the resolver tries
 * these rules in order and the first one that applies and yields a shape
 * decides. A rule that applies but leads nowhere hands the text on to the
 * next one:
 *
 * 1. ExplicitKey       - the whole remaining text is a declared key
 * 2. DictionaryKey     - bare (dot-free, bracket-free) key of a dictionary
 * 3. NestedExplicitKey - "I.Rest" where I is a required, non-terminal
 *                        declared key (longest I first)
 * 4. Index             - "[n]..." on an array/tuple, or "I[n]..." where I
 *                        is a declared key or a dictionary key
 * 5. DictionaryPath    - "key.Rest" on a dictionary
 * 6. OptionalChain     - "I.Rest" where I is an optional declared key
 * 7. Unresolvable
 *
 * A literal key that contains a dot therefore beats the same text read
 * as a nested path.
 */

#ifndef KEYPATH_PRECEDENCE_HPP
#define KEYPATH_PRECEDENCE_HPP

#include "keypath/Schema.hpp"

#include <array>
#include <optional>
#include <string_view>
#include <vector>

namespace keypath {

enum class Rule {
    ExplicitKey,
    DictionaryKey,
    NestedExplicitKey,
    Index,
    DictionaryPath,
    OptionalChain,
    Unresolvable
};

/// All rules in the order they are tried
inline constexpr std::array<Rule, 7> kRuleOrder = {
    Rule::ExplicitKey,
    Rule::DictionaryKey,
    Rule::NestedExplicitKey,
    Rule::Index,
    Rule::DictionaryPath,
    Rule::OptionalChain,
    Rule::Unresolvable,
};

/**
 * @brief Get the kebab-case name of a rule, e.g. "explicit-key"
 */
const char* rule_name(Rule rule) noexcept;

/**
 * @brief A key declared by an Object (field) or Tuple (numeric slot)
 */
struct DeclaredKey {
    Schema schema;
    bool optional = false;
};

/**
 * @brief Look up a declared key on a dereferenced node
 *
 * Objects declare their field names; tuples declare "0" .. "size-1".
 * Dictionaries declare nothing: their keys are matched by the dictionary
 * rules instead.
 */
std::optional<DeclaredKey> find_declared(const Schema& node, std::string_view key);

/**
 * @brief Whether traversal stops at this schema
 *
 * True for terminals, and for unions/optionals made only of terminals.
 */
bool is_terminal_shape(const SchemaGraph& graph, const Schema& schema);

/**
 * @brief Whether a declared key may be absent
 *
 * True when the key is flagged optional or its schema is an Optional.
 */
bool is_optional_key(const SchemaGraph& graph, const DeclaredKey& key);

/**
 * @brief Dereference and remove every Optional wrapper
 */
Schema strip_optional(const SchemaGraph& graph, const Schema& schema);

/**
 * @brief Length of the longest key a node declares (0 if none)
 *
 * No head longer than this can match, so callers only need to look that
 * far into the remaining text.
 */
size_t longest_declared_key(const Schema& node);

/**
 * @brief Positions of the dots in a key, rightmost first
 *
 * Splitting at each position in turn yields the candidate heads from the
 * longest to the shortest: "a.b.c" → {3, 1} → "a.b" | "c", then "a" | "b.c".
 * Only dots at or before `max_head` are reported.
 */
std::vector<size_t> split_points(std::string_view key,
                                 size_t max_head = std::string_view::npos);

} // namespace keypath

#endif // KEYPATH_PRECEDENCE_HPP
