/**
 * @file PathGrammar.hpp
 * @brief Path syntax: tokenizing, formatting and pattern markers
 *
 * Grammar:
 * ```
 * path          := segment ("." segment)*
 * segment       := field-name | bracket-chain
 * bracket-chain := "[" index "]" ("[" index "]")*
 * index         := "0" | nonzero-digit digit* | "*"
 * field-name    := one or more characters other than ".", "[", "]"
 * ```
 * A field name may be directly followed by a bracket chain ("items[0]"),
 * and a path may start with one ("[0].name").
 *
 * Patterns produced by the enumerator use "[*]" for "any index" and a
 * field segment "*" for "any dictionary key".
 *
 * Examples:
 * - "items[0].tags[1]" → Field(items), Index(0), Field(tags), Index(1)
 * - "[*][*].id"        → Index(*), Index(*), Field(id)
 * - "a..b", "a[", "[x]", "[01]", "a[0]b", "" → malformed
 *
 * A field segment "*" is reserved for the any-key marker; an object key
 * named "*" is never listed or written through a path.
 */

#ifndef KEYPATH_PATH_GRAMMAR_HPP
#define KEYPATH_PATH_GRAMMAR_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keypath {

/// Separator between segments
inline constexpr char kSeparator = '.';

/// Index placeholder inside brackets in path patterns
inline constexpr std::string_view kWildcardIndex = "*";

/// Field segment standing for any dictionary key in path patterns
inline constexpr std::string_view kWildcardKey = "*";

/// Longest path, in segments, that resolution and data access accept
inline constexpr std::size_t kMaxPathSegments = 512;

/**
 * @brief One navigation step of a path
 */
struct Segment {
    enum class Type { Field, Index };

    Type type = Type::Field;

    /// Field name (Field segments only)
    std::string name;

    /// Literal position (Index segments only); empty for the wildcard
    std::optional<std::size_t> index;

    static Segment field(std::string name);
    static Segment at(std::size_t position);
    static Segment any_index();

    bool is_field() const noexcept { return type == Type::Field; }
    bool is_index() const noexcept { return type == Type::Index; }
    bool is_wildcard_index() const noexcept { return is_index() && !index.has_value(); }

    friend bool operator==(const Segment& a, const Segment& b) {
        return a.type == b.type && a.name == b.name && a.index == b.index;
    }
    friend bool operator!=(const Segment& a, const Segment& b) { return !(a == b); }
};

using Path = std::vector<Segment>;

/**
 * @brief Tokenize a path string
 *
 * @param text Path text like "a.b[0].c"
 * @return Segments, or std::nullopt if the text is malformed
 */
std::optional<Path> parse_path(std::string_view text);

/**
 * @brief Check a path string against the grammar
 */
bool is_well_formed(std::string_view text);

/**
 * @brief Render segments back to path text
 *
 * Examples:
 * - [Field(a), Index(0), Field(b)] → "a[0].b"
 * - [Index(*), Field(id)] → "[*].id"
 * - [] → ""
 */
std::string format_path(const Path& path);

/**
 * @brief Append a field segment to a path prefix
 *
 * - ("", "a") → "a"
 * - ("a[*]", "b") → "a[*].b"
 */
std::string append_field(const std::string& prefix, const std::string& name);

/**
 * @brief Append a bracket segment to a path prefix
 *
 * @param position Bracket contents, e.g. "*" or "3"
 *
 * - ("", "*") → "[*]"
 * - ("items", "0") → "items[0]"
 */
std::string append_index(const std::string& prefix, const std::string& position);

/**
 * @brief Check whether an object key can be written as a path field
 *
 * Keys containing brackets, empty keys, keys with leading, trailing or
 * doubled dots, and the reserved key "*" cannot be expressed in the grammar.
 */
bool is_addressable_key(std::string_view name);

/**
 * @brief Check bracket contents: a position or the wildcard
 */
bool is_index_token(std::string_view token);

/**
 * @brief Parse a literal position ("0", "12")
 * @return The value, or std::nullopt for non-digits, leading zeros ("01")
 *         or values that do not fit in size_t
 */
std::optional<std::size_t> parse_position(std::string_view token);

/**
 * @brief Substitute literals for the wildcards of a pattern
 *
 * @param pattern Enumerated pattern, e.g. "users.*.tags[*]"
 * @param index Literal used for every "[*]"
 * @param key Literal used for every "*" key segment
 * @return Concrete path, e.g. "users.alice.tags[2]"
 * @throws InvalidPathError if the pattern is malformed
 */
std::string instantiate_pattern(std::string_view pattern, std::size_t index,
                                std::string_view key);

} // namespace keypath

#endif // KEYPATH_PATH_GRAMMAR_HPP
