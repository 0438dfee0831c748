/**
 * @file Resolver.hpp
 * @brief Resolution of a path string to the shape reachable there
 *
 * resolve() is total: it returns the shape at the path, or std::nullopt
 * ("unresolvable") for malformed paths, unknown fields, indexing into a
 * non-indexable shape, and any other text no rule accepts. It never
 * throws for a validated graph and is not limited by any depth budget.
 * Paths longer than kMaxPathSegments segments are unresolvable.
 *
 * Examples, for
 * `{ items: Array<{ id: number, tags: Array<string> }>, opt?: { prop: string } }`:
 * ```cpp
 * resolve(s, "items[0].tags[1]");  // string
 * resolve(s, "items[*].id");       // number (wildcards are accepted)
 * resolve(s, "opt.prop");          // string (Optional unwrapped)
 * resolve(s, "items.tags");        // nullopt
 * resolve(s, "items[");            // nullopt (malformed)
 * ```
 *
 * Through a Union the path is resolved against every variant; the result
 * is the union of the variants that resolve.
 *
 * See Precedence.hpp for the order in which ambiguous text is interpreted.
 */

#ifndef KEYPATH_RESOLVER_HPP
#define KEYPATH_RESOLVER_HPP

#include "keypath/Precedence.hpp"
#include "keypath/Schema.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keypath {

/**
 * @brief Resolve a path against a graph's root schema
 * @return Shape at the path (references and optional wrappers of the final
 *         step removed), or std::nullopt if unresolvable
 */
std::optional<Schema> resolve(const SchemaGraph& graph, std::string_view path);

/**
 * @brief Resolve a path against a schema that contains no references
 * @throws DanglingReferenceError if the schema does contain a reference
 */
std::optional<Schema> resolve(const Schema& schema, std::string_view path);

/**
 * @brief Whether resolve() finds a shape for the path
 */
bool is_valid_path(const SchemaGraph& graph, std::string_view path);

/**
 * @brief One rule decision made while resolving
 */
struct ResolutionStep {
    Rule rule;
    /// Path text the rule was applied to
    std::string remaining;
    /// Schema the rule was applied to
    Schema node;
};

/**
 * @brief Result of explain(): the shape plus every rule decision taken
 */
struct Resolution {
    std::optional<Schema> shape;
    std::vector<ResolutionStep> trace;

    bool resolved() const noexcept { return shape.has_value(); }
};

/**
 * @brief Resolve a path and record which rule fired at each step
 *
 * Steps appear in the order they were taken; union variants are explored
 * one after the other.
 */
Resolution explain(const SchemaGraph& graph, std::string_view path);

} // namespace keypath

#endif // KEYPATH_RESOLVER_HPP
