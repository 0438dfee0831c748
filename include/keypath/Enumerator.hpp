/**
 * @file Enumerator.hpp
 * @brief Enumeration of the valid path patterns of a schema
 *
 * Patterns use "[*]" for any array index and "*" for any dictionary key.
 * Tuple slots are listed with their literal position.
 *
 * Example:
 * ```cpp
 * Schema s = Schema::object({
 *     {"items", Schema::array(Schema::object({
 *         {"id", Schema::number()},
 *         {"tags", Schema::array(Schema::string())},
 *     }))},
 * });
 * enumerate_paths(s);
 * // {"items", "items[*]", "items[*].id", "items[*].tags", "items[*].tags[*]"}
 * ```
 *
 * Enumeration is bounded by a DepthBudget: branches stop silently when it
 * runs out, so self-referential schemas yield a finite set.
 */

#ifndef KEYPATH_ENUMERATOR_HPP
#define KEYPATH_ENUMERATOR_HPP

#include "keypath/DepthBudget.hpp"
#include "keypath/Schema.hpp"

#include <functional>
#include <set>
#include <string>

namespace keypath {

/**
 * @brief Enumeration settings
 */
struct EnumerateOptions {
    /// Object/dictionary nesting allowance
    int max_depth = kDefaultMaxDepth;
};

/// Receives each distinct pattern once
using PathVisitor = std::function<void(const std::string& pattern)>;

/**
 * @brief Stream the patterns of a graph's root schema
 *
 * Each pattern is passed to the visitor exactly once, in traversal order.
 *
 * @param graph Validated schema graph
 * @param budget Depth allowance for this traversal
 * @param visitor Callback receiving each pattern
 */
void visit_paths(const SchemaGraph& graph, DepthBudget budget, const PathVisitor& visitor);

/**
 * @brief Collect the patterns of a graph's root schema
 *
 * @throws std::invalid_argument if max_depth is negative
 */
std::set<std::string> enumerate_paths(const SchemaGraph& graph,
                                      int max_depth = kDefaultMaxDepth);

std::set<std::string> enumerate_paths(const SchemaGraph& graph, const EnumerateOptions& options);

/**
 * @brief Collect the patterns of a schema that contains no references
 *
 * @throws DanglingReferenceError if the schema does contain a reference
 */
std::set<std::string> enumerate_paths(const Schema& schema, int max_depth = kDefaultMaxDepth);

} // namespace keypath

#endif // KEYPATH_ENUMERATOR_HPP
