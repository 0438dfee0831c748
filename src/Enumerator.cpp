/**
 * @file Enumerator.cpp
 * @brief Implementation of path pattern enumeration
 */

#include "keypath/Enumerator.hpp"
#include "keypath/PathGrammar.hpp"
#include "keypath/Precedence.hpp"

#include <utility>

namespace keypath {

namespace {

/**
 * @brief One enumeration pass over a graph
 *
 * walk() emits the paths strictly below `prefix`; the step that reached
 * `prefix` has already emitted it.
 */
class Enumerator {
public:
    Enumerator(const SchemaGraph& graph, const PathVisitor& visitor)
        : graph_(graph)
        , visitor_(visitor)
    {}

    void walk(const Schema& schema, DepthBudget budget, const std::string& prefix) {
        switch (schema.kind()) {
            case SchemaKind::Terminal:
                break;

            case SchemaKind::Object:
                if (budget.exhausted()) break;
                for (const auto& field : schema.fields()) {
                    if (!is_addressable_key(field.name)) continue;
                    // Optionality changes what lives at a path, not whether it exists
                    std::string path = append_field(prefix, field.name);
                    emit(path);
                    if (!is_terminal_shape(graph_, field.schema)) {
                        walk(field.schema, budget.descend_field(), path);
                    }
                }
                break;

            case SchemaKind::Dictionary: {
                if (budget.exhausted()) break;
                std::string path = append_field(prefix, std::string(kWildcardKey));
                emit(path);
                if (!is_terminal_shape(graph_, schema.value())) {
                    walk(schema.value(), budget.descend_key(), path);
                }
                break;
            }

            case SchemaKind::Array: {
                if (loops_back(schema.element(), budget)) break;
                std::string path = append_index(prefix, std::string(kWildcardIndex));
                emit(path);
                walk(schema.element(), budget.descend_index(), path);
                break;
            }

            case SchemaKind::Tuple: {
                const auto& elements = schema.elements();
                for (size_t i = 0; i < elements.size(); ++i) {
                    if (loops_back(elements[i], budget)) continue;
                    std::string path = append_index(prefix, std::to_string(i));
                    emit(path);
                    walk(elements[i], budget.descend_index(), path);
                }
                break;
            }

            case SchemaKind::Union:
                for (const auto& variant : schema.variants()) {
                    walk(variant, budget, prefix);
                }
                break;

            case SchemaKind::Optional:
                walk(schema.inner(), budget, prefix);
                break;

            case SchemaKind::Reference: {
                auto key = std::make_pair(schema.name(), budget.remaining());
                if (repeating_.count(key)) break;
                if (active_.count(key)) {
                    // Re-entered through indices only (e.g. T = Array<T> | {x}).
                    // Walk it once more for the branches that spend budget,
                    // but no index leads back here again.
                    repeating_.insert(key);
                    walk(graph_.lookup(schema.name()), budget, prefix);
                    repeating_.erase(key);
                    break;
                }
                active_.insert(key);
                walk(graph_.lookup(schema.name()), budget, prefix);
                active_.erase(key);
                break;
            }
        }
    }

private:
    /// True if an element slot points straight back at a reference being repeated
    bool loops_back(const Schema& element, DepthBudget budget) const {
        return element.is_reference() &&
               repeating_.count(std::make_pair(element.name(), budget.remaining())) > 0;
    }

    void emit(const std::string& path) {
        if (seen_.insert(path).second) {
            visitor_(path);
        }
    }

    const SchemaGraph& graph_;
    const PathVisitor& visitor_;
    std::set<std::string> seen_;
    std::set<std::pair<std::string, int>> active_;
    std::set<std::pair<std::string, int>> repeating_;
};

} // anonymous namespace

void visit_paths(const SchemaGraph& graph, DepthBudget budget, const PathVisitor& visitor) {
    Enumerator enumerator(graph, visitor);
    enumerator.walk(graph.root(), budget, "");
}

std::set<std::string> enumerate_paths(const SchemaGraph& graph, int max_depth) {
    std::set<std::string> paths;
    visit_paths(graph, DepthBudget(max_depth),
                [&paths](const std::string& pattern) { paths.insert(pattern); });
    return paths;
}

std::set<std::string> enumerate_paths(const SchemaGraph& graph, const EnumerateOptions& options) {
    return enumerate_paths(graph, options.max_depth);
}

std::set<std::string> enumerate_paths(const Schema& schema, int max_depth) {
    return enumerate_paths(SchemaGraph(schema), max_depth);
}

} // namespace keypath
