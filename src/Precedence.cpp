/**
 * @file Precedence.cpp
 * @brief Implementation of the shared interpretation helpers
 */

#include "keypath/Precedence.hpp"
#include "keypath/PathGrammar.hpp"

#include <algorithm>
#include <string>

namespace keypath {

const char* rule_name(Rule rule) noexcept {
    switch (rule) {
        case Rule::ExplicitKey: return "explicit-key";
        case Rule::DictionaryKey: return "dictionary-key";
        case Rule::NestedExplicitKey: return "nested-explicit-key";
        case Rule::Index: return "index";
        case Rule::DictionaryPath: return "dictionary-path";
        case Rule::OptionalChain: return "optional-chain";
        case Rule::Unresolvable: return "unresolvable";
    }
    return "unknown";
}

std::optional<DeclaredKey> find_declared(const Schema& node, std::string_view key) {
    if (node.is_object()) {
        if (const Field* field = node.find_field(key)) {
            return DeclaredKey{field->schema, field->optional};
        }
        return std::nullopt;
    }

    if (node.is_tuple()) {
        const auto& elements = node.elements();
        auto position = parse_position(key);
        if (position && *position < elements.size()) {
            return DeclaredKey{elements[*position], false};
        }
    }

    return std::nullopt;
}

bool is_terminal_shape(const SchemaGraph& graph, const Schema& schema) {
    const Schema& node = graph.deref(schema);
    switch (node.kind()) {
        case SchemaKind::Terminal:
            return true;
        case SchemaKind::Optional:
            return is_terminal_shape(graph, node.inner());
        case SchemaKind::Union:
            return std::all_of(node.variants().begin(), node.variants().end(),
                               [&](const Schema& v) { return is_terminal_shape(graph, v); });
        default:
            return false;
    }
}

bool is_optional_key(const SchemaGraph& graph, const DeclaredKey& key) {
    return key.optional || graph.deref(key.schema).is_optional();
}

Schema strip_optional(const SchemaGraph& graph, const Schema& schema) {
    const Schema* current = &graph.deref(schema);
    while (current->is_optional()) {
        current = &graph.deref(current->inner());
    }
    return *current;
}

size_t longest_declared_key(const Schema& node) {
    size_t longest = 0;
    if (node.is_object()) {
        for (const auto& field : node.fields()) {
            longest = std::max(longest, field.name.size());
        }
    } else if (node.is_tuple() && !node.elements().empty()) {
        longest = std::to_string(node.elements().size() - 1).size();
    }
    return longest;
}

std::vector<size_t> split_points(std::string_view key, size_t max_head) {
    std::vector<size_t> points;
    size_t end = max_head < key.size() ? max_head + 1 : key.size();
    for (size_t i = end; i-- > 0;) {
        if (key[i] == kSeparator) {
            points.push_back(i);
        }
    }
    return points;
}

} // namespace keypath
