/**
 * @file Resolver.cpp
 * @brief Implementation of path resolution
 *
 * The rules of Precedence.hpp are kept in a table of (predicate, handler)
 * pairs. resolve_at() dereferences the current node, distributes over
 * unions, unwraps optionals, and then runs the rules whose predicate holds
 * in order until one yields a shape. Every handler either consumes part of
 * the remaining text before recursing or returns, so resolution always
 * terminates.
 *
 * The remaining text is always a suffix of the input, and the outcome for
 * a (node, suffix) pair never changes, so each pair is resolved once.
 * Key lookups only look as far into the text as the longest declared key.
 */

#include "keypath/Resolver.hpp"
#include "keypath/PathGrammar.hpp"

#include <algorithm>
#include <map>
#include <utility>

namespace keypath {

namespace {

/**
 * @brief A "head.rest" reading of a key, with head a declared key
 */
struct DottedCandidate {
    DeclaredKey head;
    std::string_view rest;
};

class Resolver {
public:
    Resolver(const SchemaGraph& graph, std::vector<ResolutionStep>* trace)
        : graph_(graph)
        , trace_(trace)
    {}

    const SchemaGraph& graph() const noexcept { return graph_; }

    std::optional<Schema> resolve_at(const Schema& schema, std::string_view key);

    void record(Rule rule, std::string_view key, const Schema& node) {
        if (trace_) {
            trace_->push_back({rule, std::string(key), node});
        }
    }

    /// Candidates found by a rule's predicate, handed to its handler
    std::vector<DottedCandidate> candidates;

private:
    std::optional<Schema> run_rules(const Schema& node, std::string_view key);

    struct Outcome {
        Schema node;  // keeps identity() valid while the entry lives
        std::optional<Schema> shape;
    };

    const SchemaGraph& graph_;
    std::vector<ResolutionStep>* trace_;
    std::map<std::pair<const void*, size_t>, Outcome> done_;
};

using Predicate = bool (*)(Resolver&, const Schema&, std::string_view);
using Handler = std::optional<Schema> (*)(Resolver&, const Schema&, std::string_view);

struct RuleEntry {
    Rule rule;
    Predicate applies;
    Handler apply;
};

bool is_bare(std::string_view key) {
    return key.find_first_of(".[") == std::string_view::npos;
}

/**
 * @brief Split candidates whose head is a declared key of the given kind
 *
 * Longest head first. Heads must lead somewhere: terminal heads are
 * skipped since nothing can follow them.
 */
std::vector<DottedCandidate> dotted_candidates(const Resolver& r, const Schema& node,
                                               std::string_view key, bool optional) {
    std::vector<DottedCandidate> out;
    for (size_t dot : split_points(key, longest_declared_key(node))) {
        std::string_view rest = key.substr(dot + 1);
        if (rest.empty()) continue;

        auto declared = find_declared(node, key.substr(0, dot));
        if (!declared || is_optional_key(r.graph(), *declared) != optional) continue;
        if (is_terminal_shape(r.graph(), strip_optional(r.graph(), declared->schema))) continue;

        out.push_back({std::move(*declared), rest});
    }
    return out;
}

std::optional<Schema> resolve_first(Resolver& r, std::vector<DottedCandidate> candidates) {
    for (const auto& candidate : candidates) {
        if (auto shape = r.resolve_at(candidate.head.schema, candidate.rest)) {
            return shape;
        }
    }
    return std::nullopt;
}

// ---- Rule 1: explicit key -------------------------------------------------

bool explicit_key_applies(Resolver&, const Schema& node, std::string_view key) {
    return find_declared(node, key).has_value();
}

std::optional<Schema> explicit_key(Resolver& r, const Schema& node, std::string_view key) {
    return strip_optional(r.graph(), find_declared(node, key)->schema);
}

// ---- Rule 2: dictionary key -----------------------------------------------

bool dictionary_key_applies(Resolver&, const Schema& node, std::string_view key) {
    return node.is_dictionary() && is_bare(key);
}

std::optional<Schema> dictionary_key(Resolver& r, const Schema& node, std::string_view) {
    return r.graph().deref(node.value());
}

// ---- Rule 3: nested path through a required key ---------------------------

bool nested_key_applies(Resolver& r, const Schema& node, std::string_view key) {
    r.candidates = dotted_candidates(r, node, key, false);
    return !r.candidates.empty();
}

std::optional<Schema> nested_key(Resolver& r, const Schema&, std::string_view) {
    return resolve_first(r, std::move(r.candidates));
}

// ---- Rule 4: array/tuple index --------------------------------------------

/**
 * @brief Position of the bracket after a "head[" prefix, if head is a
 *        declared key or a dictionary key
 */
std::optional<size_t> indexed_head(const Schema& node, std::string_view key) {
    size_t limit = std::min(key.size(), longest_declared_key(node) + 1);
    size_t bracket = key.substr(0, limit).find('[');
    if (bracket != std::string_view::npos && find_declared(node, key.substr(0, bracket))) {
        return bracket;
    }
    if (node.is_dictionary()) {
        size_t stop = key.find_first_of(".[");
        if (stop != std::string_view::npos && key[stop] == '[') {
            return stop;
        }
    }
    return std::nullopt;
}

bool index_applies(Resolver&, const Schema& node, std::string_view key) {
    if (key.empty()) {
        return false;
    }
    if (key.front() == '[') {
        return node.is_array() || node.is_tuple();
    }
    return indexed_head(node, key).has_value();
}

std::optional<Schema> index_step(Resolver& r, const Schema& node, std::string_view key) {
    if (key.front() != '[') {
        // "head[...]": step into the head, keep the brackets
        size_t bracket = *indexed_head(node, key);
        auto declared = find_declared(node, key.substr(0, bracket));
        const Schema& base = declared ? declared->schema : node.value();
        return r.resolve_at(base, key.substr(bracket));
    }

    size_t close = key.find(']');
    if (close == std::string_view::npos) {
        return std::nullopt;
    }
    std::string_view token = key.substr(1, close - 1);
    std::string_view rest = key.substr(close + 1);

    std::optional<Schema> element;
    if (node.is_array()) {
        element = node.element();
    } else if (token == kWildcardIndex) {
        std::vector<Schema> slots;
        for (const auto& slot : node.elements()) {
            slots.push_back(r.graph().deref(slot));
        }
        if (!slots.empty()) {
            element = Schema::union_of(std::move(slots));
        }
    } else if (auto slot = find_declared(node, token)) {
        element = slot->schema;
    }

    if (!element) {
        return std::nullopt;
    }
    if (rest.empty()) {
        return r.graph().deref(*element);
    }
    if (rest.front() == '[') {
        return r.resolve_at(*element, rest);
    }
    if (rest.front() == kSeparator && rest.size() > 1) {
        return r.resolve_at(*element, rest.substr(1));
    }
    return std::nullopt;
}

// ---- Rule 5: dictionary key followed by a path ----------------------------

bool dictionary_path_applies(Resolver&, const Schema& node, std::string_view key) {
    if (!node.is_dictionary()) {
        return false;
    }
    size_t dot = key.find_first_of(".[");
    return dot != std::string_view::npos && key[dot] == kSeparator && dot > 0 &&
           dot + 1 < key.size();
}

std::optional<Schema> dictionary_path(Resolver& r, const Schema& node, std::string_view key) {
    return r.resolve_at(node.value(), key.substr(key.find(kSeparator) + 1));
}

// ---- Rule 6: nested path through an optional key --------------------------

bool optional_chain_applies(Resolver& r, const Schema& node, std::string_view key) {
    r.candidates = dotted_candidates(r, node, key, true);
    return !r.candidates.empty();
}

std::optional<Schema> optional_chain(Resolver& r, const Schema&, std::string_view) {
    // resolve_at() unwraps the Optional before continuing
    return resolve_first(r, std::move(r.candidates));
}

// ---- Rule 7 ---------------------------------------------------------------

bool always(Resolver&, const Schema&, std::string_view) {
    return true;
}

std::optional<Schema> unresolvable(Resolver&, const Schema&, std::string_view) {
    return std::nullopt;
}

const RuleEntry kRules[] = {
    {Rule::ExplicitKey, explicit_key_applies, explicit_key},
    {Rule::DictionaryKey, dictionary_key_applies, dictionary_key},
    {Rule::NestedExplicitKey, nested_key_applies, nested_key},
    {Rule::Index, index_applies, index_step},
    {Rule::DictionaryPath, dictionary_path_applies, dictionary_path},
    {Rule::OptionalChain, optional_chain_applies, optional_chain},
    {Rule::Unresolvable, always, unresolvable},
};

std::optional<Schema> Resolver::resolve_at(const Schema& schema, std::string_view key) {
    const Schema& node = graph_.deref(schema);

    if (node.is_union()) {
        std::vector<Schema> shapes;
        for (const auto& variant : node.variants()) {
            if (auto shape = resolve_at(variant, key)) {
                shapes.push_back(std::move(*shape));
            }
        }
        if (shapes.empty()) {
            return std::nullopt;
        }
        return Schema::union_of(std::move(shapes));
    }

    if (node.is_optional()) {
        return resolve_at(node.inner(), key);
    }

    auto memo_key = std::make_pair(node.identity(), key.size());
    auto it = done_.find(memo_key);
    if (it != done_.end()) {
        return it->second.shape;
    }
    auto shape = run_rules(node, key);
    done_.emplace(memo_key, Outcome{node, shape});
    return shape;
}

std::optional<Schema> Resolver::run_rules(const Schema& node, std::string_view key) {
    for (const auto& entry : kRules) {
        if (!entry.applies(*this, node, key)) {
            continue;
        }
        record(entry.rule, key, node);
        if (auto shape = entry.apply(*this, node, key)) {
            return shape;
        }
    }
    return std::nullopt;
}

bool within_limits(std::string_view path) {
    auto parsed = parse_path(path);
    return parsed && parsed->size() <= kMaxPathSegments;
}

} // anonymous namespace

std::optional<Schema> resolve(const SchemaGraph& graph, std::string_view path) {
    if (!within_limits(path)) {
        return std::nullopt;
    }
    Resolver resolver(graph, nullptr);
    return resolver.resolve_at(graph.root(), path);
}

std::optional<Schema> resolve(const Schema& schema, std::string_view path) {
    return resolve(SchemaGraph(schema), path);
}

bool is_valid_path(const SchemaGraph& graph, std::string_view path) {
    return resolve(graph, path).has_value();
}

Resolution explain(const SchemaGraph& graph, std::string_view path) {
    Resolution result;
    if (!within_limits(path)) {
        result.trace.push_back({Rule::Unresolvable, std::string(path), graph.root()});
        return result;
    }
    Resolver resolver(graph, &result.trace);
    result.shape = resolver.resolve_at(graph.root(), path);
    return result;
}

} // namespace keypath
