/**
 * @file Schema.cpp
 * @brief Implementation of the schema model and graph validation
 */

#include "keypath/Schema.hpp"
#include "keypath/Errors.hpp"

#include <algorithm>
#include <set>
#include <sstream>
#include <stdexcept>

namespace keypath {

struct Schema::Node {
    SchemaKind kind = SchemaKind::Terminal;
    TerminalKind terminal = TerminalKind::Never;
    // Literal label of a terminal, or the name of a reference
    std::string text;
    std::vector<Field> fields;
    // Tuple elements, union variants, or the single child of
    // a dictionary, array or optional
    std::vector<Schema> children;
};

const char* terminal_kind_name(TerminalKind kind) noexcept {
    switch (kind) {
        case TerminalKind::Number: return "number";
        case TerminalKind::String: return "string";
        case TerminalKind::Boolean: return "boolean";
        case TerminalKind::Timestamp: return "timestamp";
        case TerminalKind::Pattern: return "pattern";
        case TerminalKind::Callable: return "callable";
        case TerminalKind::Promise: return "promise";
        case TerminalKind::Null: return "null";
        case TerminalKind::Never: return "never";
    }
    return "unknown";
}

const char* schema_kind_name(SchemaKind kind) noexcept {
    switch (kind) {
        case SchemaKind::Terminal: return "terminal";
        case SchemaKind::Object: return "object";
        case SchemaKind::Dictionary: return "dictionary";
        case SchemaKind::Array: return "array";
        case SchemaKind::Tuple: return "tuple";
        case SchemaKind::Union: return "union";
        case SchemaKind::Optional: return "optional";
        case SchemaKind::Reference: return "reference";
    }
    return "unknown";
}

// ============================================================================
// Factories
// ============================================================================

Schema Schema::terminal(TerminalKind kind, std::string literal) {
    auto node = std::make_shared<Node>();
    node->kind = SchemaKind::Terminal;
    node->terminal = kind;
    node->text = std::move(literal);
    return Schema(std::move(node));
}

Schema Schema::number() { return terminal(TerminalKind::Number); }
Schema Schema::string() { return terminal(TerminalKind::String); }
Schema Schema::boolean() { return terminal(TerminalKind::Boolean); }
Schema Schema::timestamp() { return terminal(TerminalKind::Timestamp); }
Schema Schema::pattern() { return terminal(TerminalKind::Pattern); }
Schema Schema::callable() { return terminal(TerminalKind::Callable); }
Schema Schema::promise() { return terminal(TerminalKind::Promise); }
Schema Schema::null() { return terminal(TerminalKind::Null); }
Schema Schema::never() { return terminal(TerminalKind::Never); }

Schema Schema::object(std::vector<Field> fields) {
    auto node = std::make_shared<Node>();
    node->kind = SchemaKind::Object;
    // Later declarations of the same name replace earlier ones
    for (auto& field : fields) {
        auto it = std::find_if(node->fields.begin(), node->fields.end(),
                               [&](const Field& f) { return f.name == field.name; });
        if (it != node->fields.end()) {
            *it = std::move(field);
        } else {
            node->fields.push_back(std::move(field));
        }
    }
    return Schema(std::move(node));
}

Schema Schema::dictionary(Schema value) {
    auto node = std::make_shared<Node>();
    node->kind = SchemaKind::Dictionary;
    node->children.push_back(std::move(value));
    return Schema(std::move(node));
}

Schema Schema::array(Schema element) {
    auto node = std::make_shared<Node>();
    node->kind = SchemaKind::Array;
    node->children.push_back(std::move(element));
    return Schema(std::move(node));
}

Schema Schema::tuple(std::vector<Schema> elements) {
    auto node = std::make_shared<Node>();
    node->kind = SchemaKind::Tuple;
    node->children = std::move(elements);
    return Schema(std::move(node));
}

Schema Schema::union_of(std::vector<Schema> variants) {
    std::vector<Schema> flat;
    flat.reserve(variants.size());

    auto add = [&flat](const Schema& candidate) {
        if (std::find(flat.begin(), flat.end(), candidate) == flat.end()) {
            flat.push_back(candidate);
        }
    };

    for (const auto& variant : variants) {
        if (variant.is_union()) {
            for (const auto& nested : variant.variants()) {
                add(nested);
            }
        } else {
            add(variant);
        }
    }

    if (flat.empty()) {
        return never();
    }
    if (flat.size() == 1) {
        return flat.front();
    }

    auto node = std::make_shared<Node>();
    node->kind = SchemaKind::Union;
    node->children = std::move(flat);
    return Schema(std::move(node));
}

Schema Schema::optional(Schema inner) {
    auto node = std::make_shared<Node>();
    node->kind = SchemaKind::Optional;
    node->children.push_back(std::move(inner));
    return Schema(std::move(node));
}

Schema Schema::reference(std::string name) {
    auto node = std::make_shared<Node>();
    node->kind = SchemaKind::Reference;
    node->text = std::move(name);
    return Schema(std::move(node));
}

// ============================================================================
// Inspection
// ============================================================================

SchemaKind Schema::kind() const noexcept {
    return node_->kind;
}

const Schema::Node& Schema::checked(SchemaKind expected) const {
    if (node_->kind != expected) {
        throw std::logic_error(std::string("Schema is ") + schema_kind_name(node_->kind) +
                               ", not " + schema_kind_name(expected));
    }
    return *node_;
}

TerminalKind Schema::terminal_kind() const {
    return checked(SchemaKind::Terminal).terminal;
}

const std::string& Schema::literal() const {
    return checked(SchemaKind::Terminal).text;
}

const std::vector<Field>& Schema::fields() const {
    return checked(SchemaKind::Object).fields;
}

const Field* Schema::find_field(std::string_view name) const {
    if (node_->kind != SchemaKind::Object) {
        return nullptr;
    }
    for (const auto& field : node_->fields) {
        if (field.name == name) {
            return &field;
        }
    }
    return nullptr;
}

const Schema& Schema::value() const {
    return checked(SchemaKind::Dictionary).children.front();
}

const Schema& Schema::element() const {
    return checked(SchemaKind::Array).children.front();
}

const std::vector<Schema>& Schema::elements() const {
    return checked(SchemaKind::Tuple).children;
}

const std::vector<Schema>& Schema::variants() const {
    return checked(SchemaKind::Union).children;
}

const Schema& Schema::inner() const {
    return checked(SchemaKind::Optional).children.front();
}

const std::string& Schema::name() const {
    return checked(SchemaKind::Reference).text;
}

namespace {

bool contains_equal(const std::vector<Schema>& haystack, const Schema& needle) {
    return std::find(haystack.begin(), haystack.end(), needle) != haystack.end();
}

} // anonymous namespace

bool operator==(const Schema& a, const Schema& b) {
    if (a.node_ == b.node_) {
        return true;
    }
    if (a.kind() != b.kind()) {
        return false;
    }

    const auto& x = *a.node_;
    const auto& y = *b.node_;

    switch (x.kind) {
        case SchemaKind::Terminal:
            return x.terminal == y.terminal && x.text == y.text;

        case SchemaKind::Reference:
            return x.text == y.text;

        case SchemaKind::Object:
            if (x.fields.size() != y.fields.size()) return false;
            for (const auto& field : x.fields) {
                const Field* other = b.find_field(field.name);
                if (!other || other->optional != field.optional || other->schema != field.schema) {
                    return false;
                }
            }
            return true;

        case SchemaKind::Union:
            if (x.children.size() != y.children.size()) return false;
            return std::all_of(x.children.begin(), x.children.end(),
                               [&](const Schema& s) { return contains_equal(y.children, s); });

        case SchemaKind::Dictionary:
        case SchemaKind::Array:
        case SchemaKind::Tuple:
        case SchemaKind::Optional:
            return x.children == y.children;
    }
    return false;
}

// ============================================================================
// Rendering
// ============================================================================

namespace {

void render(std::ostringstream& oss, const Schema& schema);

void render_member(std::ostringstream& oss, const Schema& schema) {
    // Unions inside postfix/array notation need parentheses
    if (schema.is_union()) {
        oss << '(';
        render(oss, schema);
        oss << ')';
    } else {
        render(oss, schema);
    }
}

void render(std::ostringstream& oss, const Schema& schema) {
    switch (schema.kind()) {
        case SchemaKind::Terminal:
            if (!schema.literal().empty()) {
                if (schema.terminal_kind() == TerminalKind::String) {
                    oss << '"' << schema.literal() << '"';
                } else {
                    oss << schema.literal();
                }
            } else {
                oss << terminal_kind_name(schema.terminal_kind());
            }
            break;

        case SchemaKind::Object: {
            const auto& fields = schema.fields();
            if (fields.empty()) {
                oss << "{}";
                break;
            }
            oss << "{ ";
            for (size_t i = 0; i < fields.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << fields[i].name << (fields[i].optional ? "?: " : ": ");
                render(oss, fields[i].schema);
            }
            oss << " }";
            break;
        }

        case SchemaKind::Dictionary:
            oss << "Record<string, ";
            render(oss, schema.value());
            oss << '>';
            break;

        case SchemaKind::Array:
            oss << "Array<";
            render(oss, schema.element());
            oss << '>';
            break;

        case SchemaKind::Tuple: {
            const auto& elements = schema.elements();
            oss << '[';
            for (size_t i = 0; i < elements.size(); ++i) {
                if (i > 0) oss << ", ";
                render(oss, elements[i]);
            }
            oss << ']';
            break;
        }

        case SchemaKind::Union: {
            const auto& variants = schema.variants();
            for (size_t i = 0; i < variants.size(); ++i) {
                if (i > 0) oss << " | ";
                render(oss, variants[i]);
            }
            break;
        }

        case SchemaKind::Optional:
            render_member(oss, schema.inner());
            oss << '?';
            break;

        case SchemaKind::Reference:
            oss << '@' << schema.name();
            break;
    }
}

} // anonymous namespace

std::string to_string(const Schema& schema) {
    std::ostringstream oss;
    render(oss, schema);
    return oss.str();
}

// ============================================================================
// SchemaGraph
// ============================================================================

SchemaGraph::SchemaGraph(Schema root, Definitions definitions)
    : root_(std::move(root))
    , definitions_(std::move(definitions))
{
    validate();
}

const Schema* SchemaGraph::find(const std::string& name) const {
    auto it = definitions_.find(name);
    return it == definitions_.end() ? nullptr : &it->second;
}

const Schema& SchemaGraph::lookup(const std::string& name) const {
    const Schema* found = find(name);
    if (!found) {
        throw DanglingReferenceError(name);
    }
    return *found;
}

const Schema& SchemaGraph::deref(const Schema& schema) const {
    // Alias loops are rejected by validate(), so this terminates
    const Schema* current = &schema;
    while (current->is_reference()) {
        current = &lookup(current->name());
    }
    return *current;
}

SchemaGraph SchemaGraph::with_root(Schema root) const {
    return SchemaGraph(std::move(root), definitions_);
}

namespace {

/**
 * @brief Collect every reference name used anywhere inside a schema
 *
 * Does not follow references.
 */
void collect_references(const Schema& schema, std::set<std::string>& out) {
    switch (schema.kind()) {
        case SchemaKind::Terminal:
            break;
        case SchemaKind::Reference:
            out.insert(schema.name());
            break;
        case SchemaKind::Object:
            for (const auto& field : schema.fields()) {
                collect_references(field.schema, out);
            }
            break;
        case SchemaKind::Dictionary:
            collect_references(schema.value(), out);
            break;
        case SchemaKind::Array:
            collect_references(schema.element(), out);
            break;
        case SchemaKind::Tuple:
            for (const auto& element : schema.elements()) {
                collect_references(element, out);
            }
            break;
        case SchemaKind::Union:
            for (const auto& variant : schema.variants()) {
                collect_references(variant, out);
            }
            break;
        case SchemaKind::Optional:
            collect_references(schema.inner(), out);
            break;
    }
}

/**
 * @brief Depth-first search along edges that do not enter any structure
 *
 * Reference, Union and Optional nodes are transparent to path resolution;
 * a definition reachable from itself through them alone never bottoms out.
 */
class AliasCycleFinder {
public:
    explicit AliasCycleFinder(const SchemaGraph::Definitions& defs) : defs_(defs) {}

    void check(const std::string& name) {
        if (done_.count(name)) return;
        chain_.clear();
        visit_name(name);
    }

private:
    void visit_name(const std::string& name) {
        auto on_chain = std::find(chain_.begin(), chain_.end(), name);
        if (on_chain != chain_.end()) {
            std::vector<std::string> loop(on_chain, chain_.end());
            loop.push_back(name);
            throw CircularAliasError(std::move(loop));
        }
        if (done_.count(name)) return;

        chain_.push_back(name);
        visit(defs_.at(name));
        chain_.pop_back();
        done_.insert(name);
    }

    void visit(const Schema& schema) {
        switch (schema.kind()) {
            case SchemaKind::Reference:
                visit_name(schema.name());
                break;
            case SchemaKind::Union:
                for (const auto& variant : schema.variants()) {
                    visit(variant);
                }
                break;
            case SchemaKind::Optional:
                visit(schema.inner());
                break;
            default:
                break;
        }
    }

    const SchemaGraph::Definitions& defs_;
    std::vector<std::string> chain_;
    std::set<std::string> done_;
};

} // anonymous namespace

void SchemaGraph::validate() const {
    std::set<std::string> used;
    collect_references(root_, used);
    for (const auto& [name, schema] : definitions_) {
        collect_references(schema, used);
    }

    for (const auto& name : used) {
        if (!find(name)) {
            throw DanglingReferenceError(name);
        }
    }

    AliasCycleFinder finder(definitions_);
    for (const auto& [name, schema] : definitions_) {
        finder.check(name);
    }
}

} // namespace keypath
