/**
 * @file Schema.hpp
 * @brief Structural schema model and schema graphs
 *
 * A Schema is an immutable handle to one node of a shape description:
 * - Terminal: leaf (number, string, boolean, timestamp, ...), never descended
 * - Object: named fields, each required or optional
 * - Dictionary: any string key maps to the same value schema
 * - Array: homogeneous, index-addressed
 * - Tuple: fixed-length, heterogeneous, index-addressed
 * - Union: value is one of the variants
 * - Optional: value may be absent
 * - Reference: named handle resolved through a SchemaGraph
 *
 * Handles share their nodes, so copying a Schema is cheap and a schema
 * may be read from any number of threads at once.
 */

#ifndef KEYPATH_SCHEMA_HPP
#define KEYPATH_SCHEMA_HPP

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace keypath {

/// Kind of a schema node
enum class SchemaKind {
    Terminal,
    Object,
    Dictionary,
    Array,
    Tuple,
    Union,
    Optional,
    Reference
};

/// Kind of a terminal (leaf) schema
enum class TerminalKind {
    Number,
    String,
    Boolean,
    Timestamp,
    Pattern,
    Callable,
    Promise,
    Null,
    Never
};

/**
 * @brief Get the lowercase name of a terminal kind
 * @return e.g. "number", "timestamp"
 */
const char* terminal_kind_name(TerminalKind kind) noexcept;

/**
 * @brief Get the lowercase name of a schema kind
 * @return e.g. "object", "reference"
 */
const char* schema_kind_name(SchemaKind kind) noexcept;

struct Field;

/**
 * @brief Immutable handle to a schema node
 *
 * Built through the static factories:
 * ```cpp
 * Schema user = Schema::object({
 *     {"name", Schema::string()},
 *     {"tags", Schema::array(Schema::string())},
 *     {"manager", Schema::reference("User"), true},   // optional field
 * });
 * ```
 *
 * Accessors for a specific kind (fields(), element(), ...) throw
 * std::logic_error when called on a node of another kind.
 */
class Schema {
public:
    // ---- Terminals ---------------------------------------------------------

    /**
     * @brief Create a terminal schema
     * @param kind Terminal kind
     * @param literal Optional literal value label (e.g. "active" for the
     *                string literal type 'active'); empty for none
     */
    static Schema terminal(TerminalKind kind, std::string literal = "");

    static Schema number();
    static Schema string();
    static Schema boolean();
    static Schema timestamp();
    static Schema pattern();
    static Schema callable();
    static Schema promise();
    static Schema null();
    static Schema never();

    // ---- Composites --------------------------------------------------------

    static Schema object(std::vector<Field> fields);
    static Schema dictionary(Schema value);
    static Schema array(Schema element);
    static Schema tuple(std::vector<Schema> elements);

    /**
     * @brief Create a union of schemas
     *
     * Nested unions are flattened and structural duplicates removed.
     * A single remaining variant is returned as is; no variant at all
     * yields Schema::never().
     */
    static Schema union_of(std::vector<Schema> variants);

    static Schema optional(Schema inner);
    static Schema reference(std::string name);

    // ---- Inspection --------------------------------------------------------

    SchemaKind kind() const noexcept;

    bool is_terminal() const noexcept { return kind() == SchemaKind::Terminal; }
    bool is_object() const noexcept { return kind() == SchemaKind::Object; }
    bool is_dictionary() const noexcept { return kind() == SchemaKind::Dictionary; }
    bool is_array() const noexcept { return kind() == SchemaKind::Array; }
    bool is_tuple() const noexcept { return kind() == SchemaKind::Tuple; }
    bool is_union() const noexcept { return kind() == SchemaKind::Union; }
    bool is_optional() const noexcept { return kind() == SchemaKind::Optional; }
    bool is_reference() const noexcept { return kind() == SchemaKind::Reference; }

    TerminalKind terminal_kind() const;
    const std::string& literal() const;

    const std::vector<Field>& fields() const;

    /**
     * @brief Look up a declared object field by exact name
     * @return Pointer to the field, or nullptr if not declared (or not an object)
     */
    const Field* find_field(std::string_view name) const;

    const Schema& value() const;
    const Schema& element() const;
    const std::vector<Schema>& elements() const;
    const std::vector<Schema>& variants() const;
    const Schema& inner() const;

    /// Name of a Reference node
    const std::string& name() const;

    /// Address of the shared node; the same for every copy of a handle
    const void* identity() const noexcept { return node_.get(); }

    /// Structural equality (field order and union order are irrelevant)
    friend bool operator==(const Schema& a, const Schema& b);
    friend bool operator!=(const Schema& a, const Schema& b) { return !(a == b); }

private:
    struct Node;

    explicit Schema(std::shared_ptr<const Node> node) : node_(std::move(node)) {}

    const Node& checked(SchemaKind expected) const;

    std::shared_ptr<const Node> node_;
};

/**
 * @brief One declared property of an Object schema
 */
struct Field {
    std::string name;
    Schema schema;
    bool optional = false;
};

/**
 * @brief Render a schema in a compact TypeScript-like notation
 *
 * Examples:
 * - `{ id: number, tags: Array<string> }`
 * - `Record<string, boolean>`
 * - `[number, string]`
 * - `number | "active"`
 * - `{ child?: @Tree }`
 */
std::string to_string(const Schema& schema);

/**
 * @brief A root schema plus the named definitions its References point to
 *
 * Construction validates the whole graph:
 * - every Reference reachable from the root or a definition must name an
 *   existing definition (DanglingReferenceError otherwise)
 * - definitions may not alias themselves through References, Unions and
 *   Optionals alone (CircularAliasError otherwise)
 *
 * Recursion through an Object, Dictionary, Array or Tuple is allowed:
 * ```cpp
 * SchemaGraph tree(Schema::reference("Tree"), {
 *     {"Tree", Schema::object({
 *         {"name", Schema::string()},
 *         {"child", Schema::reference("Tree"), true},
 *     })},
 * });
 * ```
 */
class SchemaGraph {
public:
    using Definitions = std::map<std::string, Schema>;

    /**
     * @brief Build and validate a graph
     * @throws DanglingReferenceError, CircularAliasError
     */
    explicit SchemaGraph(Schema root, Definitions definitions = {});

    const Schema& root() const noexcept { return root_; }
    const Definitions& definitions() const noexcept { return definitions_; }

    /**
     * @brief Find a definition by name
     * @return Pointer to the definition, or nullptr
     */
    const Schema* find(const std::string& name) const;

    /**
     * @brief Get a definition by name
     * @throws DanglingReferenceError if not defined
     */
    const Schema& lookup(const std::string& name) const;

    /**
     * @brief Follow Reference nodes until a non-reference node is reached
     */
    const Schema& deref(const Schema& schema) const;

    /**
     * @brief Same definitions, different root (validated)
     */
    SchemaGraph with_root(Schema root) const;

private:
    void validate() const;

    Schema root_;
    Definitions definitions_;
};

} // namespace keypath

#endif // KEYPATH_SCHEMA_HPP
