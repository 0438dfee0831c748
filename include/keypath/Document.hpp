/**
 * @file Document.hpp
 * @brief A data value bound to the schema describing it
 *
 * Document only accepts paths its schema resolves, so a form or editor
 * bound to it cannot write outside the declared shape:
 *
 * ```cpp
 * Document doc(graph, Value::object());
 * doc.set("user.name", "Ada");         // ok
 * doc.set("user.nmae", "Ada");         // throws InvalidPathError
 * doc.get("user.address.city");        // nullptr while absent
 * ```
 */

#ifndef KEYPATH_DOCUMENT_HPP
#define KEYPATH_DOCUMENT_HPP

#include "keypath/Accessor.hpp"
#include "keypath/DepthBudget.hpp"
#include "keypath/Schema.hpp"

#include <set>
#include <string>

namespace keypath {

class Document {
public:
    explicit Document(SchemaGraph schema, Value data = Value::object());

    const SchemaGraph& schema() const noexcept { return schema_; }

    // Access the underlying data
    const Value& data() const noexcept { return data_; }
    Value& data() noexcept { return data_; }

    /**
     * @brief Shape the schema declares at a path
     * @throws InvalidPathError if the schema does not resolve the path
     */
    Schema shape_at(const std::string& path) const;

    /**
     * @brief Value at a path, or nullptr while absent
     * @throws InvalidPathError if the schema does not resolve the path
     * @throws TypeError if the data does not have the declared shape
     */
    const Value* get(const std::string& path) const;

    /**
     * @brief Value at a path
     * @throws KeyError if absent, plus the errors of get()
     */
    const Value& at(const std::string& path) const;

    bool contains(const std::string& path) const;

    /**
     * @brief Write a value, creating missing containers
     * @throws InvalidPathError if the schema does not resolve the path
     * @throws TypeError if an existing intermediate has the wrong kind
     */
    void set(const std::string& path, const Value& value);

    /// Patterns of the schema
    std::set<std::string> paths(int max_depth = kDefaultMaxDepth) const;

private:
    void require_valid(const std::string& path) const;

    SchemaGraph schema_;
    Value data_;
};

} // namespace keypath

#endif // KEYPATH_DOCUMENT_HPP
