/**
 * @file Document.cpp
 * @brief Implementation of schema-bound documents
 */

#include "keypath/Document.hpp"
#include "keypath/Enumerator.hpp"
#include "keypath/Errors.hpp"
#include "keypath/Resolver.hpp"

namespace keypath {

Document::Document(SchemaGraph schema, Value data)
    : schema_(std::move(schema))
    , data_(std::move(data))
{}

void Document::require_valid(const std::string& path) const {
    if (!is_valid_path(schema_, path)) {
        throw InvalidPathError(path, "not declared by the schema");
    }
}

Schema Document::shape_at(const std::string& path) const {
    auto shape = resolve(schema_, path);
    if (!shape) {
        throw InvalidPathError(path, "not declared by the schema");
    }
    return *shape;
}

const Value* Document::get(const std::string& path) const {
    require_valid(path);
    return find_at(data_, path);
}

const Value& Document::at(const std::string& path) const {
    require_valid(path);
    return get_at(data_, path);
}

bool Document::contains(const std::string& path) const {
    return get(path) != nullptr;
}

void Document::set(const std::string& path, const Value& value) {
    require_valid(path);
    set_at(data_, path, value);
}

std::set<std::string> Document::paths(int max_depth) const {
    return enumerate_paths(schema_, max_depth);
}

} // namespace keypath
