/**
 * @file SchemaIO.hpp
 * @brief Reading and writing schema documents
 *
 * Schemas are authored as JSON (nlohmann::json) or TOML (toml++) documents.
 * A document has a root schema, optional named definitions, and optional
 * enumeration settings:
 *
 * ```json
 * {
 *   "options": { "max_depth": 5 },
 *   "root": { "ref": "Tree" },
 *   "definitions": {
 *     "Tree": {
 *       "kind": "object",
 *       "fields": { "name": "string", "child": { "ref": "Tree" } },
 *       "optional": ["child"]
 *     }
 *   }
 * }
 * ```
 *
 * Schema encoding:
 * - "number", "string", "boolean", "timestamp", "pattern", "callable",
 *   "promise", "null", "never"               → Terminal
 * - { "kind": "terminal", "type": T, "literal": V }
 * - { "kind": "object", "fields": {...}, "optional": [names] }
 * - { "kind": "dictionary", "value": S }
 * - { "kind": "array", "element": S }
 * - { "kind": "tuple", "elements": [S, ...] }
 * - { "kind": "union", "variants": [S, ...] }
 * - { "kind": "optional", "inner": S }
 * - { "ref": "Name" }
 *
 * A document without a "root" key is read as a single schema.
 */

#ifndef KEYPATH_SCHEMA_IO_HPP
#define KEYPATH_SCHEMA_IO_HPP

#include "keypath/Enumerator.hpp"
#include "keypath/Schema.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace keypath {

/**
 * @brief A schema graph together with the settings stored beside it
 */
struct SchemaDocument {
    SchemaGraph graph;
    EnumerateOptions options;
};

/**
 * @brief Decode one schema
 *
 * @param j Encoded schema
 * @param source Name used in error messages
 * @throws SchemaParseError if the encoding is malformed
 */
Schema schema_from_json(const nlohmann::json& j, const std::string& source = "<json>");

/**
 * @brief Encode one schema
 */
nlohmann::json schema_to_json(const Schema& schema);

/**
 * @brief Decode a whole document and build its graph
 *
 * @throws SchemaParseError if the document is malformed
 * @throws DanglingReferenceError, CircularAliasError from graph validation
 */
SchemaDocument document_from_json(const nlohmann::json& doc,
                                  const std::string& source = "<json>");

/**
 * @brief Encode a graph (and settings) as a document
 */
nlohmann::json document_to_json(const SchemaDocument& document);

/**
 * @brief Load a JSON file
 * @throws FileNotFoundError, SchemaParseError
 */
nlohmann::json load_json_file(const std::string& path);

/**
 * @brief Load a TOML file, converted to JSON
 *
 * Dates and times become strings.
 *
 * @throws FileNotFoundError, SchemaParseError
 */
nlohmann::json load_toml_file(const std::string& path);

/**
 * @brief Load a schema document, detecting the format by extension
 *
 * ".json" → JSON, ".toml" → TOML.
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws SchemaParseError on syntax errors, bad schemas or unknown extensions
 * @throws DanglingReferenceError, CircularAliasError from graph validation
 */
SchemaDocument load_schema_file(const std::string& path);

/**
 * @brief Get file extension (lowercase), e.g. ".json", or empty if none
 */
std::string get_file_extension(const std::string& path);

} // namespace keypath

#endif // KEYPATH_SCHEMA_IO_HPP
