/**
 * @file SchemaIO.cpp
 * @brief Schema document encoding and file loading
 *
 * JSON is parsed with nlohmann::json, TOML with toml++ and then converted
 * to the same JSON tree, so both formats share one schema decoder.
 */

#include "keypath/SchemaIO.hpp"
#include "keypath/Errors.hpp"

#include <toml++/toml.hpp>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace keypath {

using nlohmann::json;

// ============================================================================
// Utility functions
// ============================================================================

namespace {

void require_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw FileNotFoundError(path);
    }
}

/**
 * @brief Converts a parsed TOML schema document to the JSON tree the
 *        decoder reads
 *
 * Schema documents only hold strings, numbers, booleans, arrays and
 * tables. Dates and times have no meaning in them and are rejected with
 * their location.
 */
class TomlToJson {
public:
    explicit TomlToJson(const std::string& file) : file_(file) {}

    json convert(const toml::node& node, const std::string& where) const {
        if (const auto* table = node.as_table()) {
            json obj = json::object();
            for (const auto& [key, value] : *table) {
                std::string name(key.str());
                obj[name] = convert(value, where + "/" + name);
            }
            return obj;
        }
        if (const auto* array = node.as_array()) {
            json arr = json::array();
            for (size_t i = 0; i < array->size(); ++i) {
                arr.push_back(convert(*array->get(i), where + "/" + std::to_string(i)));
            }
            return arr;
        }
        if (const auto* text = node.as_string()) return json(text->get());
        if (const auto* integer = node.as_integer()) return json(integer->get());
        if (const auto* number = node.as_floating_point()) return json(number->get());
        if (const auto* flag = node.as_boolean()) return json(flag->get());

        throw SchemaParseError(file_, (where.empty() ? "/" : where) +
                                      ": dates and times are not schema values");
    }

private:
    const std::string& file_;
};

// ============================================================================
// Schema decoding
// ============================================================================

const std::pair<const char*, TerminalKind> kTerminalNames[] = {
    {"number", TerminalKind::Number},
    {"string", TerminalKind::String},
    {"boolean", TerminalKind::Boolean},
    {"timestamp", TerminalKind::Timestamp},
    {"pattern", TerminalKind::Pattern},
    {"callable", TerminalKind::Callable},
    {"promise", TerminalKind::Promise},
    {"null", TerminalKind::Null},
    {"never", TerminalKind::Never},
};

/**
 * @brief Recursive decoder that tracks where in the document it is
 *
 * Locations are JSON-pointer-like ("/root/fields/items/element") so
 * errors point at the offending node.
 */
class SchemaDecoder {
public:
    explicit SchemaDecoder(std::string source) : source_(std::move(source)) {}

    Schema decode(const json& j, const std::string& where) {
        if (j.is_string()) {
            return Schema::terminal(terminal_kind(j.get<std::string>(), where));
        }
        if (!j.is_object()) {
            fail(where, "expected a type name or an object, got " + std::string(j.type_name()));
        }

        if (j.contains("ref")) {
            return Schema::reference(string_member(j, "ref", where));
        }

        const std::string kind = string_member(j, "kind", where);

        if (kind == "terminal") {
            TerminalKind tk = terminal_kind(string_member(j, "type", where), where + "/type");
            std::string literal;
            if (j.contains("literal")) {
                const auto& lit = j.at("literal");
                literal = lit.is_string() ? lit.get<std::string>() : lit.dump();
            }
            return Schema::terminal(tk, std::move(literal));
        }

        if (kind == "object") {
            return decode_object(j, where);
        }

        if (kind == "dictionary") {
            return Schema::dictionary(decode(member(j, "value", where), where + "/value"));
        }

        if (kind == "array") {
            return Schema::array(decode(member(j, "element", where), where + "/element"));
        }

        if (kind == "tuple") {
            return Schema::tuple(decode_list(j, "elements", where));
        }

        if (kind == "union") {
            return Schema::union_of(decode_list(j, "variants", where));
        }

        if (kind == "optional") {
            return Schema::optional(decode(member(j, "inner", where), where + "/inner"));
        }

        if (kind == "reference") {
            return Schema::reference(string_member(j, "name", where));
        }

        fail(where + "/kind", "unknown schema kind '" + kind + "'");
    }

    [[noreturn]] void fail(const std::string& where, const std::string& what) const {
        throw SchemaParseError(source_, (where.empty() ? std::string("/") : where) + ": " + what);
    }

private:
    Schema decode_object(const json& j, const std::string& where) {
        std::set<std::string> optional_names;
        if (j.contains("optional")) {
            const auto& names = j.at("optional");
            if (!names.is_array()) {
                fail(where + "/optional", "expected an array of field names");
            }
            for (const auto& name : names) {
                if (!name.is_string()) {
                    fail(where + "/optional", "expected an array of field names");
                }
                optional_names.insert(name.get<std::string>());
            }
        }

        std::vector<Field> fields;
        if (j.contains("fields")) {
            const auto& members = j.at("fields");
            if (!members.is_object()) {
                fail(where + "/fields", "expected an object");
            }
            for (auto it = members.begin(); it != members.end(); ++it) {
                bool optional = optional_names.erase(it.key()) > 0;
                fields.push_back({it.key(), decode(it.value(), where + "/fields/" + it.key()), optional});
            }
        }

        if (!optional_names.empty()) {
            fail(where + "/optional", "'" + *optional_names.begin() + "' is not a declared field");
        }
        return Schema::object(std::move(fields));
    }

    std::vector<Schema> decode_list(const json& j, const char* key, const std::string& where) {
        const auto& items = member(j, key, where);
        const std::string here = where + "/" + key;
        if (!items.is_array()) {
            fail(here, "expected an array");
        }
        std::vector<Schema> out;
        for (size_t i = 0; i < items.size(); ++i) {
            out.push_back(decode(items[i], here + "/" + std::to_string(i)));
        }
        return out;
    }

    const json& member(const json& j, const char* key, const std::string& where) const {
        auto it = j.find(key);
        if (it == j.end()) {
            fail(where, std::string("missing '") + key + "'");
        }
        return *it;
    }

    std::string string_member(const json& j, const char* key, const std::string& where) const {
        const auto& value = member(j, key, where);
        if (!value.is_string()) {
            fail(where + "/" + key, "expected a string");
        }
        return value.get<std::string>();
    }

    TerminalKind terminal_kind(const std::string& name, const std::string& where) const {
        for (const auto& [text, kind] : kTerminalNames) {
            if (name == text) {
                return kind;
            }
        }
        fail(where, "unknown terminal type '" + name + "'");
    }

    std::string source_;
};

} // anonymous namespace

// ============================================================================
// Schema encoding
// ============================================================================

Schema schema_from_json(const json& j, const std::string& source) {
    SchemaDecoder decoder(source);
    return decoder.decode(j, "");
}

json schema_to_json(const Schema& schema) {
    switch (schema.kind()) {
        case SchemaKind::Terminal:
            if (schema.literal().empty()) {
                return terminal_kind_name(schema.terminal_kind());
            }
            return {{"kind", "terminal"},
                    {"type", terminal_kind_name(schema.terminal_kind())},
                    {"literal", schema.literal()}};

        case SchemaKind::Object: {
            json fields = json::object();
            json optional = json::array();
            for (const auto& field : schema.fields()) {
                fields[field.name] = schema_to_json(field.schema);
                if (field.optional) {
                    optional.push_back(field.name);
                }
            }
            json out = {{"kind", "object"}, {"fields", fields}};
            if (!optional.empty()) {
                out["optional"] = optional;
            }
            return out;
        }

        case SchemaKind::Dictionary:
            return {{"kind", "dictionary"}, {"value", schema_to_json(schema.value())}};

        case SchemaKind::Array:
            return {{"kind", "array"}, {"element", schema_to_json(schema.element())}};

        case SchemaKind::Tuple: {
            json elements = json::array();
            for (const auto& element : schema.elements()) {
                elements.push_back(schema_to_json(element));
            }
            return {{"kind", "tuple"}, {"elements", elements}};
        }

        case SchemaKind::Union: {
            json variants = json::array();
            for (const auto& variant : schema.variants()) {
                variants.push_back(schema_to_json(variant));
            }
            return {{"kind", "union"}, {"variants", variants}};
        }

        case SchemaKind::Optional:
            return {{"kind", "optional"}, {"inner", schema_to_json(schema.inner())}};

        case SchemaKind::Reference:
            return {{"ref", schema.name()}};
    }
    return nullptr;
}

SchemaDocument document_from_json(const json& doc, const std::string& source) {
    SchemaDecoder decoder(source);

    if (!doc.is_object() || !doc.contains("root")) {
        return SchemaDocument{SchemaGraph(decoder.decode(doc, "")), EnumerateOptions{}};
    }

    Schema root = decoder.decode(doc.at("root"), "/root");

    SchemaGraph::Definitions definitions;
    if (doc.contains("definitions")) {
        const auto& defs = doc.at("definitions");
        if (!defs.is_object()) {
            decoder.fail("/definitions", "expected an object");
        }
        for (auto it = defs.begin(); it != defs.end(); ++it) {
            definitions.emplace(it.key(), decoder.decode(it.value(), "/definitions/" + it.key()));
        }
    }

    EnumerateOptions options;
    if (doc.contains("options")) {
        const auto& opts = doc.at("options");
        if (!opts.is_object()) {
            decoder.fail("/options", "expected an object");
        }
        if (opts.contains("max_depth")) {
            const auto& depth = opts.at("max_depth");
            if (!depth.is_number_integer() || depth.get<long long>() < 0) {
                decoder.fail("/options/max_depth", "expected a non-negative integer");
            }
            options.max_depth = depth.get<int>();
        }
    }

    return SchemaDocument{SchemaGraph(std::move(root), std::move(definitions)), options};
}

json document_to_json(const SchemaDocument& document) {
    json definitions = json::object();
    for (const auto& [name, schema] : document.graph.definitions()) {
        definitions[name] = schema_to_json(schema);
    }
    return {
        {"options", {{"max_depth", document.options.max_depth}}},
        {"root", schema_to_json(document.graph.root())},
        {"definitions", definitions},
    };
}

// ============================================================================
// File loading
// ============================================================================

json load_json_file(const std::string& path) {
    require_file(path);

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw FileNotFoundError(path);
    }
    try {
        return json::parse(in);
    } catch (const json::parse_error& e) {
        throw SchemaParseError(path, e.what());
    }
}

json load_toml_file(const std::string& path) {
    require_file(path);

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        std::ostringstream details;
        details << "line " << e.source().begin.line
                << ", column " << e.source().begin.column
                << ": " << e.description();
        throw SchemaParseError(path, details.str());
    }

    return TomlToJson(path).convert(table, "");
}

std::string get_file_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    for (char& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return ext;
}

SchemaDocument load_schema_file(const std::string& path) {
    require_file(path);

    std::string ext = get_file_extension(path);

    if (ext == ".json") {
        return document_from_json(load_json_file(path), path);
    } else if (ext == ".toml") {
        return document_from_json(load_toml_file(path), path);
    }
    throw SchemaParseError(path, "unsupported file type '" + ext + "' (expected .json or .toml)");
}

} // namespace keypath
