/**
 * @file test_cli.cpp
 * @brief Tests for the workflows behind the keypath CLI (GoogleTest)
 *
 * Covers the library calls each command is built on:
 * - paths / check: load a schema file, enumerate, validate patterns
 * - resolve: explain() output for found and missing paths
 * - get / set: schema-checked access to a JSON data file
 *
 * The binary itself is not run here.
 */

#include <gtest/gtest.h>

#include "keypath/Document.hpp"
#include "keypath/Enumerator.hpp"
#include "keypath/Errors.hpp"
#include "keypath/PathGrammar.hpp"
#include "keypath/Resolver.hpp"
#include "keypath/SchemaIO.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace keypath;

// ============================================================================
// Test Utilities
// ============================================================================

namespace {

/**
 * @brief RAII wrapper for temporary files
 */
class TempFile {
public:
    TempFile(const std::string& filename, const std::string& content)
        : path_(fs::temp_directory_path() / filename) {
        std::ofstream f(path_);
        f << content;
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

const char* kAccountSchema = R"({
    "options": { "max_depth": 3 },
    "root": {
        "kind": "object",
        "fields": {
            "user": {
                "kind": "object",
                "fields": {
                    "name": "string",
                    "tags": { "kind": "array", "element": "string" }
                }
            },
            "settings": { "kind": "dictionary", "value": "boolean" }
        }
    }
})";

} // anonymous namespace

// ============================================================================
// paths / check
// ============================================================================

TEST(CliPaths, SchemaFileDepthApplies) {
    TempFile schema("keypath_cli_paths.json", kAccountSchema);
    SchemaDocument doc = load_schema_file(schema.path());

    auto paths = enumerate_paths(doc.graph, doc.options);
    EXPECT_TRUE(paths.count("user.name"));
    EXPECT_TRUE(paths.count("user.tags[*]"));
    EXPECT_TRUE(paths.count("settings.*"));

    // --max-depth overrides the document
    EXPECT_EQ(enumerate_paths(doc.graph, 1),
              (std::set<std::string>{"user", "settings"}));
}

TEST(CliCheck, EveryPatternResolves) {
    TempFile schema("keypath_cli_check.json", kAccountSchema);
    SchemaDocument doc = load_schema_file(schema.path());

    for (const auto& pattern : enumerate_paths(doc.graph, doc.options)) {
        EXPECT_TRUE(is_valid_path(doc.graph, pattern)) << pattern;
        EXPECT_TRUE(is_valid_path(doc.graph, instantiate_pattern(pattern, 0, "key"))) << pattern;
    }
}

// ============================================================================
// resolve
// ============================================================================

TEST(CliResolve, ExplainFoundPath) {
    TempFile schema("keypath_cli_resolve.json", kAccountSchema);
    SchemaDocument doc = load_schema_file(schema.path());

    Resolution r = explain(doc.graph, "user.tags[0]");
    ASSERT_TRUE(r.resolved());
    EXPECT_EQ(to_string(*r.shape), "string");
    ASSERT_FALSE(r.trace.empty());
    EXPECT_EQ(r.trace.front().rule, Rule::NestedExplicitKey);
    EXPECT_EQ(r.trace.front().remaining, "user.tags[0]");
}

TEST(CliResolve, ExplainMissingPath) {
    TempFile schema("keypath_cli_missing.json", kAccountSchema);
    SchemaDocument doc = load_schema_file(schema.path());

    Resolution r = explain(doc.graph, "user.email");
    EXPECT_FALSE(r.resolved());
    EXPECT_FALSE(r.trace.empty());

    Resolution malformed = explain(doc.graph, "user..name");
    EXPECT_FALSE(malformed.resolved());
    ASSERT_EQ(malformed.trace.size(), 1u);
    EXPECT_EQ(malformed.trace.front().rule, Rule::Unresolvable);
}

// ============================================================================
// get / set
// ============================================================================

TEST(CliGetSet, ReadWriteDataFile) {
    TempFile schema("keypath_cli_data_schema.json", kAccountSchema);
    TempFile data("keypath_cli_data.json", R"({"user": {"name": "Ada", "tags": ["a"]}})");

    SchemaDocument sdoc = load_schema_file(schema.path());
    Document doc(sdoc.graph, load_json_file(data.path()));

    EXPECT_EQ(doc.at("user.name"), "Ada");
    EXPECT_EQ(doc.at("user.tags[0]"), "a");

    doc.set("settings.beta", true);
    doc.set("user.tags[1]", "b");
    {
        std::ofstream out(data.path());
        out << doc.data().dump(2) << "\n";
    }

    Document reloaded(sdoc.graph, load_json_file(data.path()));
    EXPECT_EQ(reloaded.at("settings.beta"), true);
    EXPECT_EQ(reloaded.at("user.tags[1]"), "b");
}

TEST(CliGetSet, UndeclaredPathRejected) {
    TempFile schema("keypath_cli_reject.json", kAccountSchema);
    SchemaDocument sdoc = load_schema_file(schema.path());
    Document doc(sdoc.graph);

    EXPECT_THROW(doc.set("user.age", 3), InvalidPathError);
    EXPECT_THROW(doc.at("user.name"), KeyError);
}
