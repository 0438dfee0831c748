/**
 * @file test_resolver.cpp
 * @brief Unit tests for path resolution (GoogleTest)
 *
 * Tests cover each interpretation rule in precedence order, union
 * distribution, self-referential schemas, malformed paths and the
 * explain() trace.
 */

#include <gtest/gtest.h>
#include "keypath/Resolver.hpp"
#include "keypath/Errors.hpp"
#include "keypath/PathGrammar.hpp"

#include <string>

using namespace keypath;

// ============================================================================
// Fixture
// ============================================================================

class ResolverTest : public ::testing::Test {
protected:
    SchemaGraph graph{Schema::object({
        {"name", Schema::string()},
        {"items", Schema::array(Schema::object({
            {"id", Schema::number()},
            {"tags", Schema::array(Schema::string())},
        }))},
        {"opt", Schema::object({{"prop", Schema::string()}}), true},
        {"wrapped", Schema::optional(Schema::object({{"value", Schema::number()}}))},
        {"scores", Schema::dictionary(Schema::number())},
        {"users", Schema::dictionary(Schema::object({{"email", Schema::string()}}))},
        {"lists", Schema::dictionary(Schema::array(Schema::number()))},
        {"pair", Schema::tuple({
            Schema::number(),
            Schema::object({{"x", Schema::string()}}),
        })},
    })};

    std::optional<Schema> at(const std::string& path) const {
        return resolve(graph, path);
    }
};

// ============================================================================
// Explicit keys and nesting
// ============================================================================

TEST_F(ResolverTest, ExplicitKey) {
    EXPECT_EQ(at("name"), Schema::string());
}

TEST_F(ResolverTest, OptionalFieldResolvesToPresentShape) {
    EXPECT_EQ(at("opt"), Schema::object({{"prop", Schema::string()}}));
    EXPECT_EQ(at("wrapped"), Schema::object({{"value", Schema::number()}}));
}

TEST_F(ResolverTest, NestedThroughOptional) {
    EXPECT_EQ(at("opt.prop"), Schema::string());
    EXPECT_EQ(at("wrapped.value"), Schema::number());
}

TEST_F(ResolverTest, NothingBelowTerminal) {
    EXPECT_FALSE(at("name.length").has_value());
    EXPECT_FALSE(at("name[0]").has_value());
}

TEST_F(ResolverTest, UnknownField) {
    EXPECT_FALSE(at("missing").has_value());
    EXPECT_FALSE(at("opt.missing").has_value());
}

// ============================================================================
// Indexing
// ============================================================================

TEST_F(ResolverTest, ArrayIndexChain) {
    EXPECT_EQ(at("items"), Schema::array(Schema::object({
        {"id", Schema::number()},
        {"tags", Schema::array(Schema::string())},
    })));
    EXPECT_EQ(at("items[0].id"), Schema::number());
    EXPECT_EQ(at("items[0].tags[1]"), Schema::string());
    EXPECT_EQ(at("items[*].tags[*]"), Schema::string());
}

TEST_F(ResolverTest, DottedFieldOnArrayIsUnresolvable) {
    EXPECT_FALSE(at("items.tags").has_value());
    EXPECT_FALSE(at("items.id").has_value());
}

TEST_F(ResolverTest, IndexOnObjectIsUnresolvable) {
    EXPECT_FALSE(at("[0]").has_value());
    EXPECT_FALSE(at("opt[0]").has_value());
}

TEST_F(ResolverTest, TupleSlots) {
    EXPECT_EQ(at("pair[0]"), Schema::number());
    EXPECT_EQ(at("pair[1].x"), Schema::string());
    EXPECT_FALSE(at("pair[2]").has_value());
}

TEST_F(ResolverTest, TupleWildcardIsUnionOfSlots) {
    EXPECT_EQ(at("pair[*]"), Schema::union_of({
        Schema::number(),
        Schema::object({{"x", Schema::string()}}),
    }));
}

TEST_F(ResolverTest, TupleSlotsAsDottedKeys) {
    EXPECT_EQ(at("pair.0"), Schema::number());
    EXPECT_EQ(at("pair.1.x"), Schema::string());
}

TEST_F(ResolverTest, TupleSlotsRejectLeadingZeros) {
    EXPECT_FALSE(at("pair[01]").has_value());
    EXPECT_FALSE(at("pair.01").has_value());
    EXPECT_FALSE(at("pair.00").has_value());
}

TEST(ResolverRootArrays, IndexAtRoot) {
    Schema s = Schema::array(Schema::object({{"id", Schema::number()}}));
    EXPECT_EQ(resolve(s, "[0].id"), Schema::number());
    EXPECT_EQ(resolve(s, "[3]"), Schema::object({{"id", Schema::number()}}));
    EXPECT_FALSE(resolve(s, "[0][0]").has_value());
    EXPECT_FALSE(resolve(s, "id").has_value());
}

TEST(ResolverRootArrays, ConsecutiveBrackets) {
    Schema s = Schema::array(Schema::array(Schema::number()));
    EXPECT_EQ(resolve(s, "[1][2]"), Schema::number());
    EXPECT_EQ(resolve(s, "[1]"), Schema::array(Schema::number()));
}

// ============================================================================
// Dictionaries
// ============================================================================

TEST_F(ResolverTest, DictionaryKey) {
    EXPECT_EQ(at("scores.alice"), Schema::number());
    EXPECT_EQ(at("scores.*"), Schema::number());
}

TEST_F(ResolverTest, DictionaryKeyWithPath) {
    EXPECT_EQ(at("users.bob"), Schema::object({{"email", Schema::string()}}));
    EXPECT_EQ(at("users.bob.email"), Schema::string());
    EXPECT_EQ(at("users.*.email"), Schema::string());
    EXPECT_FALSE(at("users.bob.phone").has_value());
}

TEST_F(ResolverTest, DictionaryKeyWithIndex) {
    EXPECT_EQ(at("lists.primes[0]"), Schema::number());
    EXPECT_EQ(at("lists.*[*]"), Schema::number());
}

TEST(ResolverDictionaries, RootDictionary) {
    Schema s = Schema::dictionary(Schema::boolean());
    EXPECT_EQ(resolve(s, "dark_mode"), Schema::boolean());
    EXPECT_FALSE(resolve(s, "dark_mode.x").has_value());
}

// ============================================================================
// Precedence of literal dotted keys
// ============================================================================

TEST(ResolverPrecedence, ExplicitKeyBeatsNestedPath) {
    Schema s = Schema::object({
        {"a.b", Schema::object({{"c", Schema::number()}})},
        {"a", Schema::object({{"b", Schema::object({{"c", Schema::string()}})}})},
    });
    EXPECT_EQ(resolve(s, "a.b"), Schema::object({{"c", Schema::number()}}));
    EXPECT_EQ(resolve(s, "a.b.c"), Schema::number());
    EXPECT_EQ(resolve(s, "a"), Schema::object({{"b", Schema::object({{"c", Schema::string()}})}}));
}

TEST(ResolverPrecedence, FallsBackToShorterKey) {
    Schema s = Schema::object({
        {"a.b", Schema::object({{"x", Schema::number()}})},
        {"a", Schema::object({{"b", Schema::object({{"c", Schema::string()}})}})},
    });
    EXPECT_EQ(resolve(s, "a.b.x"), Schema::number());
    EXPECT_EQ(resolve(s, "a.b.c"), Schema::string());
}

TEST(ResolverPrecedence, DottedKeyWithIndex) {
    Schema s = Schema::object({{"x.y", Schema::array(Schema::boolean())}});
    EXPECT_EQ(resolve(s, "x.y[4]"), Schema::boolean());
}

TEST(ResolverPrecedence, FailedRulePassesToNextRule) {
    // "x" claims "x.y[0]" as a nested path first, which leads nowhere
    Schema s = Schema::object({
        {"x.y", Schema::array(Schema::boolean())},
        {"x", Schema::object({{"z", Schema::number()}})},
    });
    EXPECT_EQ(resolve(s, "x.y[0]"), Schema::boolean());
    EXPECT_EQ(resolve(s, "x.z"), Schema::number());

    Resolution r = explain(SchemaGraph(s), "x.y[0]");
    ASSERT_TRUE(r.resolved());
    EXPECT_EQ(r.trace.front().rule, Rule::NestedExplicitKey);
    bool indexed = false;
    for (const auto& step : r.trace) {
        if (step.rule == Rule::Index && step.remaining == "x.y[0]") indexed = true;
    }
    EXPECT_TRUE(indexed);
}

// ============================================================================
// Unions
// ============================================================================

TEST(ResolverUnions, DistributesOverVariants) {
    Schema a = Schema::terminal(TerminalKind::String, "a");
    Schema b = Schema::terminal(TerminalKind::String, "b");
    Schema s = Schema::union_of({
        Schema::object({{"kind", a}, {"a", Schema::number()}}),
        Schema::object({{"kind", b}, {"b", Schema::string()}}),
    });

    EXPECT_EQ(resolve(s, "a"), Schema::number());
    EXPECT_EQ(resolve(s, "b"), Schema::string());
    EXPECT_EQ(resolve(s, "kind"), Schema::union_of({a, b}));
    EXPECT_FALSE(resolve(s, "c").has_value());
}

TEST(ResolverUnions, SharedFieldWithDifferentShapes) {
    Schema s = Schema::union_of({
        Schema::object({{"v", Schema::number()}}),
        Schema::object({{"v", Schema::string()}}),
    });
    EXPECT_EQ(resolve(s, "v"), Schema::union_of({Schema::number(), Schema::string()}));
}

TEST(ResolverUnions, ComplexUnionField) {
    Schema s = Schema::object({
        {"data", Schema::union_of({
            Schema::array(Schema::object({{"id", Schema::number()}})),
            Schema::object({{"items", Schema::array(Schema::string())}}),
            Schema::string(),
        })},
    });
    EXPECT_EQ(resolve(s, "data[0].id"), Schema::number());
    EXPECT_EQ(resolve(s, "data.items[0]"), Schema::string());
    EXPECT_EQ(resolve(s, "data.items"), Schema::array(Schema::string()));
    EXPECT_FALSE(resolve(s, "data.other").has_value());
}

// ============================================================================
// References
// ============================================================================

TEST(ResolverReferences, DeepPathBeyondEnumerationDepth) {
    SchemaGraph graph(Schema::reference("Node"), {
        {"Node", Schema::object({
            {"name", Schema::string()},
            {"child", Schema::reference("Node"), true},
        })},
    });

    EXPECT_EQ(resolve(graph, "child.child.child.child.child.child.child.name"), Schema::string());
    EXPECT_EQ(resolve(graph, "child"), graph.lookup("Node"));
    EXPECT_FALSE(resolve(graph, "child.age").has_value());
}

TEST(ResolverReferences, ChildrenArray) {
    SchemaGraph graph(Schema::reference("Tree"), {
        {"Tree", Schema::object({
            {"name", Schema::string()},
            {"children", Schema::array(Schema::reference("Tree")), true},
        })},
    });
    EXPECT_EQ(resolve(graph, "children[0].children[1].name"), Schema::string());
    EXPECT_EQ(resolve(graph, "children[2]"), graph.lookup("Tree"));
}

TEST(ResolverReferences, AliasedRoot) {
    SchemaGraph graph(Schema::reference("Alias"), {
        {"Alias", Schema::reference("Point")},
        {"Point", Schema::object({{"x", Schema::number()}, {"y", Schema::number()}})},
    });
    EXPECT_EQ(resolve(graph, "x"), Schema::number());
    EXPECT_TRUE(is_valid_path(graph, "y"));
    EXPECT_FALSE(is_valid_path(graph, "z"));
}

TEST(ResolverReferences, SchemaOverloadRejectsReferences) {
    EXPECT_THROW(resolve(Schema::reference("Node"), "name"), DanglingReferenceError);
}

// ============================================================================
// Long paths
// ============================================================================

TEST(ResolverLongPaths, IndexChainUpToLimit) {
    SchemaGraph graph(Schema::reference("T"), {
        {"T", Schema::array(Schema::reference("T"))},
    });

    std::string path;
    for (size_t i = 0; i < kMaxPathSegments; ++i) {
        path += "[0]";
    }
    EXPECT_EQ(resolve(graph, path), graph.lookup("T"));

    path += "[0]";
    EXPECT_FALSE(resolve(graph, path).has_value());
}

TEST(ResolverLongPaths, VeryLongPathIsUnresolvable) {
    SchemaGraph graph(Schema::reference("T"), {
        {"T", Schema::array(Schema::reference("T"))},
    });

    std::string path;
    for (int i = 0; i < 100000; ++i) {
        path += "[0]";
    }
    EXPECT_FALSE(is_valid_path(graph, path));

    Resolution r = explain(graph, path);
    EXPECT_FALSE(r.resolved());
    ASSERT_EQ(r.trace.size(), 1u);
    EXPECT_EQ(r.trace[0].rule, Rule::Unresolvable);
}

TEST(ResolverLongPaths, OptionalChildChain) {
    SchemaGraph graph(Schema::reference("Node"), {
        {"Node", Schema::object({
            {"name", Schema::string()},
            {"child", Schema::reference("Node"), true},
        })},
    });

    std::string path;
    for (size_t i = 1; i < kMaxPathSegments; ++i) {
        path += "child.";
    }
    EXPECT_EQ(resolve(graph, path + "name"), Schema::string());
    EXPECT_FALSE(resolve(graph, path + "age").has_value());
}

TEST(ResolverLongPaths, OverlappingDottedKeys) {
    // Every run of "a.a" can be read two ways
    SchemaGraph graph(Schema::reference("N"), {
        {"N", Schema::object({
            {"a", Schema::reference("N")},
            {"a.a", Schema::reference("N")},
            {"end", Schema::number()},
        })},
    });

    std::string path = "a";
    for (int i = 0; i < 200; ++i) {
        path += ".a";
    }
    EXPECT_EQ(resolve(graph, path + ".end"), Schema::number());
    EXPECT_FALSE(resolve(graph, path + ".missing").has_value());
}

// ============================================================================
// Malformed paths
// ============================================================================

TEST_F(ResolverTest, MalformedPathsAreUnresolvable) {
    const char* malformed[] = {"", "items[", "items[x]", "items[0]id", "a..b", "name.", ".name"};
    for (const char* path : malformed) {
        EXPECT_FALSE(at(path).has_value()) << path;
    }
}

// ============================================================================
// explain()
// ============================================================================

TEST_F(ResolverTest, ExplainRecordsRuleOrder) {
    Resolution r = explain(graph, "opt.prop");
    ASSERT_TRUE(r.resolved());
    EXPECT_EQ(*r.shape, Schema::string());

    ASSERT_EQ(r.trace.size(), 2u);
    EXPECT_EQ(r.trace[0].rule, Rule::OptionalChain);
    EXPECT_EQ(r.trace[0].remaining, "opt.prop");
    EXPECT_EQ(r.trace[1].rule, Rule::ExplicitKey);
    EXPECT_EQ(r.trace[1].remaining, "prop");
}

TEST_F(ResolverTest, ExplainIndexAndDictionaryRules) {
    Resolution r = explain(graph, "items[0].id");
    ASSERT_TRUE(r.resolved());
    ASSERT_EQ(r.trace.size(), 3u);
    EXPECT_EQ(r.trace[0].rule, Rule::Index);
    EXPECT_EQ(r.trace[1].rule, Rule::Index);
    EXPECT_EQ(r.trace[1].remaining, "[0].id");
    EXPECT_EQ(r.trace[2].rule, Rule::ExplicitKey);

    Resolution d = explain(graph, "users.bob.email");
    ASSERT_EQ(d.trace.size(), 3u);
    EXPECT_EQ(d.trace[0].rule, Rule::NestedExplicitKey);
    EXPECT_EQ(d.trace[1].rule, Rule::DictionaryPath);
    EXPECT_EQ(d.trace[2].rule, Rule::ExplicitKey);

    Resolution k = explain(graph, "scores.alice");
    ASSERT_EQ(k.trace.size(), 2u);
    EXPECT_EQ(k.trace[1].rule, Rule::DictionaryKey);
}

TEST_F(ResolverTest, ExplainUnresolvable) {
    Resolution r = explain(graph, "missing");
    EXPECT_FALSE(r.resolved());
    ASSERT_EQ(r.trace.size(), 1u);
    EXPECT_EQ(r.trace[0].rule, Rule::Unresolvable);

    Resolution m = explain(graph, "a..b");
    EXPECT_FALSE(m.resolved());
    ASSERT_EQ(m.trace.size(), 1u);
    EXPECT_EQ(m.trace[0].rule, Rule::Unresolvable);
}

TEST(ResolverRules, NamesInOrder) {
    ASSERT_EQ(kRuleOrder.size(), 7u);
    EXPECT_EQ(kRuleOrder.front(), Rule::ExplicitKey);
    EXPECT_EQ(kRuleOrder.back(), Rule::Unresolvable);
    EXPECT_STREQ(rule_name(Rule::NestedExplicitKey), "nested-explicit-key");
    EXPECT_STREQ(rule_name(Rule::OptionalChain), "optional-chain");
}
