#include "../src/dependency_resolver.hpp"

#include <jot-cpp/error.hpp>
#include <jot-cpp/op.hpp>

#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

using namespace jot_cpp;
using namespace jot_cpp::detail;

using Ops = std::map<std::string, Operation>;
using Keys = std::vector<std::string>;

// -- Graph construction -------------------------------------------------------

TEST(DependencyGraph, no_copy_or_paste_means_no_edges) {
    const auto graph = build_dependency_graph(Ops{{"a", Set{1}}, {"b", Set{2}}});
    EXPECT_FALSE(graph.has_edges());
}

TEST(DependencyGraph, paste_depends_on_the_key_holding_the_copy) {
    const auto copy = Copy{};
    const auto graph = build_dependency_graph(Ops{{"from", copy}, {"to", Paste{copy}}});
    ASSERT_TRUE(graph.has_edges());
    ASSERT_TRUE(graph.depends_on.contains("to"));
    EXPECT_EQ(graph.depends_on.at("to"), (std::set<std::string>{"from"}));
    EXPECT_FALSE(graph.depends_on.contains("from"));
}

TEST(DependencyGraph, copy_and_paste_under_one_key_add_no_edge) {
    const auto copy = Copy{};
    const auto graph = build_dependency_graph(Ops{
        {"a", Operation{copy}.then(Paste{copy})},
    });
    EXPECT_FALSE(graph.has_edges());
}

TEST(DependencyGraph, paste_of_an_outside_copy_adds_no_edge) {
    const auto graph = build_dependency_graph(Ops{{"a", Paste{Symbol::make()}}});
    EXPECT_FALSE(graph.has_edges());
}

TEST(DependencyGraph, finds_nested_copies_and_pastes) {
    const auto copy = Copy{};
    const auto graph = build_dependency_graph(Ops{
        {"a", Apply{"inner", copy}},
        {"b", Apply{"deep", Apply{"deeper", Paste{copy}}}},
    });
    ASSERT_TRUE(graph.depends_on.contains("b"));
    EXPECT_TRUE(graph.depends_on.at("b").contains("a"));
}

// -- Flattening ---------------------------------------------------------------

TEST(FlattenDependencies, unconstrained_keys_are_lexicographic) {
    const auto order = flatten_dependencies(Keys{"c", "a", "b"}, DependencyGraph{});
    EXPECT_EQ(order, (Keys{"a", "b", "c"}));
}

TEST(FlattenDependencies, dependencies_come_first) {
    auto graph = DependencyGraph{};
    graph.depends_on["a"] = {"z"};
    const auto order = flatten_dependencies(Keys{"a", "m", "z"}, graph);
    EXPECT_EQ(order, (Keys{"z", "a", "m"}));
}

TEST(FlattenDependencies, chains_are_resolved_transitively) {
    auto graph = DependencyGraph{};
    graph.depends_on["a"] = {"b"};
    graph.depends_on["b"] = {"c"};
    const auto order = flatten_dependencies(Keys{"a", "b", "c"}, graph);
    EXPECT_EQ(order, (Keys{"c", "b", "a"}));
}

TEST(FlattenDependencies, every_key_appears_once) {
    auto graph = DependencyGraph{};
    graph.depends_on["a"] = {"c"};
    graph.depends_on["b"] = {"c"};
    const auto order = flatten_dependencies(Keys{"a", "b", "c", "d"}, graph);
    EXPECT_EQ(order, (Keys{"c", "a", "b", "d"}));
}

TEST(FlattenDependencies, cycle_is_reported_with_its_path) {
    auto graph = DependencyGraph{};
    graph.depends_on["a"] = {"b"};
    graph.depends_on["b"] = {"a"};
    try {
        flatten_dependencies(Keys{"a", "b"}, graph);
        FAIL() << "expected circular_dependency";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::circular_dependency);
        EXPECT_NE(std::string{e.what()}.find(R"("a" -> "b" -> "a")"), std::string::npos);
    }
}

TEST(FlattenDependencies, cycle_not_through_the_first_key_is_reported) {
    auto graph = DependencyGraph{};
    graph.depends_on["a"] = {"b"};
    graph.depends_on["b"] = {"c"};
    graph.depends_on["c"] = {"b"};
    try {
        flatten_dependencies(Keys{"a", "b", "c"}, graph);
        FAIL() << "expected circular_dependency";
    } catch (const Exception& e) {
        EXPECT_NE(std::string{e.what()}.find(R"("b" -> "c" -> "b")"), std::string::npos);
        EXPECT_EQ(std::string{e.what()}.find(R"("a" ->)"), std::string::npos);
    }
}

// -- Through Apply ------------------------------------------------------------

TEST(ResolveEvaluationOrder, mutual_cross_reference_is_a_cycle) {
    const auto first = Copy{};
    const auto second = Copy{};
    const auto ops = Ops{
        {"a", Operation{first}.then(Paste{second})},
        {"b", Operation{second}.then(Paste{first})},
    };
    try {
        auto order = resolve_evaluation_order(ops);
        FAIL() << "expected circular_dependency";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::circular_dependency);
    }
    EXPECT_THROW(Apply{ops}, Exception);
}

TEST(ResolveEvaluationOrder, apply_caches_the_order) {
    const auto copy = Copy{};
    const auto apply = Apply{Ops{{"a", Paste{copy}}, {"b", copy}, {"c", Set{1}}}};
    EXPECT_EQ(apply.order(), (Keys{"b", "a", "c"}));
}
