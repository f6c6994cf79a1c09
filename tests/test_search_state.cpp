#include <gtest/gtest.h>
#include <rewrite_search/search_state.hpp>
#include "test_helpers.hpp"

using namespace rewrite_search;
using namespace test_utils;

namespace {

LazyProof::Thunk proof_of(const std::string& lhs, const std::string& rhs) {
    return [lhs, rhs]() -> Proof { return EqualityProof{lhs, rhs, {"r"}}; };
}

} // anonymous namespace

class SearchStateTest : public ::testing::Test {
protected:
    SearchState state{SearchConfig{}};

    void SetUp() override {
        state.initialize(expr("a + b"), expr("b + a"));
    }
};

TEST_F(SearchStateTest, RootsAreReserved) {
    ASSERT_TRUE(state.is_initialized());
    const Vertex& left = state.vertices().get(LHS_VERTEX);
    const Vertex& right = state.vertices().get(RHS_VERTEX);

    EXPECT_TRUE(left.is_root);
    EXPECT_TRUE(right.is_root);
    EXPECT_EQ(left.side, Side::LEFT);
    EXPECT_EQ(right.side, Side::RIGHT);
    EXPECT_EQ(left.pretty(), "a + b");
    EXPECT_EQ(left.tokens.size(), 3);
    EXPECT_EQ(state.tokens().size(), 3);
    EXPECT_EQ(state.strategy().frontier_size(), 2);
}

TEST_F(SearchStateTest, InitializeTwiceThrows) {
    EXPECT_THROW(state.initialize(expr("x"), expr("y")), InvariantViolation);
}

TEST(SearchStateInit, EqualKeysThrow) {
    SearchState state{SearchConfig{}};
    EXPECT_THROW(state.initialize(expr("x"), expr("x")), InvariantViolation);
    EXPECT_FALSE(state.is_initialized());
}

TEST(SearchStateInit, InvalidConfigThrows) {
    SearchConfig config;
    config.timeout = std::chrono::milliseconds(-5);
    EXPECT_THROW(SearchState{config}, std::invalid_argument);
}

TEST_F(SearchStateTest, AddChildLinksParent) {
    const Vertex& child = state.add_child(LHS_VERTEX, expr("b + a + 0"), RuleDescriptor("r", 2), proof_of("a + b", "b + a + 0"));

    EXPECT_EQ(child.id, 2);
    EXPECT_EQ(child.side, Side::LEFT);
    EXPECT_EQ(child.depth, 1);
    EXPECT_FALSE(child.is_root);
    ASSERT_TRUE(child.parent_edge.has_value());

    const Edge& edge = state.edges().get(*child.parent_edge);
    EXPECT_EQ(edge.from, LHS_VERTEX);
    EXPECT_EQ(edge.to, child.id);
    EXPECT_EQ(edge.rule.rule_index, 2);

    const Vertex& parent = state.vertices().get(LHS_VERTEX);
    EXPECT_EQ(parent.adjacency, std::vector<EdgeId>{edge.id});
    ASSERT_EQ(parent.outgoing_rules.size(), 1);
    EXPECT_EQ(parent.outgoing_rules[0].name, "r");
    EXPECT_EQ(child.adjacency, std::vector<EdgeId>{edge.id});

    EXPECT_EQ(state.find_vertex(expr("b + a + 0")), std::optional<VertexId>(child.id));
    EXPECT_EQ(state.stats().vertices_left, 2);
    EXPECT_EQ(state.stats().max_depth_reached, 1);
    EXPECT_EQ(state.strategy().frontier_size(), 3);
}

TEST_F(SearchStateTest, ConnectDoesNotCreateVertices) {
    const Edge& edge = state.connect(LHS_VERTEX, RHS_VERTEX, RuleDescriptor("comm", 0), proof_of("a + b", "b + a"));
    state.mark_meeting(edge.id);

    EXPECT_EQ(state.vertices().size(), 2);
    EXPECT_EQ(state.edges().size(), 1);
    EXPECT_EQ(state.meeting_edge(), std::optional<EdgeId>(edge.id));
    EXPECT_FALSE(state.vertices().get(RHS_VERTEX).parent_edge.has_value());
}

TEST_F(SearchStateTest, FindVertexMissing) {
    EXPECT_FALSE(state.find_vertex(expr("c")).has_value());
    EXPECT_EQ(state.find_vertex(expr("b + a")), std::optional<VertexId>(RHS_VERTEX));
}

TEST_F(SearchStateTest, SummaryListsGraph) {
    const Vertex& child = state.add_child(RHS_VERTEX, expr("a + b + 0"), RuleDescriptor("add_zero", 1, 0, true),
                                          proof_of("b + a", "a + b + 0"));
    std::string summary = state.get_summary();

    EXPECT_NE(summary.find("=== REWRITE SEARCH SUMMARY ==="), std::string::npos);
    EXPECT_NE(summary.find("Vertices: 3 (left 1, right 2)"), std::string::npos);
    EXPECT_NE(summary.find("Vertex " + std::to_string(child.id) + " [right, depth 1]: a + b + 0"), std::string::npos);
    EXPECT_NE(summary.find("← add_zero"), std::string::npos);
}

TEST_F(SearchStateTest, DotExport) {
    state.add_child(LHS_VERTEX, expr("\"q\""), RuleDescriptor("quote", 0), proof_of("a + b", "\"q\""));
    const Edge& meeting = state.connect(2, RHS_VERTEX, RuleDescriptor("meet", 1), proof_of("\"q\"", "b + a"));
    state.mark_meeting(meeting.id);

    std::string dot = state.export_dot();
    EXPECT_EQ(dot.rfind("digraph RewriteSearch {", 0), 0);
    EXPECT_NE(dot.find("V0 [label=\"a + b\", color=blue, peripheries=2]"), std::string::npos);
    EXPECT_NE(dot.find("V1 [label=\"b + a\", color=red, peripheries=2]"), std::string::npos);
    EXPECT_NE(dot.find("label=\"\\\"q\\\"\""), std::string::npos);
    EXPECT_NE(dot.find("V2 -> V1 [label=\"meet\", style=bold, color=green]"), std::string::npos);
}

TEST(SearchStateBestFirst, PrefersVerticesCloserToOppositeRoot) {
    SearchConfig config;
    config.strategy = StrategyType::BEST_FIRST;
    SearchState state(config);
    state.initialize(expr("p q r"), expr("x y z"));

    // Drain the roots
    state.strategy().next();
    state.strategy().next();

    state.add_child(LHS_VERTEX, expr("p q s"), RuleDescriptor("far", 0), proof_of("p q r", "p q s"));
    state.add_child(LHS_VERTEX, expr("x y r"), RuleDescriptor("near", 1), proof_of("p q r", "x y r"));

    auto first = state.strategy().next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(state.vertices().get(*first).pretty(), "x y r");
    EXPECT_STREQ(state.strategy().name(), "best-first");
}
