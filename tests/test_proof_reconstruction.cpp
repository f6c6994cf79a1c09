#include <gtest/gtest.h>
#include <rewrite_search/search_driver.hpp>
#include <rewrite_search/string_rewriter.hpp>
#include "test_helpers.hpp"

using namespace rewrite_search;
using namespace test_utils;

namespace {

// Adjacent transpositions of three letters
StringRewriteEngine make_swap_engine() {
    StringRewriteEngine engine;
    engine.add_rule("swap_ab : a b = b a");
    engine.add_rule("swap_bc : b c = c b");
    engine.add_rule("swap_ac : a c = c a");
    return engine;
}

void expect_valid_proof(const SearchResult& result, const std::string& lhs, const std::string& rhs) {
    ASSERT_TRUE(result.is_success()) << result.message;
    ASSERT_EQ(result.units.size(), 2);

    const ProofUnit& left = result.units[0];
    const ProofUnit& right = result.units[1];
    EXPECT_EQ(left.side, Side::LEFT);
    EXPECT_EQ(right.side, Side::RIGHT);

    expect_chained(left, lhs);
    expect_chained(right, rhs);
    EXPECT_EQ(unit_end(left, lhs), unit_end(right, rhs)) << "units must end at the meeting expression";

    const EqualityProof& left_proof = as_equality(left.proof);
    EXPECT_EQ(left_proof.lhs, lhs);
    EXPECT_EQ(left_proof.rhs, unit_end(left, lhs));
    EXPECT_EQ(left_proof.justification.size(), left.steps.size());

    const EqualityProof& right_proof = as_equality(right.proof);
    EXPECT_EQ(right_proof.lhs, rhs);
    EXPECT_EQ(right_proof.rhs, unit_end(right, rhs));

    const EqualityProof& proof = as_equality(result.proof);
    EXPECT_EQ(proof.lhs, lhs);
    EXPECT_EQ(proof.rhs, rhs);
    EXPECT_EQ(proof.justification.size(), result.num_steps());
}

} // anonymous namespace

TEST(ProofReconstruction, MultiStepProofProvesGoal) {
    StringRewriteEngine engine = make_swap_engine();
    SearchDriver driver(engine);

    SearchResult result = driver.search(expr("a b c"), expr("c b a"));
    expect_valid_proof(result, "a b c", "c b a");
    EXPECT_GE(result.num_steps(), 3);
}

TEST(ProofReconstruction, BestFirstProvesGoal) {
    StringRewriteEngine engine = make_swap_engine();
    SearchDriver driver(engine);

    SearchConfig config;
    config.strategy = StrategyType::BEST_FIRST;
    SearchResult result = driver.search(expr("a b c"), expr("c b a"), config);
    expect_valid_proof(result, "a b c", "c b a");
}

TEST(ProofReconstruction, BreadthFirstFindsShortestChain) {
    StringRewriteEngine engine = make_swap_engine();
    SearchDriver driver(engine);

    SearchResult result = driver.search(expr("a b c"), expr("b c a"));
    expect_valid_proof(result, "a b c", "b c a");
    EXPECT_EQ(result.num_steps(), 2);
}

TEST(ProofReconstruction, OnlyPathProofsAreBuilt) {
    StringRewriteEngine engine = make_swap_engine();
    SearchDriver driver(engine);

    SearchResult result = driver.search(expr("a b c"), expr("c b a"));
    ASSERT_TRUE(result.is_success());
    EXPECT_EQ(engine.proofs_built(), result.num_steps());
    EXPECT_GT(driver.state().edges().size(), result.num_steps());

    std::size_t forced = 0;
    driver.state().edges().for_each([&forced](const Edge& edge) {
        if (edge.proof.is_forced()) ++forced;
    });
    EXPECT_EQ(forced, result.num_steps());
}

TEST(ProofReconstruction, FailedSearchBuildsNoProofs) {
    ScriptedRewriteEngine engine;
    engine.add("p", "p1", "r1");
    engine.add("p1", "p2", "r2");
    engine.add("q", "q1", "r3");
    SearchDriver driver(engine);

    SearchResult result = driver.search(expr("p"), expr("q"));
    EXPECT_TRUE(result.is_failure());
    EXPECT_EQ(engine.total_forced(), 0);
}

TEST(ProofReconstruction, EachStepProofForcedAtMostOnce) {
    ScriptedRewriteEngine engine;
    engine.add("l", "l1", "a");
    engine.add("l1", "m", "b");
    engine.add("r", "r1", "c");
    engine.add("r1", "m", "d");
    SearchDriver driver(engine);

    SearchResult result = driver.search(expr("l"), expr("r"));
    expect_valid_proof(result, "l", "r");
    EXPECT_EQ(result.num_steps(), 4);
    EXPECT_EQ(engine.max_forced(), 1);
    EXPECT_EQ(engine.total_forced(), 4);

    // Reconstructing again reuses memoised proofs
    SearchResult again = driver.reconstruct(*driver.state().meeting_edge());
    expect_valid_proof(again, "l", "r");
    EXPECT_EQ(engine.total_forced(), 4);
}

TEST(ProofReconstruction, RightUnitIsWalkedBackwards) {
    ScriptedRewriteEngine engine;
    engine.add("l", "m", "left_rule");
    engine.add("r", "m", "right_rule");
    SearchDriver driver(engine);

    SearchResult result = driver.search(expr("l"), expr("r"));
    expect_valid_proof(result, "l", "r");

    const EqualityProof& proof = as_equality(result.proof);
    std::vector<std::string> expected = {"left_rule", "← right_rule"};
    EXPECT_EQ(proof.justification, expected);

    ASSERT_EQ(result.units[1].steps.size(), 1);
    EXPECT_EQ(result.units[1].steps[0].before, "r");
    EXPECT_EQ(result.units[1].steps[0].after, "m");
}

TEST(ProofReconstruction, StatsMatchGraph) {
    StringRewriteEngine engine = make_swap_engine();
    SearchDriver driver(engine);

    SearchResult result = driver.search(expr("a b c"), expr("c b a"));
    ASSERT_TRUE(result.is_success());

    const SearchState& state = driver.state();
    EXPECT_EQ(result.stats.vertices(), state.vertices().size());
    EXPECT_EQ(result.stats.vertices_left, state.vertices().count(Side::LEFT));
    EXPECT_EQ(result.stats.edges, state.edges().size());
    EXPECT_GE(result.stats.rewrites, result.stats.edges);
    EXPECT_LE(result.stats.steps, state.config().max_steps);
}
