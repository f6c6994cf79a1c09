/**
 * Basic Rewrite Search Example
 *
 * Proves an equation over strings by searching from both sides:
 * - Declaring named rewrite rules
 * - Running a breadth-first search
 * - Printing the proof, a rewrite script and the search summary
 */

#include <rewrite_search/rewrite_search.hpp>
#include <iostream>

using namespace rewrite_search;

int main() {
    std::cout << "=== Basic Rewrite Search Example ===\n\n";

    StringRewriteEngine engine;
    engine.add_rule("add_comm : a+b = b+a");
    engine.add_rule("add_zero : b+0 => b");
    engine.add_rule("mul_one : a*1 => a");

    std::cout << "Rules:\n";
    for (const auto& rule : engine.rules()) {
        std::cout << "  " << rule.name << " : " << rule.lhs << (rule.symmetric ? " = " : " => ") << rule.rhs << "\n";
    }
    std::cout << "\n";

    Expression lhs = StringRewriteEngine::make_expression("a+b+0");
    Expression rhs = StringRewriteEngine::make_expression("b+a*1");
    std::cout << "Goal: " << lhs.pretty << " = " << rhs.pretty << "\n\n";

    SearchDriver driver(engine);
    SearchResult result = driver.search(lhs, rhs);

    if (result.is_success()) {
        const auto& proof = std::any_cast<const EqualityProof&>(result.proof);
        std::cout << "Proof found with " << result.num_steps() << " rewrites:\n";
        std::cout << "  " << proof.to_string() << "\n\n";
        std::cout << "Script:\n" << explain(result.units) << "\n\n";
    } else {
        std::cout << "No proof: " << result.message << "\n\n";
    }

    std::cout << "Steps: " << result.stats.steps << ", vertices: " << result.stats.vertices()
              << ", edges: " << result.stats.edges << "\n\n";

    if (driver.has_state()) {
        std::cout << driver.state().get_summary();
    }

    return result.is_success() ? 0 : 1;
}
