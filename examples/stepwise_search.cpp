/**
 * Stepwise Search Example
 *
 * Drives the search one expansion at a time with an observer attached,
 * then exports the explored graph as Graphviz DOT.
 */

#include <rewrite_search/rewrite_search.hpp>
#include <fstream>
#include <iostream>

using namespace rewrite_search;

namespace {

class PrintingObserver : public SearchObserver {
public:
    void on_vertex_added(const Vertex& vertex) override {
        std::cout << "    new " << side_name(vertex.side) << " vertex " << vertex.id
                  << " at depth " << vertex.depth << ": " << vertex.pretty() << "\n";
    }

    void on_duplicate_discarded(const Vertex& from, const Vertex& existing, const RuleDescriptor& rule) override {
        std::cout << "    " << rule_reference(rule) << " leads from vertex " << from.id
                  << " back to vertex " << existing.id << "\n";
    }

    void on_vertex_exhausted(const Vertex& vertex) override {
        std::cout << "    vertex " << vertex.id << " fully expanded\n";
    }
};

} // anonymous namespace

int main(int argc, char** argv) {
    std::cout << "=== Stepwise Search Example ===\n\n";

    StringRewriteEngine engine;
    engine.add_rule("swap_ab : a b = b a");
    engine.add_rule("swap_bc : b c = c b");

    PrintingObserver observer;
    SearchDriver driver(engine);
    driver.add_observer(&observer);

    SearchConfig config;
    config.strategy = StrategyType::BEST_FIRST;
    config.max_steps = 100;

    driver.start(StringRewriteEngine::make_expression("a b c"),
                 StringRewriteEngine::make_expression("c b a"), config);

    StepOutcome outcome;
    std::size_t step = 0;
    do {
        outcome = driver.step();
        std::cout << "  step " << ++step << ": " << step_status_name(outcome.status) << "\n";
    } while (!outcome.is_terminal());

    if (outcome.status == StepStatus::DONE) {
        SearchResult result = driver.reconstruct(outcome.edge);
        std::cout << "\nScript:\n" << explain(result.units) << "\n";
    } else {
        std::cout << "\nStopped: " << outcome.reason << "\n";
    }

    std::string dot_path = argc > 1 ? argv[1] : "rewrite_search.dot";
    std::ofstream dot_file(dot_path);
    if (!dot_file) {
        std::cerr << "Cannot write " << dot_path << "\n";
        return 1;
    }
    dot_file << driver.state().export_dot();
    std::cout << "Search graph written to " << dot_path << "\n";

    return 0;
}
