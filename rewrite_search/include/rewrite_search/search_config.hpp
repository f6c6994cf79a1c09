#ifndef REWRITE_SEARCH_SEARCH_CONFIG_HPP
#define REWRITE_SEARCH_SEARCH_CONFIG_HPP

#include <rewrite_search/expression.hpp>
#include <rewrite_search/strategy.hpp>
#include <chrono>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace rewrite_search {

/**
 * Search limits and policies.
 *
 * max_depth bounds how deep the strategy expands (roots are depth 0); hitting
 * it ends the search as an ordinary failure. max_steps bounds the number of
 * expansion steps and timeout the wall-clock time; exceeding either aborts.
 * max_steps = 0 aborts before the first expansion.
 *
 * canonical_key decides when two expressions are the same vertex. The default
 * compares pretty-printed text.
 */
struct SearchConfig {
    using CanonicalKey = std::function<std::string(const Expression&)>;

    std::size_t max_depth{50};
    std::size_t max_steps{10000};
    StrategyType strategy{StrategyType::BREADTH_FIRST};
    std::optional<std::chrono::milliseconds> timeout;
    CanonicalKey canonical_key;

    std::string key_of(const Expression& expression) const {
        return canonical_key ? canonical_key(expression) : expression.pretty;
    }

    /**
     * Throws std::invalid_argument for settings that cannot describe a search.
     */
    void validate() const {
        if (timeout && timeout->count() <= 0) {
            throw std::invalid_argument("SearchConfig: timeout must be positive");
        }
        if (strategy != StrategyType::BREADTH_FIRST && strategy != StrategyType::BEST_FIRST) {
            throw std::invalid_argument("SearchConfig: unknown strategy");
        }
    }
};

} // namespace rewrite_search

#endif // REWRITE_SEARCH_SEARCH_CONFIG_HPP
