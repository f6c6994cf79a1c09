#ifndef REWRITE_SEARCH_SEARCH_RESULT_HPP
#define REWRITE_SEARCH_SEARCH_RESULT_HPP

#include <rewrite_search/types.hpp>
#include <rewrite_search/expression.hpp>
#include <string>
#include <utility>
#include <vector>

namespace rewrite_search {

/**
 * One rewrite in a reconstructed proof, oriented away from its side's root:
 * before is closer to the root, after is closer to the meeting point.
 */
struct ProofStep {
    EdgeId edge{INVALID_EDGE};
    RuleDescriptor rule;
    std::string before;
    std::string after;
};

/**
 * Per-side part of a proof: proof proves root = meeting expression.
 */
struct ProofUnit {
    Proof proof;
    Side side{Side::LEFT};
    std::vector<ProofStep> steps;
};

struct SearchStats {
    std::size_t steps{0};                 // expansion steps taken
    std::size_t rewrites{0};              // rule applications reported by the engine
    std::size_t vertices_left{0};
    std::size_t vertices_right{0};
    std::size_t edges{0};
    std::size_t duplicates_discarded{0};
    std::size_t max_depth_reached{0};

    std::size_t vertices() const { return vertices_left + vertices_right; }
};

enum class SearchStatus {
    SUCCESS,
    FAILURE,  // search space exhausted, may succeed with another configuration
    ABORT     // budget exceeded, terminal for this search
};

/**
 * Terminal outcome of a search.
 */
struct SearchResult {
    SearchStatus status{SearchStatus::FAILURE};
    Proof proof;                   // lhs = rhs, only on success
    std::vector<ProofUnit> units;  // left unit then right unit, only on success
    std::string message;           // failure message or abort reason
    SearchStats stats;

    bool is_success() const { return status == SearchStatus::SUCCESS; }
    bool is_failure() const { return status == SearchStatus::FAILURE; }
    bool is_abort() const { return status == SearchStatus::ABORT; }

    std::size_t num_steps() const {
        std::size_t total = 0;
        for (const auto& unit : units) {
            total += unit.steps.size();
        }
        return total;
    }

    static SearchResult success(Proof proof, std::vector<ProofUnit> units) {
        SearchResult result;
        result.status = SearchStatus::SUCCESS;
        result.proof = std::move(proof);
        result.units = std::move(units);
        return result;
    }

    static SearchResult failure(std::string message) {
        SearchResult result;
        result.status = SearchStatus::FAILURE;
        result.message = std::move(message);
        return result;
    }

    static SearchResult abort(std::string reason) {
        SearchResult result;
        result.status = SearchStatus::ABORT;
        result.message = std::move(reason);
        return result;
    }
};

} // namespace rewrite_search

#endif // REWRITE_SEARCH_SEARCH_RESULT_HPP
