#ifndef REWRITE_SEARCH_SEARCH_DRIVER_HPP
#define REWRITE_SEARCH_SEARCH_DRIVER_HPP

#include <rewrite_search/types.hpp>
#include <rewrite_search/rewrite_engine.hpp>
#include <rewrite_search/search_config.hpp>
#include <rewrite_search/search_observer.hpp>
#include <rewrite_search/search_result.hpp>
#include <rewrite_search/search_state.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rewrite_search {

/**
 * Outcome of a single expansion step.
 */
enum class StepStatus {
    CONTINUE,   // progress made, keep searching
    REPEAT,     // rewrite led back into the same tree; retry the same vertex
    DONE,       // meeting edge found
    ABORT,      // step budget or timeout exceeded
    EXHAUSTED   // frontier empty, nothing left to expand
};

const char* step_status_name(StepStatus status);

struct StepOutcome {
    StepStatus status{StepStatus::CONTINUE};
    EdgeId edge{INVALID_EDGE};  // meeting edge for DONE
    std::string reason;         // for ABORT and EXHAUSTED

    static StepOutcome make(StepStatus status) { return StepOutcome{status, INVALID_EDGE, {}}; }
    static StepOutcome done(EdgeId meeting) { return StepOutcome{StepStatus::DONE, meeting, {}}; }
    static StepOutcome abort(std::string why) { return StepOutcome{StepStatus::ABORT, INVALID_EDGE, std::move(why)}; }
    static StepOutcome exhausted(std::string why) { return StepOutcome{StepStatus::EXHAUSTED, INVALID_EDGE, std::move(why)}; }

    bool is_terminal() const {
        return status == StepStatus::DONE || status == StepStatus::ABORT || status == StepStatus::EXHAUSTED;
    }
};

/**
 * Bidirectional rewrite search.
 *
 * Expands one rewrite per step, alternating vertices in the order the strategy
 * hands them out, until a rewrite from one side lands on a vertex of the other
 * side. The proof is then rebuilt by walking parent edges from both endpoints
 * of the meeting edge back to the roots.
 *
 * Single-threaded. The last search state is kept for inspection until the
 * next search starts.
 */
class SearchDriver {
public:
    static constexpr const char* EXHAUSTED_MESSAGE = "exhausted search space";
    static constexpr const char* RESOURCE_EXHAUSTED = "resource exhausted";

private:
    RewriteEngine& engine_;
    std::vector<SearchObserver*> observers_;

    std::unique_ptr<SearchState> state_;
    std::optional<VertexId> current_;  // vertex under expansion
    std::optional<Expression> agreed_; // set when both goal sides share a key
    std::chrono::steady_clock::time_point started_at_;

    bool budget_exceeded() const;

    /**
     * Pop vertices until an unvisited one comes out.
     */
    std::optional<VertexId> pop_unvisited();

    /**
     * Walk parent edges from vertex back to its root, root-side edge first.
     */
    std::vector<EdgeId> path_from_root(VertexId vertex) const;

    /**
     * Build the proof unit root(side) = end of path. Edges are walked starting
     * at the side's root; an edge met against its direction is proved by
     * symmetry.
     */
    ProofUnit build_unit(Side side, const std::vector<EdgeId>& path);

    void finish(const SearchResult& result) const;

public:
    explicit SearchDriver(RewriteEngine& engine)
        : engine_(engine) {}

    SearchDriver(const SearchDriver&) = delete;
    SearchDriver& operator=(const SearchDriver&) = delete;

    /**
     * Attach an observer. Not owned; must outlive the searches it watches.
     */
    void add_observer(SearchObserver* observer);
    void remove_observer(SearchObserver* observer);

    /**
     * Search for a rewrite chain proving lhs = rhs.
     * Identical sides succeed at once with a reflexivity proof.
     */
    SearchResult search(const Expression& lhs, const Expression& rhs,
                        const SearchConfig& config = SearchConfig{});

    /**
     * Stepwise interface: start() prepares a fresh search state, step() runs
     * one expansion step, reconstruct() turns a meeting edge into a result.
     * search() is start() followed by step() until a terminal outcome.
     *
     * Terminal outcomes are sticky: once step() reports DONE, ABORT or
     * EXHAUSTED, further calls report the same outcome without expanding.
     *
     * If both sides share a canonical key, start() builds no search state;
     * step() reports DONE with INVALID_EDGE and reconstruct(INVALID_EDGE)
     * returns the reflexivity proof.
     */
    void start(const Expression& lhs, const Expression& rhs, const SearchConfig& config = SearchConfig{});
    StepOutcome step();
    SearchResult reconstruct(EdgeId meeting_edge);

    bool has_state() const { return state_ != nullptr; }

    /**
     * True after start() was given two sides with the same canonical key.
     */
    bool sides_agree() const { return agreed_.has_value(); }

    /**
     * State of the current or last search; throws InvariantViolation if no
     * search was started.
     */
    const SearchState& state() const;
};

} // namespace rewrite_search

#endif // REWRITE_SEARCH_SEARCH_DRIVER_HPP
