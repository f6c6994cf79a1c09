#include <rewrite_search/search_driver.hpp>
#include <rewrite_search/debug_log.hpp>
#include <algorithm>
#include <utility>

namespace rewrite_search {

const char* step_status_name(StepStatus status) {
    switch (status) {
        case StepStatus::CONTINUE: return "continue";
        case StepStatus::REPEAT: return "repeat";
        case StepStatus::DONE: return "done";
        case StepStatus::ABORT: return "abort";
        case StepStatus::EXHAUSTED: return "exhausted";
    }
    return "unknown";
}

void SearchDriver::add_observer(SearchObserver* observer) {
    if (observer && std::find(observers_.begin(), observers_.end(), observer) == observers_.end()) {
        observers_.push_back(observer);
    }
}

void SearchDriver::remove_observer(SearchObserver* observer) {
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

const SearchState& SearchDriver::state() const {
    if (!state_) {
        throw InvariantViolation("SearchDriver::state: no search has been started");
    }
    return *state_;
}

SearchResult SearchDriver::search(const Expression& lhs, const Expression& rhs, const SearchConfig& config) {
    start(lhs, rhs, config);

    while (true) {
        StepOutcome outcome = step();
        switch (outcome.status) {
            case StepStatus::CONTINUE:
            case StepStatus::REPEAT:
                continue;
            case StepStatus::DONE: {
                SearchResult result = reconstruct(outcome.edge);
                finish(result);
                return result;
            }
            case StepStatus::ABORT: {
                SearchResult result = SearchResult::abort(outcome.reason);
                result.stats = state_->stats();
                finish(result);
                return result;
            }
            case StepStatus::EXHAUSTED: {
                SearchResult result = SearchResult::failure(outcome.reason);
                result.stats = state_->stats();
                finish(result);
                return result;
            }
        }
    }
}

void SearchDriver::start(const Expression& lhs, const Expression& rhs, const SearchConfig& config) {
    config.validate();

    state_.reset();
    current_.reset();
    agreed_.reset();
    started_at_ = std::chrono::steady_clock::now();

    if (config.key_of(lhs) == config.key_of(rhs)) {
        REWRITE_SEARCH_DEBUG_LOG("Goal sides already agree: '%s'", lhs.pretty.c_str());
        agreed_ = lhs;

        // Roots outside any store, only for the observers
        Vertex left;
        left.id = LHS_VERTEX;
        left.expression = lhs;
        left.is_root = true;
        left.side = Side::LEFT;
        Vertex right = left;
        right.id = RHS_VERTEX;
        right.expression = rhs;
        right.side = Side::RIGHT;
        for (auto* observer : observers_) {
            observer->on_search_started(left, right);
        }
        return;
    }

    state_ = std::make_unique<SearchState>(config);
    state_->initialize(lhs, rhs);

    REWRITE_SEARCH_DEBUG_LOG("Search started: max_depth %zu, max_steps %zu, strategy %s",
                             config.max_depth, config.max_steps, strategy_name(config.strategy));

    const Vertex& left = state_->vertices().get(LHS_VERTEX);
    const Vertex& right = state_->vertices().get(RHS_VERTEX);
    for (auto* observer : observers_) {
        observer->on_search_started(left, right);
    }
}

bool SearchDriver::budget_exceeded() const {
    const SearchConfig& config = state_->config();
    if (state_->stats().steps >= config.max_steps) {
        return true;
    }
    if (config.timeout) {
        auto elapsed = std::chrono::steady_clock::now() - started_at_;
        if (elapsed >= *config.timeout) {
            return true;
        }
    }
    return false;
}

std::optional<VertexId> SearchDriver::pop_unvisited() {
    while (auto next = state_->strategy().next()) {
        if (!state_->vertices().get(*next).visited) {
            return next;
        }
        REWRITE_SEARCH_DEBUG_LOG("Skipping visited vertex %zu", *next);
    }
    return std::nullopt;
}

StepOutcome SearchDriver::step() {
    if (agreed_) {
        return StepOutcome::done(INVALID_EDGE);
    }
    if (!state_) {
        throw InvariantViolation("SearchDriver::step called before start");
    }
    if (auto meeting = state_->meeting_edge()) {
        return StepOutcome::done(*meeting);
    }

    if (budget_exceeded()) {
        REWRITE_SEARCH_DEBUG_LOG("Budget exceeded after %zu steps", state_->stats().steps);
        return StepOutcome::abort(RESOURCE_EXHAUSTED);
    }

    if (!current_) {
        current_ = pop_unvisited();
        if (!current_) {
            REWRITE_SEARCH_DEBUG_LOG("Frontier exhausted at depth %zu%s", state_->strategy().current_depth(),
                                     state_->strategy().depth_limit_reached() ? " (depth limit)" : "");
            return StepOutcome::exhausted(EXHAUSTED_MESSAGE);
        }
    }

    SearchStats& stats = state_->stats();
    ++stats.steps;

    Vertex& vertex = state_->vertices().get_mutable(*current_);
    RuleOutcome outcome = engine_.try_next_rule(vertex, vertex.rule_cursor);

    if (!outcome.was_applied()) {
        vertex.visited = true;
        current_.reset();
        REWRITE_SEARCH_DEBUG_LOG("Vertex %zu exhausted: '%s'", vertex.id, vertex.pretty().c_str());
        for (auto* observer : observers_) {
            observer->on_vertex_exhausted(vertex);
        }
        return StepOutcome::make(StepStatus::CONTINUE);
    }

    ++stats.rewrites;
    vertex.rule_cursor = outcome.next_cursor;

    if (auto existing = state_->find_vertex(outcome.new_expression)) {
        const Vertex& match = state_->vertices().get(*existing);

        if (match.side != vertex.side) {
            const Edge& edge = state_->connect(vertex.id, match.id, std::move(outcome.rule), std::move(outcome.proof));
            state_->mark_meeting(edge.id);
            current_.reset();
            REWRITE_SEARCH_DEBUG_LOG("Sides met: vertex %zu (%s) -> vertex %zu (%s) via '%s'",
                                     vertex.id, side_name(vertex.side), match.id, side_name(match.side),
                                     edge.rule.name.c_str());
            for (auto* observer : observers_) {
                observer->on_edge_added(edge);
            }
            return StepOutcome::done(edge.id);
        }

        // Same tree: the rewrite does not lead anywhere new
        ++stats.duplicates_discarded;
        REWRITE_SEARCH_DEBUG_LOG("Discarding rewrite of vertex %zu back to vertex %zu via '%s'",
                                 vertex.id, match.id, outcome.rule.name.c_str());
        for (auto* observer : observers_) {
            observer->on_duplicate_discarded(vertex, match, outcome.rule);
        }
        return StepOutcome::make(StepStatus::REPEAT);
    }

    const Vertex& child = state_->add_child(vertex.id, std::move(outcome.new_expression),
                                            std::move(outcome.rule), std::move(outcome.proof));
    REWRITE_SEARCH_DEBUG_LOG("New %s vertex %zu at depth %zu: '%s'",
                             side_name(child.side), child.id, child.depth, child.pretty().c_str());
    for (auto* observer : observers_) {
        observer->on_vertex_added(child);
        observer->on_edge_added(state_->edges().get(*child.parent_edge));
    }
    return StepOutcome::make(StepStatus::CONTINUE);
}

std::vector<EdgeId> SearchDriver::path_from_root(VertexId vertex) const {
    const VertexStore& vertices = state_->vertices();
    const EdgeStore& edges = state_->edges();

    std::vector<EdgeId> path;
    VertexId cursor = vertex;
    const Side side = vertices.get(vertex).side;

    while (true) {
        const Vertex& current = vertices.get(cursor);
        if (current.is_root) {
            VertexId expected_root = side == Side::LEFT ? LHS_VERTEX : RHS_VERTEX;
            if (current.id != expected_root) {
                throw InvariantViolation("Parent chain of vertex " + std::to_string(vertex) +
                                         " ends at foreign root " + std::to_string(current.id));
            }
            break;
        }
        if (!current.parent_edge) {
            throw InvariantViolation("Non-root vertex " + std::to_string(cursor) + " has no parent edge");
        }

        const Edge& edge = edges.get(*current.parent_edge);
        auto parent = EdgeStore::other_endpoint(edge, cursor);
        if (!parent) {
            throw InvariantViolation("Parent edge " + std::to_string(edge.id) +
                                     " does not touch vertex " + std::to_string(cursor));
        }
        path.push_back(edge.id);
        cursor = *parent;

        if (path.size() > vertices.size()) {
            throw InvariantViolation("Parent chain of vertex " + std::to_string(vertex) + " contains a cycle");
        }
    }

    std::reverse(path.begin(), path.end());
    return path;
}

ProofUnit SearchDriver::build_unit(Side side, const std::vector<EdgeId>& path) {
    VertexStore& vertices = state_->vertices();
    EdgeStore& edges = state_->edges();

    ProofUnit unit;
    unit.side = side;

    VertexId cursor = side == Side::LEFT ? LHS_VERTEX : RHS_VERTEX;
    std::optional<Proof> accumulated;

    for (EdgeId edge_id : path) {
        const Edge& edge = edges.get(edge_id);
        auto next = EdgeStore::other_endpoint(edge, cursor);
        if (!next) {
            throw InvariantViolation("Proof path breaks at edge " + std::to_string(edge_id) +
                                     ", which does not touch vertex " + std::to_string(cursor));
        }

        // Edges are proved from -> to; walking one backwards needs its symmetric proof
        bool forward = edge.from == cursor;
        const Proof& forced = edges.force_proof(edge_id);
        Proof step_proof = forward ? forced : engine_.symmetry(forced);

        accumulated = accumulated ? engine_.transitivity(*accumulated, step_proof) : std::move(step_proof);

        ProofStep step;
        step.edge = edge_id;
        step.rule = edge.rule;
        step.before = vertices.get(cursor).pretty();
        step.after = vertices.get(*next).pretty();
        unit.steps.push_back(std::move(step));

        cursor = *next;
    }

    if (accumulated) {
        unit.proof = std::move(*accumulated);
    } else {
        unit.proof = engine_.reflexivity(vertices.get(cursor).expression);
    }
    return unit;
}

SearchResult SearchDriver::reconstruct(EdgeId meeting_edge) {
    if (agreed_) {
        if (meeting_edge != INVALID_EDGE) {
            throw InvariantViolation("SearchDriver::reconstruct: sides agree, there is no edge " +
                                     std::to_string(meeting_edge));
        }
        return SearchResult::success(engine_.reflexivity(*agreed_), {});
    }
    if (!state_) {
        throw InvariantViolation("SearchDriver::reconstruct called before start");
    }

    const Edge& meeting = state_->edges().get(meeting_edge);
    const Vertex& from = state_->vertices().get(meeting.from);
    const Vertex& to = state_->vertices().get(meeting.to);
    if (from.side == to.side) {
        throw InvariantViolation("Edge " + std::to_string(meeting_edge) + " does not connect the two sides");
    }

    // The meeting edge extends the tree it was discovered from, so both units
    // end at the same expression.
    std::vector<EdgeId> from_path = path_from_root(from.id);
    from_path.push_back(meeting.id);
    std::vector<EdgeId> to_path = path_from_root(to.id);

    ProofUnit from_unit = build_unit(from.side, from_path);
    ProofUnit to_unit = build_unit(to.side, to_path);

    ProofUnit& left = from.side == Side::LEFT ? from_unit : to_unit;
    ProofUnit& right = from.side == Side::LEFT ? to_unit : from_unit;

    Proof proof;
    if (right.steps.empty()) {
        proof = left.proof;
    } else if (left.steps.empty()) {
        proof = engine_.symmetry(right.proof);
    } else {
        proof = engine_.transitivity(left.proof, engine_.symmetry(right.proof));
    }

    REWRITE_SEARCH_DEBUG_LOG("Proof reconstructed: %zu left steps, %zu right steps",
                             left.steps.size(), right.steps.size());

    std::vector<ProofUnit> units;
    units.push_back(std::move(left));
    units.push_back(std::move(right));

    SearchResult result = SearchResult::success(std::move(proof), std::move(units));
    result.stats = state_->stats();
    return result;
}

void SearchDriver::finish(const SearchResult& result) const {
    REWRITE_SEARCH_DEBUG_LOG("Search finished: %s after %zu steps%s%s",
                             result.is_success() ? "success" : (result.is_abort() ? "abort" : "failure"),
                             result.stats.steps, result.message.empty() ? "" : ": ", result.message.c_str());
    for (auto* observer : observers_) {
        observer->on_search_finished(result);
    }
}

} // namespace rewrite_search
