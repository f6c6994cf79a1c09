#include <rewrite_search/search_state.hpp>
#include <rewrite_search/debug_log.hpp>
#include <algorithm>
#include <sstream>
#include <utility>

namespace rewrite_search {

namespace {

std::string escape_dot(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\') {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return escaped;
}

} // anonymous namespace

SearchState::SearchState(SearchConfig config)
    : config_(std::move(config)) {
    config_.validate();
    strategy_ = make_strategy();
}

std::unique_ptr<SearchStrategy> SearchState::make_strategy() const {
    switch (config_.strategy) {
        case StrategyType::BREADTH_FIRST:
            return std::make_unique<BreadthFirstStrategy>(config_.max_depth);
        case StrategyType::BEST_FIRST:
            return std::make_unique<BestFirstStrategy>(
                [this](const Vertex& vertex) { return distance_to_opposite_root(vertex); },
                config_.max_depth);
    }
    throw std::invalid_argument("SearchState: unknown strategy");
}

double SearchState::distance_to_opposite_root(const Vertex& vertex) const {
    VertexId target = vertex.side == Side::LEFT ? RHS_VERTEX : LHS_VERTEX;
    if (!vertices_.contains(target)) {
        // Roots are scored before both exist; they are expanded first anyway
        return 0.0;
    }
    return static_cast<double>(token_edit_distance(vertex.tokens, vertices_.get(target).tokens));
}

void SearchState::initialize(const Expression& lhs, const Expression& rhs) {
    if (!vertices_.empty()) {
        throw InvariantViolation("SearchState::initialize called twice");
    }
    if (config_.key_of(lhs) == config_.key_of(rhs)) {
        throw InvariantViolation("SearchState::initialize: both sides share the canonical key '" +
                                 config_.key_of(lhs) + "'");
    }

    const Vertex& left = add_vertex(lhs, Side::LEFT, true, 0);
    const Vertex& right = add_vertex(rhs, Side::RIGHT, true, 0);
    strategy_->enqueue(left);
    strategy_->enqueue(right);

    REWRITE_SEARCH_DEBUG_LOG("Search initialised: lhs '%s' (%zu tokens), rhs '%s' (%zu tokens), strategy %s",
                             left.pretty().c_str(), left.tokens.size(),
                             right.pretty().c_str(), right.tokens.size(), strategy_->name());
}

std::optional<VertexId> SearchState::find_vertex(const Expression& expression) const {
    return vertices_.find(config_.key_of(expression));
}

const Vertex& SearchState::add_vertex(Expression expression, Side side, bool is_root, std::size_t depth) {
    std::string key = config_.key_of(expression);
    std::vector<TokenId> token_ids = tokens_.intern(expression.pretty, side);
    const Vertex& vertex = vertices_.create(std::move(expression), std::move(token_ids), is_root, side, depth);
    vertices_.index(key, vertex.id);

    if (side == Side::LEFT) {
        ++stats_.vertices_left;
    } else {
        ++stats_.vertices_right;
    }
    stats_.max_depth_reached = std::max(stats_.max_depth_reached, depth);
    return vertex;
}

const Edge& SearchState::add_edge(VertexId from, VertexId to, RuleDescriptor rule, LazyProof::Thunk proof) {
    Vertex& source = vertices_.get_mutable(from);
    Vertex& target = vertices_.get_mutable(to);

    const Edge& edge = edges_.create(from, to, std::move(rule), LazyProof(std::move(proof)));
    source.adjacency.push_back(edge.id);
    if (to != from) {
        target.adjacency.push_back(edge.id);
    }
    source.outgoing_rules.push_back(edge.rule);
    ++stats_.edges;
    return edge;
}

const Vertex& SearchState::add_child(VertexId parent, Expression expression,
                                     RuleDescriptor rule, LazyProof::Thunk proof) {
    const Vertex& source = vertices_.get(parent);
    Side side = source.side;
    std::size_t depth = source.depth + 1;

    const Vertex& child = add_vertex(std::move(expression), side, false, depth);
    const Edge& edge = add_edge(parent, child.id, std::move(rule), std::move(proof));
    vertices_.get_mutable(child.id).parent_edge = edge.id;

    strategy_->enqueue(child);
    return child;
}

const Edge& SearchState::connect(VertexId from, VertexId to, RuleDescriptor rule, LazyProof::Thunk proof) {
    return add_edge(from, to, std::move(rule), std::move(proof));
}

std::string SearchState::get_summary() const {
    std::ostringstream ss;

    ss << "=== REWRITE SEARCH SUMMARY ===\n";
    ss << "Strategy: " << strategy_->name() << ", depth " << strategy_->current_depth()
       << ", frontier " << strategy_->frontier_size() << "\n";
    ss << "Vertices: " << vertices_.size() << " (left " << stats_.vertices_left
       << ", right " << stats_.vertices_right << "), Edges: " << edges_.size()
       << ", Tokens: " << tokens_.size() << "\n";
    ss << "Steps: " << stats_.steps << ", Rewrites: " << stats_.rewrites
       << ", Duplicates discarded: " << stats_.duplicates_discarded << "\n\n";

    ss << "Vertices:\n";
    vertices_.for_each([&ss](const Vertex& vertex) {
        ss << "  Vertex " << vertex.id << " [" << side_name(vertex.side) << ", depth " << vertex.depth
           << (vertex.is_root ? ", root" : "") << (vertex.visited ? ", visited" : "") << "]: "
           << vertex.pretty();
        if (vertex.parent_edge) {
            ss << "  (via edge " << *vertex.parent_edge << ")";
        }
        ss << "\n";
    });

    ss << "Edges:\n";
    edges_.for_each([&ss, this](const Edge& edge) {
        ss << "  Edge " << edge.id << ": Vertex " << edge.from << " → Vertex " << edge.to
           << " (" << (edge.rule.reversed ? "← " : "") << edge.rule.name;
        if (edge.rule.occurrence > 0) {
            ss << " #" << edge.rule.occurrence;
        }
        ss << ")";
        if (meeting_edge_ && *meeting_edge_ == edge.id) {
            ss << "  [meeting]";
        }
        ss << "\n";
    });

    return ss.str();
}

std::string SearchState::export_dot() const {
    std::ostringstream dot;
    dot << "digraph RewriteSearch {\n";
    dot << "  node [shape=box];\n";

    vertices_.for_each([&dot](const Vertex& vertex) {
        const char* color = vertex.side == Side::LEFT ? "blue" : "red";
        dot << "  V" << vertex.id << " [label=\"" << escape_dot(vertex.pretty()) << "\", color=" << color;
        if (vertex.is_root) {
            dot << ", peripheries=2";
        }
        dot << "];\n";
    });

    edges_.for_each([&dot, this](const Edge& edge) {
        bool meeting = meeting_edge_ && *meeting_edge_ == edge.id;
        dot << "  V" << edge.from << " -> V" << edge.to
            << " [label=\"" << (edge.rule.reversed ? "← " : "") << escape_dot(edge.rule.name) << "\"";
        if (meeting) {
            dot << ", style=bold, color=green";
        }
        dot << "];\n";
    });

    dot << "}\n";
    return dot.str();
}

} // namespace rewrite_search
