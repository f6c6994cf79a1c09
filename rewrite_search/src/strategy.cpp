#include <rewrite_search/strategy.hpp>
#include <rewrite_search/debug_log.hpp>
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace rewrite_search {

const char* strategy_name(StrategyType type) {
    switch (type) {
        case StrategyType::BREADTH_FIRST: return "breadth-first";
        case StrategyType::BEST_FIRST: return "best-first";
    }
    return "unknown";
}

/*
 * BreadthFirstStrategy
 */

void BreadthFirstStrategy::enqueue(const Vertex& vertex) {
    queue_.push_back(vertex.id);
}

std::optional<VertexId> BreadthFirstStrategy::next() {
    if (!started_) {
        queue_.push_back(std::nullopt);
        started_ = true;
    }

    while (!queue_.empty()) {
        std::optional<VertexId> entry = queue_.front();
        queue_.pop_front();
        if (entry) {
            return entry;
        }

        // Depth boundary: everything at current_depth_ has been handed out
        if (queue_.empty()) {
            return std::nullopt;
        }
        if (current_depth_ >= max_depth_) {
            REWRITE_SEARCH_DEBUG_LOG("BFS depth limit %zu reached with %zu vertices left unexpanded",
                                     max_depth_, queue_.size());
            depth_limit_reached_ = true;
            queue_.clear();
            return std::nullopt;
        }
        ++current_depth_;
        queue_.push_back(std::nullopt);
    }
    return std::nullopt;
}

std::size_t BreadthFirstStrategy::frontier_size() const {
    return static_cast<std::size_t>(std::count_if(queue_.begin(), queue_.end(),
        [](const std::optional<VertexId>& entry) { return entry.has_value(); }));
}

/*
 * BestFirstStrategy
 */

BestFirstStrategy::BestFirstStrategy(Heuristic heuristic, std::size_t max_depth)
    : heuristic_(std::move(heuristic))
    , max_depth_(max_depth) {
    if (!heuristic_) {
        throw std::invalid_argument("BestFirstStrategy requires a heuristic");
    }
}

void BestFirstStrategy::enqueue(const Vertex& vertex) {
    if (vertex.depth > max_depth_) {
        depth_limit_reached_ = true;
        return;
    }
    queue_.push(Entry{heuristic_(vertex), next_sequence_++, vertex.id, vertex.depth});
}

std::optional<VertexId> BestFirstStrategy::next() {
    if (queue_.empty()) {
        return std::nullopt;
    }
    Entry entry = queue_.top();
    queue_.pop();
    current_depth_ = entry.depth;
    return entry.vertex;
}

std::size_t token_edit_distance(const std::vector<TokenId>& a, const std::vector<TokenId>& b) {
    // Single-row dynamic programming
    std::vector<std::size_t> row(b.size() + 1);
    for (std::size_t j = 0; j <= b.size(); ++j) {
        row[j] = j;
    }
    for (std::size_t i = 1; i <= a.size(); ++i) {
        std::size_t diagonal = row[0];
        row[0] = i;
        for (std::size_t j = 1; j <= b.size(); ++j) {
            std::size_t above = row[j];
            std::size_t substitute = diagonal + (a[i - 1] == b[j - 1] ? 0 : 1);
            row[j] = std::min({above + 1, row[j - 1] + 1, substitute});
            diagonal = above;
        }
    }
    return row[b.size()];
}

} // namespace rewrite_search
