#ifndef REWRITE_SEARCH_STRATEGY_HPP
#define REWRITE_SEARCH_STRATEGY_HPP

#include <rewrite_search/types.hpp>
#include <rewrite_search/vertex_store.hpp>
#include <cstdint>
#include <deque>
#include <functional>
#include <limits>
#include <optional>
#include <queue>
#include <vector>

namespace rewrite_search {

// Frontier policy selection
enum class StrategyType {
    BREADTH_FIRST,  // shortest proofs, depth-boundary sentinels
    BEST_FIRST      // token edit distance to the opposite root
};

const char* strategy_name(StrategyType type);

/**
 * Frontier management policy: decides which discovered vertex is expanded
 * next. Implementations must return every enqueued vertex at most once.
 */
class SearchStrategy {
public:
    virtual ~SearchStrategy() = default;

    virtual void enqueue(const Vertex& vertex) = 0;

    /**
     * Next vertex to expand, or nothing when the frontier is exhausted
     * (including when the depth bound cuts the remaining frontier off).
     */
    virtual std::optional<VertexId> next() = 0;

    virtual std::size_t current_depth() const = 0;
    virtual std::size_t frontier_size() const = 0;
    virtual bool depth_limit_reached() const = 0;
    virtual const char* name() const = 0;
};

/**
 * Breadth-first frontier.
 * The queue holds vertex ids and depth-boundary sentinels (nullopt). Popping a
 * sentinel means every vertex of current_depth has been handed out: the depth
 * advances and a fresh sentinel goes to the tail. The first call to next()
 * closes depth 0, so the roots must be enqueued before it.
 */
class BreadthFirstStrategy : public SearchStrategy {
private:
    std::deque<std::optional<VertexId>> queue_;
    std::size_t current_depth_{0};
    std::size_t max_depth_;
    bool started_{false};
    bool depth_limit_reached_{false};

public:
    explicit BreadthFirstStrategy(std::size_t max_depth = std::numeric_limits<std::size_t>::max())
        : max_depth_(max_depth) {}

    void enqueue(const Vertex& vertex) override;
    std::optional<VertexId> next() override;

    std::size_t current_depth() const override { return current_depth_; }
    std::size_t frontier_size() const override;
    bool depth_limit_reached() const override { return depth_limit_reached_; }
    const char* name() const override { return "breadth-first"; }
};

/**
 * Best-first frontier ordered by a heuristic score (lower is better), ties
 * broken by insertion order. Vertices deeper than max_depth are never
 * returned.
 */
class BestFirstStrategy : public SearchStrategy {
public:
    using Heuristic = std::function<double(const Vertex&)>;

private:
    struct Entry {
        double score;
        std::uint64_t sequence;
        VertexId vertex;
        std::size_t depth;

        // std::priority_queue is a max-heap; invert to pop the smallest score first
        bool operator<(const Entry& other) const {
            if (score != other.score) return score > other.score;
            return sequence > other.sequence;
        }
    };

    std::priority_queue<Entry> queue_;
    Heuristic heuristic_;
    std::size_t max_depth_;
    std::size_t current_depth_{0};
    std::uint64_t next_sequence_{0};
    bool depth_limit_reached_{false};

public:
    BestFirstStrategy(Heuristic heuristic,
                      std::size_t max_depth = std::numeric_limits<std::size_t>::max());

    void enqueue(const Vertex& vertex) override;
    std::optional<VertexId> next() override;

    std::size_t current_depth() const override { return current_depth_; }
    std::size_t frontier_size() const override { return queue_.size(); }
    bool depth_limit_reached() const override { return depth_limit_reached_; }
    const char* name() const override { return "best-first"; }
};

/**
 * Levenshtein distance between two token sequences, unit costs.
 */
std::size_t token_edit_distance(const std::vector<TokenId>& a, const std::vector<TokenId>& b);

} // namespace rewrite_search

#endif // REWRITE_SEARCH_STRATEGY_HPP
