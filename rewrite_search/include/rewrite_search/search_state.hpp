#ifndef REWRITE_SEARCH_SEARCH_STATE_HPP
#define REWRITE_SEARCH_SEARCH_STATE_HPP

#include <rewrite_search/types.hpp>
#include <rewrite_search/token_table.hpp>
#include <rewrite_search/vertex_store.hpp>
#include <rewrite_search/edge_store.hpp>
#include <rewrite_search/strategy.hpp>
#include <rewrite_search/search_config.hpp>
#include <rewrite_search/search_result.hpp>
#include <memory>
#include <optional>
#include <string>

namespace rewrite_search {

/**
 * Everything one search knows: tokens, the two search trees and the frontier.
 *
 * Vertex 0 is the goal's left-hand side and vertex 1 its right-hand side.
 * Every non-root vertex has exactly one parent edge; each side stays a tree
 * until a meeting edge crosses sides.
 */
class SearchState {
private:
    SearchConfig config_;
    TokenTable tokens_;
    VertexStore vertices_;
    EdgeStore edges_;
    std::unique_ptr<SearchStrategy> strategy_;
    SearchStats stats_;
    std::optional<EdgeId> meeting_edge_;

    std::unique_ptr<SearchStrategy> make_strategy() const;

    /**
     * Heuristic for best-first: token edit distance to the opposite root.
     */
    double distance_to_opposite_root(const Vertex& vertex) const;

public:
    explicit SearchState(SearchConfig config);

    SearchState(const SearchState&) = delete;
    SearchState& operator=(const SearchState&) = delete;

    /**
     * Create the two root vertices and hand them to the strategy.
     * lhs and rhs must not share a canonical key.
     */
    void initialize(const Expression& lhs, const Expression& rhs);

    bool is_initialized() const { return vertices_.size() >= 2; }

    /**
     * Vertex with the same canonical key as expression, if one was discovered.
     */
    std::optional<VertexId> find_vertex(const Expression& expression) const;

    /**
     * Create a vertex reached from parent through a new edge and enqueue it.
     * Returns the new vertex; the new edge is its parent_edge.
     */
    const Vertex& add_child(VertexId parent, Expression expression,
                            RuleDescriptor rule, LazyProof::Thunk proof);

    /**
     * Record an edge between two existing vertices (the meeting edge).
     */
    const Edge& connect(VertexId from, VertexId to, RuleDescriptor rule, LazyProof::Thunk proof);

    void mark_meeting(EdgeId edge) { meeting_edge_ = edge; }
    std::optional<EdgeId> meeting_edge() const { return meeting_edge_; }

    const SearchConfig& config() const { return config_; }
    TokenTable& tokens() { return tokens_; }
    const TokenTable& tokens() const { return tokens_; }
    VertexStore& vertices() { return vertices_; }
    const VertexStore& vertices() const { return vertices_; }
    EdgeStore& edges() { return edges_; }
    const EdgeStore& edges() const { return edges_; }
    SearchStrategy& strategy() { return *strategy_; }
    const SearchStrategy& strategy() const { return *strategy_; }
    SearchStats& stats() { return stats_; }
    const SearchStats& stats() const { return stats_; }

    /**
     * Human-readable dump of both search trees.
     */
    std::string get_summary() const;

    /**
     * Export the search graph in Graphviz DOT format.
     * Left vertices are blue, right vertices red, the meeting edge bold.
     */
    std::string export_dot() const;

private:
    const Vertex& add_vertex(Expression expression, Side side, bool is_root, std::size_t depth);
    const Edge& add_edge(VertexId from, VertexId to, RuleDescriptor rule, LazyProof::Thunk proof);
};

} // namespace rewrite_search

#endif // REWRITE_SEARCH_SEARCH_STATE_HPP
