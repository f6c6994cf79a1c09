#ifndef REWRITE_SEARCH_VERTEX_STORE_HPP
#define REWRITE_SEARCH_VERTEX_STORE_HPP

#include <rewrite_search/types.hpp>
#include <rewrite_search/expression.hpp>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rewrite_search {

/**
 * Node of the search graph: one explored expression.
 * A default-constructed Vertex is the null vertex (id == INVALID_VERTEX).
 */
struct Vertex {
    VertexId id{INVALID_VERTEX};
    Expression expression;
    std::vector<TokenId> tokens;
    bool is_root{false};
    bool visited{false};                // every rule has been tried
    Side side{Side::LEFT};
    std::optional<EdgeId> parent_edge;  // how this vertex was reached from its root
    std::size_t depth{0};

    RuleCursor rule_cursor{0};                  // where the rewrite engine resumes
    std::vector<RuleDescriptor> outgoing_rules; // rules that applied here, in discovery order
    std::vector<EdgeId> adjacency;

    const std::string& pretty() const { return expression.pretty; }
    bool is_valid() const { return id != INVALID_VERTEX; }
};

/**
 * Append-only, id-addressed vertex arena.
 * References returned by get() stay valid while the store lives.
 */
class VertexStore {
private:
    std::deque<Vertex> vertices_;
    std::unordered_map<std::string, VertexId> key_index_;

public:
    VertexStore() = default;

    VertexStore(const VertexStore&) = delete;
    VertexStore& operator=(const VertexStore&) = delete;

    /**
     * Allocate the next vertex. It starts unvisited, with no parent edge, no
     * adjacency and the rule cursor at 0.
     */
    const Vertex& create(Expression expression, std::vector<TokenId> tokens,
                         bool is_root, Side side, std::size_t depth = 0);

    /**
     * Overwrite the stored vertex with the same id.
     */
    void set(const Vertex& vertex);

    /**
     * Total over issued ids; throws InvariantViolation otherwise.
     */
    const Vertex& get(VertexId id) const;
    Vertex& get_mutable(VertexId id);

    bool contains(VertexId id) const { return id < vertices_.size(); }

    /**
     * Canonical-key index used for duplicate detection.
     */
    std::optional<VertexId> find(const std::string& key) const;
    void index(const std::string& key, VertexId id);

    std::size_t size() const { return vertices_.size(); }
    bool empty() const { return vertices_.empty(); }

    std::size_t count(Side side) const;

    template<typename F>
    void for_each(F&& f) const {
        for (const auto& vertex : vertices_) {
            f(vertex);
        }
    }
};

} // namespace rewrite_search

#endif // REWRITE_SEARCH_VERTEX_STORE_HPP
