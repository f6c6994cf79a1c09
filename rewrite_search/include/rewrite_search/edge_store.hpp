#ifndef REWRITE_SEARCH_EDGE_STORE_HPP
#define REWRITE_SEARCH_EDGE_STORE_HPP

#include <rewrite_search/types.hpp>
#include <rewrite_search/expression.hpp>
#include <deque>
#include <optional>

namespace rewrite_search {

/**
 * Directed, justified transition between two vertices.
 * proof proves from = to. Only the lazy proof changes after creation.
 */
struct Edge {
    EdgeId id{INVALID_EDGE};
    VertexId from{INVALID_VERTEX};
    VertexId to{INVALID_VERTEX};
    LazyProof proof;
    RuleDescriptor rule;

    bool touches(VertexId vertex) const { return from == vertex || to == vertex; }
};

/**
 * Append-only edge arena. An edge's position is its id.
 */
class EdgeStore {
private:
    std::deque<Edge> edges_;

public:
    EdgeStore() = default;

    EdgeStore(const EdgeStore&) = delete;
    EdgeStore& operator=(const EdgeStore&) = delete;

    const Edge& create(VertexId from, VertexId to, RuleDescriptor rule, LazyProof proof);

    /**
     * Total over issued ids; throws InvariantViolation otherwise.
     */
    const Edge& get(EdgeId id) const;

    /**
     * Evaluate the edge's proof (once) and return it.
     */
    const Proof& force_proof(EdgeId id);

    /**
     * The endpoint of edge that is not known, or nothing when known is
     * neither endpoint.
     */
    static std::optional<VertexId> other_endpoint(const Edge& edge, VertexId known);

    std::size_t size() const { return edges_.size(); }
    bool empty() const { return edges_.empty(); }

    template<typename F>
    void for_each(F&& f) const {
        for (const auto& edge : edges_) {
            f(edge);
        }
    }
};

} // namespace rewrite_search

#endif // REWRITE_SEARCH_EDGE_STORE_HPP
