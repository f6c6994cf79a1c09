#include <rewrite_search/edge_store.hpp>
#include <string>
#include <utility>

namespace rewrite_search {

const Edge& EdgeStore::create(VertexId from, VertexId to, RuleDescriptor rule, LazyProof proof) {
    Edge edge;
    edge.id = edges_.size();
    edge.from = from;
    edge.to = to;
    edge.rule = std::move(rule);
    edge.proof = std::move(proof);
    edges_.push_back(std::move(edge));
    return edges_.back();
}

const Edge& EdgeStore::get(EdgeId id) const {
    if (id >= edges_.size()) {
        throw InvariantViolation("EdgeStore::get: edge id " + std::to_string(id) +
                                 " was never issued (size " + std::to_string(edges_.size()) + ")");
    }
    return edges_[id];
}

const Proof& EdgeStore::force_proof(EdgeId id) {
    if (id >= edges_.size()) {
        throw InvariantViolation("EdgeStore::force_proof: edge id " + std::to_string(id) + " was never issued");
    }
    return edges_[id].proof.force();
}

std::optional<VertexId> EdgeStore::other_endpoint(const Edge& edge, VertexId known) {
    if (edge.from == known) {
        return edge.to;
    }
    if (edge.to == known) {
        return edge.from;
    }
    return std::nullopt;
}

} // namespace rewrite_search
