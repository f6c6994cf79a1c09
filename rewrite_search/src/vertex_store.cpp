#include <rewrite_search/vertex_store.hpp>
#include <algorithm>
#include <utility>

namespace rewrite_search {

const Vertex& VertexStore::create(Expression expression, std::vector<TokenId> tokens,
                                  bool is_root, Side side, std::size_t depth) {
    Vertex vertex;
    vertex.id = vertices_.size();
    vertex.expression = std::move(expression);
    vertex.tokens = std::move(tokens);
    vertex.is_root = is_root;
    vertex.side = side;
    vertex.depth = depth;
    vertices_.push_back(std::move(vertex));
    return vertices_.back();
}

void VertexStore::set(const Vertex& vertex) {
    get_mutable(vertex.id) = vertex;
}

const Vertex& VertexStore::get(VertexId id) const {
    if (id >= vertices_.size()) {
        throw InvariantViolation("VertexStore::get: vertex id " + std::to_string(id) +
                                 " was never issued (size " + std::to_string(vertices_.size()) + ")");
    }
    return vertices_[id];
}

Vertex& VertexStore::get_mutable(VertexId id) {
    if (id >= vertices_.size()) {
        throw InvariantViolation("VertexStore::get_mutable: vertex id " + std::to_string(id) +
                                 " was never issued (size " + std::to_string(vertices_.size()) + ")");
    }
    return vertices_[id];
}

std::optional<VertexId> VertexStore::find(const std::string& key) const {
    auto it = key_index_.find(key);
    if (it == key_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void VertexStore::index(const std::string& key, VertexId id) {
    if (!contains(id)) {
        throw InvariantViolation("VertexStore::index: vertex id " + std::to_string(id) + " was never issued");
    }
    // First vertex with a key wins
    key_index_.emplace(key, id);
}

std::size_t VertexStore::count(Side side) const {
    return static_cast<std::size_t>(std::count_if(vertices_.begin(), vertices_.end(),
        [side](const Vertex& v) { return v.side == side; }));
}

} // namespace rewrite_search
