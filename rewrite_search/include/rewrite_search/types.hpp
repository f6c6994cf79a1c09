#ifndef REWRITE_SEARCH_TYPES_HPP
#define REWRITE_SEARCH_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace rewrite_search {

// Arena indices. Vertices, edges and tokens never own each other, they only
// refer to one another through these ids.
using VertexId = std::size_t;
using EdgeId = std::size_t;
using TokenId = std::size_t;

// Resume position handed back to the rewrite engine. Its meaning is private
// to the engine; the search only stores and returns it.
using RuleCursor = std::size_t;

constexpr VertexId INVALID_VERTEX = std::numeric_limits<VertexId>::max();
constexpr EdgeId INVALID_EDGE = std::numeric_limits<EdgeId>::max();
constexpr TokenId INVALID_TOKEN = std::numeric_limits<TokenId>::max();

// Reserved ids of the two goal sides
constexpr VertexId LHS_VERTEX = 0;
constexpr VertexId RHS_VERTEX = 1;

/**
 * Which side of the original equation a vertex descends from.
 */
enum class Side : std::uint8_t {
    LEFT,
    RIGHT
};

inline constexpr Side opposite(Side side) {
    return side == Side::LEFT ? Side::RIGHT : Side::LEFT;
}

inline const char* side_name(Side side) {
    return side == Side::LEFT ? "left" : "right";
}

/**
 * Raised when an internal invariant of the search graph is broken: an id the
 * stores never issued, an edge asked about a vertex it does not touch, a
 * parent chain that does not lead back to its root. Never converted into a
 * SearchResult.
 */
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& what)
        : std::logic_error(what) {}
};

} // namespace rewrite_search

#endif // REWRITE_SEARCH_TYPES_HPP
