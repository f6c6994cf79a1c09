#ifndef REWRITE_SEARCH_SEARCH_OBSERVER_HPP
#define REWRITE_SEARCH_SEARCH_OBSERVER_HPP

#include <rewrite_search/vertex_store.hpp>
#include <rewrite_search/edge_store.hpp>
#include <rewrite_search/search_result.hpp>

namespace rewrite_search {

/**
 * Receives search progress notifications. All callbacks default to no-ops.
 * Observers are passed to the driver explicitly and are not owned by it.
 *
 * Every search reports on_search_started and on_search_finished once each.
 * When both goal sides already agree, the roots passed to on_search_started
 * belong to no store and nothing else is reported in between.
 */
class SearchObserver {
public:
    virtual ~SearchObserver() = default;

    virtual void on_search_started(const Vertex& /*lhs*/, const Vertex& /*rhs*/) {}
    virtual void on_vertex_added(const Vertex& /*vertex*/) {}
    virtual void on_edge_added(const Edge& /*edge*/) {}
    virtual void on_duplicate_discarded(const Vertex& /*from*/, const Vertex& /*existing*/,
                                        const RuleDescriptor& /*rule*/) {}
    virtual void on_vertex_exhausted(const Vertex& /*vertex*/) {}
    virtual void on_search_finished(const SearchResult& /*result*/) {}
};

} // namespace rewrite_search

#endif // REWRITE_SEARCH_SEARCH_OBSERVER_HPP
