#ifndef REWRITE_SEARCH_REWRITE_SEARCH_HPP
#define REWRITE_SEARCH_REWRITE_SEARCH_HPP

// Convenience header pulling in the whole public API

#include <rewrite_search/types.hpp>
#include <rewrite_search/expression.hpp>
#include <rewrite_search/token_table.hpp>
#include <rewrite_search/vertex_store.hpp>
#include <rewrite_search/edge_store.hpp>
#include <rewrite_search/rewrite_engine.hpp>
#include <rewrite_search/strategy.hpp>
#include <rewrite_search/search_config.hpp>
#include <rewrite_search/search_result.hpp>
#include <rewrite_search/search_observer.hpp>
#include <rewrite_search/search_state.hpp>
#include <rewrite_search/search_driver.hpp>
#include <rewrite_search/string_rewriter.hpp>
#include <rewrite_search/explain.hpp>

#endif // REWRITE_SEARCH_REWRITE_SEARCH_HPP
