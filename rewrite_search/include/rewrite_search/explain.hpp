#ifndef REWRITE_SEARCH_EXPLAIN_HPP
#define REWRITE_SEARCH_EXPLAIN_HPP

#include <rewrite_search/search_result.hpp>
#include <string>
#include <vector>

namespace rewrite_search {

/**
 * Render one rewrite as a tactic argument, e.g. "add_comm" or "← mul_one".
 */
std::string rule_reference(const RuleDescriptor& rule);

/**
 * Render the proof units of a successful search as a rewrite script.
 *
 * Example for units rewriting the left side twice and the right side once:
 *   conv_lhs { rw [add_comm, ← mul_one] }
 *   conv_rhs { nth_rewrite 1 add_zero }
 *
 * Units without steps are skipped; if no unit has steps the result is "rfl".
 */
std::string explain(const std::vector<ProofUnit>& units);

} // namespace rewrite_search

#endif // REWRITE_SEARCH_EXPLAIN_HPP
