#ifndef REWRITE_SEARCH_REWRITE_ENGINE_HPP
#define REWRITE_SEARCH_REWRITE_ENGINE_HPP

#include <rewrite_search/types.hpp>
#include <rewrite_search/expression.hpp>
#include <rewrite_search/vertex_store.hpp>
#include <utility>

namespace rewrite_search {

/**
 * Answer of the rewrite engine for one vertex and cursor.
 * Either no rule applies any more, or one rule applied and produced
 * new_expression, with a proof of (vertex expression) = new_expression.
 */
struct RuleOutcome {
    bool applied{false};
    Expression new_expression;
    RuleCursor next_cursor{0};
    LazyProof::Thunk proof;
    RuleDescriptor rule;

    bool was_applied() const { return applied; }

    static RuleOutcome no_more_rules() {
        return RuleOutcome{};
    }

    static RuleOutcome make_applied(Expression expression, RuleCursor next,
                                    LazyProof::Thunk proof_thunk, RuleDescriptor descriptor) {
        RuleOutcome outcome;
        outcome.applied = true;
        outcome.new_expression = std::move(expression);
        outcome.next_cursor = next;
        outcome.proof = std::move(proof_thunk);
        outcome.rule = std::move(descriptor);
        return outcome;
    }
};

/**
 * Capability the search consumes: decides rule applicability and builds
 * proofs. The search never inspects expressions or proofs itself.
 */
class RewriteEngine {
public:
    virtual ~RewriteEngine() = default;

    /**
     * Next applicable rewrite at vertex, resuming from cursor.
     * Cursor 0 starts from the beginning; the engine returns the cursor to
     * resume from in RuleOutcome::next_cursor.
     */
    virtual RuleOutcome try_next_rule(const Vertex& vertex, RuleCursor cursor) = 0;

    // Proof combinators used to stitch step proofs together
    virtual Proof reflexivity(const Expression& expression) = 0;
    virtual Proof symmetry(const Proof& proof) = 0;
    virtual Proof transitivity(const Proof& first, const Proof& second) = 0;
};

} // namespace rewrite_search

#endif // REWRITE_SEARCH_REWRITE_ENGINE_HPP
