#ifndef REWRITE_SEARCH_STRING_REWRITER_HPP
#define REWRITE_SEARCH_STRING_REWRITER_HPP

#include <rewrite_search/rewrite_engine.hpp>
#include <string>
#include <vector>

namespace rewrite_search {

/**
 * Proof that lhs equals rhs, recording the rewrites used in order.
 */
struct EqualityProof {
    std::string lhs;
    std::string rhs;
    std::vector<std::string> justification;

    std::string to_string() const;
};

/**
 * Named textual equation lhs = rhs.
 * Symmetric rules are also tried right-to-left.
 */
struct StringRule {
    std::string name;
    std::string lhs;
    std::string rhs;
    bool symmetric{true};

    /**
     * Parse "name : lhs = rhs" (symmetric) or "name : lhs => rhs" (one way).
     * Sides may not contain '='. Throws std::invalid_argument on malformed
     * text, including text mixing both separators.
     */
    static StringRule parse(const std::string& text);
};

/**
 * One possible rewrite of a string.
 */
struct StringApplication {
    std::string result;
    RuleDescriptor rule;
};

/**
 * Rewrite engine over plain strings: rules rewrite substrings.
 *
 * Expressions carry their text as a std::string payload. Applications are
 * enumerated rule by rule, forward before backward, occurrence by occurrence;
 * the cursor is the index of the next application in that order.
 */
class StringRewriteEngine : public RewriteEngine {
private:
    std::vector<StringRule> rules_;
    std::size_t proofs_built_{0};

    static const std::string& text_of(const Expression& expression);
    static const EqualityProof& proof_of(const Proof& proof);

public:
    StringRewriteEngine() = default;
    explicit StringRewriteEngine(std::vector<StringRule> rules);

    void add_rule(StringRule rule);
    void add_rule(const std::string& text);

    const std::vector<StringRule>& rules() const { return rules_; }

    static Expression make_expression(const std::string& text);

    /**
     * Every rewrite of text, in cursor order.
     */
    std::vector<StringApplication> applications(const std::string& text) const;

    RuleOutcome try_next_rule(const Vertex& vertex, RuleCursor cursor) override;

    Proof reflexivity(const Expression& expression) override;
    Proof symmetry(const Proof& proof) override;
    Proof transitivity(const Proof& first, const Proof& second) override;

    /**
     * Number of step proofs actually evaluated (lazy thunks forced).
     */
    std::size_t proofs_built() const { return proofs_built_; }
};

} // namespace rewrite_search

#endif // REWRITE_SEARCH_STRING_REWRITER_HPP
