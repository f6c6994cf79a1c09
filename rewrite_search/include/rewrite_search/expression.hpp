#ifndef REWRITE_SEARCH_EXPRESSION_HPP
#define REWRITE_SEARCH_EXPRESSION_HPP

#include <rewrite_search/types.hpp>
#include <any>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace rewrite_search {

/**
 * Proof object produced by the rewrite engine. Opaque to the search: it is
 * only stored, forced and handed back to the engine's proof combinators.
 */
using Proof = std::any;

/**
 * An expression explored by the search.
 * The payload belongs to the rewrite engine; the search itself only ever
 * looks at the pretty-printed text.
 */
struct Expression {
    std::any payload;
    std::string pretty;

    Expression() = default;

    Expression(std::any value, std::string text)
        : payload(std::move(value)), pretty(std::move(text)) {}

    bool empty() const { return pretty.empty() && !payload.has_value(); }
};

/**
 * Description of one rewrite step: which rule, in which direction, at which
 * occurrence inside the expression.
 */
struct RuleDescriptor {
    std::string name;
    std::size_t rule_index{0};
    std::size_t occurrence{0};  // 0 = first match in the expression
    bool reversed{false};       // rule used right-to-left
    std::size_t match_count{1}; // matches of the pattern in the rewritten expression

    RuleDescriptor() = default;

    RuleDescriptor(std::string rule_name, std::size_t index,
                   std::size_t nth = 0, bool backwards = false, std::size_t matches = 1)
        : name(std::move(rule_name)), rule_index(index)
        , occurrence(nth), reversed(backwards), match_count(matches) {}

    bool operator==(const RuleDescriptor& other) const {
        return name == other.name && rule_index == other.rule_index &&
               occurrence == other.occurrence && reversed == other.reversed &&
               match_count == other.match_count;
    }
};

/**
 * Lazily evaluated proof. The thunk runs at most once; its value is memoised.
 */
class LazyProof {
public:
    using Thunk = std::function<Proof()>;

    LazyProof() = default;

    explicit LazyProof(Thunk thunk)
        : thunk_(std::move(thunk)) {}

    static LazyProof ready(Proof proof) {
        LazyProof lazy;
        lazy.value_ = std::move(proof);
        return lazy;
    }

    /**
     * Evaluate the proof if not done yet and return the cached value.
     */
    const Proof& force() {
        if (!value_) {
            if (!thunk_) {
                throw InvariantViolation("LazyProof::force: no proof thunk and no value");
            }
            value_ = thunk_();
            thunk_ = nullptr;
        }
        return *value_;
    }

    bool is_forced() const { return value_.has_value(); }

private:
    Thunk thunk_;
    std::optional<Proof> value_;
};

} // namespace rewrite_search

#endif // REWRITE_SEARCH_EXPRESSION_HPP
