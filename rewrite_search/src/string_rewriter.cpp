#include <rewrite_search/string_rewriter.hpp>
#include <rewrite_search/debug_log.hpp>
#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace rewrite_search {

namespace {

const std::string BACKWARD_MARK = "← ";

std::string trim(const std::string& text) {
    const char* blanks = " \t\r\n";
    std::size_t begin = text.find_first_not_of(blanks);
    if (begin == std::string::npos) {
        return "";
    }
    std::size_t end = text.find_last_not_of(blanks);
    return text.substr(begin, end - begin + 1);
}

std::string describe(const RuleDescriptor& rule) {
    std::string text = rule.reversed ? BACKWARD_MARK + rule.name : rule.name;
    if (rule.occurrence > 0) {
        text += "#" + std::to_string(rule.occurrence);
    }
    return text;
}

// Append every rewrite of pattern -> replacement inside text
void collect(const std::string& text, const std::string& pattern, const std::string& replacement,
             RuleDescriptor base, std::vector<StringApplication>& out) {
    std::size_t first = out.size();
    std::size_t occurrence = 0;
    for (std::size_t pos = text.find(pattern); pos != std::string::npos; pos = text.find(pattern, pos + 1)) {
        StringApplication application;
        application.result = text.substr(0, pos) + replacement + text.substr(pos + pattern.size());
        application.rule = base;
        application.rule.occurrence = occurrence++;
        out.push_back(std::move(application));
    }
    for (std::size_t i = first; i < out.size(); ++i) {
        out[i].rule.match_count = occurrence;
    }
}

} // anonymous namespace

std::string EqualityProof::to_string() const {
    std::ostringstream ss;
    ss << lhs << " = " << rhs << " by [";
    for (std::size_t i = 0; i < justification.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << justification[i];
    }
    ss << "]";
    return ss.str();
}

StringRule StringRule::parse(const std::string& text) {
    std::size_t colon = text.find(':');
    if (colon == std::string::npos) {
        throw std::invalid_argument("StringRule::parse: missing ':' in '" + text + "'");
    }

    StringRule rule;
    rule.name = trim(text.substr(0, colon));
    std::string body = text.substr(colon + 1);

    std::size_t arrow = body.find("=>");
    std::size_t split = arrow != std::string::npos ? arrow : body.find('=');
    if (split == std::string::npos) {
        throw std::invalid_argument("StringRule::parse: missing '=' in '" + text + "'");
    }
    if (body.find('=') != split || body.find('=', split + 1) != std::string::npos) {
        throw std::invalid_argument("StringRule::parse: more than one separator in '" + text + "'");
    }
    rule.symmetric = arrow == std::string::npos;
    rule.lhs = trim(body.substr(0, split));
    rule.rhs = trim(body.substr(split + (rule.symmetric ? 1 : 2)));

    if (rule.name.empty() || rule.lhs.empty() || rule.rhs.empty()) {
        throw std::invalid_argument("StringRule::parse: empty name or side in '" + text + "'");
    }
    return rule;
}

StringRewriteEngine::StringRewriteEngine(std::vector<StringRule> rules) {
    for (auto& rule : rules) {
        add_rule(std::move(rule));
    }
}

void StringRewriteEngine::add_rule(StringRule rule) {
    if (rule.lhs.empty() || rule.rhs.empty()) {
        throw std::invalid_argument("StringRewriteEngine: rule '" + rule.name + "' has an empty side");
    }
    REWRITE_SEARCH_DEBUG_LOG("Adding rule %zu: %s : %s %s %s", rules_.size(), rule.name.c_str(),
                             rule.lhs.c_str(), rule.symmetric ? "=" : "=>", rule.rhs.c_str());
    rules_.push_back(std::move(rule));
}

void StringRewriteEngine::add_rule(const std::string& text) {
    add_rule(StringRule::parse(text));
}

Expression StringRewriteEngine::make_expression(const std::string& text) {
    return Expression(std::any(text), text);
}

const std::string& StringRewriteEngine::text_of(const Expression& expression) {
    const auto* text = std::any_cast<std::string>(&expression.payload);
    if (!text) {
        throw std::invalid_argument("StringRewriteEngine: expression '" + expression.pretty +
                                    "' does not carry a string payload");
    }
    return *text;
}

const EqualityProof& StringRewriteEngine::proof_of(const Proof& proof) {
    const auto* equality = std::any_cast<EqualityProof>(&proof);
    if (!equality) {
        throw std::invalid_argument("StringRewriteEngine: proof was not built by this engine");
    }
    return *equality;
}

std::vector<StringApplication> StringRewriteEngine::applications(const std::string& text) const {
    std::vector<StringApplication> result;
    for (std::size_t i = 0; i < rules_.size(); ++i) {
        const StringRule& rule = rules_[i];
        collect(text, rule.lhs, rule.rhs, RuleDescriptor(rule.name, i, 0, false), result);
        if (rule.symmetric && rule.lhs != rule.rhs) {
            collect(text, rule.rhs, rule.lhs, RuleDescriptor(rule.name, i, 0, true), result);
        }
    }
    return result;
}

RuleOutcome StringRewriteEngine::try_next_rule(const Vertex& vertex, RuleCursor cursor) {
    const std::string& text = text_of(vertex.expression);
    std::vector<StringApplication> candidates = applications(text);
    if (cursor >= candidates.size()) {
        return RuleOutcome::no_more_rules();
    }

    StringApplication& application = candidates[cursor];
    std::string before = text;
    std::string after = application.result;
    RuleDescriptor rule = application.rule;

    auto thunk = [this, before, after, rule]() -> Proof {
        ++proofs_built_;
        return EqualityProof{before, after, {describe(rule)}};
    };

    return RuleOutcome::make_applied(make_expression(after), cursor + 1, std::move(thunk), std::move(rule));
}

Proof StringRewriteEngine::reflexivity(const Expression& expression) {
    const std::string& text = text_of(expression);
    return EqualityProof{text, text, {}};
}

Proof StringRewriteEngine::symmetry(const Proof& proof) {
    const EqualityProof& equality = proof_of(proof);
    EqualityProof flipped{equality.rhs, equality.lhs, {}};
    for (auto it = equality.justification.rbegin(); it != equality.justification.rend(); ++it) {
        if (it->rfind(BACKWARD_MARK, 0) == 0) {
            flipped.justification.push_back(it->substr(BACKWARD_MARK.size()));
        } else {
            flipped.justification.push_back(BACKWARD_MARK + *it);
        }
    }
    return flipped;
}

Proof StringRewriteEngine::transitivity(const Proof& first, const Proof& second) {
    const EqualityProof& a = proof_of(first);
    const EqualityProof& b = proof_of(second);
    if (a.rhs != b.lhs) {
        throw InvariantViolation("StringRewriteEngine::transitivity: '" + a.rhs + "' does not match '" + b.lhs + "'");
    }
    EqualityProof chained{a.lhs, b.rhs, a.justification};
    chained.justification.insert(chained.justification.end(), b.justification.begin(), b.justification.end());
    return chained;
}

} // namespace rewrite_search
