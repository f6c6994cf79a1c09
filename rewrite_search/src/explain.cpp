#include <rewrite_search/explain.hpp>
#include <sstream>

namespace rewrite_search {

namespace {

std::string join(const std::vector<std::string>& parts, const char* separator) {
    std::ostringstream ss;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) ss << separator;
        ss << parts[i];
    }
    return ss.str();
}

std::string explain_unit(const ProofUnit& unit) {
    std::vector<std::string> tactics;
    std::vector<std::string> pending;

    auto flush = [&]() {
        if (!pending.empty()) {
            tactics.push_back("rw [" + join(pending, ", ") + "]");
            pending.clear();
        }
    };

    for (const auto& step : unit.steps) {
        // rw rewrites every instance, so it only stands for a unique match
        if (step.rule.occurrence == 0 && step.rule.match_count <= 1) {
            pending.push_back(rule_reference(step.rule));
        } else {
            flush();
            tactics.push_back("nth_rewrite " + std::to_string(step.rule.occurrence) + " " +
                              rule_reference(step.rule));
        }
    }
    flush();

    const char* block = unit.side == Side::LEFT ? "conv_lhs" : "conv_rhs";
    return std::string(block) + " { " + join(tactics, ", ") + " }";
}

} // anonymous namespace

std::string rule_reference(const RuleDescriptor& rule) {
    return rule.reversed ? "← " + rule.name : rule.name;
}

std::string explain(const std::vector<ProofUnit>& units) {
    std::vector<std::string> lines;
    for (const auto& unit : units) {
        if (!unit.steps.empty()) {
            lines.push_back(explain_unit(unit));
        }
    }
    if (lines.empty()) {
        return "rfl";
    }
    return join(lines, "\n");
}

} // namespace rewrite_search
