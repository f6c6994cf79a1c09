#pragma once
#include <gtest/gtest.h>
#include <rewrite_search/rewrite_search.hpp>
#include <algorithm>
#include <chrono>
#include <map>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace test_utils {

using namespace rewrite_search;

inline Expression expr(const std::string& text) {
    return StringRewriteEngine::make_expression(text);
}

inline const EqualityProof& as_equality(const Proof& proof) {
    const auto* equality = std::any_cast<EqualityProof>(&proof);
    if (!equality) {
        throw std::runtime_error("proof is not an EqualityProof");
    }
    return *equality;
}

/**
 * Engine with a fixed rewrite table: text -> list of (result, rule name).
 * Cursor n returns the n-th listed rewrite. Counts how often each step proof
 * is evaluated.
 */
class ScriptedRewriteEngine : public StringRewriteEngine {
private:
    std::map<std::string, std::vector<std::pair<std::string, std::string>>> table_;
    std::map<std::string, std::size_t> forced_;
    std::size_t calls_{0};

public:
    void add(const std::string& from, const std::string& to, const std::string& name) {
        table_[from].emplace_back(to, name);
    }

    RuleOutcome try_next_rule(const Vertex& vertex, RuleCursor cursor) override {
        ++calls_;
        auto it = table_.find(vertex.pretty());
        if (it == table_.end() || cursor >= it->second.size()) {
            return RuleOutcome::no_more_rules();
        }
        std::string before = vertex.pretty();
        std::string after = it->second[cursor].first;
        std::string name = it->second[cursor].second;

        auto thunk = [this, before, after, name]() -> Proof {
            ++forced_[before + " -> " + after];
            return EqualityProof{before, after, {name}};
        };
        return RuleOutcome::make_applied(expr(after), cursor + 1, std::move(thunk), RuleDescriptor(name, cursor));
    }

    std::size_t calls() const { return calls_; }

    std::size_t total_forced() const {
        std::size_t total = 0;
        for (const auto& [step, count] : forced_) {
            total += count;
        }
        return total;
    }

    std::size_t max_forced() const {
        std::size_t most = 0;
        for (const auto& [step, count] : forced_) {
            most = std::max(most, count);
        }
        return most;
    }
};

/**
 * Engine rewriting "x<n>" to "x<n+1>" forever, one rewrite per vertex.
 * Optionally sleeps on every call to make timeouts reachable.
 */
class ChainRewriteEngine : public StringRewriteEngine {
private:
    std::chrono::milliseconds delay_;

public:
    explicit ChainRewriteEngine(std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : delay_(delay) {}

    RuleOutcome try_next_rule(const Vertex& vertex, RuleCursor cursor) override {
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        if (cursor > 0) {
            return RuleOutcome::no_more_rules();
        }
        const std::string& text = vertex.pretty();
        std::string prefix = text.substr(0, 1);
        std::size_t n = std::stoul(text.substr(1));
        std::string after = prefix + std::to_string(n + 1);
        auto thunk = [text, after]() -> Proof {
            return EqualityProof{text, after, {"succ"}};
        };
        return RuleOutcome::make_applied(expr(after), 1, std::move(thunk), RuleDescriptor("succ", 0));
    }
};

/**
 * Records every observer callback.
 */
class RecordingObserver : public SearchObserver {
public:
    std::size_t started{0};
    std::size_t vertices_added{0};
    std::size_t edges_added{0};
    std::size_t duplicates{0};
    std::size_t exhausted{0};
    std::size_t finished{0};
    std::vector<std::string> added_texts;
    SearchStatus last_status{SearchStatus::FAILURE};

    void on_search_started(const Vertex&, const Vertex&) override { ++started; }
    void on_vertex_added(const Vertex& vertex) override {
        ++vertices_added;
        added_texts.push_back(vertex.pretty());
    }
    void on_edge_added(const Edge&) override { ++edges_added; }
    void on_duplicate_discarded(const Vertex&, const Vertex&, const RuleDescriptor&) override { ++duplicates; }
    void on_vertex_exhausted(const Vertex&) override { ++exhausted; }
    void on_search_finished(const SearchResult& result) override {
        ++finished;
        last_status = result.status;
    }
};

/**
 * Check that a unit's steps form a chain starting at its root text.
 */
inline void expect_chained(const ProofUnit& unit, const std::string& root) {
    std::string cursor = root;
    for (const auto& step : unit.steps) {
        EXPECT_EQ(step.before, cursor) << "step via " << step.rule.name << " does not continue the chain";
        cursor = step.after;
    }
}

inline std::string unit_end(const ProofUnit& unit, const std::string& root) {
    return unit.steps.empty() ? root : unit.steps.back().after;
}

} // namespace test_utils
