// Bastion Pattern Analyzer Unit Tests

#include "../../src/validation/pattern_analyzer.hpp"
#include "../../src/validation/rules.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <memory>

using namespace bastion::validation;
using bastion::pattern::PatternEngine;

namespace {

bool has_weakness(const std::vector<PatternWeakness>& weaknesses, WeaknessType type) {
    return std::any_of(weaknesses.begin(), weaknesses.end(),
                       [type](const PatternWeakness& w) { return w.type == type; });
}

/// Estimator that reports a fixed relationship; used to exercise the injection seam
class FixedEstimator final : public OverlapEstimator {
public:
    explicit FixedEstimator(OverlapKind kind) : kind_(kind) {}

    Overlap estimate(const Rule& a, const Rule& b) const override {
        Overlap overlap;
        overlap.rule_a = &a;
        overlap.rule_b = &b;
        overlap.kind = kind_;
        overlap.confidence = 95.0;
        return overlap;
    }

private:
    OverlapKind kind_;
};

}  // namespace

TEST_CASE("Overlap estimation", "[validation][overlap]") {
    PatternEngine engine;
    PatternAnalyzer analyzer;

    SECTION("Identical patterns are exact") {
        Rule deny = make_rule("exec", Category::Deny, 0, engine);
        Rule allow = make_rule("exec", Category::Allow, 0, engine);
        Overlap overlap = analyzer.analyze_overlap(deny, allow);
        REQUIRE(overlap.kind == OverlapKind::Exact);
        REQUIRE(overlap.confidence == 100.0);
        REQUIRE(overlap.examples == std::vector<std::string>{"exec"});
        REQUIRE(overlap.rule_a == &deny);
        REQUIRE(overlap.rule_b == &allow);
    }

    SECTION("Literal inside a wildcard is a subset") {
        Rule deny = make_rule("exec", Category::Deny, 0, engine);
        Rule allow = make_rule("*", Category::Allow, 0, engine);
        Overlap overlap = analyzer.analyze_overlap(deny, allow);
        REQUIRE(overlap.kind == OverlapKind::Subset);
        REQUIRE(std::find(overlap.examples.begin(), overlap.examples.end(), "exec") !=
                overlap.examples.end());

        Overlap reverse = analyzer.analyze_overlap(allow, deny);
        REQUIRE(reverse.kind == OverlapKind::Superset);
    }

    SECTION("Globs sharing some inputs overlap partially") {
        Rule a = make_rule("src/*", Category::Deny, 0, engine);
        Rule b = make_rule("*.js", Category::Allow, 0, engine);
        Overlap overlap = analyzer.analyze_overlap(a, b);
        REQUIRE(overlap.kind == OverlapKind::Partial);
        REQUIRE_FALSE(overlap.examples.empty());
        REQUIRE(overlap.examples.size() <= MAX_OVERLAP_EXAMPLES);
        REQUIRE(overlap.confidence > 0.0);
        REQUIRE(overlap.confidence <= 100.0);
    }

    SECTION("Disjoint anchored globs never overlap") {
        Rule a = make_rule("/etc/*", Category::Deny, 0, engine);
        Rule b = make_rule("/home/*", Category::Allow, 0, engine);
        Overlap overlap = analyzer.analyze_overlap(a, b);
        REQUIRE(overlap.kind == OverlapKind::None);
        REQUIRE(overlap.examples.empty());
    }

    SECTION("Distinct literals never overlap") {
        Rule a = make_rule("exec", Category::Deny, 0, engine);
        Rule b = make_rule("eval", Category::Allow, 0, engine);
        REQUIRE(analyzer.analyze_overlap(a, b).kind == OverlapKind::None);
    }
}

TEST_CASE("Overlap flip swaps subset and superset", "[validation][overlap]") {
    Overlap overlap;
    overlap.kind = OverlapKind::Subset;
    REQUIRE(overlap.flipped().kind == OverlapKind::Superset);

    overlap.kind = OverlapKind::Partial;
    REQUIRE(overlap.flipped().kind == OverlapKind::Partial);
}

TEST_CASE("Contradiction requires distinct categories", "[validation][overlap]") {
    PatternEngine engine;
    PatternAnalyzer analyzer;

    Rule deny = make_rule("exec", Category::Deny, 0, engine);
    Rule allow = make_rule("exec", Category::Allow, 0, engine);
    Rule deny_again = make_rule("exec", Category::Deny, 1, engine);

    REQUIRE(analyzer.are_contradictory(deny, allow));
    REQUIRE_FALSE(analyzer.are_contradictory(deny, deny_again));

    Overlap partial;
    partial.kind = OverlapKind::Partial;
    partial.confidence = 100.0;
    REQUIRE_FALSE(PatternAnalyzer::is_contradictory(deny, allow, partial));
}

TEST_CASE("Custom overlap estimator", "[validation][overlap]") {
    PatternEngine engine;
    PatternAnalyzer analyzer(std::make_shared<FixedEstimator>(OverlapKind::Superset));

    Rule a = make_rule("/etc/*", Category::Deny, 0, engine);
    Rule b = make_rule("/home/*", Category::Allow, 0, engine);
    REQUIRE(analyzer.analyze_overlap(a, b).kind == OverlapKind::Superset);
    REQUIRE(analyzer.are_contradictory(a, b));
}

TEST_CASE("Sampling through the pattern engine memo", "[validation][overlap]") {
    PatternEngine engine;
    PatternAnalyzer direct;
    PatternAnalyzer memoized(std::make_shared<const SampledOverlapEstimator>(engine));

    Rule deny = make_rule("src/*", Category::Deny, 0, engine);
    Rule allow = make_rule("*.js", Category::Allow, 0, engine);

    Overlap expected = direct.analyze_overlap(deny, allow);
    Overlap first = memoized.analyze_overlap(deny, allow);
    const auto after_first = engine.stats();
    Overlap second = memoized.analyze_overlap(deny, allow);

    REQUIRE(first.kind == expected.kind);
    REQUIRE(first.confidence == expected.confidence);
    REQUIRE(first.examples == expected.examples);
    REQUIRE(second.kind == OverlapKind::Partial);

    REQUIRE(after_first.memo_misses > 0);
    REQUIRE(after_first.memo_hits == 0);
    REQUIRE(engine.stats().memo_hits == after_first.memo_misses);
}

TEST_CASE("Specificity and complexity scores", "[validation][analysis]") {
    PatternEngine engine;

    Rule literal = make_rule("exec", Category::Deny, 0, engine);
    REQUIRE(pattern_specificity(literal) == 90);
    REQUIRE(pattern_complexity(literal) == 2);

    Rule star = make_rule("*", Category::Allow, 0, engine);
    REQUIRE(pattern_specificity(star) == 55);
    REQUIRE(pattern_complexity(star) == 15);

    Rule regex = make_rule("^(a|b)$", Category::Deny, 0, engine);
    REQUIRE(regex.kind == bastion::pattern::PatternKind::Regex);
    REQUIRE(pattern_complexity(regex) > pattern_complexity(literal));
}

TEST_CASE("Weakness detection", "[validation][analysis]") {
    PatternEngine engine;

    SECTION("Bare wildcard") {
        auto weaknesses = detect_weaknesses(make_rule("*", Category::Allow, 0, engine));
        REQUIRE(has_weakness(weaknesses, WeaknessType::TooBroad));
        REQUIRE(has_weakness(weaknesses, WeaknessType::TooVague));
        REQUIRE(weaknesses.front().severity == Severity::Critical);
    }

    SECTION("Unanchored deny glob") {
        auto weaknesses = detect_weaknesses(make_rule("*.tmp", Category::Deny, 0, engine));
        REQUIRE(has_weakness(weaknesses, WeaknessType::EscapeProne));
        REQUIRE(has_weakness(weaknesses, WeaknessType::EncodingVulnerable));
        REQUIRE_FALSE(has_weakness(weaknesses, WeaknessType::TooBroad));
    }

    SECTION("Same glob in allow is not escape-prone") {
        auto weaknesses = detect_weaknesses(make_rule("*.tmp", Category::Allow, 0, engine));
        REQUIRE_FALSE(has_weakness(weaknesses, WeaknessType::EscapeProne));
    }

    SECTION("Traversal") {
        auto weaknesses = detect_weaknesses(make_rule("../secret", Category::Allow, 0, engine));
        REQUIRE(has_weakness(weaknesses, WeaknessType::TraversalRisk));
    }

    SECTION("Anchored path glob is clean") {
        REQUIRE(detect_weaknesses(make_rule("/tmp/*", Category::Deny, 0, engine)).empty());
    }
}

TEST_CASE("Pattern signature", "[validation][analysis]") {
    PatternEngine engine;
    REQUIRE(pattern_signature(make_rule("src/*.js", Category::Allow, 0, engine)) ==
            "glob:path:wildcard:ext:js:medium");
    REQUIRE(pattern_signature(make_rule("exec", Category::Deny, 0, engine)) == "literal:short");
}

TEST_CASE("Coverage and performance impact", "[validation][analysis]") {
    PatternEngine engine;
    REQUIRE(estimate_coverage(make_rule("exec", Category::Deny, 0, engine)) == 1);
    REQUIRE(estimate_coverage(make_rule("*", Category::Allow, 0, engine)) == 100);
    REQUIRE(estimate_coverage(make_rule("*.js", Category::Allow, 0, engine)) == 30);

    REQUIRE(assess_performance_impact(make_rule("exec", Category::Deny, 0, engine)) ==
            PerformanceImpact::Negligible);
    REQUIRE(assess_performance_impact(
                make_rule("^(curl|wget)\\s+(https?|ftp)://([a-z]+)\\.(com|net)$", Category::Deny,
                          0, engine)) == PerformanceImpact::High);
}

TEST_CASE("Narrowing patterns", "[validation][analysis]") {
    REQUIRE(make_more_specific("*") == "*.js");
    REQUIRE(make_more_specific("**") == "src/**");
    REQUIRE(make_more_specific("*.log") == "specific/*.log");
    REQUIRE(make_more_specific("tmp*") == "tmp.js");
    REQUIRE(make_more_specific("exec") == "src/exec");
    REQUIRE(make_more_specific("a/b") == "a/b");
}

TEST_CASE("Attack vectors", "[validation][analysis]") {
    auto script = attack_vectors("run.sh");
    REQUIRE(script.size() == 5);
    REQUIRE(script.front() == "Path traversal: ../../../run.sh");
    REQUIRE(script.back() == "Command injection: run.sh && malicious-command");

    auto absolute = attack_vectors("/etc/passwd");
    REQUIRE(absolute.size() == 3);
    REQUIRE(absolute.front() == "URL encoding: %2Fetc%2Fpasswd");
}

TEST_CASE("Full analysis", "[validation][analysis]") {
    PatternEngine engine;
    PatternAnalyzer analyzer;
    PatternAnalysis analysis = analyzer.analyze(make_rule("*", Category::Allow, 0, engine));
    REQUIRE(analysis.coverage == 100);
    REQUIRE(analysis.specificity == 55);
    REQUIRE_FALSE(analysis.weaknesses.empty());
    REQUIRE(analysis.signature == "glob:wildcard:short");
}
