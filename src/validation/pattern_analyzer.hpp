/*
 * Copyright 2025 Bastion Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Bastion Validation - Pattern Analyzer
// Scoring, weakness detection, signatures and pairwise overlap estimation

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "../pattern/pattern_engine.hpp"
#include "types.hpp"

namespace bastion::validation {

enum class WeaknessType : uint8_t { TooBroad, TraversalRisk, EncodingVulnerable, TooVague, EscapeProne };

[[nodiscard]] std::string_view to_string(WeaknessType type) noexcept;

struct PatternWeakness {
    WeaknessType type = WeaknessType::TooVague;
    Severity severity = Severity::Medium;
    std::string description;
    std::vector<std::string> exploit_examples;
    std::string resolution;
};

enum class PerformanceImpact : uint8_t { Negligible, Low, Medium, High };

[[nodiscard]] std::string_view to_string(PerformanceImpact impact) noexcept;

struct PatternAnalysis {
    int complexity = 0;
    int specificity = 0;
    std::vector<PatternWeakness> weaknesses;
    std::string signature;
    int coverage = 0;
    PerformanceImpact performance_impact = PerformanceImpact::Negligible;
};

/// Relationship between the match sets of rule_a and rule_b.
/// Subset means rule_a's matches are contained in rule_b's.
struct Overlap {
    const Rule* rule_a = nullptr;  // non-owning, valid for the duration of one detection
    const Rule* rule_b = nullptr;
    OverlapKind kind = OverlapKind::None;
    std::vector<std::string> examples;  // at most 5 inputs matched by both
    double confidence = 0.0;            // 0-100
    double coverage_percent = 0.0;      // share of the corpus matched by both

    /// Same relationship viewed from rule_b's side (Subset <-> Superset)
    [[nodiscard]] Overlap flipped() const;
};

inline constexpr size_t MAX_OVERLAP_EXAMPLES = 5;

/// Decides how two rules' match sets relate.
/// Implementations must be safe to call concurrently.
class OverlapEstimator {
public:
    virtual ~OverlapEstimator() = default;

    [[nodiscard]] virtual Overlap estimate(const Rule& a, const Rule& b) const = 0;
};

/// Heuristic estimator that samples both matchers over a bounded test corpus.
/// Identical patterns are reported Exact, and provably disjoint anchored patterns
/// None, without sampling.
class SampledOverlapEstimator final : public OverlapEstimator {
public:
    SampledOverlapEstimator() = default;

    /// Pattern-derived inputs go through the engine's match memo.
    /// The engine must outlive the estimator.
    explicit SampledOverlapEstimator(pattern::PatternEngine& patterns) : patterns_(&patterns) {}

    [[nodiscard]] Overlap estimate(const Rule& a, const Rule& b) const override;

private:
    [[nodiscard]] bool sample(const Rule& rule, std::string_view input) const;

    pattern::PatternEngine* patterns_ = nullptr;
};

// Per-rule scores

/// 0-100; length, metacharacters, grouping and kind raise it
[[nodiscard]] int pattern_complexity(const Rule& rule);

/// 0-100; wildcards and short length lower it, literals raise it
[[nodiscard]] int pattern_specificity(const Rule& rule);

[[nodiscard]] std::vector<PatternWeakness> detect_weaknesses(const Rule& rule);

/// Coarse grouping key: kind, path separator, wildcard, extension hint, length bucket
[[nodiscard]] std::string pattern_signature(const Rule& rule);

/// Rough share of the input space matched (1 for literals, 100 for bare wildcards)
[[nodiscard]] int estimate_coverage(const Rule& rule);

[[nodiscard]] PerformanceImpact assess_performance_impact(const Rule& rule);

/// Example inputs an attacker would try against pattern
[[nodiscard]] std::vector<std::string> attack_vectors(std::string_view pattern);

/// Narrowed version of pattern (bare wildcards constrained, paths prefixed)
[[nodiscard]] std::string make_more_specific(std::string_view pattern);

class PatternAnalyzer {
public:
    /// nullptr selects SampledOverlapEstimator
    explicit PatternAnalyzer(std::shared_ptr<const OverlapEstimator> estimator = nullptr);

    [[nodiscard]] PatternAnalysis analyze(const Rule& rule) const;

    [[nodiscard]] Overlap analyze_overlap(const Rule& a, const Rule& b) const {
        return estimator_->estimate(a, b);
    }

    /// Different categories, overlap neither None nor Partial, confidence above 70
    [[nodiscard]] static bool is_contradictory(const Rule& a, const Rule& b, const Overlap& overlap);
    [[nodiscard]] bool are_contradictory(const Rule& a, const Rule& b) const;

    [[nodiscard]] const OverlapEstimator& estimator() const noexcept { return *estimator_; }

private:
    std::shared_ptr<const OverlapEstimator> estimator_;
};

}  // namespace bastion::validation
