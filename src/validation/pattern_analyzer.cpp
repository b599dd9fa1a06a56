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

#include "pattern_analyzer.hpp"

#include <algorithm>
#include <cctype>

#include "../core/containers.hpp"
#include "../core/string_utils.hpp"
#include "../pattern/corpus.hpp"

namespace bastion::validation {

std::string_view to_string(WeaknessType type) noexcept {
    switch (type) {
        case WeaknessType::TooBroad:
            return "too-broad";
        case WeaknessType::TraversalRisk:
            return "traversal-risk";
        case WeaknessType::EncodingVulnerable:
            return "encoding-vulnerable";
        case WeaknessType::TooVague:
            return "too-vague";
        case WeaknessType::EscapeProne:
            return "escape-prone";
    }
    return "too-vague";
}

std::string_view to_string(PerformanceImpact impact) noexcept {
    switch (impact) {
        case PerformanceImpact::Negligible:
            return "negligible";
        case PerformanceImpact::Low:
            return "low";
        case PerformanceImpact::Medium:
            return "medium";
        case PerformanceImpact::High:
            return "high";
    }
    return "negligible";
}

Overlap Overlap::flipped() const {
    Overlap result = *this;
    std::swap(result.rule_a, result.rule_b);
    if (kind == OverlapKind::Subset) {
        result.kind = OverlapKind::Superset;
    } else if (kind == OverlapKind::Superset) {
        result.kind = OverlapKind::Subset;
    }
    return result;
}

// ============================================================================
// SampledOverlapEstimator
// ============================================================================

namespace {

OverlapKind classify_counts(size_t both, size_t a_only, size_t b_only, size_t total) {
    if (both == 0) {
        return OverlapKind::None;
    }
    if (both == total && a_only == 0 && b_only == 0) {
        return OverlapKind::Exact;
    }
    if (a_only == 0) {
        return OverlapKind::Subset;
    }
    if (b_only == 0) {
        return OverlapKind::Superset;
    }
    return OverlapKind::Partial;
}

}  // namespace

bool SampledOverlapEstimator::sample(const Rule& rule, std::string_view input) const {
    if (patterns_) {
        return patterns_->matches(rule.original, input, rule.kind);
    }
    return rule.matcher->matches(input);
}

Overlap SampledOverlapEstimator::estimate(const Rule& a, const Rule& b) const {
    Overlap overlap;
    overlap.rule_a = &a;
    overlap.rule_b = &b;

    if (!a.matcher || !b.matcher) {
        return overlap;
    }

    if (a.kind == b.kind && a.normalized == b.normalized) {
        overlap.kind = OverlapKind::Exact;
        overlap.examples.push_back(a.original);
        overlap.confidence = 100.0;
        overlap.coverage_percent = 100.0;
        return overlap;
    }

    if (pattern::provably_disjoint(*a.matcher, *b.matcher)) {
        return overlap;
    }

    size_t both = 0;
    size_t a_only = 0;
    size_t b_only = 0;
    size_t total = 0;

    auto tally = [&](bool match_a, bool match_b, std::string_view input) {
        ++total;
        if (match_a && match_b) {
            ++both;
            if (overlap.examples.size() < MAX_OVERLAP_EXAMPLES) {
                overlap.examples.emplace_back(input);
            }
        } else if (match_a) {
            ++a_only;
        } else if (match_b) {
            ++b_only;
        }
    };

    // Pattern-derived inputs first; fixed corpus entries are scored from the
    // precomputed masks below
    core::fast_set<std::string_view> seen;
    auto visit = [&](const std::string& input) {
        if (pattern::is_fixed_corpus_entry(input) || !seen.insert(input).second) {
            return;
        }
        tally(sample(a, input), sample(b, input), input);
    };

    visit(a.original);
    visit(b.original);
    for (const auto& v : a.matcher->variants()) {
        visit(v);
    }
    for (const auto& v : b.matcher->variants()) {
        visit(v);
    }

    const auto& fixed = pattern::fixed_corpus();
    const uint64_t mask_a = a.matcher->corpus_mask();
    const uint64_t mask_b = b.matcher->corpus_mask();
    for (size_t i = 0; i < fixed.size(); ++i) {
        uint64_t bit = uint64_t{1} << i;
        tally((mask_a & bit) != 0, (mask_b & bit) != 0, fixed[i]);
    }

    overlap.kind = classify_counts(both, a_only, b_only, total);

    double confidence = total > 0 ? static_cast<double>(both) / static_cast<double>(total) * 100.0
                                  : 0.0;
    if (a.kind == PatternKind::Literal && b.kind == PatternKind::Literal) {
        confidence = a.original == b.original ? 100.0 : 0.0;
    }
    if (pattern_complexity(a) > 50 || pattern_complexity(b) > 50) {
        confidence *= 0.8;
    }
    overlap.confidence = std::clamp(confidence, 0.0, 100.0);
    overlap.coverage_percent =
        total > 0 ? static_cast<double>(both) / static_cast<double>(total) * 100.0 : 0.0;

    return overlap;
}

// ============================================================================
// Per-rule scores
// ============================================================================

int pattern_complexity(const Rule& rule) {
    const std::string& p = rule.original;
    double complexity = std::min(static_cast<double>(p.size()) / 2.0, 30.0);

    constexpr std::string_view special = "*?[]{}()|\\^$+.";
    size_t specials = 0;
    for (char c : p) {
        if (special.find(c) != std::string_view::npos) {
            ++specials;
        }
    }
    complexity += static_cast<double>(specials) * 5.0;
    complexity += static_cast<double>(core::count_char(p, '(')) * 10.0;

    if (rule.kind == PatternKind::Regex) {
        complexity += 20.0;
    } else if (rule.kind == PatternKind::Glob) {
        complexity += 10.0;
    }

    return static_cast<int>(std::min(100.0, complexity));
}

int pattern_specificity(const Rule& rule) {
    const std::string& p = rule.original;
    int specificity = 100;

    specificity -= static_cast<int>(core::count_char(p, '*')) * 15;
    specificity -= static_cast<int>(core::count_char(p, '?')) * 10;

    if (p.size() < 5) {
        specificity -= 30;
    } else if (p.size() < 10) {
        specificity -= 15;
    }

    if (rule.kind == PatternKind::Literal) {
        specificity += 20;
    }

    return std::clamp(specificity, 0, 100);
}

std::vector<PatternWeakness> detect_weaknesses(const Rule& rule) {
    std::vector<PatternWeakness> weaknesses;
    const std::string& p = rule.original;

    if (p == "*" || p == "**" || p == ".*") {
        weaknesses.push_back({WeaknessType::TooBroad, Severity::Critical,
                              "Pattern matches everything, providing no security benefit",
                              {"any/path", "malicious.exe", "../../etc/passwd"},
                              "Use more specific patterns that match only intended resources"});
    }

    if (p.find("..") != std::string::npos || p.starts_with('.')) {
        weaknesses.push_back({WeaknessType::TraversalRisk, Severity::High,
                              "Pattern may be vulnerable to path traversal attacks",
                              {"../../../etc/passwd", "..\\..\\..\\windows\\system32",
                               "%2e%2e%2f%2e%2e%2f"},
                              "Use absolute paths or validate against path traversal"});
    }

    if (p.find('/') == std::string::npos && p.find('*') != std::string::npos) {
        weaknesses.push_back({WeaknessType::EncodingVulnerable, Severity::Medium,
                              "Pattern may be bypassed with encoding techniques",
                              {pattern::url::encode_component(p), core::replace_all(p, "/", "%2F")},
                              "Include path separators or use more specific patterns"});
    }

    size_t alnum = static_cast<size_t>(std::count_if(
        p.begin(), p.end(), [](unsigned char c) { return std::isalnum(c) != 0; }));
    if (p.size() < 3 || alnum < 2) {
        weaknesses.push_back({WeaknessType::TooVague, Severity::Medium,
                              "Pattern is too vague and may match unintended inputs",
                              {"a", "1", "-"},
                              "Add more specific characters to the pattern"});
    }

    if (rule.is_deny() && rule.kind == PatternKind::Glob) {
        bool anchored = p.starts_with('/') || p.ends_with('$');
        if (!anchored) {
            weaknesses.push_back({WeaknessType::EscapeProne, Severity::High,
                                  "Pattern lacks anchors and may be bypassed",
                                  {"prefix" + p, p + "suffix", "../bypass/" + p},
                                  "Add path anchors or use regex with ^ and $ anchors"});
        }
    }

    return weaknesses;
}

std::string pattern_signature(const Rule& rule) {
    const std::string& p = rule.original;
    std::string signature(pattern::to_string(rule.kind));
    signature += ':';

    if (p.find('/') != std::string::npos) {
        signature += "path:";
    }
    if (p.find('*') != std::string::npos) {
        signature += "wildcard:";
    }

    size_t dot = p.rfind('.');
    if (dot != std::string::npos) {
        std::string_view extension = std::string_view(p).substr(dot + 1);
        if (extension.size() <= 4) {
            signature += "ext:";
            signature += extension;
            signature += ':';
        }
    }

    if (p.size() < 5) {
        signature += "short";
    } else if (p.size() < 20) {
        signature += "medium";
    } else {
        signature += "long";
    }

    return signature;
}

int estimate_coverage(const Rule& rule) {
    if (rule.kind == PatternKind::Literal) {
        return 1;
    }

    const std::string& p = rule.original;
    if (p == "*" || p == "**") {
        return 100;
    }

    int coverage = 10;
    coverage += static_cast<int>(core::count_char(p, '*')) * 20;
    coverage += static_cast<int>(core::count_char(p, '?')) * 5;
    return std::min(100, coverage);
}

PerformanceImpact assess_performance_impact(const Rule& rule) {
    int complexity = pattern_complexity(rule);
    if (complexity > 70) {
        return PerformanceImpact::High;
    }
    if (complexity > 40) {
        return PerformanceImpact::Medium;
    }
    if (complexity > 20) {
        return PerformanceImpact::Low;
    }
    return PerformanceImpact::Negligible;
}

std::vector<std::string> attack_vectors(std::string_view pattern) {
    std::vector<std::string> vectors;
    std::string p(pattern);

    if (!pattern.starts_with('/')) {
        vectors.push_back("Path traversal: ../../../" + p);
    }

    std::string encoded = pattern::url::encode_component(pattern);
    vectors.push_back("URL encoding: " + encoded);
    vectors.push_back("Double encoding: " + pattern::url::encode_component(encoded));
    vectors.push_back("Null byte: " + p + "%00.safe");

    if (p.find(".sh") != std::string::npos || p.find(".exe") != std::string::npos ||
        p.find(".bat") != std::string::npos) {
        vectors.push_back("Command injection: " + p + " && malicious-command");
    }

    return vectors;
}

std::string make_more_specific(std::string_view pattern) {
    std::string p(pattern);

    if (p == "*") {
        return "*.js";
    }
    if (p == "**") {
        return "src/**";
    }
    if (p.starts_with('*')) {
        return "specific/" + p;
    }
    if (p.ends_with('*')) {
        return p.substr(0, p.size() - 1) + ".js";
    }
    if (p.find('/') == std::string::npos) {
        return "src/" + p;
    }
    return p;
}

// ============================================================================
// PatternAnalyzer
// ============================================================================

PatternAnalyzer::PatternAnalyzer(std::shared_ptr<const OverlapEstimator> estimator)
    : estimator_(estimator ? std::move(estimator)
                           : std::make_shared<const SampledOverlapEstimator>()) {}

PatternAnalysis PatternAnalyzer::analyze(const Rule& rule) const {
    PatternAnalysis analysis;
    analysis.complexity = pattern_complexity(rule);
    analysis.specificity = pattern_specificity(rule);
    analysis.weaknesses = detect_weaknesses(rule);
    analysis.signature = pattern_signature(rule);
    analysis.coverage = estimate_coverage(rule);
    analysis.performance_impact = assess_performance_impact(rule);
    return analysis;
}

bool PatternAnalyzer::is_contradictory(const Rule& a, const Rule& b, const Overlap& overlap) {
    if (a.category == b.category) {
        return false;
    }
    return overlap.kind != OverlapKind::None && overlap.kind != OverlapKind::Partial &&
           overlap.confidence > 70.0;
}

bool PatternAnalyzer::are_contradictory(const Rule& a, const Rule& b) const {
    if (a.category == b.category) {
        return false;
    }
    return is_contradictory(a, b, analyze_overlap(a, b));
}

}  // namespace bastion::validation
