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

#include "conflict_detector.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <future>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace bastion::validation {

namespace {

// Stop probe is polled once per this many pairs
constexpr size_t STOP_CHECK_INTERVAL = 64;

bool crosses_deny_boundary(const Rule& a, const Rule& b) {
    return a.is_deny() != b.is_deny();
}

bool within_deny_boundary(const Rule& a, const Rule& b) {
    return a.is_deny() == b.is_deny();
}

uint64_t pair_key(size_t i, size_t j, size_t n) {
    return static_cast<uint64_t>(i) * static_cast<uint64_t>(n) + static_cast<uint64_t>(j);
}

std::string_view describe(OverlapKind kind) {
    switch (kind) {
        case OverlapKind::Exact:
            return "exactly matches";
        case OverlapKind::Subset:
            return "is a subset of";
        case OverlapKind::Superset:
            return "is a superset of";
        case OverlapKind::Partial:
            return "partially overlaps with";
        case OverlapKind::None:
            break;
    }
    return "overlaps with";
}

std::vector<std::string> first_examples(const Overlap& overlap, size_t count) {
    std::vector<std::string> examples;
    for (size_t i = 0; i < overlap.examples.size() && i < count; ++i) {
        examples.push_back(overlap.examples[i]);
    }
    return examples;
}

ResolutionStrategy zero_bypass_resolution(OverlapKind kind) {
    switch (kind) {
        case OverlapKind::Exact:
            return ResolutionStrategy::RemoveConflictingRule;
        case OverlapKind::Superset:
            return ResolutionStrategy::MakeAllowMoreRestrictive;
        case OverlapKind::Subset:
            return ResolutionStrategy::MakeDenyMoreSpecific;
        default:
            return ResolutionStrategy::ManualReviewRequired;
    }
}

// view: rule_a is the allow/ask rule, rule_b the deny rule
Conflict zero_bypass_conflict(const Overlap& view) {
    const Rule& other = *view.rule_a;
    const Rule& deny = *view.rule_b;

    Conflict conflict;
    conflict.kind = ConflictKind::AllowOverridesDeny;
    conflict.message = fmt::format(
        "CRITICAL SECURITY VIOLATION: {} rule \"{}\" {} deny rule \"{}\". This creates a potential "
        "bypass vector where denied operations could be permitted. Examples of affected "
        "patterns: {}",
        to_string(other.category),
        other.original, describe(view.kind), deny.original,
        core::join(first_examples(view, 3), ", "));
    conflict.rules = {to_conflicting_rule(deny), to_conflicting_rule(other)};
    conflict.resolution = zero_bypass_resolution(view.kind);
    conflict.impact = other.category == Category::Allow ? Severity::Critical : Severity::High;
    conflict.overlap = view.kind;
    return conflict;
}

ConflictKind overlap_conflict_kind(const Rule& a, const Rule& b, OverlapKind kind) {
    if (a.category != b.category) {
        return (a.is_deny() || b.is_deny()) ? ConflictKind::AllowOverridesDeny
                                            : ConflictKind::ContradictoryRules;
    }
    return kind == OverlapKind::Exact ? ConflictKind::OverlappingPatterns
                                      : ConflictKind::PrecedenceAmbiguity;
}

Severity overlap_impact(const Rule& a, const Rule& b, OverlapKind kind) {
    if (a.is_deny() != b.is_deny()) {
        return Severity::Critical;
    }
    if (a.category != b.category && kind != OverlapKind::Partial) {
        return Severity::High;
    }
    if (kind == OverlapKind::Exact || kind == OverlapKind::Subset ||
        kind == OverlapKind::Superset) {
        return Severity::Medium;
    }
    return Severity::Low;
}

ResolutionStrategy overlap_resolution(const Rule& a, const Rule& b, OverlapKind kind) {
    if (kind == OverlapKind::Exact && a.category == b.category) {
        return ResolutionStrategy::RemoveConflictingRule;
    }
    if (a.is_deny() || b.is_deny()) {
        return ResolutionStrategy::MakeAllowMoreRestrictive;
    }
    return ResolutionStrategy::ManualReviewRequired;
}

bool is_significant(const Rule& a, const Rule& b, OverlapKind kind) {
    if (a.category != b.category) {
        return true;
    }
    if (kind == OverlapKind::Exact) {
        return true;
    }
    return (kind == OverlapKind::Subset || kind == OverlapKind::Superset) &&
           (a.is_deny() || b.is_deny());
}

Conflict overlap_conflict(const Overlap& overlap) {
    const Rule& a = *overlap.rule_a;
    const Rule& b = *overlap.rule_b;

    Conflict conflict;
    conflict.kind = overlap_conflict_kind(a, b, overlap.kind);
    conflict.message = fmt::format("{} rule \"{}\" {} {} rule \"{}\". {}", to_string(a.category),
                                   a.original, describe(overlap.kind), to_string(b.category),
                                   b.original,
                                   a.category == b.category
                                       ? "This creates redundancy or ambiguity in rule evaluation."
                                       : "This creates conflicting security policies.");
    conflict.rules = {to_conflicting_rule(a), to_conflicting_rule(b)};
    conflict.resolution = overlap_resolution(a, b, overlap.kind);
    conflict.impact = overlap_impact(a, b, overlap.kind);
    conflict.overlap = overlap.kind;
    return conflict;
}

Conflict contradiction_conflict(const Overlap& overlap) {
    const Rule& a = *overlap.rule_a;
    const Rule& b = *overlap.rule_b;

    Conflict conflict;
    conflict.kind = ConflictKind::ContradictoryRules;
    conflict.message =
        fmt::format("Rules \"{}\" and \"{}\" have contradictory intents", a.original, b.original);
    conflict.rules = {to_conflicting_rule(a), to_conflicting_rule(b)};
    conflict.resolution = ResolutionStrategy::ManualReviewRequired;
    if (a.is_deny() || b.is_deny()) {
        conflict.impact = Severity::High;
    } else if (a.category != b.category) {
        conflict.impact = Severity::Medium;
    } else {
        conflict.impact = Severity::Low;
    }
    conflict.overlap = overlap.kind;
    return conflict;
}

double elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
        .count();
}

}  // namespace

ConflictingRule to_conflicting_rule(const Rule& rule) {
    return ConflictingRule{rule.category, rule.original, rule.location()};
}

std::vector<Conflict> deduplicate_conflicts(std::vector<Conflict> conflicts) {
    core::fast_set<std::string> seen;
    std::vector<Conflict> unique;
    unique.reserve(conflicts.size());

    for (auto& conflict : conflicts) {
        if (seen.insert(conflict.dedup_key()).second) {
            unique.push_back(std::move(conflict));
        }
    }
    return unique;
}

void sort_by_severity(std::vector<Conflict>& conflicts) {
    std::stable_sort(conflicts.begin(), conflicts.end(),
                     [](const Conflict& a, const Conflict& b) { return a.impact < b.impact; });
}

// ============================================================================
// ConflictDetector
// ============================================================================

ConflictDetector::ConflictDetector(std::shared_ptr<const PatternAnalyzer> analyzer,
                                   core::WorkerPool* pool)
    : analyzer_(analyzer ? std::move(analyzer) : std::make_shared<const PatternAnalyzer>()),
      pool_(pool) {}

std::string ConflictDetector::cache_key(const std::vector<Rule>& rules,
                                        const DetectionOptions& options) {
    // Locations are part of the output, so the index travels with each pattern
    std::vector<std::string> entries;
    entries.reserve(rules.size());
    for (const auto& rule : rules) {
        entries.push_back(fmt::format("{}[{}]:{}", to_string(rule.category), rule.index,
                                      rule.original));
    }
    std::sort(entries.begin(), entries.end());

    return fmt::format("conflicts:{}{}:{}", options.zero_bypass_only ? 'z' : 'f',
                       options.deep_analysis ? 'd' : 's', core::join(entries, ","));
}

ConflictDetector::PairScan ConflictDetector::scan_shard(const std::vector<Rule>& rules,
                                                        PairFilter filter,
                                                        const std::function<bool()>* should_stop,
                                                        size_t shard, size_t shard_count) const {
    PairScan scan;
    const size_t n = rules.size();

    // Interleaved rows keep the triangular workload balanced across shards
    for (size_t i = shard; i < n; i += shard_count) {
        for (size_t j = i + 1; j < n; ++j) {
            if (!filter(rules[i], rules[j])) {
                continue;
            }

            if (should_stop && *should_stop && scan.pairs % STOP_CHECK_INTERVAL == 0 &&
                (*should_stop)()) {
                scan.truncated = true;
                return scan;
            }

            ++scan.pairs;
            Overlap overlap = analyzer_->analyze_overlap(rules[i], rules[j]);
            if (overlap.kind != OverlapKind::None) {
                scan.overlaps.push_back(PairOverlap{i, j, std::move(overlap)});
            }
        }
    }
    return scan;
}

ConflictDetector::PairScan ConflictDetector::scan_pairs(const std::vector<Rule>& rules,
                                                        PairFilter filter,
                                                        const std::function<bool()>* should_stop,
                                                        const DetectionOptions& options) const {
    size_t shard_count = 1;
    if (options.parallel && pool_ && rules.size() > PARALLEL_THRESHOLD) {
        shard_count = pool_->size();
        if (options.worker_count > 0) {
            shard_count = std::min(shard_count, options.worker_count);
        }
    }

    if (shard_count <= 1) {
        return scan_shard(rules, filter, should_stop, 0, 1);
    }

    std::vector<std::future<PairScan>> futures;
    futures.reserve(shard_count);
    for (size_t shard = 0; shard < shard_count; ++shard) {
        futures.push_back(pool_->submit([this, &rules, filter, should_stop, shard, shard_count]() {
            return scan_shard(rules, filter, should_stop, shard, shard_count);
        }));
    }

    // Wait for every shard before touching results so no task outlives `rules`
    std::vector<PairScan> shards;
    shards.reserve(shard_count);
    for (auto& future : futures) {
        future.wait();
    }
    for (auto& future : futures) {
        shards.push_back(future.get());
    }

    PairScan merged;
    for (auto& shard : shards) {
        merged.pairs += shard.pairs;
        merged.truncated = merged.truncated || shard.truncated;
        merged.overlaps.insert(merged.overlaps.end(), std::make_move_iterator(shard.overlaps.begin()),
                               std::make_move_iterator(shard.overlaps.end()));
    }

    // Deterministic order regardless of shard interleaving
    std::sort(merged.overlaps.begin(), merged.overlaps.end(),
              [](const PairOverlap& a, const PairOverlap& b) {
                  return a.i != b.i ? a.i < b.i : a.j < b.j;
              });
    return merged;
}

DetectionResult ConflictDetector::detect(const std::vector<Rule>& rules,
                                         const DetectionOptions& options) {
    const auto start = std::chrono::steady_clock::now();
    const std::string key = cache_key(rules, options);

    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            DetectionResult cached = it->second;
            cached.from_cache = true;
            cached.elapsed_ms = elapsed_since(start);
            return cached;
        }
    }

    DetectionResult result;
    std::vector<Conflict> conflicts;
    const size_t n = rules.size();

    // Pass 1: zero-bypass violations. Always complete, never interrupted.
    PairScan bypass = scan_pairs(rules, &crosses_deny_boundary, nullptr, options);
    result.pairs_analyzed += bypass.pairs;
    result.overlaps_found += bypass.overlaps.size();

    core::fast_set<uint64_t> reported;
    for (const auto& pair : bypass.overlaps) {
        // Orient as (allow/ask rule, deny rule)
        Overlap view = rules[pair.i].is_deny() ? pair.overlap.flipped() : pair.overlap;
        conflicts.push_back(zero_bypass_conflict(view));
        reported.insert(pair_key(pair.i, pair.j, n));
    }

    if (auto* logger = logging::get_current_logger(); logger && !bypass.overlaps.empty()) {
        LOG_WARNING(logger, "Zero-bypass violations detected: count={}, rules={}",
                    bypass.overlaps.size(), n);
    }

    if (!options.zero_bypass_only) {
        PairScan rest = scan_pairs(rules, &within_deny_boundary, &options.should_stop, options);
        result.pairs_analyzed += rest.pairs;
        result.overlaps_found += rest.overlaps.size();
        result.truncated = rest.truncated;

        if (!result.truncated) {
            core::fast_map<uint64_t, const Overlap*> table;
            for (const auto& pair : bypass.overlaps) {
                table.emplace(pair_key(pair.i, pair.j, n), &pair.overlap);
            }
            for (const auto& pair : rest.overlaps) {
                table.emplace(pair_key(pair.i, pair.j, n), &pair.overlap);
            }

            // Pass 2: precedence ambiguity within signature groups. A group only counts
            // when two of its rules from different categories really overlap and that
            // pair is not already a zero-bypass violation.
            core::fast_map<std::string, std::vector<size_t>> groups;
            for (size_t i = 0; i < n; ++i) {
                groups[pattern_signature(rules[i])].push_back(i);
            }
            for (const auto& [signature, members] : groups) {
                bool has_deny = false;
                bool ambiguous = false;
                for (size_t x = 0; x < members.size(); ++x) {
                    has_deny = has_deny || rules[members[x]].is_deny();
                    for (size_t y = x + 1; y < members.size() && !ambiguous; ++y) {
                        size_t i = members[x];
                        size_t j = members[y];
                        if (rules[i].category == rules[j].category) {
                            continue;
                        }
                        uint64_t k = pair_key(i, j, n);
                        ambiguous = table.contains(k) && !reported.contains(k);
                    }
                }
                if (!ambiguous) {
                    continue;
                }

                Conflict conflict;
                conflict.kind = ConflictKind::PrecedenceAmbiguity;
                std::vector<std::string> patterns;
                for (size_t idx : members) {
                    patterns.push_back(rules[idx].original);
                    conflict.rules.push_back(to_conflicting_rule(rules[idx]));
                }
                conflict.message = fmt::format("Ambiguous precedence for pattern group: {}",
                                               core::join(patterns, ", "));
                conflict.resolution = ResolutionStrategy::MakeDenyMoreSpecific;
                conflict.impact = has_deny ? Severity::High : Severity::Medium;
                conflicts.push_back(std::move(conflict));
            }

            // Pass 3: significant pairwise overlaps
            std::vector<const PairOverlap*> ordered;
            ordered.reserve(bypass.overlaps.size() + rest.overlaps.size());
            for (const auto& pair : bypass.overlaps) {
                ordered.push_back(&pair);
            }
            for (const auto& pair : rest.overlaps) {
                ordered.push_back(&pair);
            }
            std::sort(ordered.begin(), ordered.end(), [](const PairOverlap* a, const PairOverlap* b) {
                return a->i != b->i ? a->i < b->i : a->j < b->j;
            });

            for (const PairOverlap* pair : ordered) {
                if (reported.contains(pair_key(pair->i, pair->j, n))) {
                    continue;
                }
                if (is_significant(rules[pair->i], rules[pair->j], pair->overlap.kind)) {
                    conflicts.push_back(overlap_conflict(pair->overlap));
                }
            }

            // Pass 4: contradictory intents across categories
            for (const auto& pair : rest.overlaps) {
                const Rule& a = rules[pair.i];
                const Rule& b = rules[pair.j];
                if (PatternAnalyzer::is_contradictory(a, b, pair.overlap)) {
                    conflicts.push_back(contradiction_conflict(pair.overlap));
                }
            }

            // Pass 5: intrinsic weaknesses
            if (options.deep_analysis) {
                for (const auto& rule : rules) {
                    for (const auto& weakness : detect_weaknesses(rule)) {
                        Conflict conflict;
                        conflict.kind = ConflictKind::SecurityViolation;
                        conflict.message = fmt::format("{} rule \"{}\": {} ({})",
                                                       to_string(rule.category), rule.original,
                                                       weakness.description,
                                                       to_string(weakness.type));
                        conflict.rules = {to_conflicting_rule(rule)};
                        conflict.resolution = ResolutionStrategy::ManualReviewRequired;
                        conflict.impact = weakness.severity;
                        conflicts.push_back(std::move(conflict));
                    }
                }
            }
        }
    }

    result.conflicts = deduplicate_conflicts(std::move(conflicts));
    sort_by_severity(result.conflicts);
    result.elapsed_ms = elapsed_since(start);

    if (!result.truncated) {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        if (cache_.size() >= DETECTION_CACHE_CAPACITY) {
            cache_.clear();
        }
        cache_.emplace(key, result);
    }

    return result;
}

ConflictAnalysis ConflictDetector::analyze_conflict(const Conflict& conflict,
                                                    const std::vector<Conflict>& all) const {
    ConflictAnalysis analysis;
    analysis.conflict = conflict;
    analysis.severity = conflict.impact;

    // Attack vectors
    std::vector<std::string> vectors;
    if (conflict.kind == ConflictKind::AllowOverridesDeny) {
        vectors.push_back("Direct bypass of security policy through permissive rules");
        vectors.push_back("Privilege escalation through rule precedence exploitation");
        vectors.push_back("Path traversal attacks using pattern weaknesses");
    }
    if (conflict.kind == ConflictKind::PrecedenceAmbiguity) {
        vectors.push_back("Race condition exploitation in rule evaluation");
        vectors.push_back("Context manipulation to trigger favorable rule");
    }
    for (const auto& rule : conflict.rules) {
        auto pattern_vectors = attack_vectors(rule.pattern);
        vectors.insert(vectors.end(), pattern_vectors.begin(), pattern_vectors.end());
    }
    core::fast_set<std::string> seen;
    for (auto& v : vectors) {
        if (seen.insert(v).second) {
            analysis.attack_vectors.push_back(std::move(v));
        }
    }

    // Resolution options
    analysis.options.push_back({ResolutionStrategy::ManualReviewRequired,
                                "Manually review and resolve the conflict",
                                RiskLevel::Safe,
                                false,
                                {},
                                "Conflict resolved through human expertise",
                                {"Requires manual intervention"}});

    const ConflictingRule* weaker = nullptr;
    for (const auto& rule : conflict.rules) {
        if (rule.category != Category::Deny) {
            weaker = &rule;
            break;
        }
    }

    if (conflict.kind == ConflictKind::AllowOverridesDeny && weaker) {
        analysis.options.push_back(
            {ResolutionStrategy::RemoveConflictingRule,
             fmt::format("Remove the {} rule that conflicts with deny", to_string(weaker->category)),
             RiskLevel::Safe,
             true,
             {RemoveRule{weaker->category, weaker->pattern,
                         "Eliminates zero-bypass security violation"}},
             "Deny rule will be strictly enforced without bypass",
             {"Some legitimate operations may be blocked"}});
        analysis.options.push_back(
            {ResolutionStrategy::MakeAllowMoreRestrictive,
             "Modify the allow/ask rule to be more specific",
             RiskLevel::Moderate,
             true,
             {ModifyRule{weaker->category, weaker->pattern, make_more_specific(weaker->pattern),
                         "Reduces overlap with deny rule while preserving some functionality"}},
             "Partial functionality preserved with improved security",
             {"May require updates to dependent workflows"}});
    }

    if (conflict.kind == ConflictKind::OverlappingPatterns && conflict.rules.size() >= 2 && weaker) {
        analysis.options.push_back({ResolutionStrategy::RemoveConflictingRule,
                                    "Remove the redundant rule",
                                    RiskLevel::Safe,
                                    true,
                                    {RemoveRule{weaker->category, weaker->pattern,
                                                "Eliminates redundant pattern"}},
                                    "Single authoritative rule for the pattern",
                                    {}});
    }

    if (conflict.kind == ConflictKind::PrecedenceAmbiguity) {
        ResolutionOption reorder{ResolutionStrategy::MakeDenyMoreSpecific,
                                 "Reorder rules to clarify precedence",
                                 RiskLevel::Safe,
                                 true,
                                 {},
                                 "Clear and predictable rule precedence",
                                 {}};
        for (size_t i = 0; i < conflict.rules.size(); ++i) {
            const auto& rule = conflict.rules[i];
            reorder.changes.push_back(
                ReorderRule{rule.category, rule.pattern, i, "Clarifies rule evaluation order"});
        }
        analysis.options.push_back(std::move(reorder));
    }

    // Confidence
    int confidence = 100;
    for (const auto& rule : conflict.rules) {
        if (rule.pattern.size() > 50)
            confidence -= 10;
        if (rule.pattern.find('*') != std::string::npos)
            confidence -= 5;
        if (rule.pattern.find('?') != std::string::npos)
            confidence -= 5;
    }
    if (conflict.kind == ConflictKind::OverlappingPatterns && conflict.rules.size() >= 2 &&
        conflict.rules[0].pattern == conflict.rules[1].pattern) {
        confidence = 100;
    }
    analysis.confidence = std::clamp(confidence, 0, 100);

    if (conflict.kind == ConflictKind::OverlappingPatterns) {
        analysis.performance_impact = PerformanceImpact::Low;
    } else if (conflict.kind == ConflictKind::PrecedenceAmbiguity) {
        analysis.performance_impact = PerformanceImpact::Medium;
    } else if (conflict.impact == Severity::Critical) {
        analysis.performance_impact = PerformanceImpact::High;
    }

    // Related conflicts share at least one pattern
    const std::string own_key = conflict.dedup_key();
    for (const auto& other : all) {
        std::string other_key = other.dedup_key();
        if (other_key == own_key) {
            continue;
        }
        bool shares = std::any_of(other.rules.begin(), other.rules.end(), [&](const auto& r) {
            return std::any_of(conflict.rules.begin(), conflict.rules.end(),
                               [&](const auto& c) { return c.pattern == r.pattern; });
        });
        if (shares) {
            analysis.related_conflicts.push_back(std::move(other_key));
        }
    }

    return analysis;
}

void ConflictDetector::clear_cache() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_.clear();
}

size_t ConflictDetector::cache_size() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_.size();
}

}  // namespace bastion::validation
