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

// Bastion Validation - Conflict Detection Engine
// Five ordered passes over a normalized rule list: zero-bypass violations,
// precedence ambiguity, overlapping patterns, contradictory rules and
// (optionally) per-rule security weaknesses.

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../core/containers.hpp"
#include "../core/worker_pool.hpp"
#include "pattern_analyzer.hpp"
#include "types.hpp"

namespace bastion::validation {

/// Rule counts above this shard the pairwise overlap pass across the worker pool
inline constexpr size_t PARALLEL_THRESHOLD = 100;

/// Upper bound on cached detection results
inline constexpr size_t DETECTION_CACHE_CAPACITY = 256;

struct DetectionOptions {
    /// Run only the zero-bypass pass
    bool zero_bypass_only = false;

    /// Surface per-rule weaknesses as SecurityViolation conflicts
    bool deep_analysis = true;

    bool parallel = true;
    size_t worker_count = 0;  // 0 = every pool worker

    /// Polled between overlap computations; returning true abandons the optional
    /// passes. Must be safe to call from several threads. The zero-bypass pass
    /// never consults it.
    std::function<bool()> should_stop;
};

struct DetectionResult {
    std::vector<Conflict> conflicts;  // deduplicated, Critical first
    size_t pairs_analyzed = 0;
    size_t overlaps_found = 0;
    double elapsed_ms = 0.0;
    bool truncated = false;  // should_stop fired; only zero-bypass results are complete
    bool from_cache = false;
};

/// One way of resolving a conflict, with the concrete changes it implies
struct ResolutionOption {
    ResolutionStrategy strategy = ResolutionStrategy::ManualReviewRequired;
    std::string description;
    RiskLevel risk = RiskLevel::Safe;
    bool automated = false;
    std::vector<Change> changes;
    std::string expected_outcome;
    std::vector<std::string> side_effects;
};

struct ConflictAnalysis {
    Conflict conflict;
    Severity severity = Severity::Low;
    std::vector<std::string> attack_vectors;
    std::vector<ResolutionOption> options;
    int confidence = 100;
    PerformanceImpact performance_impact = PerformanceImpact::Negligible;
    std::vector<std::string> related_conflicts;  // dedup keys of conflicts sharing a pattern
};

class ConflictDetector {
public:
    /// analyzer nullptr selects the sampled estimator; pool nullptr disables sharding
    explicit ConflictDetector(std::shared_ptr<const PatternAnalyzer> analyzer = nullptr,
                              core::WorkerPool* pool = nullptr);

    ConflictDetector(const ConflictDetector&) = delete;
    ConflictDetector& operator=(const ConflictDetector&) = delete;

    /// Run the detection passes over rules. Thread-safe.
    [[nodiscard]] DetectionResult detect(const std::vector<Rule>& rules,
                                         const DetectionOptions& options = {});

    /// Attack vectors, resolution options and related conflicts for one conflict
    [[nodiscard]] ConflictAnalysis analyze_conflict(const Conflict& conflict,
                                                    const std::vector<Conflict>& all) const;

    void clear_cache();
    [[nodiscard]] size_t cache_size() const;

    [[nodiscard]] const PatternAnalyzer& analyzer() const noexcept { return *analyzer_; }

private:
    struct PairOverlap {
        size_t i = 0;
        size_t j = 0;
        Overlap overlap;
    };

    struct PairScan {
        std::vector<PairOverlap> overlaps;
        size_t pairs = 0;
        bool truncated = false;
    };

    using PairFilter = bool (*)(const Rule&, const Rule&);

    [[nodiscard]] PairScan scan_pairs(const std::vector<Rule>& rules, PairFilter filter,
                                      const std::function<bool()>* should_stop,
                                      const DetectionOptions& options) const;

    [[nodiscard]] PairScan scan_shard(const std::vector<Rule>& rules, PairFilter filter,
                                      const std::function<bool()>* should_stop, size_t shard,
                                      size_t shard_count) const;

    [[nodiscard]] static std::string cache_key(const std::vector<Rule>& rules,
                                               const DetectionOptions& options);

    std::shared_ptr<const PatternAnalyzer> analyzer_;
    core::WorkerPool* pool_;

    mutable std::mutex cache_mutex_;
    core::fast_map<std::string, DetectionResult> cache_;
};

/// Drop later conflicts whose dedup key was already seen (first occurrence wins)
[[nodiscard]] std::vector<Conflict> deduplicate_conflicts(std::vector<Conflict> conflicts);

/// Stable sort, Critical first
void sort_by_severity(std::vector<Conflict>& conflicts);

[[nodiscard]] ConflictingRule to_conflicting_rule(const Rule& rule);

}  // namespace bastion::validation
