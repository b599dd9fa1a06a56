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

// Bastion Validation - Resolution Engine
// Maps conflicts to security-level-aware suggestions and applies auto-fixes

#pragma once

#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"
#include "../pattern/pattern_engine.hpp"
#include "conflict_detector.hpp"
#include "pattern_analyzer.hpp"
#include "types.hpp"

namespace bastion::validation {

/// Cap on suggestions returned in permissive mode (critical ones are always kept)
inline constexpr size_t PERMISSIVE_SUGGESTION_LIMIT = 10;

/// Suggestion cache entries kept before the cache is flushed
inline constexpr size_t RESOLUTION_CACHE_CAPACITY = 256;

/// Audit record for one change applied to a configuration
struct AppliedChange {
    std::string action;  // add, remove, modify, reorder
    Category category = Category::Allow;
    std::optional<std::string> original_value;
    std::optional<std::string> new_value;
    std::optional<size_t> position;
    std::string reason;
    RiskLevel risk = RiskLevel::Safe;
};

struct ApplyResult {
    bool success = false;  // true when no conflicts remain
    nlohmann::json resolved_config;
    std::vector<AppliedChange> changes;
    std::vector<std::string> messages;
    std::vector<Conflict> remaining_conflicts;
};

void to_json(nlohmann::json& j, const AppliedChange& change);
void to_json(nlohmann::json& j, const ApplyResult& result);

// Pattern scores used when choosing and vetting fixes

/// Higher means narrower: wildcards subtract, path depth and length add
[[nodiscard]] int removal_specificity(std::string_view pattern);

/// 0-100; literal patterns, length and path depth raise it, wildcards lower it
[[nodiscard]] int security_score(std::string_view pattern);

/// Narrowed allow/ask pattern used when no template applies
[[nodiscard]] std::string make_more_restrictive(std::string_view pattern);

/// Narrowed deny pattern (advisory only)
[[nodiscard]] std::string make_deny_more_specific(std::string_view pattern);

class ResolutionEngine {
public:
    ResolutionEngine(SecurityLevel level, pattern::PatternEngine& engine,
                     std::shared_ptr<const PatternAnalyzer> analyzer = nullptr);

    ResolutionEngine(const ResolutionEngine&) = delete;
    ResolutionEngine& operator=(const ResolutionEngine&) = delete;

    /// Preferred strategy first, then each fallback in order. nullopt when every
    /// strategy fails. Thread-safe.
    [[nodiscard]] std::optional<ResolutionSuggestion> resolve_conflict(const Conflict& conflict);

    /// One suggestion per resolvable conflict, optimized
    [[nodiscard]] std::vector<ResolutionSuggestion> resolve_all(const std::vector<Conflict>& conflicts);

    /// Deduplicate by (category, pattern), order fix < warning < optimization and, in
    /// permissive mode, cap the list keeping every critical suggestion
    [[nodiscard]] std::vector<ResolutionSuggestion> optimize(
        std::vector<ResolutionSuggestion> suggestions) const;

    /// Apply every auto-fix to a copy of config and re-run detection on the result.
    /// Removing or modifying a deny rule is refused.
    [[nodiscard]] ApplyResult apply_resolutions(const nlohmann::json& config,
                                                const std::vector<ResolutionSuggestion>& suggestions);

    void set_security_level(SecurityLevel level);
    [[nodiscard]] SecurityLevel security_level() const;

    void clear_cache();
    [[nodiscard]] size_t cache_size() const;

private:
    struct StrategyPlan {
        ResolutionStrategy preferred;
        std::vector<ResolutionStrategy> fallbacks;
    };

    [[nodiscard]] static StrategyPlan plan_for(ConflictKind kind, SecurityLevel level);

    [[nodiscard]] std::optional<ResolutionSuggestion> apply_strategy(const Conflict& conflict,
                                                                     ResolutionStrategy strategy,
                                                                     SecurityLevel level);

    [[nodiscard]] std::optional<ResolutionSuggestion> removal(const Conflict& conflict,
                                                              SecurityLevel level) const;
    [[nodiscard]] std::optional<ResolutionSuggestion> restriction(const Conflict& conflict);
    [[nodiscard]] std::optional<ResolutionSuggestion> deny_specific(const Conflict& conflict,
                                                                    SecurityLevel level) const;
    [[nodiscard]] static ResolutionSuggestion manual_review(const Conflict& conflict);

    /// True when candidate no longer overlaps opposing
    [[nodiscard]] bool verify(std::string_view candidate, Category candidate_category,
                              const ConflictingRule& opposing);

    [[nodiscard]] static std::string cache_key(const Conflict& conflict, SecurityLevel level);

    pattern::PatternEngine& engine_;
    std::shared_ptr<const PatternAnalyzer> analyzer_;
    ConflictDetector detector_;

    mutable std::mutex mutex_;
    SecurityLevel level_;
    core::fast_map<std::string, ResolutionSuggestion> cache_;
};

}  // namespace bastion::validation
