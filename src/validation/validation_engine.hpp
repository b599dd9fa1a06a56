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

// Bastion Validation - Engine
// Orchestrates normalization, rule checks, conflict detection, security
// analysis and suggestion generation behind a result cache

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../control/config.hpp"
#include "../core/worker_pool.hpp"
#include "../pattern/pattern_engine.hpp"
#include "conflict_detector.hpp"
#include "pattern_analyzer.hpp"
#include "resolution.hpp"
#include "rules.hpp"
#include "types.hpp"
#include "validation_cache.hpp"

namespace bastion::validation {

struct ValidationOptions {
    bool strict_mode = false;  // InvalidPattern warnings become errors, deadline expiry is fatal
    bool skip_conflict_detection = false;  // zero-bypass detection still runs
    bool skip_cache = false;
    std::optional<uint64_t> timeout_ms;  // hard deadline for the optional phases
    bool parallel = true;
    size_t worker_count = 0;  // 0 = engine default
    std::vector<std::string> custom_patterns;  // extra high-risk tokens
    bool deep_analysis = false;  // report per-rule weaknesses as conflicts

    /// Set by the caller to abandon the run. Checked at phase boundaries and
    /// inside the overlap loops; the zero-bypass pass still completes.
    const std::atomic<bool>* cancel = nullptr;
};

enum class ValidationPhase : uint8_t {
    Initializing,
    Parsing,
    Normalizing,
    Validating,
    DetectingConflicts,
    GeneratingSuggestions,
    Complete
};

[[nodiscard]] std::string_view to_string(ValidationPhase phase) noexcept;

/// Progress snapshot (observability only)
struct ValidationState {
    ValidationPhase phase = ValidationPhase::Initializing;
    int progress = 0;  // percent
    std::string operation;
};

struct BatchResult {
    std::string id;
    std::vector<ValidationResult> results;  // same order as the input
    double total_ms = 0.0;
    size_t success_count = 0;
    size_t failure_count = 0;
};

struct RuleStatistics {
    size_t total_rules = 0;

    struct {
        size_t deny = 0;
        size_t allow = 0;
        size_t ask = 0;
    } by_category;

    struct {
        double average_pattern_length = 0.0;
        size_t max_pattern_length = 0;
        size_t regex_count = 0;
        size_t glob_count = 0;
        size_t literal_count = 0;
    } complexity;

    struct {
        int estimated_coverage = 0;                   // min(100, 10 per deny + 5 per allow)
        std::vector<std::string> uncovered_patterns;  // high-risk tokens no deny rule matches
        std::vector<std::string> redundant_rules;     // "category:pattern" duplicates
    } coverage;
};

void to_json(nlohmann::json& j, const BatchResult& batch);
void to_json(nlohmann::json& j, const RuleStatistics& stats);

class ValidationEngine {
public:
    explicit ValidationEngine(control::EngineConfig config = {});
    ~ValidationEngine();

    ValidationEngine(const ValidationEngine&) = delete;
    ValidationEngine& operator=(const ValidationEngine&) = delete;

    /// Validate one configuration document. Never throws: every failure is
    /// reported inside the returned result.
    [[nodiscard]] ValidationResult validate(const nlohmann::json& config,
                                            const ValidationOptions& options = {});

    /// Validate independent documents concurrently, at most worker_count at a time
    [[nodiscard]] BatchResult validate_batch(std::string id, const std::vector<nlohmann::json>& configs,
                                             const ValidationOptions& options = {});

    /// Counts and coverage; bypasses the result cache
    [[nodiscard]] RuleStatistics get_rule_statistics(const nlohmann::json& config);

    /// Validate and cache every configuration not already cached; returns how many ran
    size_t warm_cache(const std::vector<nlohmann::json>& configs);

    [[nodiscard]] std::string export_cache() const;
    bool import_cache(std::string_view data, std::string& error_message);
    [[nodiscard]] CacheStats cache_stats() const;
    void clear_cache();

    [[nodiscard]] ValidationState state() const;
    [[nodiscard]] const control::EngineConfig& config() const noexcept { return config_; }

private:
    using Clock = std::chrono::steady_clock;

    /// Deadline and cancellation probe shared by every phase of one run
    class RunControl {
    public:
        RunControl(const ValidationOptions& options, Clock::time_point start);

        [[nodiscard]] bool cancelled() const noexcept;
        [[nodiscard]] bool expired() const noexcept;
        [[nodiscard]] bool should_stop() const noexcept { return cancelled() || expired(); }

    private:
        const std::atomic<bool>* cancel_;
        std::optional<Clock::time_point> deadline_;
    };

    [[nodiscard]] ValidationResult run(const nlohmann::json& config, const ValidationOptions& options,
                                       Clock::time_point start);

    void validate_rules(const std::vector<Rule>& rules, const ValidationOptions& options,
                        ValidationResult& result) const;

    [[nodiscard]] SecurityAnalysis analyze_security(const std::vector<Rule>& rules,
                                                    ValidationResult& result) const;

    [[nodiscard]] std::vector<ResolutionSuggestion> generate_suggestions(
        const std::vector<Rule>& rules, const ValidationResult& result,
        const SecurityAnalysis& security);

    [[nodiscard]] std::vector<std::string> risk_tokens(const ValidationOptions& options) const;
    [[nodiscard]] bool strict_timeout(const ValidationOptions& options) const noexcept;
    [[nodiscard]] static std::string cache_key(const std::string& hash, const ValidationOptions& options);

    void update_state(ValidationPhase phase, int progress, std::string operation);

    control::EngineConfig config_;
    pattern::PatternEngine patterns_;
    std::shared_ptr<const PatternAnalyzer> analyzer_;
    std::unique_ptr<core::WorkerPool> pool_;
    ConflictDetector detector_;
    ResolutionEngine resolver_;
    ValidationCache cache_;

    mutable std::mutex state_mutex_;
    ValidationState state_;
};

}  // namespace bastion::validation
