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

#include "validation_engine.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <future>

#include "../core/core.hpp"
#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace bastion::validation {

namespace {

constexpr std::string_view SHELL_DENY_HINT = "Consider adding deny rules for shell execution commands";

double elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

std::string_view trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool is_bare_wildcard(std::string_view p) {
    return p == "*" || p == "**" || p == ".*";
}

// Deny patterns that encoding or path manipulation gets around easily
bool is_weak_deny(std::string_view p) {
    return p.size() < 3 || p == "." || p == ".." || p.starts_with("..") ||
           (p.find('/') == std::string_view::npos && p.find('*') != std::string_view::npos);
}

bool is_overly_permissive(std::string_view p) {
    return is_bare_wildcard(p) || p == "**/*" || (p.starts_with('*') && p.size() < 5);
}

std::string bypass_example(std::string_view p) {
    if (p.starts_with("..")) {
        return "URL encoding: %2e%2e%2f or Unicode: \\u002e\\u002e/";
    }
    if (p.find('*') != std::string_view::npos && p.find('/') == std::string_view::npos) {
        return fmt::format("Path traversal: ../{}/../../sensitive", p);
    }
    if (p.size() < 3) {
        return "Pattern too short, easily matched accidentally";
    }
    return "Various encoding or path manipulation techniques";
}

}  // namespace

std::string_view to_string(ValidationPhase phase) noexcept {
    switch (phase) {
        case ValidationPhase::Initializing:
            return "initializing";
        case ValidationPhase::Parsing:
            return "parsing";
        case ValidationPhase::Normalizing:
            return "normalizing";
        case ValidationPhase::Validating:
            return "validating";
        case ValidationPhase::DetectingConflicts:
            return "detecting-conflicts";
        case ValidationPhase::GeneratingSuggestions:
            return "generating-suggestions";
        case ValidationPhase::Complete:
            return "complete";
    }
    return "initializing";
}

void to_json(nlohmann::json& j, const BatchResult& batch) {
    j = nlohmann::json{{"id", batch.id},
                       {"results", batch.results},
                       {"totalTimeMs", batch.total_ms},
                       {"count", batch.results.size()},
                       {"successCount", batch.success_count},
                       {"failureCount", batch.failure_count}};
}

void to_json(nlohmann::json& j, const RuleStatistics& stats) {
    j = nlohmann::json{
        {"totalRules", stats.total_rules},
        {"byCategory",
         {{"deny", stats.by_category.deny},
          {"allow", stats.by_category.allow},
          {"ask", stats.by_category.ask}}},
        {"complexity",
         {{"averagePatternLength", stats.complexity.average_pattern_length},
          {"maxPatternLength", stats.complexity.max_pattern_length},
          {"regexCount", stats.complexity.regex_count},
          {"globCount", stats.complexity.glob_count},
          {"literalCount", stats.complexity.literal_count}}},
        {"coverage",
         {{"estimatedCoverage", stats.coverage.estimated_coverage},
          {"uncoveredPatterns", stats.coverage.uncovered_patterns},
          {"redundantRules", stats.coverage.redundant_rules}}}};
}

// ============================================================================
// RunControl
// ============================================================================

ValidationEngine::RunControl::RunControl(const ValidationOptions& options, Clock::time_point start)
    : cancel_(options.cancel) {
    if (options.timeout_ms) {
        // Saturate instead of overflowing the clock's representation
        const auto headroom =
            std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - start);
        if (*options.timeout_ms >= static_cast<uint64_t>(headroom.count())) {
            deadline_ = Clock::time_point::max();
        } else {
            deadline_ = start + std::chrono::milliseconds(
                                    static_cast<std::chrono::milliseconds::rep>(*options.timeout_ms));
        }
    }
}

bool ValidationEngine::RunControl::cancelled() const noexcept {
    return cancel_ && cancel_->load(std::memory_order_acquire);
}

bool ValidationEngine::RunControl::expired() const noexcept {
    return deadline_ && Clock::now() >= *deadline_;
}

// ============================================================================
// ValidationEngine
// ============================================================================

ValidationEngine::ValidationEngine(control::EngineConfig config)
    : config_(std::move(config)),
      analyzer_(std::make_shared<const PatternAnalyzer>(
          std::make_shared<const SampledOverlapEstimator>(patterns_))),
      pool_(std::make_unique<core::WorkerPool>(config_.max_workers)),
      detector_(analyzer_, pool_.get()),
      resolver_(parse_security_level(config_.security.level).value_or(SecurityLevel::Strict),
                patterns_, analyzer_),
      cache_(CacheConfig{config_.cache.max_entries, config_.cache.max_memory_mb,
                         config_.cache.ttl_ms}) {
    state_.operation = "Initializing validation engine";
}

ValidationEngine::~ValidationEngine() = default;

void ValidationEngine::update_state(ValidationPhase phase, int progress, std::string operation) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.phase = phase;
    state_.progress = progress;
    state_.operation = std::move(operation);
}

ValidationState ValidationEngine::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::vector<std::string> ValidationEngine::risk_tokens(const ValidationOptions& options) const {
    std::vector<std::string> tokens;
    for (const auto& token : config_.security.high_risk_tokens) {
        tokens.push_back(core::to_lower(token));
    }
    for (const auto& token : options.custom_patterns) {
        if (!token.empty()) {
            tokens.push_back(core::to_lower(token));
        }
    }
    return tokens;
}

bool ValidationEngine::strict_timeout(const ValidationOptions& options) const noexcept {
    return options.strict_mode || config_.performance.strict_timeout;
}

std::string ValidationEngine::cache_key(const std::string& hash, const ValidationOptions& options) {
    // Options that change the result content get their own cache slot
    if (!options.strict_mode && !options.skip_conflict_detection && !options.deep_analysis &&
        options.custom_patterns.empty()) {
        return hash;
    }
    std::vector<std::string> custom = options.custom_patterns;
    std::sort(custom.begin(), custom.end());
    return fmt::format("{}|s{}c{}d{}|{}", hash, options.strict_mode ? 1 : 0,
                       options.skip_conflict_detection ? 1 : 0, options.deep_analysis ? 1 : 0,
                       core::join(custom, ","));
}

ValidationResult ValidationEngine::validate(const nlohmann::json& config,
                                            const ValidationOptions& options) {
    const auto start = Clock::now();
    auto* logger = logging::get_current_logger();

    try {
        return run(config, options, start);
    } catch (const std::exception& e) {
        if (logger) {
            LOG_ERROR(logger, "Validation failed with internal error: {}", e.what());
        }

        ValidationResult failed;
        failed.add_error({IssueType::InvalidSyntax, fmt::format("Validation failed: {}", e.what()),
                          Severity::Critical, ""});
        failed.performance.elapsed_ms = elapsed_ms(start);
        failed.performance.target_ms = config_.performance.target_ms;
        failed.performance.achieved = false;
        update_state(ValidationPhase::Complete, 100, "Validation failed");
        return failed;
    }
}

ValidationResult ValidationEngine::run(const nlohmann::json& config, const ValidationOptions& options,
                                       Clock::time_point start) {
    auto* logger = logging::get_current_logger();
    const uint64_t run_id = logging::next_run_id();
    const RunControl control(options, start);
    const bool use_cache = config_.cache.enabled && !options.skip_cache;

    update_state(ValidationPhase::Parsing, 0, "Parsing configuration");
    const std::string hash = ValidationCache::generate_hash(config);
    const std::string key = cache_key(hash, options);

    if (use_cache) {
        if (auto cached = cache_.get(key)) {
            cached->performance.cache_hit = true;
            if (logger) {
                BASTION_LOG_DEBUG(logger, "Cache hit: run_id={}, elapsed_ms={:.3f}", run_id,
                                  elapsed_ms(start));
            }
            update_state(ValidationPhase::Complete, 100, "Validation complete (cached)");
            return std::move(*cached);
        }
    }

    if (logger) {
        BASTION_LOG_DEBUG(logger, "Validation started: run_id={}", run_id);
    }

    ValidationResult result;
    result.configuration_hash = hash;
    result.performance.target_ms = config_.performance.target_ms;
    auto& phases = result.performance.phases;

    // Normalize
    update_state(ValidationPhase::Normalizing, 10, "Normalizing rules");
    auto phase_start = Clock::now();
    NormalizedRules normalized = normalize_rules(config, patterns_);
    for (auto& error : normalized.errors) {
        result.add_error(std::move(error));
    }
    for (auto& warning : normalized.warnings) {
        result.add_warning(std::move(warning));
    }
    const std::vector<Rule>& rules = normalized.rules;
    result.performance.rules_processed = rules.size();
    phases.normalization_ms = elapsed_ms(phase_start);

    // Per-rule checks
    update_state(ValidationPhase::Validating, 20, "Validating rules");
    phase_start = Clock::now();
    validate_rules(rules, options, result);
    phases.rule_validation_ms = elapsed_ms(phase_start);

    // Conflict detection. The zero-bypass pass runs even when the other passes are
    // skipped or the run is already out of time so that violations are never missed.
    update_state(ValidationPhase::DetectingConflicts, 50, "Detecting rule conflicts");
    phase_start = Clock::now();

    bool interrupted = control.should_stop();
    DetectionOptions detection;
    detection.deep_analysis = options.deep_analysis;
    detection.parallel = options.parallel;
    detection.worker_count = options.worker_count;
    detection.zero_bypass_only = options.skip_conflict_detection || interrupted;
    detection.should_stop = [&control]() { return control.should_stop(); };

    DetectionResult detected = detector_.detect(rules, detection);
    interrupted = interrupted || detected.truncated;
    result.conflicts = std::move(detected.conflicts);

    // Zero-bypass enforcement: every allow/ask rule that can override a deny rule is fatal
    for (const auto& conflict : result.conflicts) {
        if (conflict.kind != ConflictKind::AllowOverridesDeny) {
            continue;
        }
        std::string location;
        for (const auto& rule : conflict.rules) {
            if (rule.category != Category::Deny) {
                location = rule.location;
                break;
            }
        }
        result.add_error({IssueType::SecurityViolation, conflict.message, conflict.impact, location});
    }
    phases.conflict_detection_ms = elapsed_ms(phase_start);

    interrupted = interrupted || control.should_stop();

    // Security analysis and suggestions are optional work
    if (!interrupted) {
        update_state(ValidationPhase::Validating, 80, "Performing security analysis");
        phase_start = Clock::now();
        SecurityAnalysis security = analyze_security(rules, result);
        phases.security_analysis_ms = elapsed_ms(phase_start);

        interrupted = control.should_stop();
        if (!interrupted) {
            update_state(ValidationPhase::GeneratingSuggestions, 90, "Generating suggestions");
            phase_start = Clock::now();
            result.suggestions = generate_suggestions(rules, result, security);
            phases.suggestion_ms = elapsed_ms(phase_start);
        }
        result.security = std::move(security);
    }

    const double elapsed = elapsed_ms(start);
    result.performance.elapsed_ms = elapsed;
    result.performance.achieved = !interrupted && elapsed < config_.performance.target_ms;

    if (interrupted) {
        if (control.cancelled()) {
            result.add_error({IssueType::InvalidSyntax, "Validation cancelled", Severity::High, ""});
        } else {
            result.add_warning({IssueType::PerformanceWarning,
                                fmt::format("Validation exceeded its {} ms deadline; optional analysis "
                                            "was skipped",
                                            options.timeout_ms.value_or(0)),
                                Severity::Medium, ""});
            if (strict_timeout(options)) {
                result.add_error({IssueType::InvalidSyntax,
                                  fmt::format("Validation timed out after {:.1f} ms", elapsed),
                                  Severity::High, ""});
            }
        }
        if (logger) {
            LOG_WARNING(logger, "Validation interrupted: run_id={}, cancelled={}, elapsed_ms={:.3f}",
                        run_id, control.cancelled(), elapsed);
        }
    } else if (!result.performance.achieved && logger) {
        LOG_WARNING(logger, "Validation took {:.2f}ms, exceeding target of {}ms", elapsed,
                    config_.performance.target_ms);
    }

    // Slow or interrupted runs are never cached
    if (use_cache && !interrupted && elapsed < config_.performance.target_ms * 2) {
        cache_.set(key, result, elapsed);
    }

    if (logger) {
        LOG_VALIDATION(logger, run_id, rules.size(), result.conflicts.size(), result.is_valid, elapsed);
    }

    update_state(ValidationPhase::Complete, 100, "Validation complete");
    return result;
}

void ValidationEngine::validate_rules(const std::vector<Rule>& rules, const ValidationOptions& options,
                                      ValidationResult& result) const {
    const std::vector<std::string> tokens = risk_tokens(options);

    auto invalid_pattern = [&](std::string message, const Rule& rule) {
        ValidationIssue issue{IssueType::InvalidPattern, std::move(message), Severity::Medium,
                              rule.location()};
        if (options.strict_mode) {
            issue.severity = Severity::High;
            result.add_error(std::move(issue));
        } else {
            result.add_warning(std::move(issue));
        }
    };

    for (const auto& rule : rules) {
        const std::string_view category = to_string(rule.category);

        if (trim(rule.original).empty()) {
            invalid_pattern(fmt::format("Empty rule pattern in {} rules", category), rule);
        }

        if (is_bare_wildcard(rule.original)) {
            result.add_warning({IssueType::BestPracticeViolation,
                                fmt::format("Overly broad pattern \"{}\" in {} rules", rule.original,
                                            category),
                                Severity::Medium, rule.location()});
        }

        if (rule.matcher && rule.matcher->fell_back()) {
            invalid_pattern(fmt::format("Invalid regex pattern \"{}\" treated as literal: {}",
                                        rule.original, rule.matcher->compile_error()),
                            rule);
        }

        if (rule.category == Category::Allow) {
            const std::string lower = core::to_lower(rule.original);
            bool dangerous = std::any_of(tokens.begin(), tokens.end(), [&](const std::string& t) {
                return lower.find(t) != std::string::npos;
            });
            if (dangerous) {
                result.add_warning({IssueType::BestPracticeViolation,
                                    fmt::format("Potentially dangerous pattern in allow rules: {}",
                                                rule.original),
                                    Severity::Medium, rule.location()});
            }
        }
    }
}

SecurityAnalysis ValidationEngine::analyze_security(const std::vector<Rule>& rules,
                                                    ValidationResult& result) const {
    SecurityAnalysis analysis;
    std::vector<std::pair<SecurityIssue, std::string>> reportable;  // issue, location

    for (const auto& conflict : result.conflicts) {
        if (conflict.kind == ConflictKind::AllowOverridesDeny) {
            SecurityIssue issue{"zero-bypass-violation", conflict.impact, conflict.message, {},
                                "Remove or modify the allow/ask rule to not overlap with deny rules"};
            for (const auto& rule : conflict.rules) {
                issue.affected_rules.push_back(rule.pattern);
            }
            // Already reported as an error by the enforcement step
            analysis.issues.push_back(std::move(issue));
        } else if (conflict.kind == ConflictKind::PrecedenceAmbiguity) {
            std::vector<std::string> patterns;
            for (const auto& rule : conflict.rules) {
                patterns.push_back(rule.pattern);
            }
            analysis.bypass_vectors.push_back(
                {"precedence-exploit",
                 fmt::format("Rules {} share a pattern shape across categories", core::join(patterns, ", ")),
                 patterns.empty() ? std::string() : patterns.front(),
                 "Make the deny rule more specific or remove the overlapping rule"});
        }
    }

    for (const auto& rule : rules) {
        for (const auto& weakness : detect_weaknesses(rule)) {
            if (weakness.type != WeaknessType::TooBroad) {
                continue;
            }
            reportable.emplace_back(
                SecurityIssue{"too-broad", weakness.severity,
                              fmt::format("Pattern \"{}\" in {} rules is too broad: {}", rule.original,
                                          to_string(rule.category), weakness.description),
                              {rule.original}, weakness.resolution},
                rule.location());
        }
    }

    if (config_.security.detect_weak_patterns) {
        for (const auto& rule : rules) {
            if (!rule.is_deny() || !is_weak_deny(rule.original)) {
                continue;
            }
            reportable.emplace_back(
                SecurityIssue{"weak-pattern", Severity::Medium,
                              fmt::format("Weak deny pattern detected: \"{}\"", rule.original),
                              {rule.original}, "Use more specific patterns to prevent bypasses"},
                rule.location());
            analysis.bypass_vectors.push_back(
                {"pattern-escape",
                 fmt::format("Pattern \"{}\" can be bypassed with encoding or path manipulation",
                             rule.original),
                 bypass_example(rule.original), "Use absolute paths and validate all inputs"});
        }
    }

    for (const auto& rule : rules) {
        if (rule.category != Category::Allow || !is_overly_permissive(rule.original)) {
            continue;
        }
        reportable.emplace_back(
            SecurityIssue{"overly-permissive", Severity::Medium,
                          fmt::format("Overly permissive allow rule: \"{}\"", rule.original),
                          {rule.original}, "Restrict the pattern to specific necessary permissions"},
            rule.location());
    }

    if (config_.security.require_deny_rules &&
        std::none_of(rules.begin(), rules.end(), [](const Rule& r) { return r.is_deny(); })) {
        reportable.emplace_back(
            SecurityIssue{"missing-deny", Severity::Medium,
                          "No deny rules defined - security policy is too permissive", {},
                          "Add deny rules for dangerous operations"},
            "permissions.deny");
    }

    for (auto& [issue, location] : reportable) {
        if (issue.severity == Severity::Critical || issue.severity == Severity::High) {
            result.add_error({IssueType::SecurityViolation, issue.description, issue.severity, location});
        } else {
            result.add_warning({IssueType::BestPracticeViolation, issue.description, issue.severity,
                                location});
        }
        analysis.issues.push_back(std::move(issue));
    }

    if (analysis.issues.empty()) {
        analysis.recommendations.push_back("Configuration has strong security posture");
    } else {
        analysis.recommendations.push_back("Address critical security issues immediately");
        analysis.recommendations.push_back("Review and test all rule interactions");
        analysis.recommendations.push_back("Consider using more specific patterns");
    }

    int score = 100;
    for (const auto& issue : analysis.issues) {
        switch (issue.severity) {
            case Severity::Critical:
                score -= 20;
                break;
            case Severity::High:
                score -= 10;
                break;
            case Severity::Medium:
                score -= 5;
                break;
            case Severity::Low:
                break;
        }
    }
    analysis.score = std::max(0, score);
    return analysis;
}

std::vector<ResolutionSuggestion> ValidationEngine::generate_suggestions(
    const std::vector<Rule>& rules, const ValidationResult& result, const SecurityAnalysis& security) {
    std::vector<ResolutionSuggestion> suggestions = resolver_.resolve_all(result.conflicts);

    core::fast_set<std::string> seen_messages;
    for (const auto& s : suggestions) {
        seen_messages.insert(s.message);
    }

    for (const auto& issue : security.issues) {
        if (issue.type == "zero-bypass-violation" || !seen_messages.insert(issue.suggested_fix).second) {
            continue;
        }
        ResolutionSuggestion suggestion;
        suggestion.kind = issue.severity == Severity::Critical ? SuggestionKind::Fix : SuggestionKind::Warning;
        suggestion.message = issue.suggested_fix;
        suggestion.critical = issue.severity == Severity::Critical;
        suggestions.push_back(std::move(suggestion));
    }

    const auto complex = std::count_if(rules.begin(), rules.end(), [](const Rule& r) {
        return r.kind == PatternKind::Regex && r.original.size() > 50;
    });
    if (complex > 0) {
        suggestions.push_back({SuggestionKind::Optimization,
                               fmt::format("{} complex regex patterns detected. Consider simplifying "
                                           "for better performance.",
                                           complex),
                               std::nullopt, false});
    }

    const bool denies_exec = std::any_of(rules.begin(), rules.end(), [](const Rule& r) {
        return r.is_deny() && r.original.find("exec") != std::string::npos;
    });
    if (!denies_exec) {
        ResolutionSuggestion hint{SuggestionKind::Warning, std::string(SHELL_DENY_HINT), std::nullopt,
                                  false};
        // Only offer the fix when it cannot itself create a zero-bypass violation
        const bool exec_permitted = std::any_of(rules.begin(), rules.end(), [](const Rule& r) {
            return !r.is_deny() && r.matcher && r.matcher->matches("exec");
        });
        if (!exec_permitted) {
            hint.auto_fix = AutoFix{"Adds a deny rule for shell execution",
                                    AddRule{Category::Deny, "exec", std::nullopt,
                                            "Blocks shell command execution"}};
        }
        suggestions.push_back(std::move(hint));
    }

    return resolver_.optimize(std::move(suggestions));
}

BatchResult ValidationEngine::validate_batch(std::string id, const std::vector<nlohmann::json>& configs,
                                             const ValidationOptions& options) {
    const auto start = Clock::now();
    BatchResult batch;
    batch.id = std::move(id);
    batch.results.resize(configs.size());

    size_t width = options.worker_count > 0 ? options.worker_count
                                            : (pool_ ? pool_->size() : core::default_worker_count());
    width = std::max<size_t>(width, 1);

    // Waves of at most `width` concurrent validations; each writes only its own slot
    for (size_t offset = 0; offset < configs.size(); offset += width) {
        const size_t end = std::min(configs.size(), offset + width);
        std::vector<std::future<void>> wave;
        wave.reserve(end - offset);
        for (size_t i = offset; i < end; ++i) {
            wave.push_back(std::async(std::launch::async, [this, &batch, &configs, &options, i]() {
                batch.results[i] = validate(configs[i], options);
            }));
        }
        for (auto& task : wave) {
            task.get();
        }
    }

    for (const auto& result : batch.results) {
        if (result.is_valid) {
            ++batch.success_count;
        } else {
            ++batch.failure_count;
        }
    }
    batch.total_ms = elapsed_ms(start);
    return batch;
}

RuleStatistics ValidationEngine::get_rule_statistics(const nlohmann::json& config) {
    RuleStatistics stats;
    NormalizedRules normalized = normalize_rules(config, patterns_);
    const auto& rules = normalized.rules;

    stats.total_rules = rules.size();
    stats.by_category.deny = normalized.count(Category::Deny);
    stats.by_category.allow = normalized.count(Category::Allow);
    stats.by_category.ask = normalized.count(Category::Ask);

    size_t total_length = 0;
    core::fast_set<std::string> seen;
    for (const auto& rule : rules) {
        total_length += rule.original.size();
        stats.complexity.max_pattern_length =
            std::max(stats.complexity.max_pattern_length, rule.original.size());

        switch (rule.kind) {
            case PatternKind::Regex:
                ++stats.complexity.regex_count;
                break;
            case PatternKind::Glob:
                ++stats.complexity.glob_count;
                break;
            case PatternKind::Literal:
                ++stats.complexity.literal_count;
                break;
        }

        std::string key = fmt::format("{}:{}", to_string(rule.category), rule.original);
        if (!seen.insert(key).second) {
            stats.coverage.redundant_rules.push_back(std::move(key));
        }
    }
    stats.complexity.average_pattern_length =
        rules.empty() ? 0.0 : static_cast<double>(total_length) / static_cast<double>(rules.size());

    stats.coverage.estimated_coverage =
        static_cast<int>(std::min<size_t>(100, stats.by_category.deny * 10 + stats.by_category.allow * 5));

    for (const auto& token : risk_tokens({})) {
        const bool covered = std::any_of(rules.begin(), rules.end(), [&](const Rule& r) {
            return r.is_deny() && r.matcher && r.matcher->matches(token);
        });
        if (!covered) {
            stats.coverage.uncovered_patterns.push_back(token);
        }
    }

    return stats;
}

size_t ValidationEngine::warm_cache(const std::vector<nlohmann::json>& configs) {
    if (!config_.cache.enabled) {
        return 0;
    }
    size_t warmed = 0;
    for (const auto& config : configs) {
        if (cache_.contains(ValidationCache::generate_hash(config))) {
            continue;
        }
        (void)validate(config);
        ++warmed;
    }
    return warmed;
}

std::string ValidationEngine::export_cache() const {
    return cache_.export_json();
}

bool ValidationEngine::import_cache(std::string_view data, std::string& error_message) {
    return cache_.import_json(data, error_message);
}

CacheStats ValidationEngine::cache_stats() const {
    return cache_.stats();
}

void ValidationEngine::clear_cache() {
    cache_.clear();
    detector_.clear_cache();
    resolver_.clear_cache();
}

}  // namespace bastion::validation
