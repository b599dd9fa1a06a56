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

#include "types.hpp"

#include <algorithm>
#include <stdexcept>
#include <type_traits>

#include <fmt/format.h>

#include "../core/string_utils.hpp"

namespace bastion::validation {

std::string_view to_string(Category category) noexcept {
    switch (category) {
        case Category::Deny:
            return "deny";
        case Category::Ask:
            return "ask";
        case Category::Allow:
            return "allow";
    }
    return "allow";
}

std::string_view to_string(OverlapKind kind) noexcept {
    switch (kind) {
        case OverlapKind::None:
            return "none";
        case OverlapKind::Exact:
            return "exact";
        case OverlapKind::Subset:
            return "subset";
        case OverlapKind::Superset:
            return "superset";
        case OverlapKind::Partial:
            return "partial";
    }
    return "none";
}

std::string_view to_string(ConflictKind kind) noexcept {
    switch (kind) {
        case ConflictKind::AllowOverridesDeny:
            return "ALLOW_OVERRIDES_DENY";
        case ConflictKind::OverlappingPatterns:
            return "OVERLAPPING_PATTERNS";
        case ConflictKind::ContradictoryRules:
            return "CONTRADICTORY_RULES";
        case ConflictKind::PrecedenceAmbiguity:
            return "PRECEDENCE_AMBIGUITY";
        case ConflictKind::SecurityViolation:
            return "SECURITY_VIOLATION";
    }
    return "OVERLAPPING_PATTERNS";
}

std::string_view to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Critical:
            return "critical";
        case Severity::High:
            return "high";
        case Severity::Medium:
            return "medium";
        case Severity::Low:
            return "low";
    }
    return "low";
}

std::string_view to_string(ResolutionStrategy strategy) noexcept {
    switch (strategy) {
        case ResolutionStrategy::RemoveConflictingRule:
            return "REMOVE_CONFLICTING_RULE";
        case ResolutionStrategy::MakeAllowMoreRestrictive:
            return "MAKE_ALLOW_MORE_RESTRICTIVE";
        case ResolutionStrategy::MakeDenyMoreSpecific:
            return "MAKE_DENY_MORE_SPECIFIC";
        case ResolutionStrategy::ManualReviewRequired:
            return "MANUAL_REVIEW_REQUIRED";
    }
    return "MANUAL_REVIEW_REQUIRED";
}

std::string_view to_string(SuggestionKind kind) noexcept {
    switch (kind) {
        case SuggestionKind::Fix:
            return "fix";
        case SuggestionKind::Warning:
            return "warning";
        case SuggestionKind::Optimization:
            return "optimization";
    }
    return "warning";
}

std::string_view to_string(SecurityLevel level) noexcept {
    switch (level) {
        case SecurityLevel::Strict:
            return "strict";
        case SecurityLevel::Moderate:
            return "moderate";
        case SecurityLevel::Permissive:
            return "permissive";
    }
    return "strict";
}

std::string_view to_string(IssueType type) noexcept {
    switch (type) {
        case IssueType::InvalidSyntax:
            return "INVALID_SYNTAX";
        case IssueType::RuleConflict:
            return "RULE_CONFLICT";
        case IssueType::MissingRequiredField:
            return "MISSING_REQUIRED_FIELD";
        case IssueType::InvalidPattern:
            return "INVALID_PATTERN";
        case IssueType::SecurityViolation:
            return "SECURITY_VIOLATION";
        case IssueType::PerformanceViolation:
            return "PERFORMANCE_VIOLATION";
        case IssueType::BestPracticeViolation:
            return "BEST_PRACTICE_VIOLATION";
        case IssueType::PerformanceWarning:
            return "PERFORMANCE_WARNING";
        case IssueType::DeprecatedPattern:
            return "DEPRECATED_PATTERN";
    }
    return "INVALID_SYNTAX";
}

std::string_view to_string(RiskLevel risk) noexcept {
    switch (risk) {
        case RiskLevel::Safe:
            return "safe";
        case RiskLevel::Moderate:
            return "moderate";
        case RiskLevel::Risky:
            return "risky";
    }
    return "risky";
}

namespace {

// Reverse lookup over a contiguous enum whose last enumerator is `last`
template <typename Enum>
std::optional<Enum> parse_enum(std::string_view name, Enum last) noexcept {
    for (int i = 0; i <= static_cast<int>(last); ++i) {
        auto value = static_cast<Enum>(i);
        if (to_string(value) == name) {
            return value;
        }
    }
    return std::nullopt;
}

template <typename Enum>
Enum require_enum(const nlohmann::json& j, const char* key, Enum last) {
    auto name = j.at(key).get<std::string>();
    auto value = parse_enum(name, last);
    if (!value) {
        throw std::invalid_argument(fmt::format("unknown value '{}' for field '{}'", name, key));
    }
    return *value;
}

}  // namespace

std::optional<Category> parse_category(std::string_view name) noexcept {
    return parse_enum(name, Category::Allow);
}

std::optional<SecurityLevel> parse_security_level(std::string_view name) noexcept {
    return parse_enum(name, SecurityLevel::Permissive);
}

std::string Rule::location() const {
    return fmt::format("permissions.{}[{}]", to_string(category), index);
}

std::string Conflict::dedup_key() const {
    std::vector<std::string> patterns;
    patterns.reserve(rules.size());
    for (const auto& rule : rules) {
        patterns.push_back(rule.pattern);
    }
    std::sort(patterns.begin(), patterns.end());
    return fmt::format("{}:{}", to_string(kind), core::join(patterns, "|"));
}

bool Conflict::involves(Category category) const noexcept {
    return std::any_of(rules.begin(), rules.end(),
                       [category](const ConflictingRule& r) { return r.category == category; });
}

std::string_view change_action(const Change& change) noexcept {
    struct Visitor {
        std::string_view operator()(const AddRule&) const { return "add"; }
        std::string_view operator()(const RemoveRule&) const { return "remove"; }
        std::string_view operator()(const ModifyRule&) const { return "modify"; }
        std::string_view operator()(const ReorderRule&) const { return "reorder"; }
    };
    return std::visit(Visitor{}, change);
}

Category change_category(const Change& change) noexcept {
    return std::visit([](const auto& c) { return c.category; }, change);
}

// JSON serialization

void to_json(nlohmann::json& j, const ConflictingRule& r) {
    j = nlohmann::json{
        {"category", to_string(r.category)}, {"pattern", r.pattern}, {"location", r.location}};
}

void from_json(const nlohmann::json& j, ConflictingRule& r) {
    r.category = require_enum(j, "category", Category::Allow);
    r.pattern = j.at("pattern").get<std::string>();
    r.location = j.value("location", std::string());
}

void to_json(nlohmann::json& j, const Conflict& c) {
    j = nlohmann::json{{"type", to_string(c.kind)},
                       {"message", c.message},
                       {"conflictingRules", c.rules},
                       {"resolution", to_string(c.resolution)},
                       {"securityImpact", to_string(c.impact)}};
    if (c.overlap) {
        j["overlap"] = to_string(*c.overlap);
    }
}

void from_json(const nlohmann::json& j, Conflict& c) {
    c.kind = require_enum(j, "type", ConflictKind::SecurityViolation);
    c.message = j.value("message", std::string());
    c.rules = j.at("conflictingRules").get<std::vector<ConflictingRule>>();
    c.resolution = require_enum(j, "resolution", ResolutionStrategy::ManualReviewRequired);
    c.impact = require_enum(j, "securityImpact", Severity::Low);
    c.overlap.reset();
    if (j.contains("overlap")) {
        c.overlap = require_enum(j, "overlap", OverlapKind::Partial);
    }
}

void to_json(nlohmann::json& j, const Change& change) {
    j = nlohmann::json{{"action", change_action(change)},
                       {"category", to_string(change_category(change))}};

    std::visit(
        [&j](const auto& c) {
            using T = std::decay_t<decltype(c)>;
            j["reason"] = c.reason;
            if constexpr (std::is_same_v<T, AddRule>) {
                j["newPattern"] = c.pattern;
                if (c.position) {
                    j["position"] = *c.position;
                }
            } else if constexpr (std::is_same_v<T, RemoveRule>) {
                j["originalPattern"] = c.pattern;
            } else if constexpr (std::is_same_v<T, ModifyRule>) {
                j["originalPattern"] = c.original_pattern;
                j["newPattern"] = c.new_pattern;
            } else {
                j["originalPattern"] = c.pattern;
                j["position"] = c.position;
            }
        },
        change);
}

void from_json(const nlohmann::json& j, Change& change) {
    auto action = j.at("action").get<std::string>();
    Category category = require_enum(j, "category", Category::Allow);
    std::string reason = j.value("reason", std::string());

    if (action == "add") {
        AddRule add{category, j.at("newPattern").get<std::string>(), std::nullopt, reason};
        if (j.contains("position")) {
            add.position = j.at("position").get<size_t>();
        }
        change = std::move(add);
    } else if (action == "remove") {
        change = RemoveRule{category, j.at("originalPattern").get<std::string>(), reason};
    } else if (action == "modify") {
        change = ModifyRule{category, j.at("originalPattern").get<std::string>(),
                            j.at("newPattern").get<std::string>(), reason};
    } else if (action == "reorder") {
        change = ReorderRule{category, j.at("originalPattern").get<std::string>(),
                             j.at("position").get<size_t>(), reason};
    } else {
        throw std::invalid_argument(fmt::format("unknown change action '{}'", action));
    }
}

void to_json(nlohmann::json& j, const ResolutionSuggestion& s) {
    j = nlohmann::json{{"type", to_string(s.kind)}, {"message", s.message}};
    if (s.critical) {
        j["critical"] = true;
    }
    if (s.auto_fix) {
        j["autoFix"] = {{"description", s.auto_fix->description}, {"changes", s.auto_fix->change}};
    }
}

void from_json(const nlohmann::json& j, ResolutionSuggestion& s) {
    s.kind = require_enum(j, "type", SuggestionKind::Optimization);
    s.message = j.value("message", std::string());
    s.critical = j.value("critical", false);
    s.auto_fix.reset();
    if (j.contains("autoFix")) {
        const auto& fix = j.at("autoFix");
        s.auto_fix = AutoFix{fix.value("description", std::string()),
                             fix.at("changes").get<Change>()};
    }
}

void to_json(nlohmann::json& j, const ValidationIssue& issue) {
    j = nlohmann::json{{"type", to_string(issue.type)},
                       {"message", issue.message},
                       {"severity", to_string(issue.severity)}};
    if (!issue.location.empty()) {
        j["location"] = issue.location;
    }
}

void from_json(const nlohmann::json& j, ValidationIssue& issue) {
    issue.type = require_enum(j, "type", IssueType::DeprecatedPattern);
    issue.message = j.value("message", std::string());
    issue.severity = require_enum(j, "severity", Severity::Low);
    issue.location = j.value("location", std::string());
}

void to_json(nlohmann::json& j, const PerformanceMetrics& p) {
    j = nlohmann::json{{"elapsedMs", p.elapsed_ms},
                       {"rulesProcessed", p.rules_processed},
                       {"target", p.target_ms},
                       {"achieved", p.achieved},
                       {"cacheHit", p.cache_hit},
                       {"phases",
                        {{"normalizationMs", p.phases.normalization_ms},
                         {"ruleValidationMs", p.phases.rule_validation_ms},
                         {"conflictDetectionMs", p.phases.conflict_detection_ms},
                         {"securityAnalysisMs", p.phases.security_analysis_ms},
                         {"suggestionMs", p.phases.suggestion_ms}}}};
}

void from_json(const nlohmann::json& j, PerformanceMetrics& p) {
    p.elapsed_ms = j.value("elapsedMs", 0.0);
    p.rules_processed = j.value("rulesProcessed", size_t{0});
    p.target_ms = j.value("target", 100.0);
    p.achieved = j.value("achieved", true);
    p.cache_hit = j.value("cacheHit", false);
    if (j.contains("phases")) {
        const auto& ph = j.at("phases");
        p.phases.normalization_ms = ph.value("normalizationMs", 0.0);
        p.phases.rule_validation_ms = ph.value("ruleValidationMs", 0.0);
        p.phases.conflict_detection_ms = ph.value("conflictDetectionMs", 0.0);
        p.phases.security_analysis_ms = ph.value("securityAnalysisMs", 0.0);
        p.phases.suggestion_ms = ph.value("suggestionMs", 0.0);
    }
}

void to_json(nlohmann::json& j, const SecurityAnalysis& s) {
    nlohmann::json issues = nlohmann::json::array();
    for (const auto& issue : s.issues) {
        issues.push_back({{"type", issue.type},
                          {"severity", to_string(issue.severity)},
                          {"description", issue.description},
                          {"affectedRules", issue.affected_rules},
                          {"suggestedFix", issue.suggested_fix}});
    }

    nlohmann::json vectors = nlohmann::json::array();
    for (const auto& v : s.bypass_vectors) {
        vectors.push_back({{"type", v.type},
                           {"description", v.description},
                           {"example", v.example},
                           {"mitigation", v.mitigation}});
    }

    j = nlohmann::json{{"securityScore", s.score},
                       {"issues", std::move(issues)},
                       {"bypassVectors", std::move(vectors)},
                       {"recommendations", s.recommendations}};
}

void from_json(const nlohmann::json& j, SecurityAnalysis& s) {
    s.score = j.value("securityScore", 100);
    s.issues.clear();
    for (const auto& item : j.value("issues", nlohmann::json::array())) {
        SecurityIssue issue;
        issue.type = item.value("type", std::string());
        issue.severity = require_enum(item, "severity", Severity::Low);
        issue.description = item.value("description", std::string());
        issue.affected_rules = item.value("affectedRules", std::vector<std::string>());
        issue.suggested_fix = item.value("suggestedFix", std::string());
        s.issues.push_back(std::move(issue));
    }
    s.bypass_vectors.clear();
    for (const auto& item : j.value("bypassVectors", nlohmann::json::array())) {
        s.bypass_vectors.push_back(BypassVector{
            item.value("type", std::string()), item.value("description", std::string()),
            item.value("example", std::string()), item.value("mitigation", std::string())});
    }
    s.recommendations = j.value("recommendations", std::vector<std::string>());
}

void to_json(nlohmann::json& j, const ValidationResult& r) {
    j = nlohmann::json{{"isValid", r.is_valid},
                       {"errors", r.errors},
                       {"warnings", r.warnings},
                       {"conflicts", r.conflicts},
                       {"suggestions", r.suggestions},
                       {"performance", r.performance}};
    if (r.configuration_hash) {
        j["configurationHash"] = *r.configuration_hash;
    }
    if (r.security) {
        j["security"] = *r.security;
    }
}

void from_json(const nlohmann::json& j, ValidationResult& r) {
    // Validity follows the error list; a stored "isValid" is not trusted
    r.errors = j.value("errors", std::vector<ValidationIssue>());
    r.is_valid = r.errors.empty();
    r.warnings = j.value("warnings", std::vector<ValidationIssue>());
    r.conflicts = j.value("conflicts", std::vector<Conflict>());
    r.suggestions = j.value("suggestions", std::vector<ResolutionSuggestion>());
    r.performance = j.value("performance", PerformanceMetrics{});
    r.configuration_hash.reset();
    if (j.contains("configurationHash")) {
        r.configuration_hash = j.at("configurationHash").get<std::string>();
    }
    r.security.reset();
    if (j.contains("security")) {
        r.security = j.at("security").get<SecurityAnalysis>();
    }
}

}  // namespace bastion::validation
