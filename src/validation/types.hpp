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

// Bastion Validation - Core Types
// Rules, conflicts, suggestions and the terminal ValidationResult

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "../pattern/pattern.hpp"

namespace bastion::validation {

using pattern::MatcherPtr;
using pattern::PatternKind;

/// Rule tier, declared in precedence order (Deny beats Ask beats Allow)
enum class Category : uint8_t { Deny, Ask, Allow };

enum class OverlapKind : uint8_t { None, Exact, Subset, Superset, Partial };

enum class ConflictKind : uint8_t {
    AllowOverridesDeny,
    OverlappingPatterns,
    ContradictoryRules,
    PrecedenceAmbiguity,
    SecurityViolation
};

/// Declared most severe first so that sorting ascending puts Critical on top
enum class Severity : uint8_t { Critical, High, Medium, Low };

enum class ResolutionStrategy : uint8_t {
    RemoveConflictingRule,
    MakeAllowMoreRestrictive,
    MakeDenyMoreSpecific,
    ManualReviewRequired
};

enum class SuggestionKind : uint8_t { Fix, Warning, Optimization };

enum class SecurityLevel : uint8_t { Strict, Moderate, Permissive };

/// Risk of applying a change to a rule list
enum class RiskLevel : uint8_t { Safe, Moderate, Risky };

enum class IssueType : uint8_t {
    // Error taxonomy
    InvalidSyntax,
    RuleConflict,
    MissingRequiredField,
    InvalidPattern,
    SecurityViolation,
    PerformanceViolation,
    // Warning-only types
    BestPracticeViolation,
    PerformanceWarning,
    DeprecatedPattern
};

[[nodiscard]] std::string_view to_string(Category category) noexcept;
[[nodiscard]] std::string_view to_string(OverlapKind kind) noexcept;
[[nodiscard]] std::string_view to_string(ConflictKind kind) noexcept;
[[nodiscard]] std::string_view to_string(Severity severity) noexcept;
[[nodiscard]] std::string_view to_string(ResolutionStrategy strategy) noexcept;
[[nodiscard]] std::string_view to_string(SuggestionKind kind) noexcept;
[[nodiscard]] std::string_view to_string(SecurityLevel level) noexcept;
[[nodiscard]] std::string_view to_string(IssueType type) noexcept;
[[nodiscard]] std::string_view to_string(RiskLevel risk) noexcept;

[[nodiscard]] std::optional<Category> parse_category(std::string_view name) noexcept;
[[nodiscard]] std::optional<SecurityLevel> parse_security_level(std::string_view name) noexcept;

/// Normalized rule. Built fresh per validation call and never mutated afterwards.
struct Rule {
    std::string original;
    std::string normalized;  // matcher expression
    PatternKind kind = PatternKind::Literal;
    MatcherPtr matcher;
    Category category = Category::Allow;
    int priority = 0;  // lower value = evaluated first
    size_t index = 0;  // position inside its category array

    [[nodiscard]] bool is_deny() const noexcept { return category == Category::Deny; }

    /// "permissions.<category>[<index>]"
    [[nodiscard]] std::string location() const;
};

struct ConflictingRule {
    Category category = Category::Allow;
    std::string pattern;
    std::string location;

    bool operator==(const ConflictingRule&) const = default;
};

struct Conflict {
    ConflictKind kind = ConflictKind::OverlappingPatterns;
    std::string message;
    std::vector<ConflictingRule> rules;
    ResolutionStrategy resolution = ResolutionStrategy::ManualReviewRequired;
    Severity impact = Severity::Low;
    std::optional<OverlapKind> overlap;  // set for pairwise conflicts

    /// kind plus the sorted conflicting patterns
    [[nodiscard]] std::string dedup_key() const;
    [[nodiscard]] bool involves(Category category) const noexcept;

    bool operator==(const Conflict&) const = default;
};

// Auto-fix changes: one alternative per action, each carrying only its own fields

struct AddRule {
    Category category = Category::Deny;
    std::string pattern;
    std::optional<size_t> position;  // append when empty
    std::string reason;

    bool operator==(const AddRule&) const = default;
};

struct RemoveRule {
    Category category = Category::Allow;
    std::string pattern;
    std::string reason;

    bool operator==(const RemoveRule&) const = default;
};

struct ModifyRule {
    Category category = Category::Allow;
    std::string original_pattern;
    std::string new_pattern;
    std::string reason;

    bool operator==(const ModifyRule&) const = default;
};

struct ReorderRule {
    Category category = Category::Allow;
    std::string pattern;
    size_t position = 0;
    std::string reason;

    bool operator==(const ReorderRule&) const = default;
};

using Change = std::variant<AddRule, RemoveRule, ModifyRule, ReorderRule>;

[[nodiscard]] std::string_view change_action(const Change& change) noexcept;
[[nodiscard]] Category change_category(const Change& change) noexcept;

struct AutoFix {
    std::string description;
    Change change;

    bool operator==(const AutoFix&) const = default;
};

struct ResolutionSuggestion {
    SuggestionKind kind = SuggestionKind::Warning;
    std::string message;
    std::optional<AutoFix> auto_fix;
    bool critical = false;  // never dropped when suggestions are capped

    bool operator==(const ResolutionSuggestion&) const = default;
};

struct ValidationIssue {
    IssueType type = IssueType::InvalidSyntax;
    std::string message;
    Severity severity = Severity::Medium;
    std::string location;  // empty when not tied to a rule

    bool operator==(const ValidationIssue&) const = default;
};

struct PhaseTimings {
    double normalization_ms = 0.0;
    double rule_validation_ms = 0.0;
    double conflict_detection_ms = 0.0;
    double security_analysis_ms = 0.0;
    double suggestion_ms = 0.0;

    bool operator==(const PhaseTimings&) const = default;
};

struct PerformanceMetrics {
    double elapsed_ms = 0.0;
    size_t rules_processed = 0;
    double target_ms = 100.0;
    bool achieved = true;
    bool cache_hit = false;
    PhaseTimings phases;

    bool operator==(const PerformanceMetrics&) const = default;
};

struct SecurityIssue {
    std::string type;  // zero-bypass-violation, too-broad, weak-pattern, overly-permissive, missing-deny
    Severity severity = Severity::Medium;
    std::string description;
    std::vector<std::string> affected_rules;
    std::string suggested_fix;

    bool operator==(const SecurityIssue&) const = default;
};

struct BypassVector {
    std::string type;  // pattern-escape, precedence-exploit
    std::string description;
    std::string example;
    std::string mitigation;

    bool operator==(const BypassVector&) const = default;
};

struct SecurityAnalysis {
    int score = 100;
    std::vector<SecurityIssue> issues;
    std::vector<BypassVector> bypass_vectors;
    std::vector<std::string> recommendations;

    bool operator==(const SecurityAnalysis&) const = default;
};

/// Terminal artifact of every validation. is_valid == errors.empty() at all times
/// when mutated through add_error().
struct ValidationResult {
    bool is_valid = true;
    std::vector<ValidationIssue> errors;
    std::vector<ValidationIssue> warnings;
    std::vector<Conflict> conflicts;
    std::vector<ResolutionSuggestion> suggestions;
    PerformanceMetrics performance;
    std::optional<std::string> configuration_hash;
    std::optional<SecurityAnalysis> security;

    void add_error(ValidationIssue issue) {
        is_valid = false;
        errors.push_back(std::move(issue));
    }

    void add_warning(ValidationIssue issue) { warnings.push_back(std::move(issue)); }

    [[nodiscard]] bool has_errors() const noexcept { return !is_valid || !errors.empty(); }

    bool operator==(const ValidationResult&) const = default;
};

// JSON serialization (used for CLI output, cache size estimation and cache export)
// from_json overloads throw nlohmann::json::exception or std::invalid_argument on
// malformed input.

void to_json(nlohmann::json& j, const ConflictingRule& r);
void from_json(const nlohmann::json& j, ConflictingRule& r);
void to_json(nlohmann::json& j, const Conflict& c);
void from_json(const nlohmann::json& j, Conflict& c);
void to_json(nlohmann::json& j, const Change& change);
void from_json(const nlohmann::json& j, Change& change);
void to_json(nlohmann::json& j, const ResolutionSuggestion& s);
void from_json(const nlohmann::json& j, ResolutionSuggestion& s);
void to_json(nlohmann::json& j, const ValidationIssue& issue);
void from_json(const nlohmann::json& j, ValidationIssue& issue);
void to_json(nlohmann::json& j, const PerformanceMetrics& p);
void from_json(const nlohmann::json& j, PerformanceMetrics& p);
void to_json(nlohmann::json& j, const SecurityAnalysis& s);
void from_json(const nlohmann::json& j, SecurityAnalysis& s);
void to_json(nlohmann::json& j, const ValidationResult& r);
void from_json(const nlohmann::json& j, ValidationResult& r);

}  // namespace bastion::validation
