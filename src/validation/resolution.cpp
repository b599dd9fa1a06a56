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

#include "resolution.hpp"

#include <fmt/format.h>

#include <algorithm>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"
#include "rules.hpp"

namespace bastion::validation {

namespace {

struct ResolutionTemplate {
    std::string_view name;
    ResolutionStrategy strategy;
    bool (*applies)(const Conflict&);
    std::string (*transform)(std::string_view);
};

const ConflictingRule* second_rule(const Conflict& conflict) {
    return conflict.rules.size() > 1 ? &conflict.rules[1] : nullptr;
}

// Checked in order; the first applicable template wins
const ResolutionTemplate TEMPLATES[] = {
    {"wildcard-to-specific", ResolutionStrategy::MakeAllowMoreRestrictive,
     [](const Conflict& c) {
         return c.kind == ConflictKind::AllowOverridesDeny &&
                std::any_of(c.rules.begin(), c.rules.end(), [](const ConflictingRule& r) {
                    return r.pattern == "*" || r.pattern == "**";
                });
     },
     [](std::string_view) { return std::string("*.safe"); }},
    {"add-path-prefix", ResolutionStrategy::MakeAllowMoreRestrictive,
     [](const Conflict& c) {
         const auto* other = second_rule(c);
         return c.kind == ConflictKind::AllowOverridesDeny && other &&
                other->pattern.find('/') == std::string::npos;
     },
     [](std::string_view p) { return fmt::format("safe/{}", p); }},
    {"add-extension-filter", ResolutionStrategy::MakeAllowMoreRestrictive,
     [](const Conflict& c) {
         const auto* other = second_rule(c);
         return other && other->pattern.ends_with('*');
     },
     [](std::string_view p) {
         std::string out(p);
         if (out.ends_with('*')) {
             out.pop_back();
             out += "*.txt";
         }
         return out;
     }},
};

const ConflictingRule* find_rule(const Conflict& conflict, bool deny) {
    for (const auto& rule : conflict.rules) {
        if ((rule.category == Category::Deny) == deny) {
            return &rule;
        }
    }
    return nullptr;
}

RiskLevel assess_change_risk(const Change& change) {
    if (const auto* add = std::get_if<AddRule>(&change)) {
        return add->category == Category::Allow ? RiskLevel::Moderate : RiskLevel::Safe;
    }
    if (std::holds_alternative<ModifyRule>(change)) {
        return RiskLevel::Moderate;
    }
    return RiskLevel::Safe;
}

// Index of the first string entry equal to pattern
std::optional<size_t> find_entry(const nlohmann::json& rules, std::string_view pattern) {
    for (size_t i = 0; i < rules.size(); ++i) {
        if (rules[i].is_string() && rules[i].get_ref<const std::string&>() == pattern) {
            return i;
        }
    }
    return std::nullopt;
}

bool apply_change(nlohmann::json& permissions, const Change& change) {
    const std::string category(to_string(change_category(change)));
    if (!permissions.contains(category) || !permissions[category].is_array()) {
        permissions[category] = nlohmann::json::array();
    }
    nlohmann::json& rules = permissions[category];

    if (const auto* remove = std::get_if<RemoveRule>(&change)) {
        auto index = find_entry(rules, remove->pattern);
        if (!index) {
            return false;
        }
        rules.erase(*index);
        return true;
    }
    if (const auto* modify = std::get_if<ModifyRule>(&change)) {
        auto index = find_entry(rules, modify->original_pattern);
        if (!index) {
            return false;
        }
        rules[*index] = modify->new_pattern;
        return true;
    }
    if (const auto* add = std::get_if<AddRule>(&change)) {
        if (find_entry(rules, add->pattern)) {
            return false;
        }
        if (add->position && *add->position < rules.size()) {
            rules.insert(rules.begin() + static_cast<std::ptrdiff_t>(*add->position), add->pattern);
        } else {
            rules.push_back(add->pattern);
        }
        return true;
    }
    if (const auto* reorder = std::get_if<ReorderRule>(&change)) {
        auto index = find_entry(rules, reorder->pattern);
        if (!index) {
            return false;
        }
        rules.erase(*index);
        size_t position = std::min(reorder->position, rules.size());
        rules.insert(rules.begin() + static_cast<std::ptrdiff_t>(position), reorder->pattern);
        return true;
    }
    return false;
}

AppliedChange change_record(const Change& change) {
    AppliedChange record;
    record.action = std::string(change_action(change));
    record.category = change_category(change);
    record.risk = assess_change_risk(change);

    if (const auto* add = std::get_if<AddRule>(&change)) {
        record.new_value = add->pattern;
        record.position = add->position;
        record.reason = add->reason;
    } else if (const auto* remove = std::get_if<RemoveRule>(&change)) {
        record.new_value = remove->pattern;
        record.reason = remove->reason;
    } else if (const auto* modify = std::get_if<ModifyRule>(&change)) {
        record.original_value = modify->original_pattern;
        record.new_value = modify->new_pattern;
        record.reason = modify->reason;
    } else if (const auto* reorder = std::get_if<ReorderRule>(&change)) {
        record.new_value = reorder->pattern;
        record.position = reorder->position;
        record.reason = reorder->reason;
    }
    return record;
}

// Key used to collapse suggestions that touch the same rule
std::string change_target(const Change& change) {
    std::string_view pattern;
    if (const auto* modify = std::get_if<ModifyRule>(&change)) {
        pattern = modify->original_pattern;
    } else if (const auto* add = std::get_if<AddRule>(&change)) {
        pattern = add->pattern;
    } else if (const auto* remove = std::get_if<RemoveRule>(&change)) {
        pattern = remove->pattern;
    } else if (const auto* reorder = std::get_if<ReorderRule>(&change)) {
        pattern = reorder->pattern;
    }
    return fmt::format("{}:{}", to_string(change_category(change)), pattern);
}

bool is_critical(const ResolutionSuggestion& s) {
    return s.critical || s.message.find("CRITICAL") != std::string::npos ||
           s.message.find("zero-bypass") != std::string::npos;
}

}  // namespace

// ============================================================================
// Pattern scores
// ============================================================================

int removal_specificity(std::string_view pattern) {
    int score = 100;
    score -= static_cast<int>(core::count_char(pattern, '*')) * 20;
    score -= static_cast<int>(core::count_char(pattern, '?')) * 10;
    score += static_cast<int>(core::count_char(pattern, '/')) * 5;
    score += static_cast<int>(std::min<size_t>(pattern.size(), 20));
    return score;
}

int security_score(std::string_view pattern) {
    int score = 50;
    const int stars = static_cast<int>(core::count_char(pattern, '*'));
    const int questions = static_cast<int>(core::count_char(pattern, '?'));

    if (stars == 0 && questions == 0) {
        score += 30;
    }
    score += static_cast<int>(std::min<size_t>(pattern.size(), 20));
    score += static_cast<int>(core::count_char(pattern, '/')) * 5;
    score -= stars * 10;
    score -= questions * 5;
    return std::clamp(score, 0, 100);
}

std::string make_more_restrictive(std::string_view pattern) {
    if (pattern == "*")
        return "*.txt";
    if (pattern == "**")
        return "safe/**";
    if (pattern == ".*")
        return ".config";

    std::string p(pattern);
    if (p.find('/') == std::string::npos) {
        return "allowed/" + p;
    }
    if (p.ends_with('*') && !p.ends_with("**")) {
        return p.substr(0, p.size() - 1) + ".allowed";
    }
    if (p.find('*') != std::string::npos) {
        return core::replace_all(p, "*", "allowed");
    }
    return p + ".allowed";
}

std::string make_deny_more_specific(std::string_view pattern) {
    if (pattern == "*")
        return "dangerous.*";
    if (pattern == "**")
        return "**/dangerous/**";

    std::string p(pattern);
    if (p.find('/') == std::string::npos) {
        return "dangerous/" + p;
    }
    if (p.find('*') != std::string::npos) {
        return core::replace_all(p, "*", "dangerous");
    }
    if (p.find('.') == std::string::npos) {
        return p + ".dangerous";
    }
    return p;
}

// ============================================================================
// JSON
// ============================================================================

void to_json(nlohmann::json& j, const AppliedChange& change) {
    j = nlohmann::json{{"type", change.action},
                       {"category", to_string(change.category)},
                       {"reason", change.reason},
                       {"risk", to_string(change.risk)}};
    if (change.original_value)
        j["originalValue"] = *change.original_value;
    if (change.new_value)
        j["newValue"] = *change.new_value;
    if (change.position)
        j["position"] = *change.position;
}

void to_json(nlohmann::json& j, const ApplyResult& result) {
    j = nlohmann::json{{"success", result.success},
                       {"resolvedConfig", result.resolved_config},
                       {"changes", result.changes},
                       {"messages", result.messages},
                       {"remainingConflicts", result.remaining_conflicts}};
}

// ============================================================================
// ResolutionEngine
// ============================================================================

ResolutionEngine::ResolutionEngine(SecurityLevel level, pattern::PatternEngine& engine,
                                   std::shared_ptr<const PatternAnalyzer> analyzer)
    : engine_(engine),
      analyzer_(analyzer ? std::move(analyzer) : std::make_shared<const PatternAnalyzer>()),
      detector_(analyzer_),
      level_(level) {}

ResolutionEngine::StrategyPlan ResolutionEngine::plan_for(ConflictKind kind, SecurityLevel level) {
    using S = ResolutionStrategy;
    switch (kind) {
        case ConflictKind::AllowOverridesDeny:
            return {level == SecurityLevel::Strict ? S::RemoveConflictingRule
                                                   : S::MakeAllowMoreRestrictive,
                    {S::MakeDenyMoreSpecific, S::ManualReviewRequired}};
        case ConflictKind::PrecedenceAmbiguity:
            return {S::MakeDenyMoreSpecific, {S::RemoveConflictingRule, S::ManualReviewRequired}};
        case ConflictKind::ContradictoryRules:
            return {S::ManualReviewRequired, {S::RemoveConflictingRule}};
        case ConflictKind::OverlappingPatterns:
            return {S::RemoveConflictingRule,
                    {S::MakeAllowMoreRestrictive, S::ManualReviewRequired}};
        case ConflictKind::SecurityViolation:
            break;
    }
    return {S::ManualReviewRequired, {}};
}

std::string ResolutionEngine::cache_key(const Conflict& conflict, SecurityLevel level) {
    std::vector<std::string> patterns;
    patterns.reserve(conflict.rules.size());
    for (const auto& rule : conflict.rules) {
        patterns.push_back(fmt::format("{}:{}", to_string(rule.category), rule.pattern));
    }
    std::sort(patterns.begin(), patterns.end());
    return fmt::format("{}:{}:{}", to_string(conflict.kind), core::join(patterns, "|"),
                       to_string(level));
}

std::optional<ResolutionSuggestion> ResolutionEngine::resolve_conflict(const Conflict& conflict) {
    SecurityLevel level;
    std::string key;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        level = level_;
        key = cache_key(conflict, level);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            return it->second;
        }
    }

    StrategyPlan plan = plan_for(conflict.kind, level);
    std::optional<ResolutionSuggestion> suggestion = apply_strategy(conflict, plan.preferred, level);
    for (auto strategy : plan.fallbacks) {
        if (suggestion) {
            break;
        }
        suggestion = apply_strategy(conflict, strategy, level);
    }

    if (suggestion) {
        suggestion->critical = conflict.impact == Severity::Critical;
        std::lock_guard<std::mutex> lock(mutex_);
        if (cache_.size() >= RESOLUTION_CACHE_CAPACITY && !cache_.contains(key)) {
            cache_.clear();
        }
        cache_.insert_or_assign(key, *suggestion);
    }
    return suggestion;
}

std::vector<ResolutionSuggestion> ResolutionEngine::resolve_all(const std::vector<Conflict>& conflicts) {
    std::vector<ResolutionSuggestion> suggestions;
    suggestions.reserve(conflicts.size());
    for (const auto& conflict : conflicts) {
        if (auto suggestion = resolve_conflict(conflict)) {
            suggestions.push_back(std::move(*suggestion));
        }
    }
    return optimize(std::move(suggestions));
}

std::optional<ResolutionSuggestion> ResolutionEngine::apply_strategy(const Conflict& conflict,
                                                                     ResolutionStrategy strategy,
                                                                     SecurityLevel level) {
    switch (strategy) {
        case ResolutionStrategy::RemoveConflictingRule:
            return removal(conflict, level);
        case ResolutionStrategy::MakeAllowMoreRestrictive:
            return restriction(conflict);
        case ResolutionStrategy::MakeDenyMoreSpecific:
            return deny_specific(conflict, level);
        case ResolutionStrategy::ManualReviewRequired:
            return manual_review(conflict);
    }
    return std::nullopt;
}

std::optional<ResolutionSuggestion> ResolutionEngine::removal(const Conflict& conflict,
                                                              SecurityLevel level) const {
    if (conflict.rules.empty()) {
        return std::nullopt;
    }

    const ConflictingRule* target = nullptr;
    if (level == SecurityLevel::Strict) {
        target = find_rule(conflict, false);
    }
    if (!target) {
        if (conflict.rules.size() < 2) {
            target = &conflict.rules[0];
        } else {
            const auto& first = conflict.rules[0];
            const auto& second = conflict.rules[1];
            target = removal_specificity(first.pattern) > removal_specificity(second.pattern)
                         ? &second
                         : &first;
        }
    }

    // Deny rules are never removed automatically
    if (target->category == Category::Deny) {
        return std::nullopt;
    }

    ResolutionSuggestion suggestion;
    suggestion.kind = SuggestionKind::Fix;
    suggestion.message = fmt::format("Remove {} rule \"{}\" to resolve conflict",
                                     to_string(target->category), target->pattern);
    suggestion.auto_fix = AutoFix{
        fmt::format("Removes the conflicting {} rule", to_string(target->category)),
        RemoveRule{target->category, target->pattern, conflict.message}};
    return suggestion;
}

std::optional<ResolutionSuggestion> ResolutionEngine::restriction(const Conflict& conflict) {
    const ConflictingRule* target = find_rule(conflict, false);
    if (!target) {
        return std::nullopt;
    }

    // Verify against the deny rule when there is one, otherwise the other side
    const ConflictingRule* opposing = find_rule(conflict, true);
    if (!opposing) {
        for (const auto& rule : conflict.rules) {
            if (&rule != target) {
                opposing = &rule;
                break;
            }
        }
    }

    std::string candidate;
    const ResolutionTemplate* applied = nullptr;
    for (const auto& tmpl : TEMPLATES) {
        if (tmpl.strategy == ResolutionStrategy::MakeAllowMoreRestrictive && tmpl.applies(conflict)) {
            applied = &tmpl;
            break;
        }
    }
    candidate = applied ? applied->transform(target->pattern) : make_more_restrictive(target->pattern);

    if (candidate == target->pattern) {
        return std::nullopt;
    }
    if (opposing && !verify(candidate, target->category, *opposing)) {
        if (auto* logger = logging::get_current_logger()) {
            BASTION_LOG_DEBUG(logger, "Rejected unverified restriction: {} -> {}", target->pattern,
                              candidate);
        }
        return std::nullopt;
    }

    ResolutionSuggestion suggestion;
    suggestion.kind = SuggestionKind::Fix;
    suggestion.message = fmt::format("Make {} rule more restrictive: \"{}\" → \"{}\"",
                                     to_string(target->category), target->pattern, candidate);
    suggestion.auto_fix = AutoFix{
        fmt::format("Restricts the {} rule to prevent security bypass", to_string(target->category)),
        ModifyRule{target->category, target->pattern, candidate, "Prevents override of deny rules"}};
    return suggestion;
}

std::optional<ResolutionSuggestion> ResolutionEngine::deny_specific(const Conflict& conflict,
                                                                    SecurityLevel level) const {
    const ConflictingRule* deny = find_rule(conflict, true);
    if (!deny) {
        return std::nullopt;
    }

    std::string candidate = make_deny_more_specific(deny->pattern);
    if (level == SecurityLevel::Strict && security_score(candidate) < security_score(deny->pattern)) {
        return std::nullopt;
    }

    // Narrowing a deny rule weakens it, so this is advice only and never an auto-fix
    ResolutionSuggestion suggestion;
    suggestion.kind = SuggestionKind::Warning;
    suggestion.message = fmt::format(
        "Consider making deny rule more specific: \"{}\" → \"{}\". Review manually; deny rules "
        "are never changed automatically.",
        deny->pattern, candidate);
    return suggestion;
}

ResolutionSuggestion ResolutionEngine::manual_review(const Conflict& conflict) {
    const bool has_deny = conflict.involves(Category::Deny);
    const bool mixed = std::any_of(conflict.rules.begin(), conflict.rules.end(),
                                   [&](const ConflictingRule& r) {
                                       return r.category != conflict.rules.front().category;
                                   });

    std::string_view guidance;
    if (has_deny && mixed) {
        guidance = "This involves security-critical deny rules mixed with permissive rules. "
                   "Exercise extreme caution.";
    } else if (conflict.rules.size() > 2) {
        guidance = "Multiple rules are involved. Consider breaking down into smaller, more "
                   "specific patterns.";
    } else if (conflict.impact == Severity::Critical) {
        guidance = "This is a critical security issue that requires immediate attention.";
    } else {
        guidance = "Review the business logic to determine the correct precedence.";
    }

    ResolutionSuggestion suggestion;
    suggestion.kind = SuggestionKind::Warning;
    suggestion.message = fmt::format("Manual review required for {}: {}. {}", to_string(conflict.kind),
                                     conflict.message, guidance);
    return suggestion;
}

bool ResolutionEngine::verify(std::string_view candidate, Category candidate_category,
                              const ConflictingRule& opposing) {
    Rule fixed = make_rule(candidate, candidate_category, 0, engine_);
    Rule other = make_rule(opposing.pattern, opposing.category, 0, engine_);
    return analyzer_->analyze_overlap(fixed, other).kind == OverlapKind::None;
}

std::vector<ResolutionSuggestion> ResolutionEngine::optimize(
    std::vector<ResolutionSuggestion> suggestions) const {
    std::vector<ResolutionSuggestion> optimized;
    optimized.reserve(suggestions.size());
    core::fast_set<std::string> targets;

    for (auto& suggestion : suggestions) {
        if (suggestion.auto_fix && !targets.insert(change_target(suggestion.auto_fix->change)).second) {
            continue;
        }
        optimized.push_back(std::move(suggestion));
    }

    std::stable_sort(optimized.begin(), optimized.end(),
                     [](const ResolutionSuggestion& a, const ResolutionSuggestion& b) {
                         return a.kind < b.kind;
                     });

    if (security_level() != SecurityLevel::Permissive ||
        optimized.size() <= PERMISSIVE_SUGGESTION_LIMIT) {
        return optimized;
    }

    std::vector<ResolutionSuggestion> capped;
    std::vector<ResolutionSuggestion> others;
    for (auto& suggestion : optimized) {
        if (is_critical(suggestion)) {
            capped.push_back(std::move(suggestion));
        } else {
            others.push_back(std::move(suggestion));
        }
    }
    size_t room = capped.size() < PERMISSIVE_SUGGESTION_LIMIT
                      ? PERMISSIVE_SUGGESTION_LIMIT - capped.size()
                      : 0;
    for (size_t i = 0; i < others.size() && i < room; ++i) {
        capped.push_back(std::move(others[i]));
    }
    return capped;
}

ApplyResult ResolutionEngine::apply_resolutions(const nlohmann::json& config,
                                                const std::vector<ResolutionSuggestion>& suggestions) {
    ApplyResult result;

    if (!config.is_object()) {
        result.messages.push_back("Configuration must be a JSON object");
        result.resolved_config = config;
        return result;
    }

    result.resolved_config = config;
    nlohmann::json& permissions = result.resolved_config["permissions"];
    if (!permissions.is_object()) {
        permissions = nlohmann::json::object();
    }

    for (const auto& suggestion : suggestions) {
        if (!suggestion.auto_fix) {
            continue;
        }
        const Change& change = suggestion.auto_fix->change;

        const bool touches_deny = change_category(change) == Category::Deny &&
                                  (std::holds_alternative<RemoveRule>(change) ||
                                   std::holds_alternative<ModifyRule>(change));
        if (touches_deny) {
            result.messages.push_back(
                fmt::format("Refused: {} (deny rules are never removed or modified automatically)",
                            suggestion.message));
            continue;
        }

        if (apply_change(permissions, change)) {
            result.changes.push_back(change_record(change));
            result.messages.push_back(fmt::format("Applied: {}", suggestion.message));
        } else {
            result.messages.push_back(fmt::format("Failed to apply: {}", suggestion.message));
        }
    }

    NormalizedRules normalized = normalize_rules(result.resolved_config, engine_);
    DetectionOptions options;
    options.deep_analysis = false;
    result.remaining_conflicts = detector_.detect(normalized.rules, options).conflicts;
    result.success = result.remaining_conflicts.empty();

    if (auto* logger = logging::get_current_logger()) {
        LOG_INFO(logger, "Resolutions applied: changes={}, remaining_conflicts={}",
                 result.changes.size(), result.remaining_conflicts.size());
    }
    return result;
}

void ResolutionEngine::set_security_level(SecurityLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    cache_.clear();
}

SecurityLevel ResolutionEngine::security_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void ResolutionEngine::clear_cache() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

size_t ResolutionEngine::cache_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

}  // namespace bastion::validation
