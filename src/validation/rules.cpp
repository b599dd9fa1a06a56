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

#include "rules.hpp"

#include <fmt/format.h>

#include <array>

#include "../core/string_utils.hpp"

namespace bastion::validation {

namespace {

// Normalization order: deny first, then ask, then allow
constexpr std::array<Category, 3> CATEGORY_ORDER = {Category::Deny, Category::Ask,
                                                    Category::Allow};

int category_rank(Category category) {
    return static_cast<int>(category);
}

}  // namespace

size_t NormalizedRules::count(Category category) const noexcept {
    size_t n = 0;
    for (const auto& rule : rules) {
        if (rule.category == category) {
            ++n;
        }
    }
    return n;
}

Rule make_rule(std::string_view pattern, Category category, size_t index,
               pattern::PatternEngine& engine) {
    Rule rule;
    rule.original = std::string(pattern);
    rule.kind = pattern::classify(pattern);
    rule.matcher = engine.compile(pattern, rule.kind);
    rule.normalized = rule.matcher->expression();
    rule.category = category;
    rule.priority = category_rank(category) * CATEGORY_PRIORITY_STRIDE + static_cast<int>(index);
    rule.index = index;
    return rule;
}

NormalizedRules normalize_rules(const nlohmann::json& config, pattern::PatternEngine& engine) {
    NormalizedRules result;

    if (!config.is_object()) {
        result.errors.push_back({IssueType::InvalidSyntax,
                                 fmt::format("Configuration must be a JSON object, got {}",
                                             config.type_name()),
                                 Severity::High, ""});
        return result;
    }

    auto perms_it = config.find("permissions");
    if (perms_it == config.end() || perms_it->is_null()) {
        return result;
    }

    const nlohmann::json& permissions = *perms_it;
    if (!permissions.is_object()) {
        result.errors.push_back({IssueType::InvalidSyntax,
                                 fmt::format("'permissions' must be an object, got {}",
                                             permissions.type_name()),
                                 Severity::High, "permissions"});
        return result;
    }

    // Unknown keys are usually typos of a category name
    static const std::vector<std::string> known = {"deny", "allow", "ask"};
    for (const auto& [key, value] : permissions.items()) {
        if (parse_category(key)) {
            continue;
        }
        std::string message = fmt::format("Unknown permissions key '{}'", key);
        auto similar = core::find_similar_strings(key, known, 2);
        if (!similar.empty()) {
            message += fmt::format(". Did you mean '{}'?", similar.front());
        }
        result.warnings.push_back({IssueType::BestPracticeViolation, std::move(message),
                                   Severity::Low, fmt::format("permissions.{}", key)});
    }

    for (Category category : CATEGORY_ORDER) {
        std::string key(to_string(category));
        auto it = permissions.find(key);
        if (it == permissions.end() || it->is_null()) {
            continue;
        }

        std::string location = fmt::format("permissions.{}", key);
        if (!it->is_array()) {
            result.errors.push_back({IssueType::InvalidSyntax,
                                     fmt::format("'{}' must be an array of strings, got {}",
                                                 location, it->type_name()),
                                     Severity::High, location});
            continue;
        }

        for (size_t i = 0; i < it->size(); ++i) {
            const auto& entry = (*it)[i];
            if (!entry.is_string()) {
                result.warnings.push_back(
                    {IssueType::InvalidPattern,
                     fmt::format("Skipping non-string rule of type {}", entry.type_name()),
                     Severity::Medium, fmt::format("{}[{}]", location, i)});
                continue;
            }
            result.rules.push_back(make_rule(entry.get_ref<const std::string&>(), category, i, engine));
        }
    }

    return result;
}

nlohmann::json make_config(const std::vector<std::string>& deny,
                           const std::vector<std::string>& allow,
                           const std::vector<std::string>& ask) {
    nlohmann::json permissions = nlohmann::json::object();
    if (!deny.empty()) {
        permissions["deny"] = deny;
    }
    if (!allow.empty()) {
        permissions["allow"] = allow;
    }
    if (!ask.empty()) {
        permissions["ask"] = ask;
    }
    return nlohmann::json{{"permissions", std::move(permissions)}};
}

}  // namespace bastion::validation
