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

// Bastion Validation - Rule Normalization
// Turns a raw permissions document into an ordered, compiled rule list

#pragma once

#include <nlohmann/json.hpp>
#include <string_view>
#include <vector>

#include "../pattern/pattern_engine.hpp"
#include "types.hpp"

namespace bastion::validation {

/// Priority stride between categories; deny < ask < allow for any realistic rule count
inline constexpr int CATEGORY_PRIORITY_STRIDE = 1'000'000;

/// Normalized rules plus structural problems found while reading the document
struct NormalizedRules {
    std::vector<Rule> rules;  // deny, then ask, then allow; original order within each
    std::vector<ValidationIssue> errors;
    std::vector<ValidationIssue> warnings;

    [[nodiscard]] size_t count(Category category) const noexcept;
};

/// Build one rule (compiled through engine's cache)
[[nodiscard]] Rule make_rule(std::string_view pattern, Category category, size_t index,
                             pattern::PatternEngine& engine);

/// Normalize a configuration object of shape {"permissions": {"deny": [..], "allow": [..],
/// "ask": [..]}}. Never throws on malformed input: problems are reported as issues and
/// offending entries are skipped.
[[nodiscard]] NormalizedRules normalize_rules(const nlohmann::json& config,
                                              pattern::PatternEngine& engine);

/// Convenience constructor for a permissions document
[[nodiscard]] nlohmann::json make_config(const std::vector<std::string>& deny,
                                         const std::vector<std::string>& allow = {},
                                         const std::vector<std::string>& ask = {});

}  // namespace bastion::validation
