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

// Configuration Validator - Typo Detection & Security Policy Checks

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"

namespace bastion::control {

/// Maximum length of a single high-risk token
constexpr size_t MAX_RISK_TOKEN_LENGTH = 64;

/// Checks that need the raw document (unknown keys) or go beyond plain ranges
class ConfigValidator {
public:
    /// Unknown keys at the top level and inside each section, with suggestions
    [[nodiscard]] static ConfigValidation validate_document(const nlohmann::json& document);

    /// Security posture checks on a parsed configuration
    [[nodiscard]] static ConfigValidation validate_security(const EngineConfig& config);

    /// "Did you mean 'x'?" or empty when nothing is close
    [[nodiscard]] static std::string suggest_key(std::string_view typo,
                                                 const std::vector<std::string>& known);

private:
    static void check_keys(const nlohmann::json& section, std::string_view context,
                           const std::vector<std::string>& known, ConfigValidation& result);

    /// Empty string if valid, error message if invalid
    [[nodiscard]] static std::string validate_risk_token(std::string_view token);
};

}  // namespace bastion::control
