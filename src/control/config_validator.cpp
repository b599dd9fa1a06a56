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

// Config Validator - Implementation

#include "config_validator.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

#include "../core/containers.hpp"
#include "../core/string_utils.hpp"

namespace bastion::control {

namespace {

const std::vector<std::string> CACHE_KEYS = {"enabled", "max_entries", "max_memory_mb", "ttl_ms"};
const std::vector<std::string> PERFORMANCE_KEYS = {"target_ms", "strict_timeout"};
const std::vector<std::string> SECURITY_KEYS = {"level", "enforce_zero_bypass",
                                                "detect_weak_patterns", "require_deny_rules",
                                                "high_risk_tokens"};
const std::vector<std::string> LOGGING_KEYS = {"level", "format", "output", "rotation"};

}  // namespace

std::string ConfigValidator::suggest_key(std::string_view typo,
                                         const std::vector<std::string>& known) {
    auto similar = core::find_similar_strings(typo, known, 3);
    if (similar.empty()) {
        return "";
    }
    return fmt::format("Did you mean '{}'?", similar.front());
}

void ConfigValidator::check_keys(const nlohmann::json& section, std::string_view context,
                                 const std::vector<std::string>& known, ConfigValidation& result) {
    if (!section.is_object()) {
        return;
    }
    for (auto it = section.begin(); it != section.end(); ++it) {
        const std::string& key = it.key();
        if (std::find(known.begin(), known.end(), key) != known.end()) {
            continue;
        }
        std::string message = context.empty()
                                  ? fmt::format("Unknown configuration key '{}'", key)
                                  : fmt::format("Unknown key '{}' in '{}'", key, context);
        std::string suggestion = suggest_key(key, known);
        if (!suggestion.empty()) {
            message += ". " + suggestion;
        }
        result.add_warning(std::move(message));
    }
}

ConfigValidation ConfigValidator::validate_document(const nlohmann::json& document) {
    ConfigValidation result;

    if (!document.is_object()) {
        result.add_error(
            fmt::format("Engine configuration must be a JSON object, got {}", document.type_name()));
        return result;
    }

    check_keys(document, "", known_config_keys(), result);

    struct Section {
        std::string_view name;
        const std::vector<std::string>* keys;
    };
    const Section sections[] = {{"cache", &CACHE_KEYS},
                                {"performance", &PERFORMANCE_KEYS},
                                {"security", &SECURITY_KEYS},
                                {"logging", &LOGGING_KEYS}};

    for (const auto& section : sections) {
        auto it = document.find(section.name);
        if (it == document.end()) {
            continue;
        }
        if (!it->is_object()) {
            result.add_error(fmt::format("'{}' must be an object", section.name));
            continue;
        }
        check_keys(*it, section.name, *section.keys, result);
    }

    return result;
}

std::string ConfigValidator::validate_risk_token(std::string_view token) {
    if (token.empty()) {
        return "High-risk token cannot be empty";
    }
    if (token.length() > MAX_RISK_TOKEN_LENGTH) {
        return fmt::format("High-risk token too long ({} > {} chars)", token.length(),
                           MAX_RISK_TOKEN_LENGTH);
    }
    for (size_t i = 0; i < token.length(); ++i) {
        if (std::iscntrl(static_cast<unsigned char>(token[i]))) {
            return fmt::format("Control character at position {} in high-risk token", i);
        }
    }
    return "";
}

ConfigValidation ConfigValidator::validate_security(const EngineConfig& config) {
    ConfigValidation result;
    const auto& security = config.security;

    if (!security.enforce_zero_bypass) {
        result.add_warning(
            "security.enforce_zero_bypass=false is ignored: zero-bypass violations are always errors");
    }

    if (security.level == "permissive") {
        result.add_warning("security.level 'permissive' caps resolution suggestions at 10");
    }

    if (security.high_risk_tokens.empty()) {
        result.add_warning("security.high_risk_tokens is empty: risky allow rules will not be flagged");
    }

    core::fast_set<std::string> seen;
    for (const auto& token : security.high_risk_tokens) {
        std::string error = validate_risk_token(token);
        if (!error.empty()) {
            result.add_error(error);
            continue;
        }
        if (!seen.insert(core::to_lower(token)).second) {
            result.add_warning(fmt::format("Duplicate high-risk token '{}'", token));
        }
    }

    return result;
}

}  // namespace bastion::control
