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

// Bastion Configuration - Implementation

#include "config.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <sstream>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"
#include "config_validator.hpp"

namespace bastion::control {

namespace {

constexpr uint32_t MAX_WORKERS_LIMIT = 64;

const std::vector<std::string> SECURITY_LEVELS = {"strict", "moderate", "permissive"};
const std::vector<std::string> LOG_LEVELS = {"debug", "info", "warning", "error"};
const std::vector<std::string> LOG_FORMATS = {"json", "text"};

bool one_of(const std::string& value, const std::vector<std::string>& allowed) {
    return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
}

void merge(ConfigValidation& into, ConfigValidation from) {
    for (auto& e : from.errors) {
        into.add_error(std::move(e));
    }
    for (auto& w : from.warnings) {
        into.add_warning(std::move(w));
    }
}

}  // namespace

// ConfigLoader implementation

std::optional<EngineConfig> ConfigLoader::load_from_file(std::string_view path,
                                                         std::string& error_message) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        error_message = fmt::format("Cannot open engine configuration '{}'", path_str);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json, error_message);
}

std::optional<EngineConfig> ConfigLoader::load_from_json(std::string_view json,
                                                         std::string& error_message) {
    EngineConfig config;
    ConfigValidation validation;

    try {
        auto j = nlohmann::json::parse(json);
        validation = ConfigValidator::validate_document(j);
        if (validation.has_errors()) {
            error_message = core::join(validation.errors, "; ");
            return std::nullopt;
        }
        config = j.get<EngineConfig>();
    } catch (const nlohmann::json::exception& e) {
        error_message = fmt::format("JSON parsing error: {}", e.what());
        return std::nullopt;
    }

    merge(validation, validate(config));
    merge(validation, ConfigValidator::validate_security(config));

    if (validation.has_errors()) {
        error_message = core::join(validation.errors, "; ");
        return std::nullopt;
    }

    if (auto* logger = logging::get_current_logger()) {
        for (const auto& warning : validation.warnings) {
            LOG_WARNING(logger, "Engine configuration: {}", warning);
        }
    }

    return config;
}

ConfigValidation ConfigLoader::validate(const EngineConfig& config) {
    ConfigValidation result;

    if (config.max_workers > MAX_WORKERS_LIMIT) {
        result.add_error(fmt::format("max_workers must be <= {} (got {})", MAX_WORKERS_LIMIT,
                                     config.max_workers));
    }

    // Cache
    if (config.cache.max_entries == 0) {
        result.add_error("cache.max_entries must be > 0");
    }
    if (config.cache.max_memory_mb == 0) {
        result.add_error("cache.max_memory_mb must be > 0");
    }
    if (config.cache.ttl_ms == 0) {
        result.add_error("cache.ttl_ms must be > 0");
    }

    // Performance
    if (!(config.performance.target_ms > 0.0)) {
        result.add_error("performance.target_ms must be > 0");
    }

    // Security
    if (!one_of(config.security.level, SECURITY_LEVELS)) {
        std::string message = fmt::format("Unknown security.level '{}'", config.security.level);
        std::string suggestion = ConfigValidator::suggest_key(config.security.level, SECURITY_LEVELS);
        if (!suggestion.empty()) {
            message += ". " + suggestion;
        }
        result.add_error(std::move(message));
    }

    // Logging
    if (!one_of(config.logging.level, LOG_LEVELS)) {
        result.add_warning(
            fmt::format("Unknown logging.level '{}' (info will be used)", config.logging.level));
    }
    if (!one_of(config.logging.format, LOG_FORMATS)) {
        result.add_error(fmt::format("Unknown logging.format '{}'", config.logging.format));
    }
    if (config.logging.output.empty()) {
        result.add_error("logging.output cannot be empty");
    }
    if (config.logging.rotation.max_size_mb == 0 || config.logging.rotation.max_files == 0) {
        result.add_error("logging.rotation sizes must be > 0");
    }

    return result;
}

std::string ConfigLoader::to_json(const EngineConfig& config) {
    nlohmann::json j = config;
    return j.dump(2);
}

}  // namespace bastion::control
