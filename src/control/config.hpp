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

// Bastion Configuration - Header
// Engine settings schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bastion::control {

/// Result cache settings
struct CacheSettings {
    bool enabled = true;
    uint32_t max_entries = 1000;
    uint32_t max_memory_mb = 50;
    uint64_t ttl_ms = 300000;  // 5 minutes
};

/// Latency budget
struct PerformanceSettings {
    double target_ms = 100.0;
    bool strict_timeout = false;  // deadline expiry becomes an error
};

/// Security posture
struct SecuritySettings {
    std::string level = "strict";  // strict, moderate, permissive
    bool enforce_zero_bypass = true;  // informational: enforcement cannot be disabled
    bool detect_weak_patterns = true;
    bool require_deny_rules = false;
    std::vector<std::string> high_risk_tokens = {"exec",  "eval",   "shell", "cmd",
                                                 "powershell", "system", "spawn", "fork"};
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";            // debug, info, warning, error
    std::string format = "json";           // json, text
    std::string output = "/tmp/bastion";   // Log directory (bastion.log appended)

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Full engine configuration
struct EngineConfig {
    uint32_t max_workers = 0;  // 0 = min(4, cores)
    CacheSettings cache;
    PerformanceSettings performance;
    SecuritySettings security;
    LogConfig logging;

    std::string version = "1.0";
};

/// Top-level keys recognised in an engine configuration document
inline const std::vector<std::string>& known_config_keys() {
    static const std::vector<std::string> keys = {"max_workers", "cache",   "performance",
                                                  "security",    "logging", "version"};
    return keys;
}

// All config types use custom from_json/to_json so that partial documents fill in defaults

inline void from_json(const nlohmann::json& j, CacheSettings& c) {
    c.enabled = j.value("enabled", true);
    c.max_entries = j.value("max_entries", 1000u);
    c.max_memory_mb = j.value("max_memory_mb", 50u);
    c.ttl_ms = j.value("ttl_ms", uint64_t(300000));
}

inline void to_json(nlohmann::json& j, const CacheSettings& c) {
    j = nlohmann::json{{"enabled", c.enabled},
                       {"max_entries", c.max_entries},
                       {"max_memory_mb", c.max_memory_mb},
                       {"ttl_ms", c.ttl_ms}};
}

inline void from_json(const nlohmann::json& j, PerformanceSettings& p) {
    p.target_ms = j.value("target_ms", 100.0);
    p.strict_timeout = j.value("strict_timeout", false);
}

inline void to_json(nlohmann::json& j, const PerformanceSettings& p) {
    j = nlohmann::json{{"target_ms", p.target_ms}, {"strict_timeout", p.strict_timeout}};
}

inline void from_json(const nlohmann::json& j, SecuritySettings& s) {
    s.level = j.value("level", std::string("strict"));
    s.enforce_zero_bypass = j.value("enforce_zero_bypass", true);
    s.detect_weak_patterns = j.value("detect_weak_patterns", true);
    s.require_deny_rules = j.value("require_deny_rules", false);
    if (j.contains("high_risk_tokens")) {
        j.at("high_risk_tokens").get_to(s.high_risk_tokens);
    }
}

inline void to_json(nlohmann::json& j, const SecuritySettings& s) {
    j = nlohmann::json{{"level", s.level},
                       {"enforce_zero_bypass", s.enforce_zero_bypass},
                       {"detect_weak_patterns", s.detect_weak_patterns},
                       {"require_deny_rules", s.require_deny_rules},
                       {"high_risk_tokens", s.high_risk_tokens}};
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("json"));
    l.output = j.value("output", std::string("/tmp/bastion"));
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{
        {"level", l.level}, {"format", l.format}, {"output", l.output}, {"rotation", l.rotation}};
}

inline void from_json(const nlohmann::json& j, EngineConfig& c) {
    // contains() + get_to() rather than value() keeps nested defaults intact
    c.max_workers = j.value("max_workers", 0u);
    if (j.contains("cache")) {
        j.at("cache").get_to(c.cache);
    }
    if (j.contains("performance")) {
        j.at("performance").get_to(c.performance);
    }
    if (j.contains("security")) {
        j.at("security").get_to(c.security);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
    c.version = j.value("version", std::string("1.0"));
}

inline void to_json(nlohmann::json& j, const EngineConfig& c) {
    j = nlohmann::json::object();
    j["max_workers"] = c.max_workers;
    j["cache"] = c.cache;
    j["performance"] = c.performance;
    j["security"] = c.security;
    j["logging"] = c.logging;
    j["version"] = c.version;
}

/// Configuration validation result
struct ConfigValidation {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from a JSON file. On failure error_message says why.
    [[nodiscard]] static std::optional<EngineConfig> load_from_file(std::string_view path,
                                                                    std::string& error_message);

    /// Load configuration from a JSON string. Validation errors reject the document;
    /// validation warnings are logged.
    [[nodiscard]] static std::optional<EngineConfig> load_from_json(std::string_view json,
                                                                    std::string& error_message);

    /// Range and enumeration checks
    [[nodiscard]] static ConfigValidation validate(const EngineConfig& config);

    /// Convert configuration to a JSON string
    [[nodiscard]] static std::string to_json(const EngineConfig& config);
};

}  // namespace bastion::control
