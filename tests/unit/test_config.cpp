// Bastion Configuration Layer Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>

#include "../../src/control/config.hpp"
#include "../../src/control/config_validator.hpp"

using namespace bastion::control;

namespace {

bool contains_text(const std::vector<std::string>& messages, const std::string& text) {
    for (const auto& m : messages) {
        if (m.find(text) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace

TEST_CASE("Config JSON serialization", "[control][config]") {
    EngineConfig config;
    config.max_workers = 2;
    config.cache.ttl_ms = 1000;

    std::string json = ConfigLoader::to_json(config);
    REQUIRE_FALSE(json.empty());
    REQUIRE(json.find("\"version\"") != std::string::npos);
    REQUIRE((json.find("\"ttl_ms\": 1000") != std::string::npos ||
             json.find("\"ttl_ms\":1000") != std::string::npos));
}

TEST_CASE("Config JSON deserialization", "[control][config]") {
    const char* json = R"({
        "version": "1.0",
        "max_workers": 3,
        "cache": { "max_entries": 10 },
        "security": { "level": "moderate", "require_deny_rules": true }
    })";

    std::string error;
    auto maybe_config = ConfigLoader::load_from_json(json, error);
    REQUIRE(maybe_config.has_value());
    REQUIRE(error.empty());

    const auto& config = *maybe_config;
    REQUIRE(config.max_workers == 3);
    REQUIRE(config.cache.max_entries == 10);
    REQUIRE(config.security.level == "moderate");
    REQUIRE(config.security.require_deny_rules);

    // Missing fields keep their defaults
    REQUIRE(config.cache.enabled);
    REQUIRE(config.cache.ttl_ms == 300000);
    REQUIRE(config.performance.target_ms == 100.0);
    REQUIRE(config.security.high_risk_tokens.size() == 8);
    REQUIRE(config.logging.format == "json");
}

TEST_CASE("Config serialization survives a reload", "[control][config]") {
    EngineConfig config;
    config.security.level = "permissive";
    config.security.high_risk_tokens = {"exec", "curl"};
    config.performance.strict_timeout = true;

    std::string error;
    auto reloaded = ConfigLoader::load_from_json(ConfigLoader::to_json(config), error);
    REQUIRE(reloaded.has_value());
    REQUIRE(reloaded->security.level == "permissive");
    REQUIRE(reloaded->security.high_risk_tokens == std::vector<std::string>{"exec", "curl"});
    REQUIRE(reloaded->performance.strict_timeout);
}

TEST_CASE("Config validation - defaults are valid", "[control][config]") {
    auto validation = ConfigLoader::validate(EngineConfig{});
    REQUIRE(validation.valid);
    REQUIRE_FALSE(validation.has_errors());
    REQUIRE(validation.warnings.empty());
}

TEST_CASE("Config validation - ranges", "[control][config]") {
    EngineConfig config;

    SECTION("Too many workers") {
        config.max_workers = 1000;
        auto validation = ConfigLoader::validate(config);
        REQUIRE_FALSE(validation.valid);
        REQUIRE(contains_text(validation.errors, "max_workers must be <= 64"));
    }

    SECTION("Zero cache capacity") {
        config.cache.max_entries = 0;
        config.cache.ttl_ms = 0;
        auto validation = ConfigLoader::validate(config);
        REQUIRE(validation.errors.size() == 2);
    }

    SECTION("Non-positive target") {
        config.performance.target_ms = 0.0;
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("Empty log output") {
        config.logging.output = "";
        REQUIRE(contains_text(ConfigLoader::validate(config).errors, "logging.output"));
    }

    SECTION("Unknown log level is only a warning") {
        config.logging.level = "verbose";
        auto validation = ConfigLoader::validate(config);
        REQUIRE(validation.valid);
        REQUIRE(validation.warnings.size() == 1);
    }
}

TEST_CASE("Config validation - misspelled security level", "[control][config]") {
    EngineConfig config;
    config.security.level = "stric";

    auto validation = ConfigLoader::validate(config);
    REQUIRE_FALSE(validation.valid);
    REQUIRE(validation.errors[0] == "Unknown security.level 'stric'. Did you mean 'strict'?");
}

TEST_CASE("Unknown keys suggest the closest known key", "[control][config][typo]") {
    nlohmann::json document = {{"cach", {{"enabled", true}}},
                               {"security", {{"levle", "strict"}}},
                               {"zzzzzzzzzz", 1}};

    auto validation = ConfigValidator::validate_document(document);
    REQUIRE(validation.valid);
    REQUIRE(validation.warnings.size() == 3);
    REQUIRE(contains_text(validation.warnings, "Unknown configuration key 'cach'. Did you mean 'cache'?"));
    REQUIRE(contains_text(validation.warnings,
                          "Unknown key 'levle' in 'security'. Did you mean 'level'?"));
    REQUIRE(contains_text(validation.warnings, "Unknown configuration key 'zzzzzzzzzz'"));
    REQUIRE_FALSE(contains_text(validation.warnings, "zzzzzzzzzz'. Did you mean"));
}

TEST_CASE("Document shape errors", "[control][config]") {
    REQUIRE_FALSE(ConfigValidator::validate_document(nlohmann::json::array()).valid);

    auto validation = ConfigValidator::validate_document({{"cache", 5}});
    REQUIRE_FALSE(validation.valid);
    REQUIRE(validation.errors[0] == "'cache' must be an object");

    std::string error;
    REQUIRE_FALSE(ConfigLoader::load_from_json(R"({"cache": 5})", error).has_value());
    REQUIRE(error == "'cache' must be an object");

    REQUIRE_FALSE(ConfigLoader::load_from_json("{ not json", error).has_value());
    REQUIRE(error.starts_with("JSON parsing error"));
}

TEST_CASE("Security policy checks", "[control][config][security]") {
    EngineConfig config;

    SECTION("Zero-bypass cannot be turned off") {
        config.security.enforce_zero_bypass = false;
        auto validation = ConfigValidator::validate_security(config);
        REQUIRE(validation.valid);
        REQUIRE(contains_text(validation.warnings, "enforce_zero_bypass=false is ignored"));
    }

    SECTION("Permissive level") {
        config.security.level = "permissive";
        auto validation = ConfigValidator::validate_security(config);
        REQUIRE(contains_text(validation.warnings, "caps resolution suggestions at 10"));
    }

    SECTION("Token list problems") {
        config.security.high_risk_tokens = {"exec", "EXEC", "", std::string(65, 'x'),
                                           std::string("a\x01") + "b"};
        auto validation = ConfigValidator::validate_security(config);
        REQUIRE_FALSE(validation.valid);
        REQUIRE(validation.errors.size() == 3);
        REQUIRE(contains_text(validation.errors, "High-risk token cannot be empty"));
        REQUIRE(contains_text(validation.errors, "High-risk token too long (65 > 64 chars)"));
        REQUIRE(contains_text(validation.errors, "Control character at position 1"));
        REQUIRE(validation.warnings == std::vector<std::string>{"Duplicate high-risk token 'EXEC'"});
    }

    SECTION("Empty token list") {
        config.security.high_risk_tokens.clear();
        auto validation = ConfigValidator::validate_security(config);
        REQUIRE(validation.valid);
        REQUIRE(validation.warnings.size() == 1);
    }
}

TEST_CASE("Loader rejects invalid security settings", "[control][config][security]") {
    std::string error;
    auto config = ConfigLoader::load_from_json(R"({"security": {"high_risk_tokens": [""]}})", error);
    REQUIRE_FALSE(config.has_value());
    REQUIRE(error == "High-risk token cannot be empty");
}

TEST_CASE("Config file loading", "[control][config]") {
    auto path = std::filesystem::temp_directory_path() / "bastion_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"performance": {"target_ms": 250, "strict_timeout": true}})";
    }

    std::string error;
    auto config = ConfigLoader::load_from_file(path.string(), error);
    std::filesystem::remove(path);

    REQUIRE(config.has_value());
    REQUIRE(config->performance.target_ms == 250.0);
    REQUIRE(config->performance.strict_timeout);

    REQUIRE_FALSE(ConfigLoader::load_from_file("/nonexistent/bastion.json", error).has_value());
    REQUIRE(error == "Cannot open engine configuration '/nonexistent/bastion.json'");
}
