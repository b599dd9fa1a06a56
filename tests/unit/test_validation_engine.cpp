// Bastion Validation Engine Unit Tests

#include "../../src/validation/validation_engine.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <limits>
#include <string>

using namespace bastion::validation;
using bastion::control::EngineConfig;

namespace {

bool has_issue(const std::vector<ValidationIssue>& issues, IssueType type) {
    return std::any_of(issues.begin(), issues.end(),
                       [type](const ValidationIssue& i) { return i.type == type; });
}

bool has_message(const std::vector<ValidationIssue>& issues, const std::string& text) {
    return std::any_of(issues.begin(), issues.end(), [&](const ValidationIssue& i) {
        return i.message.find(text) != std::string::npos;
    });
}

ValidationOptions uncached() {
    ValidationOptions options;
    options.skip_cache = true;
    return options;
}

}  // namespace

TEST_CASE("Allow rule identical to a deny rule is rejected", "[validation][engine]") {
    ValidationEngine engine;
    auto result = engine.validate(make_config({"exec"}, {"exec"}));

    REQUIRE_FALSE(result.is_valid);
    REQUIRE(result.errors.size() == 1);
    REQUIRE(result.errors[0].type == IssueType::SecurityViolation);
    REQUIRE(result.errors[0].severity == Severity::Critical);
    REQUIRE(result.errors[0].location == "permissions.allow[0]");
    REQUIRE(result.errors[0].message.starts_with("CRITICAL SECURITY VIOLATION"));

    REQUIRE(result.conflicts.size() == 1);
    REQUIRE(result.conflicts[0].kind == ConflictKind::AllowOverridesDeny);

    // Allow rule carries a high-risk token
    REQUIRE(has_message(result.warnings, "Potentially dangerous pattern in allow rules: exec"));

    REQUIRE(result.security.has_value());
    REQUIRE(result.security->score == 80);
    REQUIRE(result.security->issues[0].type == "zero-bypass-violation");

    REQUIRE(result.suggestions.size() == 1);
    REQUIRE(result.suggestions[0].message == "Remove allow rule \"exec\" to resolve conflict");
    REQUIRE(result.suggestions[0].critical);

    REQUIRE(result.configuration_hash.has_value());
    REQUIRE(result.performance.rules_processed == 2);
}

TEST_CASE("Wildcard allow rule over a deny rule", "[validation][engine]") {
    ValidationEngine engine;
    auto result = engine.validate(make_config({"exec"}, {"*"}));

    REQUIRE_FALSE(result.is_valid);
    REQUIRE(result.conflicts.size() == 1);
    REQUIRE(result.conflicts[0].overlap == OverlapKind::Superset);
    REQUIRE(result.conflicts[0].impact == Severity::Critical);

    // Zero-bypass violation plus the too-broad pattern
    REQUIRE(result.errors.size() == 2);
    REQUIRE(has_message(result.errors, "Pattern \"*\" in allow rules is too broad"));
    REQUIRE(has_message(result.warnings, "Overly broad pattern \"*\" in allow rules"));
    REQUIRE(has_message(result.warnings, "Overly permissive allow rule: \"*\""));
    REQUIRE(result.security->score == 55);
}

TEST_CASE("Disjoint rules validate cleanly", "[validation][engine]") {
    ValidationEngine engine;
    auto result = engine.validate(make_config({"/etc/*"}, {"/home/*"}));

    REQUIRE(result.is_valid);
    REQUIRE(result.errors.empty());
    REQUIRE(result.conflicts.empty());
    REQUIRE(result.security->score == 100);
    REQUIRE(result.security->recommendations ==
            std::vector<std::string>{"Configuration has strong security posture"});

    // Shell execution hint with a safe auto-fix
    REQUIRE(result.suggestions.size() == 1);
    const auto& hint = result.suggestions[0];
    REQUIRE(hint.message == "Consider adding deny rules for shell execution commands");
    REQUIRE(hint.auto_fix.has_value());
    const auto& add = std::get<AddRule>(hint.auto_fix->change);
    REQUIRE(add.category == Category::Deny);
    REQUIRE(add.pattern == "exec");
}

TEST_CASE("Shell hint has no auto-fix when exec is already permitted", "[validation][engine]") {
    ValidationEngine engine;
    auto result = engine.validate(make_config({"/etc/*"}, {"exec"}));

    REQUIRE(result.is_valid);
    auto hint = std::find_if(result.suggestions.begin(), result.suggestions.end(),
                             [](const ResolutionSuggestion& s) {
                                 return s.message ==
                                        "Consider adding deny rules for shell execution commands";
                             });
    REQUIRE(hint != result.suggestions.end());
    REQUIRE_FALSE(hint->auto_fix.has_value());
}

TEST_CASE("Duplicate deny rules are a warning-level conflict", "[validation][engine]") {
    ValidationEngine engine;
    auto result = engine.validate(make_config({"exec", "exec"}));

    REQUIRE(result.is_valid);
    REQUIRE(result.conflicts.size() == 1);
    REQUIRE(result.conflicts[0].kind == ConflictKind::OverlappingPatterns);
    REQUIRE(std::any_of(result.suggestions.begin(), result.suggestions.end(),
                        [](const ResolutionSuggestion& s) {
                            return s.message.starts_with("Manual review required for");
                        }));
}

TEST_CASE("Partial overlap with a deny rule is fatal", "[validation][engine]") {
    ValidationEngine engine;
    auto result = engine.validate(make_config({"src/*"}, {"*.js"}));

    REQUIRE_FALSE(result.is_valid);
    REQUIRE(result.conflicts[0].kind == ConflictKind::AllowOverridesDeny);
    REQUIRE(result.conflicts[0].overlap == OverlapKind::Partial);
    REQUIRE(has_issue(result.errors, IssueType::SecurityViolation));
}

TEST_CASE("Ask rules cannot override deny rules either", "[validation][engine]") {
    ValidationEngine engine;
    auto result = engine.validate(make_config({"rm"}, {}, {"rm"}));

    REQUIRE_FALSE(result.is_valid);
    REQUIRE(result.errors[0].severity == Severity::High);
    REQUIRE(result.errors[0].location == "permissions.ask[0]");
}

TEST_CASE("Ask-side bypass weighs as high in the security score", "[validation][engine]") {
    ValidationEngine engine;
    auto ask = engine.validate(make_config({"exec"}, {}, {"exec"}));
    auto allow = engine.validate(make_config({"exec"}, {"exec"}));

    REQUIRE(ask.conflicts[0].impact == Severity::High);
    REQUIRE(ask.security->issues[0].type == "zero-bypass-violation");
    REQUIRE(ask.security->issues[0].severity == Severity::High);
    REQUIRE(ask.security->score == 90);
    REQUIRE(allow.security->score == 80);
}

TEST_CASE("Large disjoint rule set", "[validation][engine][scale]") {
    ValidationEngine engine;
    std::vector<std::string> deny;
    std::vector<std::string> allow;
    for (int i = 0; i < 500; ++i) {
        deny.push_back("/deny/" + std::to_string(i) + "/*");
        allow.push_back("/allow/" + std::to_string(i) + "/*");
    }

    auto result = engine.validate(make_config(deny, allow));
    REQUIRE(result.is_valid);
    REQUIRE(result.conflicts.empty());
    REQUIRE(result.performance.rules_processed == 1000);
}

TEST_CASE("Reference scenarios", "[validation][engine][scenarios]") {
    ValidationEngine engine;

    SECTION("Allowed file inside a denied extension") {
        auto result = engine.validate(make_config({"*.exe"}, {"app.exe"}));
        REQUIRE_FALSE(result.is_valid);
        REQUIRE(result.conflicts.size() == 1);
        REQUIRE(result.conflicts[0].kind == ConflictKind::AllowOverridesDeny);
        REQUIRE(result.conflicts[0].overlap == OverlapKind::Subset);
        REQUIRE(result.conflicts[0].impact == Severity::Critical);
    }

    SECTION("Separate directories") {
        auto result = engine.validate(make_config({"dangerous/*"}, {"safe/*"}));
        REQUIRE(result.is_valid);
        REQUIRE(result.conflicts.empty());
    }

    SECTION("Duplicated deny glob") {
        auto result = engine.validate(make_config({"test/*", "test/*"}));
        REQUIRE(result.is_valid);
        REQUIRE(result.conflicts.size() == 1);
        REQUIRE(result.conflicts[0].kind == ConflictKind::OverlappingPatterns);
        REQUIRE(result.conflicts[0].overlap == OverlapKind::Exact);
    }

    SECTION("Thousand rules across three categories") {
        std::vector<std::string> deny;
        std::vector<std::string> allow;
        std::vector<std::string> ask;
        for (int i = 0; i < 400; ++i) {
            deny.push_back("/deny/" + std::to_string(i) + "/*");
            allow.push_back("/allow/" + std::to_string(i) + "/*");
        }
        for (int i = 0; i < 200; ++i) {
            ask.push_back("/ask/" + std::to_string(i) + "/*");
        }

        auto result = engine.validate(make_config(deny, allow, ask));
        REQUIRE(result.is_valid);
        REQUIRE(result.performance.rules_processed == 1000);
    }
}

TEST_CASE("Zero-bypass survives every shortcut", "[validation][engine][zero-bypass]") {
    ValidationEngine engine;
    auto config = make_config({"exec"}, {"exec"});

    SECTION("Expired deadline") {
        ValidationOptions options = uncached();
        options.timeout_ms = 0;
        auto result = engine.validate(config, options);

        REQUIRE_FALSE(result.is_valid);
        REQUIRE(has_issue(result.errors, IssueType::SecurityViolation));
        REQUIRE(has_issue(result.warnings, IssueType::PerformanceWarning));
        REQUIRE_FALSE(has_issue(result.errors, IssueType::InvalidSyntax));
        REQUIRE_FALSE(result.performance.achieved);
        REQUIRE_FALSE(result.security.has_value());
    }

    SECTION("Expired deadline in strict mode") {
        ValidationOptions options = uncached();
        options.timeout_ms = 0;
        options.strict_mode = true;
        auto result = engine.validate(config, options);

        REQUIRE(has_issue(result.errors, IssueType::SecurityViolation));
        REQUIRE(has_message(result.errors, "Validation timed out after"));
    }

    SECTION("Cancelled run") {
        std::atomic<bool> cancel{true};
        ValidationOptions options = uncached();
        options.cancel = &cancel;
        auto result = engine.validate(config, options);

        REQUIRE_FALSE(result.is_valid);
        REQUIRE(has_issue(result.errors, IssueType::SecurityViolation));
        REQUIRE(has_message(result.errors, "Validation cancelled"));
    }

    SECTION("Conflict detection skipped") {
        ValidationOptions options = uncached();
        options.skip_conflict_detection = true;
        auto result = engine.validate(make_config({"exec", "exec"}, {"exec"}), options);

        REQUIRE_FALSE(result.is_valid);
        REQUIRE(result.conflicts.size() == 1);
        REQUIRE(result.conflicts[0].kind == ConflictKind::AllowOverridesDeny);
    }

    // Interrupted runs never reach the cache
    REQUIRE(engine.cache_stats().entries == 0);
}

TEST_CASE("Very large timeouts never expire early", "[validation][engine][timeout]") {
    ValidationEngine engine;
    auto config = make_config({"/etc/*"}, {"/home/*"});

    for (uint64_t timeout : {uint64_t{10'000'000'000'000}, std::numeric_limits<uint64_t>::max()}) {
        ValidationOptions options = uncached();
        options.timeout_ms = timeout;
        options.strict_mode = true;
        auto result = engine.validate(config, options);

        REQUIRE(result.is_valid);
        REQUIRE(result.errors.empty());
        REQUIRE_FALSE(has_issue(result.warnings, IssueType::PerformanceWarning));
        REQUIRE(result.security.has_value());
    }
}

TEST_CASE("Repeated validation hits the cache", "[validation][engine][cache]") {
    ValidationEngine engine;
    auto config = make_config({"exec"}, {"exec"});

    auto first = engine.validate(config);
    REQUIRE_FALSE(first.performance.cache_hit);

    auto second = engine.validate(config);
    REQUIRE(second.performance.cache_hit);

    second.performance = first.performance;
    REQUIRE(second == first);

    // Key order and metadata do not change the hash
    nlohmann::json reordered = {{"metadata", {{"note", "x"}}},
                                {"permissions", {{"allow", {"exec"}}, {"deny", {"exec"}}}}};
    REQUIRE(engine.validate(reordered).performance.cache_hit);

    auto stats = engine.cache_stats();
    REQUIRE(stats.hits == 2);
    REQUIRE(stats.entries == 1);
}

TEST_CASE("Options that change results use separate cache slots", "[validation][engine][cache]") {
    ValidationEngine engine;
    auto config = make_config({"exec"}, {"exec"});
    (void)engine.validate(config);

    ValidationOptions strict;
    strict.strict_mode = true;
    REQUIRE_FALSE(engine.validate(config, strict).performance.cache_hit);
    REQUIRE(engine.validate(config, strict).performance.cache_hit);

    REQUIRE_FALSE(engine.validate(config, uncached()).performance.cache_hit);

    engine.clear_cache();
    REQUIRE(engine.cache_stats().entries == 0);
}

TEST_CASE("Malformed documents", "[validation][engine][errors]") {
    ValidationEngine engine;

    SECTION("Not an object") {
        auto result = engine.validate(nlohmann::json("not json"));
        REQUIRE_FALSE(result.is_valid);
        REQUIRE(result.errors[0].type == IssueType::InvalidSyntax);
    }

    SECTION("Permissions of the wrong type") {
        auto result = engine.validate(nlohmann::json{{"permissions", nlohmann::json::array()}});
        REQUIRE_FALSE(result.is_valid);
        REQUIRE(result.errors[0].type == IssueType::InvalidSyntax);
        REQUIRE(result.errors[0].location == "permissions");
    }

    SECTION("Empty document") {
        auto result = engine.validate(nlohmann::json::object());
        REQUIRE(result.is_valid);
        REQUIRE(result.performance.rules_processed == 0);
    }
}

TEST_CASE("Boundary patterns", "[validation][engine][patterns]") {
    ValidationEngine engine;

    SECTION("Empty pattern is a warning, or an error in strict mode") {
        auto config = make_config({""});
        auto lenient = engine.validate(config);
        REQUIRE(lenient.is_valid);
        REQUIRE(has_message(lenient.warnings, "Empty rule pattern in deny rules"));

        ValidationOptions strict;
        strict.strict_mode = true;
        auto result = engine.validate(config, strict);
        REQUIRE_FALSE(result.is_valid);
        REQUIRE(has_issue(result.errors, IssueType::InvalidPattern));
    }

    SECTION("Bare wildcard allow without deny rules") {
        auto result = engine.validate(make_config({}, {"*"}));
        REQUIRE_FALSE(result.is_valid);
        REQUIRE(result.conflicts.empty());
        REQUIRE(result.errors[0].type == IssueType::SecurityViolation);
        REQUIRE(result.errors[0].severity == Severity::Critical);
    }

    SECTION("Unparseable regex is kept as a literal") {
        auto result = engine.validate(make_config({"/etc/*"}, {"(unclosed"}));
        REQUIRE(result.is_valid);
        REQUIRE(result.performance.rules_processed == 2);
        REQUIRE(has_message(result.warnings, "Invalid regex pattern \"(unclosed\" treated as literal"));
    }

    SECTION("Weak deny pattern") {
        auto result = engine.validate(make_config({"*.tmp"}));
        REQUIRE(result.is_valid);
        REQUIRE(has_message(result.warnings, "Weak deny pattern detected: \"*.tmp\""));
        REQUIRE(result.security->bypass_vectors.size() == 1);
        REQUIRE(result.security->bypass_vectors[0].type == "pattern-escape");
        REQUIRE(result.security->bypass_vectors[0].example ==
                "Path traversal: ../*.tmp/../../sensitive");
    }
}

TEST_CASE("Deep analysis reports weaknesses as conflicts", "[validation][engine]") {
    ValidationEngine engine;
    auto config = make_config({"*.tmp"});

    REQUIRE(engine.validate(config).conflicts.empty());

    ValidationOptions deep;
    deep.deep_analysis = true;
    auto result = engine.validate(config, deep);
    REQUIRE_FALSE(result.conflicts.empty());
    REQUIRE(result.conflicts[0].kind == ConflictKind::SecurityViolation);
}

TEST_CASE("Custom high-risk tokens", "[validation][engine]") {
    ValidationEngine engine;
    auto config = make_config({"/etc/*"}, {"docker run"});

    REQUIRE_FALSE(has_message(engine.validate(config).warnings, "Potentially dangerous"));

    ValidationOptions options;
    options.custom_patterns = {"Docker"};
    auto result = engine.validate(config, options);
    REQUIRE(has_message(result.warnings, "Potentially dangerous pattern in allow rules: docker run"));
}

TEST_CASE("Engine configuration drives policy", "[validation][engine][config]") {
    SECTION("Moderate level narrows instead of removing") {
        EngineConfig config;
        config.security.level = "moderate";
        ValidationEngine engine(config);

        auto result = engine.validate(make_config({"exec"}, {"exec"}));
        REQUIRE_FALSE(result.is_valid);
        const auto& modify = std::get<ModifyRule>(result.suggestions[0].auto_fix->change);
        REQUIRE(modify.new_pattern == "safe/exec");
    }

    SECTION("Required deny rules") {
        EngineConfig config;
        config.security.require_deny_rules = true;
        ValidationEngine engine(config);

        auto result = engine.validate(make_config({}, {"ls"}));
        REQUIRE(result.is_valid);
        REQUIRE(has_message(result.warnings, "No deny rules defined"));
    }

    SECTION("Weak pattern detection can be disabled") {
        EngineConfig config;
        config.security.detect_weak_patterns = false;
        ValidationEngine engine(config);

        auto result = engine.validate(make_config({"*.tmp"}));
        REQUIRE_FALSE(has_message(result.warnings, "Weak deny pattern"));
    }

    SECTION("Disabled cache") {
        EngineConfig config;
        config.cache.enabled = false;
        ValidationEngine engine(config);

        auto config_json = make_config({"exec"});
        (void)engine.validate(config_json);
        REQUIRE_FALSE(engine.validate(config_json).performance.cache_hit);
        REQUIRE(engine.warm_cache({config_json}) == 0);
    }
}

TEST_CASE("Batch validation keeps input order", "[validation][engine][batch]") {
    ValidationEngine engine;
    std::vector<nlohmann::json> configs = {
        make_config({"/etc/*"}, {"/home/*"}),
        make_config({"exec"}, {"exec"}),
        make_config({"rm"}),
    };

    ValidationOptions options;
    options.worker_count = 2;
    BatchResult batch = engine.validate_batch("batch-1", configs, options);

    REQUIRE(batch.id == "batch-1");
    REQUIRE(batch.results.size() == 3);
    REQUIRE(batch.results[0].is_valid);
    REQUIRE_FALSE(batch.results[1].is_valid);
    REQUIRE(batch.results[2].is_valid);
    REQUIRE(batch.success_count == 2);
    REQUIRE(batch.failure_count == 1);

    nlohmann::json j = batch;
    REQUIRE(j["count"] == 3);
    REQUIRE(j["failureCount"] == 1);
}

TEST_CASE("Rule statistics", "[validation][engine][stats]") {
    ValidationEngine engine;
    auto stats = engine.get_rule_statistics(make_config({"exec", "exec", "rm"}, {"*.js"}, {"git"}));

    REQUIRE(stats.total_rules == 5);
    REQUIRE(stats.by_category.deny == 3);
    REQUIRE(stats.by_category.allow == 1);
    REQUIRE(stats.by_category.ask == 1);
    REQUIRE(stats.complexity.glob_count == 1);
    REQUIRE(stats.complexity.literal_count == 4);
    REQUIRE(stats.complexity.max_pattern_length == 4);
    REQUIRE(stats.coverage.redundant_rules == std::vector<std::string>{"deny:exec"});
    REQUIRE(stats.coverage.estimated_coverage == 35);

    const auto& uncovered = stats.coverage.uncovered_patterns;
    REQUIRE(uncovered.size() == 7);
    REQUIRE(std::find(uncovered.begin(), uncovered.end(), "exec") == uncovered.end());
    REQUIRE(std::find(uncovered.begin(), uncovered.end(), "eval") != uncovered.end());

    // Statistics never touch the result cache
    REQUIRE(engine.cache_stats().entries == 0);
}

TEST_CASE("Cache warming and persistence", "[validation][engine][cache]") {
    std::vector<nlohmann::json> configs = {make_config({"exec"}), make_config({"rm"}, {"ls -la"})};

    ValidationEngine engine;
    REQUIRE(engine.warm_cache(configs) == 2);
    REQUIRE(engine.warm_cache(configs) == 0);
    REQUIRE(engine.cache_stats().entries == 2);

    std::string snapshot = engine.export_cache();

    ValidationEngine restored;
    std::string error;
    REQUIRE(restored.import_cache(snapshot, error));
    REQUIRE(restored.validate(configs[1]).performance.cache_hit);

    REQUIRE_FALSE(restored.import_cache("{}", error));
    REQUIRE_FALSE(error.empty());
}

TEST_CASE("Progress state ends complete", "[validation][engine]") {
    ValidationEngine engine;
    REQUIRE(engine.state().phase == ValidationPhase::Initializing);

    (void)engine.validate(make_config({"exec"}));
    ValidationState state = engine.state();
    REQUIRE(state.phase == ValidationPhase::Complete);
    REQUIRE(state.progress == 100);
    REQUIRE(to_string(state.phase) == "complete");
}
