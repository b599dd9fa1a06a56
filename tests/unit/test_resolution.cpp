// Bastion Resolution Engine Unit Tests

#include "../../src/validation/resolution.hpp"
#include "../../src/validation/rules.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>

using namespace bastion::validation;
using bastion::pattern::PatternEngine;

namespace {

Conflict first_conflict(PatternEngine& engine, const nlohmann::json& config) {
    ConflictDetector detector;
    DetectionOptions options;
    options.deep_analysis = false;
    auto result = detector.detect(normalize_rules(config, engine).rules, options);
    REQUIRE_FALSE(result.conflicts.empty());
    return result.conflicts.front();
}

ResolutionSuggestion warning(std::string message) {
    ResolutionSuggestion suggestion;
    suggestion.kind = SuggestionKind::Warning;
    suggestion.message = std::move(message);
    return suggestion;
}

ResolutionSuggestion fix(std::string message, Change change) {
    ResolutionSuggestion suggestion;
    suggestion.kind = SuggestionKind::Fix;
    suggestion.message = std::move(message);
    suggestion.auto_fix = AutoFix{"test change", std::move(change)};
    return suggestion;
}

}  // namespace

TEST_CASE("Pattern scores", "[validation][resolution]") {
    REQUIRE(removal_specificity("*") == 81);
    REQUIRE(removal_specificity("src/app.js") == 115);
    REQUIRE(removal_specificity("src/app.js") > removal_specificity("src/*"));

    REQUIRE(security_score("exec") == 84);
    REQUIRE(security_score("*") == 41);
    REQUIRE(security_score("/a/b/c/d/e/f/g/h/i/j") == 100);
    REQUIRE(security_score("********************") == 0);
}

TEST_CASE("Restriction and deny narrowing heuristics", "[validation][resolution]") {
    REQUIRE(make_more_restrictive("*") == "*.txt");
    REQUIRE(make_more_restrictive("**") == "safe/**");
    REQUIRE(make_more_restrictive("exec") == "allowed/exec");
    REQUIRE(make_more_restrictive("src/*") == "src/.allowed");
    REQUIRE(make_more_restrictive("a/b") == "a/b.allowed");

    REQUIRE(make_deny_more_specific("*") == "dangerous.*");
    REQUIRE(make_deny_more_specific("rm") == "dangerous/rm");
    REQUIRE(make_deny_more_specific("/tmp/*") == "/tmp/dangerous");
    REQUIRE(make_deny_more_specific("/etc/passwd") == "/etc/passwd.dangerous");
    REQUIRE(make_deny_more_specific("/etc/app.conf") == "/etc/app.conf");
}

TEST_CASE("Strict mode removes the permissive side of a bypass", "[validation][resolution]") {
    PatternEngine engine;
    ResolutionEngine resolver(SecurityLevel::Strict, engine);
    Conflict conflict = first_conflict(engine, make_config({"exec"}, {"exec"}));
    REQUIRE(conflict.kind == ConflictKind::AllowOverridesDeny);

    auto suggestion = resolver.resolve_conflict(conflict);
    REQUIRE(suggestion.has_value());
    REQUIRE(suggestion->kind == SuggestionKind::Fix);
    REQUIRE(suggestion->critical);
    REQUIRE(suggestion->message == "Remove allow rule \"exec\" to resolve conflict");
    REQUIRE(suggestion->auto_fix.has_value());

    const auto& remove = std::get<RemoveRule>(suggestion->auto_fix->change);
    REQUIRE(remove.category == Category::Allow);
    REQUIRE(remove.pattern == "exec");
}

TEST_CASE("Moderate mode narrows the permissive side", "[validation][resolution]") {
    PatternEngine engine;
    ResolutionEngine resolver(SecurityLevel::Moderate, engine);

    SECTION("Path prefix for a bare command") {
        Conflict conflict = first_conflict(engine, make_config({"exec"}, {"exec"}));
        auto suggestion = resolver.resolve_conflict(conflict);
        REQUIRE(suggestion.has_value());
        REQUIRE(suggestion->message == "Make allow rule more restrictive: \"exec\" → \"safe/exec\"");

        const auto& modify = std::get<ModifyRule>(suggestion->auto_fix->change);
        REQUIRE(modify.category == Category::Allow);
        REQUIRE(modify.original_pattern == "exec");
        REQUIRE(modify.new_pattern == "safe/exec");
    }

    SECTION("Bare wildcard becomes an extension filter") {
        Conflict conflict = first_conflict(engine, make_config({"exec"}, {"*"}));
        auto suggestion = resolver.resolve_conflict(conflict);
        REQUIRE(suggestion.has_value());
        const auto& modify = std::get<ModifyRule>(suggestion->auto_fix->change);
        REQUIRE(modify.original_pattern == "*");
        REQUIRE(modify.new_pattern == "*.safe");
    }
}

TEST_CASE("Restriction candidates are verified against the deny rule", "[validation][resolution]") {
    PatternEngine engine;
    ResolutionEngine resolver(SecurityLevel::Moderate, engine);

    Conflict conflict = first_conflict(engine, make_config({"safe/*"}, {"*"}));
    REQUIRE(conflict.kind == ConflictKind::AllowOverridesDeny);

    auto suggestion = resolver.resolve_conflict(conflict);
    REQUIRE(suggestion.has_value());
    if (suggestion->auto_fix) {
        // An auto-fix targets the allow rule and clears the overlap with the deny rule
        const auto& modify = std::get<ModifyRule>(suggestion->auto_fix->change);
        REQUIRE(modify.category == Category::Allow);
        Rule narrowed = make_rule(modify.new_pattern, Category::Allow, 0, engine);
        Rule deny = make_rule("safe/*", Category::Deny, 0, engine);
        PatternAnalyzer analyzer;
        REQUIRE(analyzer.analyze_overlap(narrowed, deny).kind == OverlapKind::None);
    } else {
        REQUIRE(suggestion->kind == SuggestionKind::Warning);
    }
}

TEST_CASE("Deny rules are never removed", "[validation][resolution]") {
    PatternEngine engine;

    for (auto level : {SecurityLevel::Strict, SecurityLevel::Moderate, SecurityLevel::Permissive}) {
        ResolutionEngine resolver(level, engine);
        Conflict conflict = first_conflict(engine, make_config({"exec", "exec"}));
        REQUIRE(conflict.kind == ConflictKind::OverlappingPatterns);

        auto suggestion = resolver.resolve_conflict(conflict);
        REQUIRE(suggestion.has_value());
        REQUIRE(suggestion->kind == SuggestionKind::Warning);
        REQUIRE_FALSE(suggestion->auto_fix.has_value());
        REQUIRE(suggestion->message.starts_with(
            "Manual review required for OVERLAPPING_PATTERNS: "));
    }
}

TEST_CASE("Precedence ambiguity gets deny narrowing advice", "[validation][resolution]") {
    PatternEngine engine;
    ResolutionEngine resolver(SecurityLevel::Strict, engine);

    Conflict conflict;
    conflict.kind = ConflictKind::PrecedenceAmbiguity;
    conflict.message = "Ambiguous precedence for pattern group: rm, rm";
    conflict.rules = {{Category::Deny, "rm", "permissions.deny[0]"},
                      {Category::Ask, "rm", "permissions.ask[0]"}};
    conflict.impact = Severity::High;

    auto suggestion = resolver.resolve_conflict(conflict);
    REQUIRE(suggestion.has_value());
    REQUIRE(suggestion->kind == SuggestionKind::Warning);
    REQUIRE_FALSE(suggestion->auto_fix.has_value());
    REQUIRE(suggestion->message.find("\"rm\" → \"dangerous/rm\"") != std::string::npos);
    REQUIRE_FALSE(suggestion->critical);
}

TEST_CASE("Contradictions require manual review", "[validation][resolution]") {
    PatternEngine engine;
    ResolutionEngine resolver(SecurityLevel::Moderate, engine);
    Conflict conflict = first_conflict(engine, make_config({}, {"git"}, {"git"}));
    REQUIRE(conflict.kind == ConflictKind::ContradictoryRules);

    auto suggestion = resolver.resolve_conflict(conflict);
    REQUIRE(suggestion.has_value());
    REQUIRE(suggestion->message.starts_with("Manual review required for CONTRADICTORY_RULES: "));
    REQUIRE(suggestion->message.ends_with(
        "Review the business logic to determine the correct precedence."));
}

TEST_CASE("Security level changes invalidate cached suggestions", "[validation][resolution]") {
    PatternEngine engine;
    ResolutionEngine resolver(SecurityLevel::Strict, engine);
    Conflict conflict = first_conflict(engine, make_config({"exec"}, {"exec"}));

    auto strict = resolver.resolve_conflict(conflict);
    auto again = resolver.resolve_conflict(conflict);
    REQUIRE(strict == again);
    REQUIRE(std::holds_alternative<RemoveRule>(strict->auto_fix->change));

    resolver.set_security_level(SecurityLevel::Moderate);
    REQUIRE(resolver.security_level() == SecurityLevel::Moderate);
    auto moderate = resolver.resolve_conflict(conflict);
    REQUIRE(std::holds_alternative<ModifyRule>(moderate->auto_fix->change));
}

TEST_CASE("Suggestion cache stays bounded", "[validation][resolution]") {
    PatternEngine engine;
    ResolutionEngine resolver(SecurityLevel::Moderate, engine);

    for (size_t i = 0; i < RESOLUTION_CACHE_CAPACITY + 50; ++i) {
        const std::string pattern = "tool" + std::to_string(i);
        Conflict conflict;
        conflict.kind = ConflictKind::ContradictoryRules;
        conflict.impact = Severity::Medium;
        conflict.rules = {{Category::Deny, pattern, "permissions.deny[0]"},
                          {Category::Allow, pattern, "permissions.allow[0]"}};

        REQUIRE(resolver.resolve_conflict(conflict).has_value());
        REQUIRE(resolver.cache_size() <= RESOLUTION_CACHE_CAPACITY);
    }
    REQUIRE(resolver.cache_size() == 50);
}

TEST_CASE("Suggestion optimization", "[validation][resolution]") {
    PatternEngine engine;

    SECTION("Duplicate targets collapse and fixes sort first") {
        ResolutionEngine resolver(SecurityLevel::Strict, engine);
        std::vector<ResolutionSuggestion> input = {
            warning("look at this"),
            fix("remove exec", RemoveRule{Category::Allow, "exec", ""}),
            fix("remove exec again", RemoveRule{Category::Allow, "exec", ""}),
            fix("remove ls", RemoveRule{Category::Allow, "ls", ""}),
        };

        auto optimized = resolver.optimize(input);
        REQUIRE(optimized.size() == 3);
        REQUIRE(optimized[0].message == "remove exec");
        REQUIRE(optimized[1].message == "remove ls");
        REQUIRE(optimized[2].message == "look at this");
    }

    SECTION("Permissive mode caps the list but keeps critical entries") {
        ResolutionEngine resolver(SecurityLevel::Permissive, engine);
        std::vector<ResolutionSuggestion> input;
        for (int i = 0; i < 15; ++i) {
            input.push_back(warning("warning " + std::to_string(i)));
        }
        auto critical = warning("late but important");
        critical.critical = true;
        input.push_back(critical);

        auto optimized = resolver.optimize(input);
        REQUIRE(optimized.size() == PERMISSIVE_SUGGESTION_LIMIT);
        REQUIRE(optimized[0].message == "late but important");
        REQUIRE(optimized[1].message == "warning 0");
    }

    SECTION("Strict mode never caps") {
        ResolutionEngine resolver(SecurityLevel::Strict, engine);
        std::vector<ResolutionSuggestion> input;
        for (int i = 0; i < 15; ++i) {
            input.push_back(warning("warning " + std::to_string(i)));
        }
        REQUIRE(resolver.optimize(input).size() == 15);
    }
}

TEST_CASE("Applying resolutions", "[validation][resolution][apply]") {
    PatternEngine engine;
    ResolutionEngine resolver(SecurityLevel::Strict, engine);
    auto config = make_config({"exec"}, {"exec", "ls"});

    SECTION("Resolved configuration is conflict free") {
        ConflictDetector detector;
        DetectionOptions options;
        options.deep_analysis = false;
        auto conflicts = detector.detect(normalize_rules(config, engine).rules, options).conflicts;
        auto suggestions = resolver.resolve_all(conflicts);
        REQUIRE(suggestions.size() == 1);

        ApplyResult result = resolver.apply_resolutions(config, suggestions);
        REQUIRE(result.success);
        REQUIRE(result.remaining_conflicts.empty());
        REQUIRE(result.resolved_config["permissions"]["allow"] == nlohmann::json::array({"ls"}));
        REQUIRE(result.resolved_config["permissions"]["deny"] == nlohmann::json::array({"exec"}));
        REQUIRE(result.changes.size() == 1);
        REQUIRE(result.changes[0].action == "remove");
        REQUIRE(result.messages[0] == "Applied: Remove allow rule \"exec\" to resolve conflict");

        // The input document is untouched
        REQUIRE(config["permissions"]["allow"].size() == 2);
    }

    SECTION("Changes to deny rules are refused") {
        std::vector<ResolutionSuggestion> suggestions = {
            fix("drop the deny", RemoveRule{Category::Deny, "exec", ""}),
            fix("loosen the deny", ModifyRule{Category::Deny, "exec", "exec2", ""}),
        };
        ApplyResult result = resolver.apply_resolutions(config, suggestions);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.changes.empty());
        REQUIRE(result.messages.size() == 2);
        REQUIRE(result.messages[0].starts_with("Refused: drop the deny"));
        REQUIRE(result.resolved_config == config);
        REQUIRE(result.remaining_conflicts.size() == 1);
    }

    SECTION("Missing targets are reported") {
        std::vector<ResolutionSuggestion> suggestions = {
            fix("remove missing", RemoveRule{Category::Allow, "nope", ""}),
        };
        ApplyResult result = resolver.apply_resolutions(config, suggestions);
        REQUIRE(result.messages == std::vector<std::string>{"Failed to apply: remove missing"});
    }

    SECTION("Adding a deny rule at a position") {
        std::vector<ResolutionSuggestion> suggestions = {
            fix("add sudo", AddRule{Category::Deny, "sudo", size_t{0}, "block sudo"}),
        };
        ApplyResult result = resolver.apply_resolutions(config, suggestions);
        REQUIRE(result.resolved_config["permissions"]["deny"] ==
                nlohmann::json::array({"sudo", "exec"}));
        REQUIRE(result.changes[0].risk == RiskLevel::Safe);
        REQUIRE(result.changes[0].position == size_t{0});

        nlohmann::json j = result;
        REQUIRE(j["changes"][0]["type"] == "add");
        REQUIRE(j["changes"][0]["newValue"] == "sudo");
    }

    SECTION("Non-object configuration") {
        ApplyResult result = resolver.apply_resolutions(nlohmann::json::array(), {});
        REQUIRE_FALSE(result.success);
        REQUIRE(result.messages == std::vector<std::string>{"Configuration must be a JSON object"});
    }
}
