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

// Bastion Pattern Layer - Pattern Classification and Compiled Matchers

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "regex.hpp"

namespace bastion::pattern {

/// Syntactic family of a rule pattern
enum class PatternKind : uint8_t {
    Literal,  // exact string equality
    Glob,     // '*' / '?' wildcards, anchored at both ends
    Regex     // PCRE2 expression, unanchored search
};

/// Classify raw rule text.
/// Contains '*', '?' or '[' -> Glob; else '\\', '^', '$', '(' or '|' -> Regex; else Literal.
[[nodiscard]] PatternKind classify(std::string_view pattern) noexcept;

[[nodiscard]] std::string_view to_string(PatternKind kind) noexcept;
[[nodiscard]] std::optional<PatternKind> parse_pattern_kind(std::string_view name) noexcept;

/// Anchored regular expression equivalent to a glob: metacharacters escaped,
/// runs of '*' become ".*", '?' becomes "."
[[nodiscard]] std::string glob_to_regex(std::string_view glob);

/// Immutable compiled form of one pattern.
/// Shared between threads via shared_ptr<const Matcher>; all members are read-only
/// after compile().
class Matcher {
public:
    /// Compile source as kind. Never fails: an invalid regex falls back to an escaped
    /// literal search and fell_back() reports it.
    [[nodiscard]] static std::shared_ptr<const Matcher> compile(std::string_view source,
                                                                PatternKind kind);

    [[nodiscard]] bool matches(std::string_view input) const;

    [[nodiscard]] PatternKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& source() const noexcept { return source_; }

    /// Normalized form: the literal itself, or the regex actually executed
    [[nodiscard]] const std::string& expression() const noexcept { return expression_; }

    [[nodiscard]] bool fell_back() const noexcept { return fell_back_; }
    [[nodiscard]] const std::string& compile_error() const noexcept { return compile_error_; }

    /// True when every match must span the whole input (Literal, Glob)
    [[nodiscard]] bool anchored() const noexcept { return anchored_; }

    /// Fixed text every match starts / ends with (meaningful only when anchored)
    [[nodiscard]] std::string_view literal_prefix() const noexcept { return prefix_; }
    [[nodiscard]] std::string_view literal_suffix() const noexcept { return suffix_; }

    /// Bit i set when fixed_corpus()[i] matches
    [[nodiscard]] uint64_t corpus_mask() const noexcept { return corpus_mask_; }

    /// Pattern-derived test inputs (wildcard substitutions, case and encoding variants)
    [[nodiscard]] const std::vector<std::string>& variants() const noexcept { return variants_; }

    Matcher(const Matcher&) = delete;
    Matcher& operator=(const Matcher&) = delete;

private:
    Matcher() = default;

    std::string source_;
    std::string expression_;
    std::string compile_error_;
    PatternKind kind_ = PatternKind::Literal;
    std::optional<Regex> regex_;
    bool fell_back_ = false;
    bool anchored_ = false;
    std::string prefix_;
    std::string suffix_;
    uint64_t corpus_mask_ = 0;
    std::vector<std::string> variants_;
};

using MatcherPtr = std::shared_ptr<const Matcher>;

/// True when no input can match both anchored matchers because their fixed
/// prefixes or suffixes disagree. Always false if either side is unanchored.
[[nodiscard]] bool provably_disjoint(const Matcher& a, const Matcher& b);

}  // namespace bastion::pattern
