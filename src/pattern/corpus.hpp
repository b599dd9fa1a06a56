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

// Bastion Pattern Layer - Overlap Test Corpus
// Bounded, heuristic set of inputs used to compare two patterns' match sets

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "pattern.hpp"

namespace bastion::pattern {

/// Fixed inputs: common file names, relative/absolute paths and attack strings
/// (traversal, command injection, NUL tricks, fully percent-encoded traversal).
/// At most 64 entries so matchers can store a bitmask over it.
[[nodiscard]] const std::vector<std::string>& fixed_corpus();

[[nodiscard]] bool is_fixed_corpus_entry(std::string_view input);

/// Wildcard substitutions for globs ('*' -> "test", "", "a/b/c"; '?' -> "x"),
/// affix and case variants for literals. Regexes yield nothing.
[[nodiscard]] std::vector<std::string> pattern_variants(std::string_view pattern,
                                                        PatternKind kind);

/// URL-encoded, "%2F"/"%2E" substituted, U+2215 separator and double-encoded forms
[[nodiscard]] std::vector<std::string> encoding_variants(std::string_view pattern);

/// Full deduplicated corpus for comparing a and b: both sources, their variants,
/// then the fixed corpus
[[nodiscard]] std::vector<std::string> generate_test_inputs(const Matcher& a, const Matcher& b);

}  // namespace bastion::pattern
