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

#pragma once

#include <optional>
#include <string>
#include <string_view>

// Forward declare PCRE2 types to avoid exposing the PCRE2 header
struct pcre2_real_code_8;

namespace bastion::pattern {

// PCRE2 wrapper for regex compilation and matching
// Thread-safe for read operations after compilation
class Regex {
public:
    // Compile a regex pattern
    // Returns nullopt if compilation fails
    [[nodiscard]] static std::optional<Regex> compile(std::string_view pattern);

    // Compile a regex pattern with error message
    [[nodiscard]] static std::optional<Regex> compile(std::string_view pattern,
                                                      std::string& error_message);

    // Move-only type (manages PCRE2 resources)
    Regex(Regex&& other) noexcept;
    Regex& operator=(Regex&& other) noexcept;
    ~Regex();

    Regex(const Regex&) = delete;
    Regex& operator=(const Regex&) = delete;

    // Unanchored search: true if the pattern matches anywhere in subject
    [[nodiscard]] bool matches(std::string_view subject) const;

    [[nodiscard]] std::string_view pattern() const { return pattern_; }

private:
    explicit Regex(pcre2_real_code_8* code, std::string pattern);

    pcre2_real_code_8* code_;  // Compiled regex (owned)
    std::string pattern_;
};

// Backslash-escape every regex metacharacter in text: . + ^ $ { } ( ) | [ ] \ * ?
[[nodiscard]] std::string escape(std::string_view text);

namespace url {

// Percent-encode everything except A-Z a-z 0-9 and - _ . ! ~ * ' ( )
[[nodiscard]] std::string encode_component(std::string_view str);

}  // namespace url

}  // namespace bastion::pattern
