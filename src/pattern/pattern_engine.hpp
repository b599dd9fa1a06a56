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

// Bastion Pattern Layer - Pattern Engine
// Memoized compilation and matching shared across one engine's validation runs

#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"
#include "pattern.hpp"

namespace bastion::pattern {

struct PatternEngineStats {
    size_t compiled_entries = 0;
    size_t memo_entries = 0;
    uint64_t compile_hits = 0;
    uint64_t compile_misses = 0;
    uint64_t memo_hits = 0;
    uint64_t memo_misses = 0;
};

/// Thread-safe pattern compiler with bounded caches.
/// A cache that reaches its bound is cleared wholesale; entries are cheap to rebuild.
class PatternEngine {
public:
    static constexpr size_t DEFAULT_MAX_COMPILED = 4096;
    static constexpr size_t DEFAULT_MAX_MEMO = 65536;

    explicit PatternEngine(size_t max_compiled = DEFAULT_MAX_COMPILED,
                           size_t max_memo = DEFAULT_MAX_MEMO);

    PatternEngine(const PatternEngine&) = delete;
    PatternEngine& operator=(const PatternEngine&) = delete;

    /// Classify and compile
    [[nodiscard]] MatcherPtr compile(std::string_view pattern);
    [[nodiscard]] MatcherPtr compile(std::string_view pattern, PatternKind kind);

    /// Memoized per (pattern, input, kind)
    [[nodiscard]] bool matches(std::string_view pattern, std::string_view input, PatternKind kind);
    [[nodiscard]] bool matches(std::string_view pattern, std::string_view input);

    /// Overlap corpus for two raw patterns
    [[nodiscard]] std::vector<std::string> test_inputs(std::string_view a, std::string_view b);

    void clear();
    [[nodiscard]] PatternEngineStats stats() const;

private:
    [[nodiscard]] static std::string compiled_key(std::string_view pattern, PatternKind kind);

    size_t max_compiled_;
    size_t max_memo_;

    mutable std::mutex mutex_;
    core::fast_map<std::string, MatcherPtr> compiled_;
    core::fast_map<std::string, bool> memo_;
    PatternEngineStats stats_;
};

}  // namespace bastion::pattern
