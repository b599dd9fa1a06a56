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

#include "pattern_engine.hpp"

#include "corpus.hpp"

namespace bastion::pattern {

PatternEngine::PatternEngine(size_t max_compiled, size_t max_memo)
    : max_compiled_(max_compiled == 0 ? 1 : max_compiled), max_memo_(max_memo == 0 ? 1 : max_memo) {}

std::string PatternEngine::compiled_key(std::string_view pattern, PatternKind kind) {
    std::string key;
    key.reserve(pattern.size() + 2);
    key += static_cast<char>('0' + static_cast<int>(kind));
    key += '\x1f';
    key.append(pattern);
    return key;
}

MatcherPtr PatternEngine::compile(std::string_view pattern) {
    return compile(pattern, classify(pattern));
}

MatcherPtr PatternEngine::compile(std::string_view pattern, PatternKind kind) {
    std::string key = compiled_key(pattern, kind);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = compiled_.find(key);
        if (it != compiled_.end()) {
            stats_.compile_hits++;
            return it->second;
        }
        stats_.compile_misses++;
    }

    // Compile outside the lock; a racing thread may compile the same pattern once more
    MatcherPtr matcher = Matcher::compile(pattern, kind);

    std::lock_guard<std::mutex> lock(mutex_);
    if (compiled_.size() >= max_compiled_) {
        compiled_.clear();
    }
    compiled_.emplace(std::move(key), matcher);
    return matcher;
}

bool PatternEngine::matches(std::string_view pattern, std::string_view input, PatternKind kind) {
    std::string key = compiled_key(pattern, kind);
    key += '\x1e';
    key.append(input);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = memo_.find(key);
        if (it != memo_.end()) {
            stats_.memo_hits++;
            return it->second;
        }
        stats_.memo_misses++;
    }

    bool result = compile(pattern, kind)->matches(input);

    std::lock_guard<std::mutex> lock(mutex_);
    if (memo_.size() >= max_memo_) {
        memo_.clear();
    }
    memo_.emplace(std::move(key), result);
    return result;
}

bool PatternEngine::matches(std::string_view pattern, std::string_view input) {
    return matches(pattern, input, classify(pattern));
}

std::vector<std::string> PatternEngine::test_inputs(std::string_view a, std::string_view b) {
    return generate_test_inputs(*compile(a), *compile(b));
}

void PatternEngine::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    compiled_.clear();
    memo_.clear();
}

PatternEngineStats PatternEngine::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PatternEngineStats snapshot = stats_;
    snapshot.compiled_entries = compiled_.size();
    snapshot.memo_entries = memo_.size();
    return snapshot;
}

}  // namespace bastion::pattern
