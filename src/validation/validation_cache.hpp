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

// Bastion Validation - Result Cache
// Content-addressed (SHA-256 of the canonical configuration) LRU cache with TTL
// and a memory budget. Safe for concurrent use.

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <list>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "../core/containers.hpp"
#include "types.hpp"

namespace bastion::validation {

inline constexpr std::string_view CACHE_EXPORT_VERSION = "1.0.0";

struct CacheConfig {
    size_t max_entries = 1000;
    size_t max_memory_mb = 50;
    uint64_t ttl_ms = 300'000;
};

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    size_t entries = 0;
    size_t memory_used = 0;  // estimated bytes
    double avg_retrieval_ms = 0.0;
    double avg_validation_ms = 0.0;
    double hit_rate = 0.0;  // percent
};

void to_json(nlohmann::json& j, const CacheStats& stats);

class ValidationCache {
public:
    explicit ValidationCache(CacheConfig config = {});

    ValidationCache(const ValidationCache&) = delete;
    ValidationCache& operator=(const ValidationCache&) = delete;

    /// Hex SHA-256 of the canonical form: object keys sorted, "metadata" and
    /// "timestamp" keys dropped at every level, array elements sorted
    [[nodiscard]] static std::string generate_hash(const nlohmann::json& config);

    /// Canonical form hashed by generate_hash
    [[nodiscard]] static nlohmann::json canonicalize(const nlohmann::json& config);

    /// Counts a hit or miss; expired entries are dropped and count as a miss
    [[nodiscard]] std::optional<ValidationResult> get(const std::string& hash);

    /// Insert or replace, evicting least recently used entries to stay within limits
    void set(const std::string& hash, const ValidationResult& result,
             std::optional<double> validation_ms = std::nullopt);

    /// Presence check without touching statistics or recency
    [[nodiscard]] bool contains(const std::string& hash) const;

    /// Drop entries whose key matches the regular expression; returns the count.
    /// An invalid expression removes nothing.
    size_t invalidate(std::string_view key_pattern);

    /// Drops entries and resets statistics
    void clear();

    [[nodiscard]] CacheStats stats() const;

    /// Serialized snapshot: {"version", "timestamp", "entries": [...], "stats"}
    [[nodiscard]] std::string export_json() const;

    /// Replace the contents with an exported snapshot. Expired entries are skipped.
    /// On failure the cache is unchanged and error_message is set.
    bool import_json(std::string_view data, std::string& error_message);

private:
    using Clock = std::chrono::system_clock;

    struct Entry {
        ValidationResult result;
        Clock::time_point created_at;
        uint64_t access_count = 0;
        size_t size_bytes = 0;
        std::list<std::string>::iterator lru_position;
    };

    [[nodiscard]] bool expired(const Entry& entry, Clock::time_point now) const noexcept;
    [[nodiscard]] static size_t estimate_size(const ValidationResult& result);

    void evict_lru_locked();
    void erase_locked(const std::string& hash);
    void update_hit_rate_locked();
    static void record_sample(std::deque<double>& samples, double value, double& average);

    CacheConfig config_;

    mutable std::mutex mutex_;
    core::fast_map<std::string, Entry> entries_;
    std::list<std::string> lru_;  // front = least recently used
    CacheStats stats_;
    std::deque<double> retrieval_samples_;
    std::deque<double> validation_samples_;
};

}  // namespace bastion::validation
