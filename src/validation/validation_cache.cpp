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

#include "validation_cache.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <numeric>
#include <vector>

#include "../core/digest.hpp"
#include "../core/logging.hpp"
#include "../pattern/regex.hpp"

namespace bastion::validation {

namespace {

// Moving averages cover the most recent samples only
constexpr size_t TIMING_WINDOW = 100;

bool is_volatile_key(std::string_view key) {
    return key == "metadata" || key == "timestamp";
}

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

}  // namespace

void to_json(nlohmann::json& j, const CacheStats& stats) {
    j = nlohmann::json{{"hits", stats.hits},
                       {"misses", stats.misses},
                       {"entries", stats.entries},
                       {"memoryUsed", stats.memory_used},
                       {"avgCacheRetrievalTime", stats.avg_retrieval_ms},
                       {"avgValidationTime", stats.avg_validation_ms},
                       {"hitRate", stats.hit_rate}};
}

ValidationCache::ValidationCache(CacheConfig config) : config_(config) {}

nlohmann::json ValidationCache::canonicalize(const nlohmann::json& config) {
    if (config.is_object()) {
        // nlohmann::json objects keep keys ordered
        nlohmann::json out = nlohmann::json::object();
        for (auto it = config.begin(); it != config.end(); ++it) {
            if (is_volatile_key(it.key())) {
                continue;
            }
            out[it.key()] = canonicalize(it.value());
        }
        return out;
    }

    if (config.is_array()) {
        std::vector<std::pair<std::string, nlohmann::json>> items;
        items.reserve(config.size());
        for (const auto& item : config) {
            nlohmann::json normalized = canonicalize(item);
            const auto bytes = nlohmann::json::to_cbor(normalized);
            std::string text(bytes.begin(), bytes.end());
            items.emplace_back(std::move(text), std::move(normalized));
        }
        std::sort(items.begin(), items.end(),
                  [](const auto& a, const auto& b) { return a.first < b.first; });

        nlohmann::json out = nlohmann::json::array();
        for (auto& [text, item] : items) {
            out.push_back(std::move(item));
        }
        return out;
    }

    return config;
}

std::string ValidationCache::generate_hash(const nlohmann::json& config) {
    // CBOR keeps string bytes verbatim, so distinct invalid UTF-8 never collides
    const auto bytes = nlohmann::json::to_cbor(canonicalize(config));
    std::string canonical(bytes.begin(), bytes.end());
    if (auto digest = core::sha256_hex(canonical)) {
        return *digest;
    }
    // Digest unavailable: the canonical encoding is itself a stable key
    return canonical;
}

bool ValidationCache::expired(const Entry& entry, Clock::time_point now) const noexcept {
    return now - entry.created_at > std::chrono::milliseconds(config_.ttl_ms);
}

size_t ValidationCache::estimate_size(const ValidationResult& result) {
    nlohmann::json j = result;
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace).size() * 2;
}

void ValidationCache::record_sample(std::deque<double>& samples, double value, double& average) {
    samples.push_back(value);
    if (samples.size() > TIMING_WINDOW) {
        samples.pop_front();
    }
    average = std::accumulate(samples.begin(), samples.end(), 0.0) /
              static_cast<double>(samples.size());
}

void ValidationCache::update_hit_rate_locked() {
    const uint64_t total = stats_.hits + stats_.misses;
    stats_.hit_rate = total > 0 ? static_cast<double>(stats_.hits) / static_cast<double>(total) * 100.0
                                : 0.0;
}

void ValidationCache::erase_locked(const std::string& hash) {
    auto it = entries_.find(hash);
    if (it == entries_.end()) {
        return;
    }
    stats_.memory_used -= std::min(stats_.memory_used, it->second.size_bytes);
    lru_.erase(it->second.lru_position);
    entries_.erase(it);
    stats_.entries = entries_.size();
}

void ValidationCache::evict_lru_locked() {
    if (lru_.empty()) {
        return;
    }
    std::string victim = lru_.front();
    erase_locked(victim);
}

std::optional<ValidationResult> ValidationCache::get(const std::string& hash) {
    const auto start = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(hash);
    if (it == entries_.end()) {
        ++stats_.misses;
        update_hit_rate_locked();
        return std::nullopt;
    }

    if (expired(it->second, Clock::now())) {
        erase_locked(hash);
        ++stats_.misses;
        update_hit_rate_locked();
        return std::nullopt;
    }

    Entry& entry = it->second;
    ++entry.access_count;
    lru_.splice(lru_.end(), lru_, entry.lru_position);

    ++stats_.hits;
    update_hit_rate_locked();

    ValidationResult result = entry.result;
    record_sample(retrieval_samples_,
                  std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
                      .count(),
                  stats_.avg_retrieval_ms);
    return result;
}

void ValidationCache::set(const std::string& hash, const ValidationResult& result,
                          std::optional<double> validation_ms) {
    const size_t size_bytes = estimate_size(result);
    const size_t memory_limit = config_.max_memory_mb * 1024 * 1024;

    std::lock_guard<std::mutex> lock(mutex_);

    // Replacing an entry frees its slot before the limits are checked
    erase_locked(hash);

    while (!lru_.empty() && stats_.memory_used + size_bytes > memory_limit) {
        evict_lru_locked();
    }
    while (!lru_.empty() && entries_.size() >= config_.max_entries) {
        evict_lru_locked();
    }
    if (config_.max_entries == 0) {
        return;
    }

    lru_.push_back(hash);
    Entry entry;
    entry.result = result;
    entry.created_at = Clock::now();
    entry.size_bytes = size_bytes;
    entry.lru_position = std::prev(lru_.end());
    entries_.insert_or_assign(hash, std::move(entry));

    stats_.entries = entries_.size();
    stats_.memory_used += size_bytes;

    if (validation_ms) {
        record_sample(validation_samples_, *validation_ms, stats_.avg_validation_ms);
    }
}

bool ValidationCache::contains(const std::string& hash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(hash);
    return it != entries_.end() && !expired(it->second, Clock::now());
}

size_t ValidationCache::invalidate(std::string_view key_pattern) {
    std::string error;
    auto regex = pattern::Regex::compile(key_pattern, error);
    if (!regex) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_WARNING(logger, "Cache invalidation pattern rejected: {}", error);
        }
        return 0;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> doomed;
    for (const auto& [key, entry] : entries_) {
        if (regex->matches(key)) {
            doomed.push_back(key);
        }
    }
    for (const auto& key : doomed) {
        erase_locked(key);
    }
    return doomed.size();
}

void ValidationCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    lru_.clear();
    stats_ = CacheStats{};
    retrieval_samples_.clear();
    validation_samples_.clear();
}

CacheStats ValidationCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

std::string ValidationCache::export_json() const {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json entries = nlohmann::json::array();
    size_t skipped = 0;
    // Least recently used first so that an import reproduces the recency order
    for (const auto& key : lru_) {
        const Entry& entry = entries_.at(key);
        nlohmann::json item{{"key", key},
                            {"result", entry.result},
                            {"configHash", key},
                            {"createdAt", to_epoch_ms(entry.created_at)}};
        // Entries holding invalid UTF-8 cannot be written back byte for byte
        try {
            (void)item.dump();
        } catch (const nlohmann::json::type_error& e) {
            ++skipped;
            if (auto* logger = logging::get_current_logger()) {
                LOG_WARNING(logger, "Cache entry {} left out of export: {}", key, e.what());
            }
            continue;
        }
        entries.push_back(std::move(item));
    }
    if (skipped > 0) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_INFO(logger, "Cache export skipped {} entries", skipped);
        }
    }

    nlohmann::json data{{"version", CACHE_EXPORT_VERSION},
                        {"timestamp", to_epoch_ms(Clock::now())},
                        {"entries", std::move(entries)},
                        {"stats", stats_}};
    return data.dump();
}

bool ValidationCache::import_json(std::string_view data, std::string& error_message) {
    struct Imported {
        std::string key;
        ValidationResult result;
        Clock::time_point created_at;
        size_t size_bytes = 0;
    };

    std::vector<Imported> imported;
    const auto now = Clock::now();

    try {
        nlohmann::json doc = nlohmann::json::parse(data);

        const std::string version = doc.value("version", std::string{});
        if (version != CACHE_EXPORT_VERSION) {
            error_message = fmt::format("Unsupported cache version: {}",
                                        version.empty() ? "<missing>" : version);
            return false;
        }

        const auto& entries = doc.at("entries");
        if (!entries.is_array()) {
            error_message = "Cache export 'entries' must be an array";
            return false;
        }

        for (const auto& item : entries) {
            Imported entry;
            entry.key = item.at("key").get<std::string>();
            entry.created_at =
                Clock::time_point(std::chrono::milliseconds(item.at("createdAt").get<int64_t>()));
            if (now - entry.created_at > std::chrono::milliseconds(config_.ttl_ms)) {
                continue;
            }
            entry.result = item.at("result").get<ValidationResult>();
            entry.size_bytes = estimate_size(entry.result);
            imported.push_back(std::move(entry));
        }
    } catch (const std::exception& e) {
        error_message = fmt::format("Failed to import cache: {}", e.what());
        if (auto* logger = logging::get_current_logger()) {
            LOG_ERROR(logger, "{}", error_message);
        }
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    lru_.clear();
    stats_ = CacheStats{};
    retrieval_samples_.clear();
    validation_samples_.clear();

    const size_t memory_limit = config_.max_memory_mb * 1024 * 1024;
    for (auto& item : imported) {
        if (config_.max_entries == 0) {
            break;
        }
        // Same admission order as set(): drop the old copy, then make room
        erase_locked(item.key);
        while (!lru_.empty() && stats_.memory_used + item.size_bytes > memory_limit) {
            evict_lru_locked();
        }
        while (!lru_.empty() && entries_.size() >= config_.max_entries) {
            evict_lru_locked();
        }
        lru_.push_back(item.key);
        Entry entry;
        entry.result = std::move(item.result);
        entry.created_at = item.created_at;
        entry.size_bytes = item.size_bytes;
        entry.lru_position = std::prev(lru_.end());
        stats_.memory_used += item.size_bytes;
        entries_.insert_or_assign(std::move(item.key), std::move(entry));
    }
    stats_.entries = entries_.size();
    return true;
}

}  // namespace bastion::validation
