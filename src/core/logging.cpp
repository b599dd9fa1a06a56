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

#include "logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <mutex>
#include <system_error>

#include "../control/config.hpp"
#include "string_utils.hpp"

namespace bastion::logging {

static std::atomic<quill::Logger*> g_current_logger{nullptr};
static std::atomic<uint64_t> g_run_counter{0};

void init_logging_system() {
  static std::once_flag started;
  std::call_once(started, []() { quill::Backend::start(); });
}

quill::Logger* init_logger(const control::LogConfig& log_config) {
  std::error_code ec;
  std::filesystem::create_directories(log_config.output, ec);

  quill::RotatingFileSinkConfig config;
  config.set_rotation_max_file_size(log_config.rotation.max_size_mb * 1'000'000);
  config.set_max_backup_files(log_config.rotation.max_files);
  config.set_open_mode('a');

  std::string log_path = fmt::format("{}/bastion.log", log_config.output);

  quill::Logger* logger = nullptr;

  if (log_config.format == "json") {
    auto json_sink = quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(
        log_path, config);
    logger = quill::Frontend::create_or_get_logger("bastion", std::move(json_sink));
  } else {
    auto file_sink = quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(
        log_path, config);
    logger = quill::Frontend::create_or_get_logger("bastion", std::move(file_sink));
  }

  std::string level_lower = core::to_lower(log_config.level);

  if (level_lower == "debug") {
    logger->set_log_level(quill::LogLevel::Debug);
  } else if (level_lower == "warning" || level_lower == "warn") {
    logger->set_log_level(quill::LogLevel::Warning);
  } else if (level_lower == "error") {
    logger->set_log_level(quill::LogLevel::Error);
  } else {
    logger->set_log_level(quill::LogLevel::Info);
  }

  g_current_logger.store(logger, std::memory_order_release);
  return logger;
}

void shutdown_logging() {
  g_current_logger.store(nullptr, std::memory_order_release);
  quill::Backend::stop();
}

quill::Logger* get_current_logger() {
  return g_current_logger.load(std::memory_order_acquire);
}

uint64_t next_run_id() {
  return g_run_counter.fetch_add(1, std::memory_order_relaxed) + 1;
}

}  // namespace bastion::logging
