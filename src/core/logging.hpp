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

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <cstdint>
#include <string>

// Forward declaration to avoid circular dependency
namespace bastion::control {
struct LogConfig;
}

namespace bastion::logging {

// Start the Quill backend thread (idempotent)
void init_logging_system();

// Create the process logger from config and install it as the current logger
// Returns the logger (never nullptr once the backend is running)
quill::Logger* init_logger(const bastion::control::LogConfig& config);

// Stop the backend (called at exit); the current logger is cleared
void shutdown_logging();

// Installed logger, or nullptr if logging was never initialised
quill::Logger* get_current_logger();

// Monotonic identifier attached to log lines of one validation run
uint64_t next_run_id();

// Validation run logging
#define LOG_VALIDATION(logger, run_id, rules, conflicts, valid, elapsed_ms)                 \
    LOG_INFO(logger,                                                                     \
             "Validation completed: run_id={}, rules={}, conflicts={}, valid={}, "       \
             "elapsed_ms={:.3f}",                                                        \
             run_id, rules, conflicts, valid, elapsed_ms)

// Debug logging (eliminated in release builds)
#if defined(NDEBUG)
#define BASTION_LOG_DEBUG(logger, message, ...) ((void)0)
#else
#define BASTION_LOG_DEBUG(logger, message, ...) LOG_INFO(logger, "DEBUG: " message, ##__VA_ARGS__)
#endif

}  // namespace bastion::logging
