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


// Bastion Core - Header
// Thread and worker sizing utilities

#pragma once

#include <cstdint>

namespace bastion::core {

/// Upper bound for the default worker count
inline constexpr uint32_t MAX_DEFAULT_WORKERS = 4;

/// Get number of available CPU cores (at least 1)
[[nodiscard]] uint32_t get_cpu_count();

/// Default size for worker pools: min(4, available cores)
[[nodiscard]] uint32_t default_worker_count();

} // namespace bastion::core
