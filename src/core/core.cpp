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


// Bastion Core - Implementation
// Thread and worker sizing utilities

#include "core.hpp"

#include <algorithm>
#include <thread>

namespace bastion::core {

uint32_t get_cpu_count() {
    // hardware_concurrency() may report 0 when the count is not computable
    return std::max(1u, std::thread::hardware_concurrency());
}

uint32_t default_worker_count() {
    return std::min(MAX_DEFAULT_WORKERS, get_cpu_count());
}

} // namespace bastion::core
