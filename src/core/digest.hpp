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

// Bastion Core - Digest Helpers
// SHA-256 over OpenSSL EVP for content-addressed cache keys

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace bastion::core {

/// SHA-256 of data as 64 lowercase hex characters
/// Returns nullopt if the OpenSSL digest context cannot be created
[[nodiscard]] std::optional<std::string> sha256_hex(std::string_view data);

}  // namespace bastion::core
