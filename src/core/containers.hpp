#pragma once

#include <ankerl/unordered_dense.h>

namespace bastion::core {

// Container aliases over ankerl::unordered_dense.
// Dense storage keeps iteration over memo tables and rule indexes cheap.
// Iterators are invalidated on insertion (like std::vector).
//
// Usage:
//   bastion::core::fast_map<std::string, size_t> pattern_index;
//   bastion::core::fast_set<std::string> seen_inputs;

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

template <typename Key>
using fast_set = ankerl::unordered_dense::set<Key>;

}  // namespace bastion::core
