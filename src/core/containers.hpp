#pragma once

#include <ankerl/unordered_dense.h>

namespace switchyard::core {

// Dense open-addressing containers (ankerl::unordered_dense).
// Iterator invalidation works like std::vector: any insertion or erase
// may invalidate iterators and references into the map.
//
// Usage:
//   switchyard::core::fast_map<std::string, std::vector<ConnectionPtr>> by_gateway;

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

template <typename Key>
using fast_set = ankerl::unordered_dense::set<Key>;

}  // namespace switchyard::core
