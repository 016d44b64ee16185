#pragma once

#include <absl/container/btree_map.h>
#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>

#include <functional>
#include <memory>
#include <utility>

namespace rvfs {
    template<typename TKey, typename TValue, typename TCompare = std::less<TKey>, typename TAllocator = std::allocator<std::pair<const TKey, TValue>>>
    using BTreeMap = absl::btree_map<TKey, TValue, TCompare, TAllocator>;

    template<typename TKey, typename TValue, typename THash = absl::container_internal::hash_default_hash<TKey>, typename TEqual = absl::container_internal::hash_default_eq<TKey>, typename TAllocator = std::allocator<std::pair<const TKey, TValue>>>
    using FlatHashMap = absl::flat_hash_map<TKey, TValue, THash, TEqual, TAllocator>;

    template<typename TKey, typename THash = absl::container_internal::hash_default_hash<TKey>, typename TEqual = absl::container_internal::hash_default_eq<TKey>, typename TAllocator = std::allocator<TKey>>
    using FlatHashSet = absl::flat_hash_set<TKey, THash, TEqual, TAllocator>;
}
