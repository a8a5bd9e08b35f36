#pragma once

#include <absl/container/btree_map.h>
#include <absl/container/flat_hash_map.h>
#include <absl/container/inlined_vector.h>

namespace sm {
    template<typename TKey, typename TValue, typename TCompare = std::less<TKey>>
    using BTreeMap = absl::btree_map<TKey, TValue, TCompare>;

    template<typename TKey, typename TValue, typename THash = absl::Hash<TKey>, typename TEqual = std::equal_to<TKey>>
    using FlatHashMap = absl::flat_hash_map<TKey, TValue, THash, TEqual>;

    template<typename T, size_t N>
    using InlinedVector = absl::InlinedVector<T, N>;
}
