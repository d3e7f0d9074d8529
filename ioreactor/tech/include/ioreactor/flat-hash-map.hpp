#pragma once

#include <bytell_hash_map.hpp>
#include <functional>
#include <memory>
#include <utility>

namespace ioreactor {

// Open addressing hash map used by the hot registries (fd -> registration, timer id -> timer).
// Elements move on rehash: store pointers when references must survive insertions.
template <typename K, typename V, typename H = std::hash<K>, typename E = std::equal_to<K>,
          typename A = std::allocator<std::pair<K, V> > >
using flat_hash_map = ska::bytell_hash_map<K, V, H, E, A>;

}  // namespace ioreactor
