#ifndef CACHENODE_HPP
#define CACHENODE_HPP

#include <cstdint>
#include <limits>
#include <optional>

#include "../interfaces/IClock.hpp"

using SlotIndex = std::uint32_t;

static constexpr SlotIndex NIL_SLOT = std::numeric_limits<SlotIndex>::max();

// Stable identity of a node inside a NodePool. The generation changes every
// time a slot is released, so a handle to an evicted node never matches the
// node that later reuses its slot.
struct NodeHandle {
    SlotIndex slot = NIL_SLOT;
    std::uint32_t generation = 0;

    bool operator==(const NodeHandle& other) const {
        return slot == other.slot && generation == other.generation;
    }
    bool operator!=(const NodeHandle& other) const { return !(*this == other); }
};

// Recency links, stored per slot (sentinels included).
struct NodeLinks {
    SlotIndex prev = NIL_SLOT;
    SlotIndex next = NIL_SLOT;
};

template <typename K, typename V>
struct CacheNode {
    K key;
    V value;
    std::optional<TimePoint> expiry_at; // nullopt = never expires

    CacheNode(K k, V v, std::optional<TimePoint> expiry)
        : key(std::move(k)), value(std::move(v)), expiry_at(expiry) {}

    bool isExpired(TimePoint now) const {
        return expiry_at.has_value() && now > *expiry_at;
    }
};

#endif // CACHENODE_HPP
