#ifndef NODEPOOL_HPP
#define NODEPOOL_HPP

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "CacheNode.hpp"

// Fixed-size arena of cache nodes addressed by NodeHandle.
//
// Slot 0 and slot 1 are the recency-list sentinels and never carry a node.
// The remaining `capacity` slots are chained through NodeLinks::next on a free
// list while unused. Nothing is allocated after construction apart from
// whatever K and V allocate themselves.
template <typename K, typename V>
class NodePool {
public:
    static constexpr SlotIndex HEAD_SLOT = 0;
    static constexpr SlotIndex TAIL_SLOT = 1;

    explicit NodePool(std::size_t capacity) : slots_(capacity + 2), capacity_(capacity) {
        reset();
    }

    NodePool(const NodePool&) = delete;
    NodePool& operator=(const NodePool&) = delete;

    // Throws std::length_error when every slot is in use.
    NodeHandle acquire(K key, V value, std::optional<TimePoint> expiry_at) {
        if (free_head_ == NIL_SLOT) {
            throw std::length_error("NodePool exhausted (capacity " + std::to_string(capacity_) + ")");
        }
        SlotIndex slot = free_head_;
        Slot& s = slots_[slot];
        free_head_ = s.links.next;
        s.links = NodeLinks{};
        s.node.emplace(std::move(key), std::move(value), expiry_at);
        ++live_;
        return NodeHandle{slot, s.generation};
    }

    void release(NodeHandle handle) {
        if (!isLive(handle)) {
            return;
        }
        Slot& s = slots_[handle.slot];
        s.node.reset();
        ++s.generation;
        s.links = NodeLinks{NIL_SLOT, free_head_};
        free_head_ = handle.slot;
        --live_;
    }

    bool isLive(NodeHandle handle) const {
        return handle.slot >= FIRST_NODE_SLOT && handle.slot < slots_.size() &&
               slots_[handle.slot].node.has_value() &&
               slots_[handle.slot].generation == handle.generation;
    }

    // Caller guarantees isLive(handle).
    CacheNode<K, V>& node(NodeHandle handle) { return *slots_[handle.slot].node; }
    const CacheNode<K, V>& node(NodeHandle handle) const { return *slots_[handle.slot].node; }

    // Handle of whatever currently occupies the slot (sentinels included).
    NodeHandle handleAt(SlotIndex slot) const { return NodeHandle{slot, slots_[slot].generation}; }

    NodeLinks& links(SlotIndex slot) { return slots_[slot].links; }
    const NodeLinks& links(SlotIndex slot) const { return slots_[slot].links; }

    std::size_t liveCount() const { return live_; }
    std::size_t capacity() const { return capacity_; }

    // Drops every node and rebuilds the free list. Generations keep counting
    // so handles issued before the reset stay dead.
    void reset() {
        for (std::size_t i = FIRST_NODE_SLOT; i < slots_.size(); ++i) {
            if (slots_[i].node) {
                slots_[i].node.reset();
                ++slots_[i].generation;
            }
            slots_[i].links.prev = NIL_SLOT;
            slots_[i].links.next = (i + 1 < slots_.size()) ? static_cast<SlotIndex>(i + 1) : NIL_SLOT;
        }
        free_head_ = slots_.size() > FIRST_NODE_SLOT ? FIRST_NODE_SLOT : NIL_SLOT;
        slots_[HEAD_SLOT].links = NodeLinks{};
        slots_[TAIL_SLOT].links = NodeLinks{};
        live_ = 0;
    }

private:
    static constexpr SlotIndex FIRST_NODE_SLOT = 2;

    struct Slot {
        std::optional<CacheNode<K, V>> node;
        NodeLinks links;
        std::uint32_t generation = 0;
    };

    std::vector<Slot> slots_;
    std::size_t capacity_;
    SlotIndex free_head_ = NIL_SLOT;
    std::size_t live_ = 0;
};

#endif // NODEPOOL_HPP
