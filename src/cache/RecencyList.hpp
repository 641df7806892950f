#ifndef RECENCYLIST_HPP
#define RECENCYLIST_HPP

#include <optional>

#include "NodePool.hpp"

// Doubly linked recency order over the nodes of a NodePool.
//
//   head.next -> most recently used (MRU)
//   tail.prev -> least recently used (LRU)
//
// The head/tail sentinels are the pool's two reserved slots, so no operation
// has to special-case an empty list or an end node. The list never owns or
// allocates nodes; callers pass handles of nodes that are live in the pool.
template <typename K, typename V>
class RecencyList {
public:
    explicit RecencyList(NodePool<K, V>& pool) : pool_(pool) {
        reset();
    }

    RecencyList(const RecencyList&) = delete;
    RecencyList& operator=(const RecencyList&) = delete;

    // Insert right after head (MRU position).
    void addFront(NodeHandle handle) {
        linkBetween(handle.slot, HEAD, pool_.links(HEAD).next);
    }

    // Insert right before tail (LRU position).
    void addBack(NodeHandle handle) {
        linkBetween(handle.slot, pool_.links(TAIL).prev, TAIL);
    }

    // Unlink from wherever the node sits. The node's own links are cleared.
    void unlink(NodeHandle handle) {
        NodeLinks& links = pool_.links(handle.slot);
        pool_.links(links.prev).next = links.next;
        pool_.links(links.next).prev = links.prev;
        links.prev = NIL_SLOT;
        links.next = NIL_SLOT;
    }

    void moveToFront(NodeHandle handle) {
        unlink(handle);
        addFront(handle);
    }

    // Unlinks and returns the LRU node, or nullopt if the list is empty.
    std::optional<NodeHandle> removeBack() {
        SlotIndex last = pool_.links(TAIL).prev;
        if (last == HEAD) {
            return std::nullopt;
        }
        NodeHandle handle = pool_.handleAt(last);
        unlink(handle);
        return handle;
    }

    std::optional<NodeHandle> back() const {
        SlotIndex last = pool_.links(TAIL).prev;
        if (last == HEAD) {
            return std::nullopt;
        }
        return pool_.handleAt(last);
    }

    bool empty() const { return pool_.links(HEAD).next == TAIL; }

    // Visits nodes from MRU to LRU.
    template <typename Fn>
    void forEach(Fn&& fn) const {
        for (SlotIndex s = pool_.links(HEAD).next; s != TAIL; s = pool_.links(s).next) {
            fn(pool_.node(pool_.handleAt(s)));
        }
    }

    // Forgets every node; pair with NodePool::reset().
    void reset() {
        pool_.links(HEAD) = NodeLinks{NIL_SLOT, TAIL};
        pool_.links(TAIL) = NodeLinks{HEAD, NIL_SLOT};
    }

private:
    static constexpr SlotIndex HEAD = NodePool<K, V>::HEAD_SLOT;
    static constexpr SlotIndex TAIL = NodePool<K, V>::TAIL_SLOT;

    void linkBetween(SlotIndex slot, SlotIndex before, SlotIndex after) {
        NodeLinks& links = pool_.links(slot);
        links.prev = before;
        links.next = after;
        pool_.links(before).next = slot;
        pool_.links(after).prev = slot;
    }

    NodePool<K, V>& pool_;
};

#endif // RECENCYLIST_HPP
