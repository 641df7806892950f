#ifndef EXPIRYINDEX_HPP
#define EXPIRYINDEX_HPP

#include <cstddef>
#include <optional>
#include <queue>
#include <vector>

#include "CacheNode.hpp"

// Min-heap of (deadline, node) pairs for nodes that carry a TTL.
//
// Entries are never removed when their node is evicted, removed or updated.
// They stay in the heap until they reach the top, where the owner decides
// whether the handle still refers to the live, expired node (see
// LruTtlCache::drainExpired). The index itself knows nothing about liveness.
class ExpiryIndex {
public:
    struct Entry {
        TimePoint expiry_at;
        NodeHandle handle;
    };

    void insert(NodeHandle handle, TimePoint expiry_at);

    // Earliest deadline, O(1).
    std::optional<Entry> peekMin() const;

    // Removes and returns the earliest deadline, O(log n).
    std::optional<Entry> extractMin();

    std::size_t size() const { return heap_.size(); }
    bool empty() const { return heap_.empty(); }
    void clear();

private:
    struct LaterDeadline {
        bool operator()(const Entry& a, const Entry& b) const {
            return a.expiry_at > b.expiry_at;
        }
    };

    std::priority_queue<Entry, std::vector<Entry>, LaterDeadline> heap_;
};

#endif // EXPIRYINDEX_HPP
