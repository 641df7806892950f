#include "ExpiryIndex.hpp"

void ExpiryIndex::insert(NodeHandle handle, TimePoint expiry_at) {
    heap_.push(Entry{expiry_at, handle});
}

std::optional<ExpiryIndex::Entry> ExpiryIndex::peekMin() const {
    if (heap_.empty()) {
        return std::nullopt;
    }
    return heap_.top();
}

std::optional<ExpiryIndex::Entry> ExpiryIndex::extractMin() {
    if (heap_.empty()) {
        return std::nullopt;
    }
    Entry top = heap_.top();
    heap_.pop();
    return top;
}

void ExpiryIndex::clear() {
    // priority_queue has no clear(); swap in an empty one to release storage.
    std::priority_queue<Entry, std::vector<Entry>, LaterDeadline> empty;
    heap_.swap(empty);
}
