#ifndef LRUTTLCACHE_HPP
#define LRUTTLCACHE_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "../config/CacheConfig.hpp"
#include "../core/BackgroundSweeper.hpp"
#include "../core/SteadyClock.hpp"
#include "../interfaces/CacheInterface.hpp"
#include "../interfaces/IClock.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../metrics/DummyStatsDClient.hpp"
#include "../models/CacheStats.hpp"
#include "../utils/KeyFormat.hpp"
#include "ExpiryIndex.hpp"
#include "NodePool.hpp"
#include "RecencyList.hpp"

// Bounded LRU cache with optional per-entry TTL.
//
// Three structures are kept in step under one mutex:
//   index_    key -> node handle
//   recency_  MRU..LRU order of exactly the nodes in index_
//   expiry_   min-heap of deadlines; may hold stale handles (lazy deletion)
//
// Expired entries are dropped when read (get/exists), when a new key is
// inserted (drained from the heap before the capacity check) and by the
// optional background sweeper. size() counts expired entries that none of
// those paths has reached yet.
template <typename K, typename V, typename Hash = std::hash<K>>
class LruTtlCache : public CacheInterface<K, V> {
public:
    // sweep_interval == 0 disables the background sweeper.
    // Throws std::invalid_argument on capacity <= 0, a negative interval or a
    // null collaborator.
    LruTtlCache(
        int capacity,
        std::chrono::milliseconds sweep_interval,
        std::shared_ptr<ILogger> logger,
        std::shared_ptr<IStatsDClient> statsd_client = DummyStatsDClient::getInstance(),
        std::shared_ptr<IClock> clock = SteadyClock::getInstance(),
        std::chrono::milliseconds shutdown_timeout = std::chrono::seconds(5))
        : capacity_(validateCapacity(capacity)),
          logger_(logger),
          statsd_client_(statsd_client),
          clock_(clock),
          pool_(capacity_),
          recency_(pool_) {
        if (!logger_) {
            throw std::invalid_argument("Logger cannot be null for LruTtlCache");
        }
        if (!statsd_client_) {
            throw std::invalid_argument("StatsDClient cannot be null for LruTtlCache");
        }
        if (!clock_) {
            throw std::invalid_argument("Clock cannot be null for LruTtlCache");
        }
        if (sweep_interval.count() < 0) {
            throw std::invalid_argument("sweep interval must be >= 0");
        }
        index_.reserve(capacity_);

        if (sweep_interval.count() > 0) {
            sweeper_ = std::make_unique<BackgroundSweeper>(
                "LruTtlCache", sweep_interval, [this]() { return sweepExpired(); }, logger_, shutdown_timeout);
        }
        logger_->setup("LruTtlCache created with capacity " + std::to_string(capacity_) +
            (sweeper_ ? ", sweeping every " + std::to_string(sweep_interval.count()) + "ms"
                      : ", background sweep disabled"));
    }

    ~LruTtlCache() override {
        shutdown();
    }

    LruTtlCache(const LruTtlCache&) = delete;
    LruTtlCache& operator=(const LruTtlCache&) = delete;

    std::optional<V> get(const K& key) override {
        std::optional<V> result;
        bool expired = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = index_.find(key);
            if (it != index_.end()) {
                NodeHandle handle = it->second;
                CacheNode<K, V>& node = pool_.node(handle);
                if (node.isExpired(clock_->now())) {
                    // Lazy cleanup on read; the heap entry is left behind as stale.
                    logDebug("[GET] lazy-evicted expired key=", key);
                    evictLocked(handle);
                    ++stats_.expirations;
                    expired = true;
                } else {
                    recency_.moveToFront(handle);
                    result = node.value;
                }
            }
            if (result) {
                ++stats_.hits;
            } else {
                ++stats_.misses;
            }
        }
        statsd_client_->increment(result ? MetricsDefinitions::CACHE_HIT : MetricsDefinitions::CACHE_MISS);
        if (expired) {
            statsd_client_->increment(MetricsDefinitions::CACHE_EXPIRATION);
        }
        return result;
    }

    void put(const K& key, const V& value) override {
        putInternal(key, value, std::nullopt);
    }

    void put(const K& key, const V& value, std::chrono::milliseconds ttl) override {
        putInternal(key, value, ttl.count() > 0 ? std::optional<std::chrono::milliseconds>(ttl) : std::nullopt);
    }

    bool remove(const K& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        evictLocked(it->second);
        return true;
    }

    // Like get() without touching recency.
    bool exists(const K& key) override {
        bool expired = false;
        bool found = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = index_.find(key);
            if (it != index_.end()) {
                if (pool_.node(it->second).isExpired(clock_->now())) {
                    evictLocked(it->second);
                    ++stats_.expirations;
                    expired = true;
                } else {
                    found = true;
                }
            }
        }
        if (expired) {
            statsd_client_->increment(MetricsDefinitions::CACHE_EXPIRATION);
        }
        return found;
    }

    void clear() override {
        std::lock_guard<std::mutex> lock(mutex_);
        index_.clear();
        pool_.reset();
        recency_.reset();
        expiry_.clear();
    }

    // Approximate: includes expired entries that have not been swept yet.
    std::size_t size() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.size();
    }

    // Evicts every live entry whose deadline is <= now and returns how many
    // were evicted. Stale heap entries are discarded without being counted.
    std::size_t drainExpired(TimePoint now) {
        std::size_t drained;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            drained = drainExpiredLocked(now);
        }
        if (drained > 0) {
            statsd_client_->increment(MetricsDefinitions::CACHE_EXPIRATION, static_cast<int>(drained));
        }
        return drained;
    }

    // One background sweep: drain against the current time and publish
    // duration and size.
    std::size_t sweepExpired() {
        auto started = std::chrono::steady_clock::now();
        std::size_t drained = drainExpired(clock_->now());
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        statsd_client_->timing(MetricsDefinitions::SWEEP_DURATION, elapsed);
        statsd_client_->gauge(MetricsDefinitions::CACHE_SIZE, static_cast<double>(size()));
        if (drained > 0) {
            logger_->info("[BG-CLEANUP] Swept " + std::to_string(drained) + " expired entries.");
        }
        return drained;
    }

    void shutdown() override {
        if (sweeper_) {
            sweeper_->shutdown();
        }
    }

    std::size_t capacity() const { return capacity_; }

    CacheStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        CacheStats snapshot = stats_;
        snapshot.size = index_.size();
        snapshot.capacity = capacity_;
        return snapshot;
    }

    // Keys from most to least recently used.
    std::vector<K> keysByRecency() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<K> keys;
        keys.reserve(index_.size());
        recency_.forEach([&keys](const CacheNode<K, V>& node) { keys.push_back(node.key); });
        return keys;
    }

    // Heap entries, live and stale.
    std::size_t pendingExpiryCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return expiry_.size();
    }

    bool hasBackgroundSweeper() const { return sweeper_ != nullptr; }

private:
    static std::size_t validateCapacity(int capacity) {
        if (capacity <= 0) {
            throw std::invalid_argument("capacity must be > 0, got " + std::to_string(capacity));
        }
        if (static_cast<unsigned long long>(capacity) >= std::numeric_limits<SlotIndex>::max() - 2) {
            throw std::invalid_argument("capacity too large: " + std::to_string(capacity));
        }
        return static_cast<std::size_t>(capacity);
    }

    // now + ttl, clamped to TimePoint::max() instead of overflowing.
    static TimePoint deadlineAfter(TimePoint now, std::chrono::milliseconds ttl) {
        auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(TimePoint::max() - now);
        if (ttl >= headroom) {
            return TimePoint::max();
        }
        return now + std::chrono::duration_cast<TimePoint::duration>(ttl);
    }

    void putInternal(const K& key, const V& value, std::optional<std::chrono::milliseconds> ttl) {
        std::size_t drained = 0;
        bool evicted = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            TimePoint now = clock_->now();
            std::optional<TimePoint> expiry_at;
            if (ttl) {
                expiry_at = deadlineAfter(now, *ttl);
            }

            auto it = index_.find(key);
            if (it != index_.end()) {
                // Update in place. A previous heap entry for this node stays
                // behind with the old deadline and is skipped when it surfaces.
                NodeHandle handle = it->second;
                CacheNode<K, V>& node = pool_.node(handle);
                node.value = value;
                node.expiry_at = expiry_at;
                if (expiry_at) {
                    expiry_.insert(handle, *expiry_at);
                }
                recency_.moveToFront(handle);
                return;
            }

            // Reclaim expired slots before deciding whether LRU eviction is needed.
            drained = drainExpiredLocked(now);
            if (index_.size() >= capacity_) {
                evicted = evictLruLocked();
            }

            NodeHandle handle = pool_.acquire(key, value, expiry_at);
            try {
                index_.emplace(key, handle);
            } catch (...) {
                pool_.release(handle);
                throw;
            }
            recency_.addFront(handle);
            if (expiry_at) {
                expiry_.insert(handle, *expiry_at);
            }
        }
        if (drained > 0) {
            statsd_client_->increment(MetricsDefinitions::CACHE_EXPIRATION, static_cast<int>(drained));
        }
        if (evicted) {
            statsd_client_->increment(MetricsDefinitions::CACHE_EVICTION);
        }
    }

    std::size_t drainExpiredLocked(TimePoint now) {
        std::size_t drained = 0;
        while (auto earliest = expiry_.peekMin()) {
            if (earliest->expiry_at > now) {
                break; // nothing else has expired
            }
            expiry_.extractMin();

            if (!isCurrentLocked(earliest->handle)) {
                continue; // node already evicted, removed or cleared
            }
            const CacheNode<K, V>& node = pool_.node(earliest->handle);
            if (!node.expiry_at || *node.expiry_at > now) {
                continue; // node was re-put with a later or no deadline
            }
            logDebug("[DRAIN] evicted expired key=", node.key);
            evictLocked(earliest->handle);
            ++drained;
        }
        stats_.expirations += drained;
        return drained;
    }

    bool evictLruLocked() {
        std::optional<NodeHandle> lru = recency_.removeBack();
        if (!lru) {
            return false;
        }
        logDebug("[PUT] LRU capacity-evicted key=", pool_.node(*lru).key);
        index_.erase(pool_.node(*lru).key);
        pool_.release(*lru);
        ++stats_.evictions;
        return true;
    }

    // Unlinks from recency, erases from index_, frees the slot. Any heap entry
    // for the node becomes stale.
    void evictLocked(NodeHandle handle) {
        recency_.unlink(handle);
        index_.erase(pool_.node(handle).key);
        pool_.release(handle);
    }

    bool isCurrentLocked(NodeHandle handle) const {
        if (!pool_.isLive(handle)) {
            return false;
        }
        auto it = index_.find(pool_.node(handle).key);
        return it != index_.end() && it->second == handle;
    }

    void logDebug(const char* what, const K& key) {
        if (logger_->isEnabled(LogUtils::LogLevel::DEBUG)) {
            logger_->debug(what + KeyFormat::toString(key));
        }
    }

    const std::size_t capacity_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::shared_ptr<IClock> clock_;

    mutable std::mutex mutex_;
    NodePool<K, V> pool_;
    RecencyList<K, V> recency_;
    ExpiryIndex expiry_;
    std::unordered_map<K, NodeHandle, Hash> index_;
    CacheStats stats_;

    // Last member: its thread calls back into the cache, so it must stop first.
    std::unique_ptr<BackgroundSweeper> sweeper_;
};

#endif // LRUTTLCACHE_HPP
