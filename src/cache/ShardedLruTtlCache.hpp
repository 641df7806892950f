#ifndef SHARDEDLRUTTLCACHE_HPP
#define SHARDEDLRUTTLCACHE_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "LruTtlCache.hpp"

// Splits keys across independent LruTtlCache shards, each with its own lock.
//
// Capacity is divided between shards, so LRU order and the capacity bound
// apply per shard; with one shard behaviour matches a plain LruTtlCache.
// A single BackgroundSweeper drains all shards in turn.
template <typename K, typename V, typename Hash = std::hash<K>>
class ShardedLruTtlCache : public CacheInterface<K, V> {
public:
    using Shard = LruTtlCache<K, V, Hash>;

    // Throws std::invalid_argument on shard_count < 1, capacity < shard_count
    // or anything LruTtlCache rejects.
    ShardedLruTtlCache(
        int capacity,
        int shard_count,
        std::chrono::milliseconds sweep_interval,
        std::shared_ptr<ILogger> logger,
        std::shared_ptr<IStatsDClient> statsd_client = DummyStatsDClient::getInstance(),
        std::shared_ptr<IClock> clock = SteadyClock::getInstance(),
        std::chrono::milliseconds shutdown_timeout = std::chrono::seconds(5))
        : logger_(logger), statsd_client_(statsd_client), clock_(clock) {
        if (!logger_) {
            throw std::invalid_argument("Logger cannot be null for ShardedLruTtlCache");
        }
        if (!statsd_client_) {
            throw std::invalid_argument("StatsDClient cannot be null for ShardedLruTtlCache");
        }
        if (!clock_) {
            throw std::invalid_argument("Clock cannot be null for ShardedLruTtlCache");
        }
        if (shard_count < 1) {
            throw std::invalid_argument("shard_count must be >= 1, got " + std::to_string(shard_count));
        }
        if (capacity < shard_count) {
            throw std::invalid_argument("capacity (" + std::to_string(capacity) +
                ") must be >= shard_count (" + std::to_string(shard_count) + ")");
        }
        if (sweep_interval.count() < 0) {
            throw std::invalid_argument("sweep interval must be >= 0");
        }

        int base = capacity / shard_count;
        int remainder = capacity % shard_count;
        shards_.reserve(static_cast<std::size_t>(shard_count));
        for (int i = 0; i < shard_count; ++i) {
            int shard_capacity = base + (i < remainder ? 1 : 0);
            shards_.push_back(std::make_unique<Shard>(
                shard_capacity, std::chrono::milliseconds(0), logger_, statsd_client_, clock_));
        }

        if (sweep_interval.count() > 0) {
            sweeper_ = std::make_unique<BackgroundSweeper>(
                "ShardedLruTtlCache", sweep_interval, [this]() { return sweepExpired(); }, logger_, shutdown_timeout);
        }
        logger_->setup("ShardedLruTtlCache created with " + std::to_string(shard_count) +
            " shards, total capacity " + std::to_string(capacity));
    }

    ~ShardedLruTtlCache() override {
        shutdown();
    }

    ShardedLruTtlCache(const ShardedLruTtlCache&) = delete;
    ShardedLruTtlCache& operator=(const ShardedLruTtlCache&) = delete;

    std::optional<V> get(const K& key) override { return shardFor(key).get(key); }
    void put(const K& key, const V& value) override { shardFor(key).put(key, value); }
    void put(const K& key, const V& value, std::chrono::milliseconds ttl) override {
        shardFor(key).put(key, value, ttl);
    }
    bool remove(const K& key) override { return shardFor(key).remove(key); }
    bool exists(const K& key) override { return shardFor(key).exists(key); }

    void clear() override {
        for (auto& shard : shards_) {
            shard->clear();
        }
    }

    std::size_t size() const override {
        std::size_t total = 0;
        for (const auto& shard : shards_) {
            total += shard->size();
        }
        return total;
    }

    std::size_t drainExpired(TimePoint now) {
        std::size_t drained = 0;
        for (auto& shard : shards_) {
            drained += shard->drainExpired(now);
        }
        return drained;
    }

    std::size_t sweepExpired() {
        auto started = std::chrono::steady_clock::now();
        std::size_t drained = drainExpired(clock_->now());
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        statsd_client_->timing(MetricsDefinitions::SWEEP_DURATION, elapsed);
        statsd_client_->gauge(MetricsDefinitions::CACHE_SIZE, static_cast<double>(size()));
        if (drained > 0) {
            logger_->info("[BG-CLEANUP] Swept " + std::to_string(drained) + " expired entries across " +
                std::to_string(shards_.size()) + " shards.");
        }
        return drained;
    }

    void shutdown() override {
        if (sweeper_) {
            sweeper_->shutdown();
        }
    }

    CacheStats stats() const {
        CacheStats total;
        for (const auto& shard : shards_) {
            total += shard->stats();
        }
        return total;
    }

    std::size_t shardCount() const { return shards_.size(); }
    std::size_t shardIndexFor(const K& key) const { return hasher_(key) % shards_.size(); }
    const Shard& shard(std::size_t index) const { return *shards_.at(index); }
    bool hasBackgroundSweeper() const { return sweeper_ != nullptr; }

private:
    Shard& shardFor(const K& key) { return *shards_[shardIndexFor(key)]; }

    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::shared_ptr<IClock> clock_;
    Hash hasher_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::unique_ptr<BackgroundSweeper> sweeper_;
};

#endif // SHARDEDLRUTTLCACHE_HPP
