// tests/test_sharded_cache.cpp
#include <chrono>
#include <memory>
#include <string>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "../src/cache/ShardedLruTtlCache.hpp"
#include "TestDoubles.hpp"

using namespace std::chrono_literals;
using ::testing::NiceMock;

using ShardedCache = ShardedLruTtlCache<std::string, int>;

class ShardedLruTtlCacheTest : public ::testing::Test {
protected:
    std::shared_ptr<NiceMock<MockLogger>> logger = std::make_shared<NiceMock<MockLogger>>();
    std::shared_ptr<NiceMock<MockStatsDClient>> statsd = std::make_shared<NiceMock<MockStatsDClient>>();
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();

    std::unique_ptr<ShardedCache> makeCache(int capacity, int shards) {
        return std::make_unique<ShardedCache>(capacity, shards, 0ms, logger, statsd, clock);
    }
};

TEST_F(ShardedLruTtlCacheTest, RejectsInvalidShardLayout) {
    EXPECT_THROW(ShardedCache(10, 0, 0ms, logger, statsd, clock), std::invalid_argument);
    EXPECT_THROW(ShardedCache(3, 4, 0ms, logger, statsd, clock), std::invalid_argument);
    EXPECT_THROW(ShardedCache(0, 1, 0ms, logger, statsd, clock), std::invalid_argument);
    EXPECT_THROW(ShardedCache(10, 2, -1ms, logger, statsd, clock), std::invalid_argument);
    EXPECT_THROW(ShardedCache(10, 2, 0ms, nullptr, statsd, clock), std::invalid_argument);
}

TEST_F(ShardedLruTtlCacheTest, SingleShardBehavesLikePlainCache) {
    auto cache = makeCache(3, 1);
    cache->put("a", 1);
    cache->put("b", 2);
    cache->put("c", 3);
    cache->get("a");
    cache->put("d", 4);

    EXPECT_FALSE(cache->get("b").has_value());
    EXPECT_EQ(*cache->get("a"), 1);
    EXPECT_EQ(cache->size(), 3u);
}

TEST_F(ShardedLruTtlCacheTest, CapacityIsSplitWithRemainderToLeadingShards) {
    auto cache = makeCache(10, 3);
    ASSERT_EQ(cache->shardCount(), 3u);
    EXPECT_EQ(cache->shard(0).capacity(), 4u);
    EXPECT_EQ(cache->shard(1).capacity(), 3u);
    EXPECT_EQ(cache->shard(2).capacity(), 3u);
    EXPECT_EQ(cache->stats().capacity, 10u);
    EXPECT_THROW(cache->shard(3), std::out_of_range);
}

TEST_F(ShardedLruTtlCacheTest, KeysRouteToOneShardConsistently) {
    auto cache = makeCache(80, 4);
    for (int i = 0; i < 20; ++i) {
        std::string key = "key-" + std::to_string(i);
        cache->put(key, i);
        std::size_t index = cache->shardIndexFor(key);
        ASSERT_LT(index, 4u);
        EXPECT_TRUE(cache->shard(index).stats().size > 0);
        EXPECT_EQ(*cache->get(key), i);
    }

    std::size_t total = 0;
    for (std::size_t i = 0; i < cache->shardCount(); ++i) {
        total += cache->shard(i).size();
    }
    EXPECT_EQ(total, 20u);
    EXPECT_EQ(cache->size(), 20u);
}

TEST_F(ShardedLruTtlCacheTest, TotalSizeNeverExceedsCapacity) {
    auto cache = makeCache(8, 4);
    for (int i = 0; i < 200; ++i) {
        cache->put(std::to_string(i), i);
        ASSERT_LE(cache->size(), 8u);
    }
    for (std::size_t i = 0; i < cache->shardCount(); ++i) {
        EXPECT_LE(cache->shard(i).size(), cache->shard(i).capacity());
    }
}

TEST_F(ShardedLruTtlCacheTest, RemoveExistsAndClearDelegate) {
    auto cache = makeCache(12, 3);
    cache->put("x", 1);
    cache->put("y", 2, 50ms);
    EXPECT_TRUE(cache->exists("x"));
    EXPECT_TRUE(cache->remove("x"));
    EXPECT_FALSE(cache->remove("x"));

    clock->advance(60ms);
    EXPECT_FALSE(cache->exists("y"));

    cache->put("z", 3);
    cache->clear();
    EXPECT_EQ(cache->size(), 0u);
}

TEST_F(ShardedLruTtlCacheTest, DrainAndStatsAggregateAcrossShards) {
    auto cache = makeCache(30, 3);
    for (int i = 0; i < 9; ++i) {
        cache->put("ttl-" + std::to_string(i), i, 10ms);
    }
    cache->put("keep", 100);
    cache->get("keep");
    cache->get("missing");

    clock->advance(20ms);
    EXPECT_EQ(cache->drainExpired(clock->now()), 9u);

    CacheStats stats = cache->stats();
    EXPECT_EQ(stats.size, 1u);
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.expirations, 9u);
}

TEST_F(ShardedLruTtlCacheTest, SharedSweeperDrainsEveryShard) {
    ShardedCache cache(16, 4, 5ms, logger, statsd, clock);
    ASSERT_TRUE(cache.hasBackgroundSweeper());
    for (std::size_t i = 0; i < cache.shardCount(); ++i) {
        EXPECT_FALSE(cache.shard(i).hasBackgroundSweeper());
    }

    for (int i = 0; i < 8; ++i) {
        cache.put("k" + std::to_string(i), i, 30ms);
    }
    clock->advance(50ms);

    EXPECT_TRUE(waitUntil([&cache]() { return cache.size() == 0; }));
    cache.shutdown();
    cache.shutdown();
}
