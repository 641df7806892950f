// tests/test_cache_stats.cpp
#include <string>

#include "gtest/gtest.h"

#include "../src/models/CacheStats.hpp"

TEST(CacheStatsTest, HitRateIsZeroWithoutLookups) {
    CacheStats stats;
    EXPECT_DOUBLE_EQ(stats.hitRate(), 0.0);
}

TEST(CacheStatsTest, HitRate) {
    CacheStats stats;
    stats.hits = 3;
    stats.misses = 1;
    EXPECT_DOUBLE_EQ(stats.hitRate(), 0.75);
}

TEST(CacheStatsTest, AccumulatesEveryCounter) {
    CacheStats a;
    a.hits = 1; a.misses = 2; a.evictions = 3; a.expirations = 4; a.size = 5; a.capacity = 10;
    CacheStats b;
    b.hits = 10; b.misses = 20; b.evictions = 30; b.expirations = 40; b.size = 1; b.capacity = 6;

    a += b;
    EXPECT_EQ(a.hits, 11u);
    EXPECT_EQ(a.misses, 22u);
    EXPECT_EQ(a.evictions, 33u);
    EXPECT_EQ(a.expirations, 44u);
    EXPECT_EQ(a.size, 6u);
    EXPECT_EQ(a.capacity, 16u);
}

TEST(CacheStatsTest, SerializesToJson) {
    CacheStats stats;
    stats.hits = 1;
    stats.misses = 1;
    stats.evictions = 2;
    stats.size = 3;
    stats.capacity = 4;

    json j = stats;
    EXPECT_EQ(j["hits"], 1);
    EXPECT_EQ(j["evictions"], 2);
    EXPECT_EQ(j["capacity"], 4);
    EXPECT_DOUBLE_EQ(j["hit_rate"].get<double>(), 0.5);

    CacheStats parsed = json::parse(j.dump()).get<CacheStats>();
    EXPECT_EQ(parsed.hits, 1u);
    EXPECT_EQ(parsed.size, 3u);
    EXPECT_EQ(parsed.capacity, 4u);
}

TEST(CacheStatsTest, FromJsonRequiresEveryField) {
    json incomplete = {{"hits", 1}};
    EXPECT_THROW(incomplete.get<CacheStats>(), json::out_of_range);
}

TEST(CacheStatsTest, ToStringShowsOccupancy) {
    CacheStats stats;
    stats.size = 2;
    stats.capacity = 8;
    EXPECT_NE(stats.to_string().find("size: 2/8"), std::string::npos);
}
