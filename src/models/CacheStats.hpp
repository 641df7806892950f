#ifndef CACHESTATS_HPP
#define CACHESTATS_HPP

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// --- Point-in-time counters of a cache ---
class CacheStats {
public:
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;   // capacity (LRU) evictions
    uint64_t expirations = 0; // entries dropped because their TTL elapsed
    std::size_t size = 0;
    std::size_t capacity = 0;

    double hitRate() const {
        uint64_t lookups = hits + misses;
        return lookups == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(lookups);
    }

    CacheStats& operator+=(const CacheStats& other) {
        hits += other.hits;
        misses += other.misses;
        evictions += other.evictions;
        expirations += other.expirations;
        size += other.size;
        capacity += other.capacity;
        return *this;
    }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "CacheStats {"
            << " size: " << size << "/" << capacity
            << ", hits: " << hits
            << ", misses: " << misses
            << ", evictions: " << evictions
            << ", expirations: " << expirations
            << " }";
        return oss.str();
    }
};

inline void to_json(json& j, const CacheStats& stats) {
    j = json{
        {"hits", stats.hits},
        {"misses", stats.misses},
        {"evictions", stats.evictions},
        {"expirations", stats.expirations},
        {"size", stats.size},
        {"capacity", stats.capacity},
        {"hit_rate", stats.hitRate()}
    };
}

inline void from_json(const json& j, CacheStats& stats) {
    j.at("hits").get_to(stats.hits);
    j.at("misses").get_to(stats.misses);
    j.at("evictions").get_to(stats.evictions);
    j.at("expirations").get_to(stats.expirations);
    j.at("size").get_to(stats.size);
    j.at("capacity").get_to(stats.capacity);
}

#endif // CACHESTATS_HPP
