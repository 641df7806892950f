#pragma once

#include <chrono>
#include <string>

// Sink for the cache's metrics: counters for hits, misses, evictions and
// expirations, a size gauge and the sweep timer.
class IStatsDClient {
public:
    virtual ~IStatsDClient() = default;

    // Adds value to a counter; bulk expirations are reported as one call.
    virtual void increment(const std::string& key, int value = 1) = 0;
    virtual void gauge(const std::string& key, double value) = 0;
    virtual void timing(const std::string& key, std::chrono::milliseconds value) = 0;
};
