#include <chrono>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "cache/LruTtlCache.hpp"
#include "cache/ShardedLruTtlCache.hpp"
#include "config/CacheConfig.hpp"
#include "logging/ConsoleLogger.hpp"
#include "metrics/DummyStatsDClient.hpp"
#include "metrics/StatsDClient.hpp"
#include "models/CacheStats.hpp"
#include "utils/Utils.hpp"

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

template <typename T>
std::string show(const std::optional<T>& value) {
    if (!value) {
        return "null";
    }
    std::ostringstream oss;
    oss << *value;
    return oss.str();
}

// --- Helper Function to Initialize StatsD Client ---
std::shared_ptr<IStatsDClient> initializeStatsDClient(std::shared_ptr<ILogger> logger_) {
    const char* statsd_server_value = std::getenv(Constants::STATSD_SERVER_ENV);
    if (statsd_server_value == nullptr || std::string(statsd_server_value).empty()) {
        logger_->setup("STATSD_SERVER not set. Creating DummyStatsDClient instance.");
        return DummyStatsDClient::getInstance();
    }
    try {
        return std::make_shared<StatsDClient>(logger_, statsd_server_value);
    } catch (const std::exception& e) {
        logger_->error("StatsDClient failed to get created: " + std::string(e.what()) + ". Creating DummyStatsDClient instance.");
    }
    return DummyStatsDClient::getInstance();
}

// --- Helper Function to Initialize Cache ---
std::shared_ptr<CacheInterface<std::string, std::string>> initializeCache(
    const CacheConfig& config_,
    std::shared_ptr<ILogger> logger_,
    std::shared_ptr<IStatsDClient> statsd_client) {
    std::chrono::milliseconds sweep_interval(config_.sweep_interval_in_millis);
    std::chrono::milliseconds shutdown_timeout(config_.shutdown_timeout_in_millis);
    if (config_.shard_count > 1) {
        logger_->setup("Creating ShardedLruTtlCache.");
        return std::make_shared<ShardedLruTtlCache<std::string, std::string>>(
            config_.capacity, config_.shard_count, sweep_interval, logger_, statsd_client,
            SteadyClock::getInstance(), shutdown_timeout);
    }
    logger_->setup("Creating LruTtlCache.");
    return std::make_shared<LruTtlCache<std::string, std::string>>(
        config_.capacity, sweep_interval, logger_, statsd_client, SteadyClock::getInstance(), shutdown_timeout);
}

void lruEvictionScenario(std::shared_ptr<ILogger> logger) {
    std::cout << "-- Scenario 1: Basic LRU Eviction (capacity=3) --" << std::endl;
    LruTtlCache<std::string, int> cache(3, 0ms, logger);

    cache.put("a", 1);
    cache.put("b", 2);
    cache.put("c", 3);
    std::cout << "get(a) = " << show(cache.get("a")) << std::endl; // promotes a

    cache.put("d", 4); // b is now least recently used
    std::cout << "get(b) = " << show(cache.get("b")) << std::endl;
    std::cout << "get(c) = " << show(cache.get("c")) << std::endl;
    std::cout << "get(d) = " << show(cache.get("d")) << std::endl;
}

void expiryOnReadScenario(std::shared_ptr<ILogger> logger, std::chrono::milliseconds ttl,
                          LruTtlCache<std::string, std::string>& cache) {
    std::cout << std::endl << "-- Scenario 2: TTL expiry detected on GET --" << std::endl;
    cache.put("session:1", "user-alice", ttl);
    cache.put("session:2", "user-bob", 5000ms);
    cache.put("permanent", "admin");

    std::cout << "Before expiry:" << std::endl
              << "  session:1 = " << show(cache.get("session:1")) << std::endl
              << "  session:2 = " << show(cache.get("session:2")) << std::endl
              << "  permanent = " << show(cache.get("permanent")) << std::endl;

    std::this_thread::sleep_for(ttl + 100ms);

    std::cout << "After " << (ttl + 100ms).count() << "ms (session:1 should be expired):" << std::endl
              << "  session:1 = " << show(cache.get("session:1")) << std::endl
              << "  session:2 = " << show(cache.get("session:2")) << std::endl
              << "  permanent = " << show(cache.get("permanent")) << std::endl;
    logger->debug(cache.stats().to_string());
}

void reclaimOnPutScenario(std::shared_ptr<ILogger> logger, std::chrono::milliseconds ttl) {
    std::cout << std::endl << "-- Scenario 3: expired slots reclaimed on PUT --" << std::endl;
    LruTtlCache<int, std::string> cache(3, 0ms, logger);

    cache.put(1, "one", ttl);
    cache.put(2, "two", ttl);
    cache.put(3, "three", ttl);
    std::cout << "size before expiry = " << cache.size() << std::endl;

    std::this_thread::sleep_for(ttl + 50ms);

    // The first put drains all three expired entries, so nothing live is evicted.
    cache.put(4, "four");
    cache.put(5, "five");
    cache.put(6, "six");
    std::cout << "get(1) = " << show(cache.get(1)) << std::endl;
    std::cout << "get(4) = " << show(cache.get(4)) << std::endl;
    std::cout << "get(5) = " << show(cache.get(5)) << std::endl;
    std::cout << "get(6) = " << show(cache.get(6)) << std::endl;
    std::cout << "evictions = " << cache.stats().evictions << std::endl;
}

void removeScenario(LruTtlCache<std::string, std::string>& cache) {
    std::cout << std::endl << "-- Scenario 4: Manual remove --" << std::endl;
    cache.remove("permanent");
    std::cout << "After remove, permanent = " << show(cache.get("permanent")) << std::endl;
}

void backgroundSweepScenario(std::shared_ptr<ILogger> logger) {
    std::cout << std::endl << "-- Scenario 5: Background sweep --" << std::endl;
    LruTtlCache<std::string, int> cache(10, 25ms, logger);
    cache.put("x", 100, 50ms);
    cache.put("y", 200, 50ms);
    cache.put("z", 300);
    std::cout << "size right after insert = " << cache.size() << std::endl;

    std::this_thread::sleep_for(150ms); // several sweep periods
    std::cout << "size after background sweep = " << cache.size() << std::endl;
    std::cout << "get(z) = " << show(cache.get("z")) << std::endl;
    cache.shutdown();
}

} // namespace

// --- Main Function ---
int main(int argc, char** argv) {
    try {
        std::vector<std::string> args_vec;
        for (int i = 1; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        std::optional<std::map<std::string, std::string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            ConsoleLogger::getInstance()->error("Failed to parse command-line arguments. Exiting.");
            return 1;
        }

        CacheConfig config_ = Utils::loadConfiguration(parsedArgsOpt.value());

        std::shared_ptr<ILogger> logger_ = ConsoleLogger::getInstance(config_.log_level);
        logger_->setup("Configuration loaded.");
        logger_->setup(config_.to_string());

        std::shared_ptr<IStatsDClient> statsd_client = initializeStatsDClient(logger_);
        std::shared_ptr<CacheInterface<std::string, std::string>> cache_instance =
            initializeCache(config_, logger_, statsd_client);

        std::chrono::milliseconds demo_ttl(config_.default_demo_ttl_in_millis);

        lruEvictionScenario(logger_);
        LruTtlCache<std::string, std::string> session_cache(5, 60s, logger_, statsd_client);
        expiryOnReadScenario(logger_, demo_ttl, session_cache);
        reclaimOnPutScenario(logger_, demo_ttl);
        removeScenario(session_cache);
        backgroundSweepScenario(logger_);
        session_cache.shutdown();

        std::cout << std::endl << "-- Configured cache --" << std::endl;
        for (int i = 0; i < 2 * config_.capacity; ++i) {
            cache_instance->put("key:" + std::to_string(i), "value:" + std::to_string(i), demo_ttl);
        }
        cache_instance->get("key:" + std::to_string(2 * config_.capacity - 1));
        cache_instance->get("key:0");

        CacheStats stats;
        if (auto single = std::dynamic_pointer_cast<LruTtlCache<std::string, std::string>>(cache_instance)) {
            stats = single->stats();
        } else if (auto sharded = std::dynamic_pointer_cast<ShardedLruTtlCache<std::string, std::string>>(cache_instance)) {
            stats = sharded->stats();
        }
        std::cout << json(stats).dump(4) << std::endl;

        cache_instance->shutdown();
        logger_->setup("All scenarios finished. Exiting.");
        return 0;
    } catch (const std::exception& e) {
        ConsoleLogger::getInstance()->error("Unhandled exception: " + std::string(e.what()));
        return 1;
    }
}
