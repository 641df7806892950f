#ifndef CACHECONFIG_HPP
#define CACHECONFIG_HPP

#include <iostream>
#include <string>
#include <sstream>

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };

    static std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static std::string INFO_LOG_PREFIX = "[Info] ";
    static std::string WARN_LOG_PREFIX = "[Warning] ";
    static std::string CERROR_LOG_PREFIX = "[Error] ";
    static std::string SETUP_LOG_PREFIX = "[Setup] ";
}

namespace MetricsDefinitions {
    static std::string CACHE_HIT = "ttlcache.hit";

    static std::string CACHE_MISS = "ttlcache.miss";

    // Capacity (LRU) evictions only; expirations are counted separately.
    static std::string CACHE_EVICTION = "ttlcache.eviction";

    static std::string CACHE_EXPIRATION = "ttlcache.expiration";

    static std::string SWEEP_DURATION = "ttlcache.sweep.duration";

    static std::string CACHE_SIZE = "ttlcache.size";
}

namespace Constants {
    static constexpr auto CONFIG_FILE_NAME = "ttlcache.config";
    static constexpr auto STATSD_SERVER_ENV = "STATSD_SERVER";
};

// --- Configuration Struct ---
class CacheConfig {
public:
    // Cache configuration
    int capacity;
    int shard_count;

    // Background sweeper
    int sweep_interval_in_millis;
    int shutdown_timeout_in_millis;

    // Demo
    int default_demo_ttl_in_millis;

    // Logging Level
    LogUtils::LogLevel log_level;

    CacheConfig() {
        // --- Set Defaults  ---
        capacity = 1000;
        shard_count = 1;
        sweep_interval_in_millis = 30000;
        shutdown_timeout_in_millis = 5000;
        default_demo_ttl_in_millis = 200;
        log_level = LogUtils::LogLevel::CERROR; // Default log level
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "// --- Cache Configuration --- //" << std::endl
            << "capacity: " << capacity << std::endl
            << "shard_count: " << shard_count << std::endl
            << "// --- Background Sweeper --- //" << std::endl
            << "sweep_interval_in_millis: " << sweep_interval_in_millis << std::endl
            << "shutdown_timeout_in_millis: " << shutdown_timeout_in_millis << std::endl
            << "// --- Demo & Logging --- //" << std::endl
            << "default_demo_ttl_in_millis: " << default_demo_ttl_in_millis << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl  // Cast enum to int
            << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // CACHECONFIG_HPP
