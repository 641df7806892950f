#pragma once

#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>

#include "../config/CacheConfig.hpp"
#include "../interfaces/ILogger.hpp"

class ConsoleLogger : public ILogger {
public:
    // Returns the process-wide logger; every call re-applies logLevel so a
    // logger fetched before the configuration is loaded picks up the final level.
    static std::shared_ptr<ConsoleLogger> getInstance(LogUtils::LogLevel logLevel);
    // Leaves the current level alone; CERROR if the logger does not exist yet.
    static std::shared_ptr<ConsoleLogger> getInstance();
    ~ConsoleLogger() override = default;

    void info(const std::string& message) override;
    void debug(const std::string& message) override;
    void warn(const std::string& message) override;
    void error(const std::string& message) override;
    void setup(const std::string& message) override;
    int getLogLevel() override { return logLevel_.load(); }
    void setLogLevel(LogUtils::LogLevel logLevel) { logLevel_.store(logLevel); }

private:
    explicit ConsoleLogger(LogUtils::LogLevel logLevel) : logLevel_(logLevel) {}
    void write(std::ostream& out, const std::string& prefix, const std::string& message);

    std::atomic<int> logLevel_;
    std::mutex out_mutex_; // Serialises std::cout / std::cerr writes

    static std::shared_ptr<ConsoleLogger> instance;
    static std::once_flag init_flag;

    ConsoleLogger(const ConsoleLogger&) = delete;
    ConsoleLogger& operator=(const ConsoleLogger&) = delete;
    ConsoleLogger(ConsoleLogger&&) = delete;
    ConsoleLogger& operator=(ConsoleLogger&&) = delete;
};
