#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Fire-and-forget StatsD client. Each metric is one UDP datagram sent on a
// non-blocking socket; a datagram that cannot be sent immediately is dropped.
class StatsDClient : public IStatsDClient {
public:
    // stats_server_endpoint is "<host>:<port>"; throws std::runtime_error when
    // it is malformed or cannot be resolved.
    StatsDClient(std::shared_ptr<ILogger> logger, const std::string& stats_server_endpoint,
        std::string prefix = "");
    ~StatsDClient() override;

    void increment(const std::string& key, int value = 1) override;
    void gauge(const std::string& key, double value) override;
    void timing(const std::string& key, std::chrono::milliseconds value) override;

    uint64_t droppedCount() const;

private:
    void send(const std::string& message);

    std::shared_ptr<ILogger> logger_;
    std::string prefix_;
    boost::asio::io_context ioc_;
    boost::asio::ip::udp::socket socket_;
    boost::asio::ip::udp::endpoint endpoint_;
    mutable std::mutex send_mutex_;
    uint64_t dropped_ = 0;

    StatsDClient(const StatsDClient&) = delete;
    StatsDClient& operator=(const StatsDClient&) = delete;
    StatsDClient(StatsDClient&&) = delete;
    StatsDClient& operator=(StatsDClient&&) = delete;
};
