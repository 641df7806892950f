#include <sstream>
#include <stdexcept>

#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/system/error_code.hpp>

#include "StatsDClient.hpp"

namespace net = boost::asio;
using udp = net::ip::udp;

StatsDClient::StatsDClient(
    std::shared_ptr<ILogger> logger,
    const std::string& statsd_address,
    std::string prefix) : logger_(logger), prefix_(std::move(prefix)), socket_(ioc_) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for StatsDClient");
    }
    auto colon_pos = statsd_address.rfind(':');
    if (colon_pos == std::string::npos || colon_pos == 0) {
        throw std::runtime_error("STATSD_SERVER must be in the format <host>:<port>");
    }

    std::string host = statsd_address.substr(0, colon_pos);
    std::string port = statsd_address.substr(colon_pos + 1);

    boost::system::error_code ec;
    udp::resolver resolver(ioc_);
    auto results = resolver.resolve(udp::v4(), host, port, ec);
    if (ec || results.empty()) {
        throw std::runtime_error("Failed to resolve STATSD_SERVER " + statsd_address + ": " + ec.message());
    }
    endpoint_ = results.begin()->endpoint();

    socket_.open(udp::v4(), ec);
    if (ec) {
        throw std::runtime_error("Failed to open StatsD socket: " + ec.message());
    }
    socket_.non_blocking(true, ec);
    if (ec) {
        throw std::runtime_error("Failed to make StatsD socket non-blocking: " + ec.message());
    }
    logger_->setup("StatsDClient sending to " + endpoint_.address().to_string() + ":" + std::to_string(endpoint_.port()));
}

StatsDClient::~StatsDClient() {
    boost::system::error_code ec;
    socket_.close(ec);
    if (ec) {
        logger_->error("StatsDClient: failed to close socket: " + ec.message());
    }
}

void StatsDClient::send(const std::string& message) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    boost::system::error_code ec;
    socket_.send_to(net::buffer(message), endpoint_, 0, ec);
    if (ec) {
        ++dropped_;
        if (ec != net::error::would_block) {
            logger_->error("StatsDClient: Failed to send UDP message: " + ec.message());
        }
    }
}

uint64_t StatsDClient::droppedCount() const {
    std::lock_guard<std::mutex> lock(send_mutex_);
    return dropped_;
}

// Increment a counter
void StatsDClient::increment(const std::string& key, int value) {
    std::stringstream ss;
    ss << prefix_ << key << ":" << value << "|c";
    send(ss.str());
}

// Record a gauge value
void StatsDClient::gauge(const std::string& key, double value) {
    std::stringstream ss;
    ss << prefix_ << key << ":" << value << "|g";
    send(ss.str());
}

// Record a timing value
void StatsDClient::timing(const std::string& key, std::chrono::milliseconds value) {
    std::stringstream ss;
    ss << prefix_ << key << ":" << value.count() << "|ms";
    send(ss.str());
}
