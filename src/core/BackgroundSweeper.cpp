#include "BackgroundSweeper.hpp"

#include <exception>
#include <stdexcept>

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

namespace net = boost::asio;

BackgroundSweeper::BackgroundSweeper(
    std::string name,
    std::chrono::milliseconds interval,
    Task task,
    std::shared_ptr<ILogger> logger,
    std::chrono::milliseconds shutdown_timeout)
    : name_(std::move(name)),
      interval_(interval),
      shutdown_timeout_(shutdown_timeout),
      task_(std::move(task)),
      logger_(logger),
      timer_(ioc_),
      finished_future_(finished_.get_future()),
      stopped_(false),
      runs_(0) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for BackgroundSweeper");
    }
    if (interval_.count() <= 0) {
        throw std::invalid_argument("BackgroundSweeper interval must be > 0");
    }
    if (shutdown_timeout_.count() < 0) {
        throw std::invalid_argument("BackgroundSweeper shutdown timeout must be >= 0");
    }
    if (!task_) {
        throw std::invalid_argument("BackgroundSweeper task cannot be empty");
    }

    // Arm before the thread starts so run() has pending work and does not return at once.
    timer_.expires_after(interval_);
    timer_.async_wait([this](const boost::system::error_code& ec) { onTimer(ec); });

    thread_ = std::thread([this]() {
        logger_->debug(name_ + " sweeper thread started.");
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            logger_->error(name_ + " sweeper io_context failed: " + std::string(e.what()));
        }
        logger_->debug(name_ + " sweeper thread exiting.");
        finished_.set_value();
    });
}

BackgroundSweeper::~BackgroundSweeper() {
    shutdown();
}

void BackgroundSweeper::arm() {
    // Fixed rate: the next deadline is measured from the previous one, not from now.
    timer_.expires_at(timer_.expiry() + interval_);
    timer_.async_wait([this](const boost::system::error_code& ec) { onTimer(ec); });
}

void BackgroundSweeper::onTimer(const boost::system::error_code& ec) {
    if (ec == net::error::operation_aborted || stopped_.load()) {
        logger_->debug(name_ + " sweeper timer cancelled.");
        return;
    }
    if (ec) {
        // Skip this run; the schedule continues.
        logger_->error(name_ + " sweeper timer error: " + ec.message());
    } else {
        try {
            task_();
        } catch (const std::exception& e) {
            logger_->error(name_ + " sweep failed: " + std::string(e.what()));
        }
        runs_.fetch_add(1);
    }

    if (!stopped_.load()) {
        arm();
    }
}

void BackgroundSweeper::shutdown() {
    if (stopped_.exchange(true)) {
        return; // Already shut down
    }
    logger_->debug("Shutting down " + name_ + " sweeper...");

    // timer_ belongs to the sweeper thread; cancel it there.
    net::post(ioc_, [this]() { timer_.cancel(); });

    if (finished_future_.wait_for(shutdown_timeout_) == std::future_status::timeout) {
        logger_->warn(name_ + " sweeper did not stop within " +
            std::to_string(shutdown_timeout_.count()) + "ms; forcing stop.");
        ioc_.stop();
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    logger_->debug(name_ + " sweeper shut down complete.");
}
