#ifndef BACKGROUNDSWEEPER_HPP
#define BACKGROUNDSWEEPER_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

#include "../interfaces/ILogger.hpp"

// Runs a task on its own thread at a fixed rate until shut down.
//
// The schedule is driven by a steady_timer on a private io_context. The first
// run happens one interval after construction. A run that is in progress when
// shutdown() is called always finishes; cancellation only prevents the next one.
class BackgroundSweeper {
public:
    using Task = std::function<std::size_t()>;

    // Throws std::invalid_argument for a non-positive interval, a negative
    // shutdown timeout, an empty task or a null logger.
    BackgroundSweeper(
        std::string name,
        std::chrono::milliseconds interval,
        Task task,
        std::shared_ptr<ILogger> logger,
        std::chrono::milliseconds shutdown_timeout = std::chrono::seconds(5));

    ~BackgroundSweeper();

    BackgroundSweeper(const BackgroundSweeper&) = delete;
    BackgroundSweeper& operator=(const BackgroundSweeper&) = delete;

    // Stops future runs and waits up to shutdown_timeout for the sweeper
    // thread; if it has not finished by then the io_context is stopped and the
    // thread joined. Idempotent. Must not be called from inside the task.
    void shutdown();

    bool isRunning() const { return !stopped_.load(); }
    uint64_t runCount() const { return runs_.load(); }
    std::chrono::milliseconds interval() const { return interval_; }

protected:
    // Timer completion handler; runs on the sweeper thread only.
    void onTimer(const boost::system::error_code& ec);
    boost::asio::io_context& context() { return ioc_; }

private:
    void arm();

    std::string name_;
    std::chrono::milliseconds interval_;
    std::chrono::milliseconds shutdown_timeout_;
    Task task_;
    std::shared_ptr<ILogger> logger_;

    boost::asio::io_context ioc_;
    boost::asio::steady_timer timer_;
    std::promise<void> finished_;
    std::future<void> finished_future_;
    std::thread thread_;
    std::atomic<bool> stopped_;
    std::atomic<uint64_t> runs_;
};

#endif // BACKGROUNDSWEEPER_HPP
