// tests/test_background_sweeper.cpp
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "../src/core/BackgroundSweeper.hpp"
#include "TestDoubles.hpp"

using namespace std::chrono_literals;
using ::testing::_;
using ::testing::AnyNumber;
using ::testing::HasSubstr;
using ::testing::NiceMock;

// Delivers a timer error on the sweeper thread, as a failing steady_timer would.
class TimerFaultSweeper : public BackgroundSweeper {
public:
    using BackgroundSweeper::BackgroundSweeper;

    void failNextWait() {
        boost::asio::post(context(), [this]() {
            onTimer(boost::asio::error::make_error_code(boost::asio::error::timed_out));
        });
    }
};

class BackgroundSweeperTest : public ::testing::Test {
protected:
    std::shared_ptr<NiceMock<MockLogger>> logger = std::make_shared<NiceMock<MockLogger>>();
};

TEST_F(BackgroundSweeperTest, RejectsInvalidArguments) {
    auto task = []() -> std::size_t { return 0; };
    EXPECT_THROW(BackgroundSweeper("s", 0ms, task, logger), std::invalid_argument);
    EXPECT_THROW(BackgroundSweeper("s", -10ms, task, logger), std::invalid_argument);
    EXPECT_THROW(BackgroundSweeper("s", 10ms, task, nullptr), std::invalid_argument);
    EXPECT_THROW(BackgroundSweeper("s", 10ms, BackgroundSweeper::Task(), logger), std::invalid_argument);
    EXPECT_THROW(BackgroundSweeper("s", 10ms, task, logger, -1ms), std::invalid_argument);
}

TEST_F(BackgroundSweeperTest, RunsPeriodicallyUntilShutdown) {
    std::atomic<int> calls{0};
    BackgroundSweeper sweeper("periodic", 5ms, [&calls]() -> std::size_t {
        ++calls;
        return 0;
    }, logger);

    EXPECT_TRUE(sweeper.isRunning());
    EXPECT_EQ(sweeper.interval(), 5ms);
    ASSERT_TRUE(waitUntil([&calls]() { return calls.load() >= 3; }));

    sweeper.shutdown();
    EXPECT_FALSE(sweeper.isRunning());
    int after_shutdown = calls.load();
    EXPECT_EQ(static_cast<uint64_t>(after_shutdown), sweeper.runCount());

    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(calls.load(), after_shutdown);
}

TEST_F(BackgroundSweeperTest, FirstRunWaitsOneInterval) {
    std::atomic<int> calls{0};
    BackgroundSweeper sweeper("delayed", 10s, [&calls]() -> std::size_t {
        ++calls;
        return 0;
    }, logger);

    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(calls.load(), 0);
    sweeper.shutdown(); // cancels the pending wait without running the task
    EXPECT_EQ(calls.load(), 0);
}

TEST_F(BackgroundSweeperTest, ShutdownWaitsForRunInProgress) {
    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};
    BackgroundSweeper sweeper("slow", 1ms, [&]() -> std::size_t {
        started = true;
        std::this_thread::sleep_for(50ms);
        finished = true;
        return 0;
    }, logger, 2s);

    ASSERT_TRUE(waitUntil([&started]() { return started.load(); }));
    sweeper.shutdown();
    EXPECT_TRUE(finished.load());
}

TEST_F(BackgroundSweeperTest, ForcesStopWhenRunExceedsTimeout) {
    EXPECT_CALL(*logger, warn(HasSubstr("forcing stop"))).Times(1);

    std::atomic<bool> started{false};
    BackgroundSweeper sweeper("stuck", 1ms, [&started]() -> std::size_t {
        started = true;
        std::this_thread::sleep_for(300ms);
        return 0;
    }, logger, 20ms);

    ASSERT_TRUE(waitUntil([&started]() { return started.load(); }));
    auto before = std::chrono::steady_clock::now();
    sweeper.shutdown();
    // The join still waits for the task, but the warning was issued at the timeout.
    EXPECT_GE(std::chrono::steady_clock::now() - before, 20ms);
}

TEST_F(BackgroundSweeperTest, TaskFailureIsLoggedAndScheduleContinues) {
    EXPECT_CALL(*logger, error(HasSubstr("failing sweep failed: boom"))).Times(::testing::AtLeast(1));

    std::atomic<int> calls{0};
    BackgroundSweeper sweeper("failing", 2ms, [&calls]() -> std::size_t {
        if (++calls == 1) {
            throw std::runtime_error("boom");
        }
        return 0;
    }, logger);

    ASSERT_TRUE(waitUntil([&calls]() { return calls.load() >= 3; }));
    sweeper.shutdown();
}

TEST_F(BackgroundSweeperTest, TimerErrorIsLoggedAndScheduleContinues) {
    EXPECT_CALL(*logger, error(HasSubstr("faulty sweeper timer error"))).Times(1);

    std::atomic<int> calls{0};
    TimerFaultSweeper sweeper("faulty", 5ms, [&calls]() -> std::size_t {
        ++calls;
        return 0;
    }, logger);

    ASSERT_TRUE(waitUntil([&calls]() { return calls.load() >= 1; }));
    sweeper.failNextWait();

    int before = calls.load();
    EXPECT_TRUE(waitUntil([&calls, before]() { return calls.load() >= before + 3; }));
    EXPECT_TRUE(sweeper.isRunning());
    sweeper.shutdown();
}

TEST_F(BackgroundSweeperTest, ShutdownIsIdempotentAndDestructorSafe) {
    auto sweeper = std::make_unique<BackgroundSweeper>(
        "twice", 5ms, []() -> std::size_t { return 0; }, logger);
    sweeper->shutdown();
    sweeper->shutdown();
    EXPECT_NO_THROW(sweeper.reset());
}
