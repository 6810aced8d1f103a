/**
 * @file test_tick_scheduler.cpp
 * @brief Unit tests for TickScheduler
 */

#include <gtest/gtest.h>
#include <heartfield/core/TickScheduler.hpp>
#include <heartfield/core/exception.h>
#include <heartfield/core/Logger.hpp>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace heartfield::core;

class TickSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLevel(LogLevel::WARNING);
    }
};

TEST_F(TickSchedulerTest, RunsRequestedFrames) {
    TickScheduler scheduler(0.0);
    int calls = 0;
    EXPECT_EQ(scheduler.run([&]() { ++calls; return true; }, 25), 25u);
    EXPECT_EQ(calls, 25);
    EXPECT_FALSE(scheduler.isRunning());
}

TEST_F(TickSchedulerTest, StepCanEndLoop) {
    TickScheduler scheduler(0.0);
    int calls = 0;
    EXPECT_EQ(scheduler.run([&]() { return ++calls < 3; }), 3u);
}

TEST_F(TickSchedulerTest, StopFromStepIsImmediate) {
    TickScheduler scheduler(0.0);
    int calls = 0;
    const uint64_t frames = scheduler.run([&]() {
        if (++calls == 4) {
            scheduler.stop();
            scheduler.stop();
        }
        return true;
    });
    EXPECT_EQ(frames, 4u);
    EXPECT_EQ(calls, 4);
}

TEST_F(TickSchedulerTest, StopFromAnotherThread) {
    TickScheduler scheduler(200.0);
    std::thread stopper([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        scheduler.stop();
    });
    const uint64_t frames = scheduler.run([]() { return true; });
    stopper.join();
    EXPECT_GT(frames, 0u);
    EXPECT_FALSE(scheduler.isRunning());
}

TEST_F(TickSchedulerTest, PacesToTargetRate) {
    TickScheduler scheduler(100.0);
    const auto start = std::chrono::steady_clock::now();
    scheduler.run([]() { return true; }, 10);
    const double elapsed_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
    // 10 frames at 100 fps: nine sleeps of 10 ms plus the final one
    EXPECT_GE(elapsed_ms, 80.0);
}

TEST_F(TickSchedulerTest, NegativeRateThrows) {
    EXPECT_THROW(TickScheduler scheduler(-1.0), InvalidParameterException);
}

TEST_F(TickSchedulerTest, ThrowingStepLeavesSchedulerReusable) {
    TickScheduler scheduler(0.0);
    int calls = 0;
    EXPECT_THROW(scheduler.run([&]() -> bool {
        if (++calls == 2) {
            throw std::runtime_error("render failure");
        }
        return true;
    }, 10), std::runtime_error);
    EXPECT_EQ(calls, 2);
    EXPECT_FALSE(scheduler.isRunning());

    calls = 0;
    EXPECT_EQ(scheduler.run([&]() { ++calls; return true; }, 5), 5u);
    EXPECT_EQ(calls, 5);
}
