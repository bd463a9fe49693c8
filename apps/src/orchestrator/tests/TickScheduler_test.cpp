#include "orchestrator/TickScheduler.h"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>

using namespace SimPool;
using namespace std::chrono_literals;

TEST(TickSchedulerTest, RunsBothLoopsAtTheirOwnRates)
{
    std::atomic<int> physics{ 0 };
    std::atomic<int> consumption{ 0 };
    TickScheduler scheduler(
        200.0, 20.0, [&physics]() { physics++; }, [&consumption]() { consumption++; });

    scheduler.start();
    EXPECT_TRUE(scheduler.isRunning());
    std::this_thread::sleep_for(500ms);
    scheduler.stop();

    EXPECT_FALSE(scheduler.isRunning());
    EXPECT_GT(physics.load(), 20);
    EXPECT_GT(consumption.load(), 2);
    EXPECT_GT(physics.load(), consumption.load());
    EXPECT_EQ(scheduler.physicsTicks(), static_cast<uint64_t>(physics.load()));
}

TEST(TickSchedulerTest, NothingRunsAfterStop)
{
    std::atomic<int> physics{ 0 };
    TickScheduler scheduler(100.0, 10.0, [&physics]() { physics++; }, nullptr);

    scheduler.start();
    std::this_thread::sleep_for(100ms);
    scheduler.stop();
    const int atStop = physics.load();
    std::this_thread::sleep_for(100ms);

    EXPECT_EQ(physics.load(), atStop);
}

TEST(TickSchedulerTest, ThrowingCallbackDoesNotStopTheLoops)
{
    std::atomic<int> physics{ 0 };
    std::atomic<int> consumption{ 0 };
    TickScheduler scheduler(
        100.0,
        50.0,
        [&physics]() {
            physics++;
            throw std::runtime_error("physics failed");
        },
        [&consumption]() { consumption++; });

    scheduler.start();
    std::this_thread::sleep_for(300ms);
    scheduler.stop();

    EXPECT_GT(physics.load(), 5);
    EXPECT_GT(consumption.load(), 3);
}

TEST(TickSchedulerTest, StartAndStopAreIdempotent)
{
    TickScheduler scheduler(100.0, 10.0, nullptr, nullptr);

    scheduler.stop();
    scheduler.start();
    scheduler.start();
    scheduler.stop();
    scheduler.stop();

    EXPECT_FALSE(scheduler.isRunning());
}

TEST(TickSchedulerTest, RejectsNonPositiveRates)
{
    EXPECT_THROW(TickScheduler(0.0, 10.0, nullptr, nullptr), std::invalid_argument);
    EXPECT_THROW(TickScheduler(10.0, -1.0, nullptr, nullptr), std::invalid_argument);
}
