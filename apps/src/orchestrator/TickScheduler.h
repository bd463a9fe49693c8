#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace SimPool {

/**
 * @brief Drives two periodic callbacks from one coordinating thread.
 *
 * The physics callback runs every 1/physicsHz seconds and the consumption
 * callback every 1/consumptionHz seconds, each on its own deadline. A late
 * loop skips the missed periods instead of bursting. An exception from one
 * callback is logged and does not stop either loop.
 */
class TickScheduler {
public:
    using Callback = std::function<void()>;

    TickScheduler(double physicsHz, double consumptionHz, Callback physics, Callback consumption);
    ~TickScheduler();

    TickScheduler(const TickScheduler&) = delete;
    TickScheduler& operator=(const TickScheduler&) = delete;

    void start();
    void stop();

    bool isRunning() const { return running_.load(); }
    uint64_t physicsTicks() const { return physicsTicks_.load(); }
    uint64_t consumptionTicks() const { return consumptionTicks_.load(); }

private:
    void run();
    void invoke(const Callback& callback, const char* loopName);

    std::chrono::nanoseconds physicsPeriod_;
    std::chrono::nanoseconds consumptionPeriod_;
    Callback physics_;
    Callback consumption_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopRequested_ = false;
    std::atomic<bool> running_{ false };
    std::atomic<uint64_t> physicsTicks_{ 0 };
    std::atomic<uint64_t> consumptionTicks_{ 0 };
    std::thread thread_;
};

} // namespace SimPool
