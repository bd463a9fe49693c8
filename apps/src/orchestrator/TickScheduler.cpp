#include "TickScheduler.h"
#include "core/LoggingChannels.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace SimPool {

namespace {

std::chrono::nanoseconds periodFor(double hz)
{
    if (hz <= 0.0) {
        throw std::invalid_argument("Tick rate must be positive");
    }
    return std::chrono::nanoseconds(static_cast<int64_t>(1e9 / hz));
}

} // namespace

TickScheduler::TickScheduler(
    double physicsHz, double consumptionHz, Callback physics, Callback consumption)
    : physicsPeriod_(periodFor(physicsHz)),
      consumptionPeriod_(periodFor(consumptionHz)),
      physics_(std::move(physics)),
      consumption_(std::move(consumption))
{}

TickScheduler::~TickScheduler()
{
    stop();
}

void TickScheduler::start()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_.joinable()) {
        return;
    }
    stopRequested_ = false;
    running_ = true;
    thread_ = std::thread([this]() { run(); });
    LOG_INFO(
        Scheduler,
        "Loops started (physics every {} us, consumption every {} us)",
        std::chrono::duration_cast<std::chrono::microseconds>(physicsPeriod_).count(),
        std::chrono::duration_cast<std::chrono::microseconds>(consumptionPeriod_).count());
}

void TickScheduler::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
        LOG_INFO(
            Scheduler,
            "Loops stopped after {} physics / {} consumption ticks",
            physicsTicks_.load(),
            consumptionTicks_.load());
    }
    running_ = false;
}

void TickScheduler::run()
{
    using Clock = std::chrono::steady_clock;

    auto nextPhysics = Clock::now();
    auto nextConsumption = nextPhysics + consumptionPeriod_;

    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopRequested_) {
        const auto wakeAt = std::min(nextPhysics, nextConsumption);
        if (cv_.wait_until(lock, wakeAt, [this]() { return stopRequested_; })) {
            break;
        }
        lock.unlock();

        const auto now = Clock::now();
        if (now >= nextPhysics) {
            invoke(physics_, "physics");
            physicsTicks_++;
            nextPhysics += physicsPeriod_;
            if (nextPhysics < now) {
                nextPhysics = now + physicsPeriod_;
            }
        }
        if (now >= nextConsumption) {
            invoke(consumption_, "consumption");
            consumptionTicks_++;
            nextConsumption += consumptionPeriod_;
            if (nextConsumption < now) {
                nextConsumption = now + consumptionPeriod_;
            }
        }

        lock.lock();
    }
}

void TickScheduler::invoke(const Callback& callback, const char* loopName)
{
    if (!callback) {
        return;
    }
    try {
        callback();
    }
    catch (const std::exception& e) {
        LOG_ERROR(Scheduler, "{} tick failed: {}", loopName, e.what());
    }
}

} // namespace SimPool
