#pragma once

#include "UnitEnvironment.h"
#include "core/network/UnitProtocol.h"
#include "core/physics/PhysicsEngineFactory.h"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace SimPool {

struct SimulationUnitConfig {
    int maxEpisodeSteps = 1000;
    EngineFactory engineFactory; // Empty means createPhysicsEngine().
};

/**
 * @brief Isolated worker hosting the engines of the environments assigned to it.
 *
 * The unit owns a thread and an inbox of serialized command frames. Frames are
 * handled strictly in arrival order, one at a time, and every reply leaves as a
 * serialized frame through the reply sink. Nothing else crosses the boundary.
 *
 * Handler exceptions become `error` replies carrying the envId and context; the
 * unit keeps serving its other environments.
 */
class SimulationUnit {
public:
    using ReplySink = std::function<void(std::vector<std::byte>)>;

    SimulationUnit(int unitId, SimulationUnitConfig config, ReplySink replySink);
    ~SimulationUnit();

    SimulationUnit(const SimulationUnit&) = delete;
    SimulationUnit& operator=(const SimulationUnit&) = delete;

    void start();

    /**
     * @brief Queue a command frame. Returns false once the unit is terminated.
     */
    bool post(std::vector<std::byte> frame);

    /**
     * @brief Hard stop: queued frames are discarded and the thread is joined.
     * Frames already being handled finish first. Safe to call repeatedly.
     */
    void terminate();

    int id() const { return unitId_; }
    bool isRunning() const { return running_.load(); }

private:
    void run();
    void handleFrame(const std::vector<std::byte>& frame);
    std::optional<UnitProtocol::Reply> handleCommand(const UnitProtocol::Command& command);
    UnitEnvironment& environment(int envId);
    void sendReply(uint64_t id, const UnitProtocol::Reply& reply);

    int unitId_;
    SimulationUnitConfig config_;
    ReplySink replySink_;

    mutable std::mutex inboxMutex_;
    std::condition_variable inboxCv_;
    std::deque<std::vector<std::byte>> inbox_;
    std::atomic<bool> stopRequested_{ false };
    std::atomic<bool> running_{ false };
    std::thread worker_;

    // Touched only by the worker thread.
    std::map<int, std::unique_ptr<UnitEnvironment>> environments_;
};

} // namespace SimPool
