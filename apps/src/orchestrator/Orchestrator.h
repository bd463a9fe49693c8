#pragma once

#include "MessageRouter.h"
#include "OrchestratorConfig.h"
#include "RequestError.h"
#include "SimulationUnit.h"
#include "TickScheduler.h"
#include "core/Result.h"
#include "core/network/UnitProtocol.h"
#include "core/physics/Observation.h"
#include "core/physics/PhysicsEngineFactory.h"
#include "core/training/ActionPolicy.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <variant>
#include <vector>

namespace SimPool {

/**
 * Read-only copy of one environment's orchestrator-side state.
 */
struct EnvironmentSnapshot {
    int id = 0;
    int unitId = 0;
    Observation lastObservation;
    double lastReward = 0.0;
    bool done = false;
    int stepCount = 0;
    double episodeReward = 0.0;

    bool initialized = false;
    bool awaitingReset = false;
    std::optional<std::string> lastError;
    int completedEpisodes = 0;
    double lastEpisodeReward = 0.0;

    // Set only on the update published for a failed step; the state is otherwise unchanged.
    bool stepFaulted = false;
};

/**
 * @brief Owns a fixed pool of simulation units and the environments they host.
 *
 * Environment ids are partitioned across units once, at construction. The
 * physics tick sends one fire-and-forget `step` per environment; replies are
 * buffered by unit threads and applied by the consumption tick. Both ticks run
 * on the TickScheduler thread after startLoops(), or can be called directly.
 *
 * Buffered replies carry the environment's generation at arrival. Resets bump
 * the generation, so results that predate a reset are discarded when consumed.
 */
class Orchestrator {
public:
    using UpdateCallback = std::function<void(const EnvironmentSnapshot&)>;
    using VoidResult = Result<std::monostate, RequestError>;

    /**
     * Throws std::invalid_argument if the config does not validate.
     */
    explicit Orchestrator(OrchestratorConfig config, EngineFactory engineFactory = nullptr);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * @brief Maps an environment id to the unit that hosts it.
     * unit = floor(envId / ceil(numEnvironments / numUnits)).
     */
    static int unitForEnvironment(int envId, int numEnvironments, int numUnits);

    /**
     * @brief Start the units and create every environment.
     *
     * Blocks until each environment acknowledged its own `init`. Environments
     * that failed or timed out are named in the InitializationFailure error and
     * stay uninitialized; the others are usable.
     */
    VoidResult initialize();

    // Physics tick. Returns the number of step commands sent.
    size_t step() { return physicsTick(); }
    size_t physicsTick();

    // Applies buffered replies and returns how many were consumed.
    size_t consumptionTick();

    /**
     * @brief Blocking reset through the router.
     *
     * On success the counters are zeroed, done is cleared, the observation is
     * replaced and results buffered from before the reset are discarded. On
     * failure the environment stays awaiting a reset and is skipped by the
     * physics tick until a reset lands.
     */
    Result<Observation, RequestError> reset(int envId);

    Result<UnitProtocol::StateReport, RequestError> queryState(int envId);

    // Fire-and-forget reset. The environment skips physics ticks until it lands.
    VoidResult requestReset(int envId);

    /**
     * A zero force clears the pending force for the body; a non-zero force
     * replaces it until the next step consumes it.
     */
    VoidResult applyForce(
        int envId, int bodyId, std::vector<double> force, std::vector<double> point);

    VoidResult clearActuators(int envId);

    std::optional<EnvironmentSnapshot> getEnvironmentState(int envId) const;

    // Queue a single-use action for the next physics tick.
    bool setAction(int envId, std::vector<double> action);

    void setPolicy(std::shared_ptr<const ActionPolicy> policy);
    void onUpdate(UpdateCallback callback);

    /**
     * @brief Block until at least count step replies are buffered.
     * A step reply is a step_result or an error raised by a step command.
     * @return false on timeout or termination.
     */
    bool waitForStepResults(size_t count, std::chrono::milliseconds timeout);

    std::vector<int> environmentIds() const;
    int unitCount() const { return static_cast<int>(units_.size()); }
    size_t actuatorCount(int envId) const;
    size_t bufferedCount() const;
    const OrchestratorConfig& config() const { return config_; }

    void startLoops();
    void stopLoops();

    // Stops the loops, hard-terminates every unit and rejects pending requests.
    void terminate();
    bool isTerminated() const { return terminated_.load(); }

private:
    struct EnvironmentRecord {
        EnvironmentSnapshot state;
        std::optional<std::vector<double>> queuedAction;
        uint64_t generation = 0;
        size_t actuatorCount = 0;
    };

    struct BufferedReply {
        uint64_t generation = 0;
        UnitProtocol::Reply reply;
    };

    void onUnitFrame(int unitId, std::vector<std::byte> frame);
    void bufferReply(const UnitProtocol::Reply& reply);
    bool send(int envId, uint64_t id, const UnitProtocol::Command& command);
    std::optional<RequestError> checkEnvironment(int envId) const;
    Result<UnitProtocol::Reply, RequestError> request(int envId, const UnitProtocol::Command& command);
    std::vector<double> randomAction(size_t count, double scale);
    std::shared_ptr<const ActionPolicy> currentPolicy() const;

    OrchestratorConfig config_;
    MessageRouter router_;
    std::vector<std::unique_ptr<SimulationUnit>> units_;
    std::unique_ptr<TickScheduler> scheduler_;

    mutable std::mutex envMutex_;
    std::map<int, EnvironmentRecord> environments_;

    mutable std::mutex bufferMutex_;
    std::condition_variable bufferCv_;
    std::vector<BufferedReply> buffer_;
    size_t stepRepliesBuffered_ = 0;

    mutable std::mutex policyMutex_;
    std::shared_ptr<const ActionPolicy> policy_;

    std::mutex callbackMutex_;
    std::vector<UpdateCallback> callbacks_;

    // Used only by the physics tick.
    std::mt19937 rng_;

    std::atomic<bool> started_{ false };
    std::atomic<bool> terminated_{ false };
};

} // namespace SimPool
