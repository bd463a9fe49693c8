#pragma once

#include "ForceQueue.h"
#include "core/network/UnitProtocol.h"
#include "core/physics/EnvironmentType.h"
#include "core/physics/PhysicsEngine.h"

#include <memory>
#include <vector>

namespace SimPool {

/**
 * One environment as hosted inside a simulation unit: the engine instance, its
 * pending forces and the unit-side episode counters.
 *
 * Reward is cos(angle) for the pendulum and forward progress minus an
 * activation penalty otherwise. An episode is done past maxEpisodeSteps or when
 * a non-pendulum torso drops below kFallHeight.
 */
class UnitEnvironment {
public:
    UnitEnvironment(
        int envId,
        Environment::EnumType type,
        int maxEpisodeSteps,
        std::unique_ptr<PhysicsEngine> engine);

    /**
     * Apply actions (clamped to [-1, 1], zero-filled to nu) and pending forces,
     * advance one step and report the result. Throws std::runtime_error if the
     * engine produces non-finite state.
     */
    UnitProtocol::StepResult step(const std::vector<double>& actions);

    Observation reset();

    /**
     * Throws std::out_of_range for a body id outside the model.
     */
    UnitProtocol::ForceApplied applyForce(
        int bodyId, const std::vector<double>& force, const std::vector<double>& point);

    void clearActuators();

    UnitProtocol::StateReport state() const;

    int envId() const { return envId_; }
    Environment::EnumType type() const { return type_; }
    const ForceQueue& forces() const { return forces_; }
    const PhysicsEngine& engine() const { return *engine_; }

    static constexpr double kFallHeight = 0.1;
    static constexpr double kActivationPenalty = 0.01;

private:
    double computeReward() const;
    bool isDone() const;

    int envId_;
    Environment::EnumType type_;
    int maxEpisodeSteps_;
    std::unique_ptr<PhysicsEngine> engine_;
    ForceQueue forces_;
    int stepCount_ = 0;
    double totalReward_ = 0.0;
    double lastX_ = 0.0;
};

} // namespace SimPool
