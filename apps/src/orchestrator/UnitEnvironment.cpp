#include "UnitEnvironment.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace SimPool {

UnitEnvironment::UnitEnvironment(
    int envId,
    Environment::EnumType type,
    int maxEpisodeSteps,
    std::unique_ptr<PhysicsEngine> engine)
    : envId_(envId), type_(type), maxEpisodeSteps_(maxEpisodeSteps), engine_(std::move(engine))
{
    reset();
}

UnitProtocol::StepResult UnitEnvironment::step(const std::vector<double>& actions)
{
    auto& data = engine_->data();

    for (size_t i = 0; i < data.ctrl.size(); ++i) {
        data.ctrl[i] = i < actions.size() ? std::clamp(actions[i], -1.0, 1.0) : 0.0;
    }

    forces_.applyAndClear(data);
    engine_->step();
    std::fill(data.xfrcApplied.begin(), data.xfrcApplied.end(), 0.0);

    const double reward = computeReward();
    lastX_ = data.qpos[0];
    stepCount_++;
    totalReward_ += reward;

    UnitProtocol::StepResult result;
    result.envId = envId_;
    result.observation = captureObservation(*engine_);
    result.reward = reward;
    result.done = isDone();
    result.info = UnitProtocol::StepInfo{ .stepCount = stepCount_, .totalReward = totalReward_ };

    if (!std::isfinite(reward) || !isFinite(result.observation)) {
        throw std::runtime_error(
            "Simulation diverged at step " + std::to_string(stepCount_) + " (non-finite state)");
    }

    return result;
}

Observation UnitEnvironment::reset()
{
    engine_->resetData();
    engine_->forward();
    forces_.clear();
    stepCount_ = 0;
    totalReward_ = 0.0;
    lastX_ = engine_->data().qpos[0];
    return captureObservation(*engine_);
}

UnitProtocol::ForceApplied UnitEnvironment::applyForce(
    int bodyId, const std::vector<double>& force, const std::vector<double>& point)
{
    if (bodyId < 0 || bodyId >= engine_->model().nbody) {
        throw std::out_of_range(
            "Body " + std::to_string(bodyId) + " out of range (model has "
            + std::to_string(engine_->model().nbody) + " bodies)");
    }
    if (force.size() != 3 || point.size() != 3) {
        throw std::invalid_argument("force and point must have 3 components");
    }

    const bool active = forces_.set(
        bodyId, { force[0], force[1], force[2] }, { point[0], point[1], point[2] });

    return UnitProtocol::ForceApplied{
        .envId = envId_, .bodyId = bodyId, .force = force, .active = active
    };
}

void UnitEnvironment::clearActuators()
{
    auto& ctrl = engine_->data().ctrl;
    std::fill(ctrl.begin(), ctrl.end(), 0.0);
}

UnitProtocol::StateReport UnitEnvironment::state() const
{
    return UnitProtocol::StateReport{
        .envId = envId_,
        .observation = captureObservation(*engine_),
        .info = UnitProtocol::StepInfo{ .stepCount = stepCount_, .totalReward = totalReward_ },
    };
}

double UnitEnvironment::computeReward() const
{
    const auto& data = engine_->data();

    if (type_ == Environment::EnumType::Pendulum) {
        return std::cos(data.qpos[0]);
    }

    double activation = 0.0;
    for (const double c : data.ctrl) {
        activation += std::abs(c);
    }
    return (data.qpos[0] - lastX_) - kActivationPenalty * activation;
}

bool UnitEnvironment::isDone() const
{
    if (stepCount_ > maxEpisodeSteps_) {
        return true;
    }
    if (type_ == Environment::EnumType::Pendulum) {
        return false;
    }

    const int torso = engine_->model().torsoBody;
    return engine_->data().xpos[3 * torso + 2] < kFallHeight;
}

} // namespace SimPool
