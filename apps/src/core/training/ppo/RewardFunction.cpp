#include "RewardFunction.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace SimPool::Ppo {

namespace {

std::vector<double> slice(const std::vector<double>& values, size_t begin, size_t end)
{
    if (begin >= values.size()) {
        return {};
    }
    return std::vector<double>(
        values.begin() + begin, values.begin() + std::min(end, values.size()));
}

} // namespace

RewardState makeRewardState(const Observation& observation)
{
    RewardState state;
    state.bodyPos = observation.bodyPos;
    state.footContacts = observation.contacts;
    state.time = observation.time;

    // Floating base: qpos = [xyz, quat, joints], qvel = [v, w, joints].
    if (observation.qpos.size() >= 7) {
        state.bodyVel = slice(observation.qvel, 0, 3);
        state.bodyQuaternion = slice(observation.qpos, 3, 7);
        state.jointAngles = slice(observation.qpos, 7, observation.qpos.size());
        state.jointVelocities = slice(observation.qvel, 6, observation.qvel.size());
    }
    else {
        state.bodyVel = { 0.0, 0.0, 0.0 };
        state.bodyQuaternion = observation.xquat.size() >= 8
            ? slice(observation.xquat, 4, 8)
            : std::vector<double>{ 1.0, 0.0, 0.0, 0.0 };
        state.jointAngles = observation.qpos;
        state.jointVelocities = observation.qvel;
    }
    return state;
}

RewardEvaluation evaluateRewardSafely(
    const RewardFunction& function, const RewardState& state, const std::vector<double>& action)
{
    RewardEvaluation evaluation;
    if (!function) {
        evaluation.faulted = true;
        evaluation.error = "no reward function";
        return evaluation;
    }

    try {
        const RewardOutcome outcome = function(state, action);
        if (const auto* value = std::get_if<double>(&outcome)) {
            evaluation.reward = *value;
        }
        else {
            const auto& full = std::get<RewardWithDone>(outcome);
            evaluation.reward = full.reward;
            evaluation.done = full.done;
        }
    }
    catch (const std::exception& e) {
        evaluation.faulted = true;
        evaluation.error = e.what();
        evaluation.reward = 0.0;
        evaluation.done = false;
        return evaluation;
    }

    if (!std::isfinite(evaluation.reward)) {
        evaluation.faulted = true;
        evaluation.error = "non-finite reward";
        evaluation.reward = 0.0;
        evaluation.done = false;
    }
    return evaluation;
}

RewardOutcome standingReward(const RewardState& state, const std::vector<double>& action)
{
    const double height = state.bodyPos.size() >= 3 ? state.bodyPos[2] : 0.0;

    // Uprightness: z component of the torso's up axis, 1 when vertical.
    double upright = 1.0;
    if (state.bodyQuaternion.size() == 4) {
        const double x = state.bodyQuaternion[1];
        const double y = state.bodyQuaternion[2];
        upright = 1.0 - 2.0 * (x * x + y * y);
    }

    double activation = 0.0;
    for (double a : action) {
        activation += a * a;
    }

    RewardWithDone result;
    result.reward = 2.0 * height + upright + 1.0 - 0.01 * activation;
    result.done = height < kStandingMinHeight;
    return result;
}

RewardFunction rewardFunctionByName(const std::string& name)
{
    if (name == "task") {
        return nullptr;
    }
    if (name == "standing") {
        return standingReward;
    }
    throw std::invalid_argument("Unknown reward function '" + name + "'");
}

} // namespace SimPool::Ppo
