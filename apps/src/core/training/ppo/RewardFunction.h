#pragma once

#include "core/physics/Observation.h"

#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace SimPool::Ppo {

/**
 * Body state handed to reward functions, derived from an observation.
 */
struct RewardState {
    std::vector<double> bodyPos;
    std::vector<double> bodyVel;
    std::vector<double> bodyQuaternion; // [w, x, y, z]
    std::vector<double> jointAngles;
    std::vector<double> jointVelocities;
    std::vector<double> footContacts;
    double time = 0.0;
};

struct RewardWithDone {
    double reward = 0.0;
    bool done = false;
};

using RewardOutcome = std::variant<double, RewardWithDone>;

/**
 * External reward: (state, action) -> reward or {reward, done}.
 * May throw or return non-finite values; callers go through evaluateRewardSafely().
 */
using RewardFunction = std::function<RewardOutcome(const RewardState&, const std::vector<double>&)>;

struct RewardEvaluation {
    double reward = 0.0;
    bool done = false;
    bool faulted = false;
    std::string error;
};

RewardState makeRewardState(const Observation& observation);

/**
 * Runs the reward function. An exception or a non-finite reward yields reward 0
 * with faulted set; a fault never sets done.
 */
RewardEvaluation evaluateRewardSafely(
    const RewardFunction& function, const RewardState& state, const std::vector<double>& action);

/**
 * Built-in standing reward: height, uprightness and an alive bonus minus an
 * activation penalty. Ends the episode when the torso drops below kStandingMinHeight.
 */
RewardOutcome standingReward(const RewardState& state, const std::vector<double>& action);

constexpr double kStandingMinHeight = 0.7;

// Returns nullptr for "task", which means the unit's own reward is used.
RewardFunction rewardFunctionByName(const std::string& name);

} // namespace SimPool::Ppo
