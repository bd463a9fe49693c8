#pragma once

#include "GaussianPolicy.h"
#include "PpoConfig.h"
#include "RewardFunction.h"
#include "RolloutBuffer.h"
#include "StateExtractor.h"
#include "core/training/ActionPolicy.h"
#include "core/training/ActionSink.h"
#include "core/training/AdamOptimizer.h"
#include "core/training/Mlp.h"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>

namespace SimPool::Ppo {

namespace Phase {
enum class EnumType : uint8_t { CollectingRollout = 0, ComputingAdvantages, UpdatingPolicy };

const char* toString(EnumType phase);
} // namespace Phase

/**
 * One environment step as seen by the trainer: the observation after the step,
 * the environment's own reward for it and whether the episode ended.
 */
struct StepSample {
    int envId = 0;
    Observation observation;
    double envReward = 0.0;
    bool done = false;
};

struct UpdateStats {
    int update = 0;
    size_t transitions = 0;
    double policyLoss = 0.0;
    double valueLoss = 0.0;
    double entropy = 0.0;
    double meanReward = 0.0;
    double gradNorm = 0.0;
};

/**
 * @brief Proximal policy optimization over a pool of environments.
 *
 * observe() is called once per environment update. It closes the transition
 * opened by the previous action for that environment (the reward for step t is
 * known only after t executed), then samples the next action and queues it on
 * the sink. When the rollout holds rolloutSize transitions the trainer computes
 * advantages per environment, standardizes them across the whole rollout and
 * runs the clipped-surrogate update.
 *
 * Not thread-safe; call from one thread.
 */
class PpoTrainer {
public:
    PpoTrainer(PpoConfig config, size_t actionSize, RewardFunction rewardFunction = nullptr);

    void observe(const StepSample& sample, ActionSink& sink);

    /**
     * The environment failed to execute its last step. The action pending for it
     * never produced a transition, so it is dropped and a fresh action is queued
     * from the last good observation.
     */
    void onStepFault(int envId, const Observation& lastObservation, ActionSink& sink);

    /**
     * Runs an update if at least rolloutSize transitions are buffered.
     */
    std::optional<UpdateStats> maybeUpdate();

    // Update on whatever is buffered. Returns nullopt for an empty buffer.
    std::optional<UpdateStats> update();

    // Deterministic mean actions, no buffering and no updates.
    void setEvaluationMode(bool enabled);
    bool evaluationMode() const { return evaluationMode_; }

    Phase::EnumType phase() const { return phase_; }

    double value(const std::vector<double>& state) const;

    /**
     * Immutable copy of the current actor for Orchestrator::setPolicy().
     */
    std::shared_ptr<const ActionPolicy> snapshotPolicy() const;

    // Reinitializes the actor and its optimizer if any parameter is non-finite.
    bool ensureFiniteActor();

    GaussianPolicy& policy() { return policy_; }
    const GaussianPolicy& policy() const { return policy_; }
    const Mlp& critic() const { return critic_; }
    const RolloutBuffer& buffer() const { return buffer_; }
    const PpoConfig& config() const { return config_; }
    const StateExtractor& extractor() const { return extractor_; }

    int updateCount() const { return updateCount_; }
    int reinitializationCount() const { return reinitializations_; }
    int rewardFaultCount() const { return rewardFaults_; }
    int completedEpisodes() const { return completedEpisodes_; }
    double lastEpisodeReward() const { return lastEpisodeReward_; }

private:
    struct PendingStep {
        std::vector<double> state;
        std::vector<double> action;
        double logProb = 0.0;
        double value = 0.0;
    };

    void computeAdvantages();
    UpdateStats optimize();
    void resetActor();

    PpoConfig config_;
    StateExtractor extractor_;
    RewardFunction rewardFunction_;
    std::mt19937 rng_;

    GaussianPolicy policy_;
    Mlp critic_;
    AdamOptimizer actorOptimizer_;
    AdamOptimizer logStdOptimizer_;
    AdamOptimizer criticOptimizer_;

    RolloutBuffer buffer_;
    std::map<int, PendingStep> pending_;
    std::map<int, double> episodeRewards_;

    Phase::EnumType phase_ = Phase::EnumType::CollectingRollout;
    bool evaluationMode_ = false;
    int updateCount_ = 0;
    int reinitializations_ = 0;
    int rewardFaults_ = 0;
    int completedEpisodes_ = 0;
    double lastEpisodeReward_ = 0.0;
};

/**
 * Read-only actor: maps an observation to the policy mean.
 */
class GaussianMeanPolicy : public ActionPolicy {
public:
    GaussianMeanPolicy(GaussianPolicy policy, StateExtractor extractor);

    std::vector<double> act(const Observation& observation) const override;

private:
    GaussianPolicy policy_;
    StateExtractor extractor_;
};

} // namespace SimPool::Ppo
