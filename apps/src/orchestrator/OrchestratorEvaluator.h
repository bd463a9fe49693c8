#pragma once

#include "core/training/ActionSink.h"
#include "core/training/evolution/PopulationTrainer.h"

#include <chrono>
#include <cstdint>
#include <random>
#include <vector>

namespace SimPool {

class Orchestrator;

/**
 * Lets trainers write to an orchestrator through the ActionSink interface.
 */
class OrchestratorActionSink : public ActionSink {
public:
    explicit OrchestratorActionSink(Orchestrator& orchestrator) : orchestrator_(orchestrator) {}

    bool setAction(int envId, std::vector<double> action) override;
    bool requestReset(int envId) override;

private:
    Orchestrator& orchestrator_;
};

/**
 * @brief Scores genomes on the orchestrator's environments in lockstep.
 *
 * Genomes are assigned to environments in batches of the pool size. Every
 * episode starts with a blocking reset; then each tick queues the policy's
 * action (with uniform exploration noise) for every active environment, runs
 * one physics tick, waits for the replies and consumes them. An environment's
 * episode ends when it reports done or after maxEpisodeSteps ticks. Fitness is
 * the mean episode reward.
 */
class OrchestratorEvaluator : public PolicyEvaluator {
public:
    OrchestratorEvaluator(
        Orchestrator& orchestrator,
        int maxEpisodeSteps,
        double explorationNoise,
        uint32_t seed,
        std::chrono::milliseconds stepTimeout = std::chrono::milliseconds(5000));

    std::vector<double> evaluate(
        const std::vector<Genome>& genomes,
        const std::vector<int>& layerSizes,
        int episodes) override;

private:
    std::vector<double> runEpisode(
        const std::vector<int>& envIds, const std::vector<const ActionPolicy*>& policies);

    Orchestrator& orchestrator_;
    int maxEpisodeSteps_;
    double explorationNoise_;
    std::mt19937 rng_;
    std::chrono::milliseconds stepTimeout_;
};

} // namespace SimPool
