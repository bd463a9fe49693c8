#include "OrchestratorEvaluator.h"
#include "Orchestrator.h"
#include "core/LoggingChannels.h"
#include "core/training/evolution/GenomePolicy.h"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <utility>

namespace SimPool {

bool OrchestratorActionSink::setAction(int envId, std::vector<double> action)
{
    return orchestrator_.setAction(envId, std::move(action));
}

bool OrchestratorActionSink::requestReset(int envId)
{
    auto result = orchestrator_.requestReset(envId);
    if (result.isError()) {
        LOG_WARN(Orchestrator, "Reset request failed: {}", describe(result.errorValue()));
        return false;
    }
    return true;
}

OrchestratorEvaluator::OrchestratorEvaluator(
    Orchestrator& orchestrator,
    int maxEpisodeSteps,
    double explorationNoise,
    uint32_t seed,
    std::chrono::milliseconds stepTimeout)
    : orchestrator_(orchestrator),
      maxEpisodeSteps_(maxEpisodeSteps),
      explorationNoise_(explorationNoise),
      rng_(seed),
      stepTimeout_(stepTimeout)
{}

std::vector<double> OrchestratorEvaluator::evaluate(
    const std::vector<Genome>& genomes, const std::vector<int>& layerSizes, int episodes)
{
    std::vector<int> envIds;
    for (int envId : orchestrator_.environmentIds()) {
        const auto state = orchestrator_.getEnvironmentState(envId);
        if (state.has_value() && state->initialized) {
            envIds.push_back(envId);
        }
    }
    if (envIds.empty()) {
        throw std::runtime_error("No initialized environments to evaluate on");
    }

    std::vector<double> fitness(genomes.size(), 0.0);
    for (size_t start = 0; start < genomes.size(); start += envIds.size()) {
        const size_t batch = std::min(envIds.size(), genomes.size() - start);

        std::vector<std::unique_ptr<GenomePolicy>> owned;
        std::vector<const ActionPolicy*> policies;
        std::vector<int> batchEnvs(envIds.begin(), envIds.begin() + batch);
        for (size_t i = 0; i < batch; ++i) {
            owned.push_back(std::make_unique<GenomePolicy>(genomes[start + i], layerSizes));
            policies.push_back(owned.back().get());
        }

        for (int episode = 0; episode < episodes; ++episode) {
            const auto rewards = runEpisode(batchEnvs, policies);
            for (size_t i = 0; i < batch; ++i) {
                fitness[start + i] += rewards[i];
            }
        }
        for (size_t i = 0; i < batch; ++i) {
            fitness[start + i] /= static_cast<double>(episodes);
        }

        LOG_DEBUG(
            Evolution, "Evaluated genomes {}..{} of {}", start, start + batch - 1, genomes.size());
    }
    return fitness;
}

std::vector<double> OrchestratorEvaluator::runEpisode(
    const std::vector<int>& envIds, const std::vector<const ActionPolicy*>& policies)
{
    const size_t count = envIds.size();
    std::vector<double> rewards(count, 0.0);
    std::vector<bool> active(count, true);
    std::vector<int> baselineEpisodes(count, 0);

    for (size_t i = 0; i < count; ++i) {
        auto reset = orchestrator_.reset(envIds[i]);
        if (reset.isError()) {
            LOG_WARN(
                Evolution,
                "Env {} reset failed, scoring 0: {}",
                envIds[i],
                describe(reset.errorValue()));
            active[i] = false;
            continue;
        }
        baselineEpisodes[i] = orchestrator_.getEnvironmentState(envIds[i])->completedEpisodes;
    }

    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    for (int step = 0; step < maxEpisodeSteps_; ++step) {
        if (std::none_of(active.begin(), active.end(), [](bool a) { return a; })) {
            break;
        }

        for (size_t i = 0; i < count; ++i) {
            if (!active[i]) {
                continue;
            }
            const auto state = orchestrator_.getEnvironmentState(envIds[i]);
            auto action = policies[i]->act(state->lastObservation);
            for (double& value : action) {
                value = std::clamp(value + (uniform(rng_) - 0.5) * explorationNoise_, -1.0, 1.0);
            }
            orchestrator_.setAction(envIds[i], std::move(action));
        }

        const size_t sent = orchestrator_.physicsTick();
        if (sent > 0 && !orchestrator_.waitForStepResults(sent, stepTimeout_)) {
            LOG_WARN(Evolution, "Timed out waiting for {} step results", sent);
        }
        orchestrator_.consumptionTick();

        for (size_t i = 0; i < count; ++i) {
            if (!active[i]) {
                continue;
            }
            const auto state = orchestrator_.getEnvironmentState(envIds[i]);
            if (state->completedEpisodes > baselineEpisodes[i]) {
                rewards[i] = state->lastEpisodeReward;
                active[i] = false;
            }
        }
    }

    for (size_t i = 0; i < count; ++i) {
        if (active[i]) {
            rewards[i] = orchestrator_.getEnvironmentState(envIds[i])->episodeReward;
        }
    }
    return rewards;
}

} // namespace SimPool
