#include "TrainRunner.h"
#include "core/LoggingChannels.h"
#include "core/training/PolicyStore.h"
#include "core/training/evolution/PopulationTrainer.h"
#include "core/training/ppo/PpoTrainer.h"
#include "orchestrator/Orchestrator.h"
#include "orchestrator/OrchestratorEvaluator.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <utility>

namespace SimPool {
namespace Client {

TrainRunner::TrainRunner(OrchestratorConfig orchestratorConfig)
    : orchestratorConfig_(std::move(orchestratorConfig)),
      stepTimeout_(std::chrono::milliseconds(orchestratorConfig_.requestTimeoutMs))
{}

bool TrainRunner::startOrchestrator(Orchestrator& orchestrator, TrainResults& results)
{
    auto initResult = orchestrator.initialize();
    if (initResult.isError()) {
        // Partially initialized pools still train on the environments that came up.
        SLOG_WARN("{}", describe(initResult.errorValue()));
    }

    for (int envId : orchestrator.environmentIds()) {
        const auto state = orchestrator.getEnvironmentState(envId);
        if (state.has_value() && state->initialized) {
            return true;
        }
    }

    results.errorMessage = "No environment initialized";
    SLOG_ERROR("{}", results.errorMessage);
    return false;
}

bool TrainRunner::lockstepTick(Orchestrator& orchestrator)
{
    const size_t sent = orchestrator.physicsTick();
    if (sent > 0 && !orchestrator.waitForStepResults(sent, stepTimeout_)) {
        if (orchestrator.isTerminated()) {
            return false;
        }
        SLOG_WARN("Timed out waiting for {} step results", sent);
    }
    orchestrator.consumptionTick();
    return true;
}

TrainResults TrainRunner::runPpo(
    const PpoConfig& config, int iterations, const std::filesystem::path& outPath)
{
    TrainResults results;
    results.method = "ppo";
    results.iterationsRequested = iterations;

    Orchestrator orchestrator(orchestratorConfig_);
    if (!startOrchestrator(orchestrator, results)) {
        orchestrator.terminate();
        return results;
    }

    const auto envIds = orchestrator.environmentIds();
    size_t actionSize = 0;
    for (int envId : envIds) {
        actionSize = std::max(actionSize, orchestrator.actuatorCount(envId));
    }

    Ppo::PpoTrainer trainer(config, actionSize, Ppo::rewardFunctionByName(config.reward));
    OrchestratorActionSink sink(orchestrator);

    SLOG_INFO("Starting PPO training:");
    SLOG_INFO("  Environment: {}", Environment::toString(orchestratorConfig_.environmentType));
    SLOG_INFO("  Pool: {} envs on {} units", envIds.size(), orchestrator.unitCount());
    SLOG_INFO("  Actions: {}, state size: {}", actionSize, config.stateSize);
    SLOG_INFO("  Updates: {} x {} transitions", iterations, config.rolloutSize);
    SLOG_INFO("  Reward: {}", config.reward);

    orchestrator.onUpdate([&trainer, &sink](const EnvironmentSnapshot& snapshot) {
        if (snapshot.stepFaulted) {
            trainer.onStepFault(snapshot.id, snapshot.lastObservation, sink);
            return;
        }
        trainer.observe(
            Ppo::StepSample{ snapshot.id, snapshot.lastObservation, snapshot.lastReward, snapshot.done },
            sink);
    });
    orchestrator.setPolicy(trainer.snapshotPolicy());

    // Queue a first action for every environment from its initial observation.
    for (int envId : envIds) {
        const auto state = orchestrator.getEnvironmentState(envId);
        if (state.has_value() && state->initialized) {
            trainer.observe(Ppo::StepSample{ envId, state->lastObservation, 0.0, false }, sink);
        }
    }

    const auto startTime = std::chrono::steady_clock::now();
    int lastUpdate = 0;
    results.bestScore = -std::numeric_limits<double>::infinity();

    while (!stopRequested_ && trainer.updateCount() < iterations) {
        if (!lockstepTick(orchestrator)) {
            results.errorMessage = "Orchestrator terminated during training";
            break;
        }

        if (trainer.updateCount() != lastUpdate) {
            lastUpdate = trainer.updateCount();
            orchestrator.setPolicy(trainer.snapshotPolicy());

            results.lastScore = trainer.lastEpisodeReward();
            results.bestScore = std::max(results.bestScore, results.lastScore);
            displayProgress("Update", lastUpdate, iterations, results.lastScore, results.bestScore);
        }
    }
    std::cerr << std::endl;

    results.durationSec =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
    results.iterationsCompleted = trainer.updateCount();
    results.episodesCompleted = trainer.completedEpisodes();
    results.completed = results.errorMessage.empty() && results.iterationsCompleted >= iterations;
    if (!std::isfinite(results.bestScore)) {
        results.bestScore = 0.0;
    }

    if (trainer.reinitializationCount() > 0) {
        SLOG_WARN("Actor was reinitialized {} times", trainer.reinitializationCount());
    }
    if (trainer.rewardFaultCount() > 0) {
        SLOG_WARN("Reward function faulted {} times", trainer.rewardFaultCount());
    }

    orchestrator.terminate();

    if (!outPath.empty() && results.iterationsCompleted > 0) {
        auto saveResult = PolicyStore::save(
            PolicyStore::fromPpo(trainer.policy(), results.iterationsCompleted, results.lastScore),
            outPath);
        if (saveResult.isError()) {
            results.errorMessage = saveResult.errorValue();
            results.completed = false;
            SLOG_ERROR("{}", results.errorMessage);
        }
        else {
            results.savedTo = outPath;
        }
    }
    return results;
}

TrainResults TrainRunner::runEvolution(
    const EvolutionConfig& config,
    const MutationConfig& mutation,
    const std::filesystem::path& outPath)
{
    TrainResults results;
    results.method = "evolution";
    results.iterationsRequested = config.maxGenerations;

    Orchestrator orchestrator(orchestratorConfig_);
    if (!startOrchestrator(orchestrator, results)) {
        orchestrator.terminate();
        return results;
    }

    // Genomes drive every actuator of the environment.
    EvolutionConfig effective = config;
    size_t actuators = 0;
    for (int envId : orchestrator.environmentIds()) {
        actuators = std::max(actuators, orchestrator.actuatorCount(envId));
    }
    if (actuators > 0 && effective.layerSizes.back() != static_cast<int>(actuators)) {
        SLOG_WARN(
            "Output layer {} does not match {} actuators, resizing",
            effective.layerSizes.back(),
            actuators);
        effective.layerSizes.back() = static_cast<int>(actuators);
    }

    PopulationTrainer trainer(effective, mutation);
    OrchestratorEvaluator evaluator(
        orchestrator,
        effective.maxEpisodeSteps,
        effective.explorationNoise,
        effective.seed,
        stepTimeout_);

    SLOG_INFO("Starting evolution:");
    SLOG_INFO("  Environment: {}", Environment::toString(orchestratorConfig_.environmentType));
    SLOG_INFO("  Generations: {}", effective.maxGenerations);
    SLOG_INFO("  Population: {}", effective.populationSize);
    SLOG_INFO("  Tournament size: {}", effective.tournamentSize);
    SLOG_INFO("  Mutation rate: {}", mutation.rate);

    const auto startTime = std::chrono::steady_clock::now();
    try {
        while (!stopRequested_ && trainer.generation() < effective.maxGenerations) {
            const auto stats = trainer.runGeneration(evaluator);
            results.lastScore = stats.bestFitness;
            results.bestScore = trainer.champion()->fitness;
            displayProgress(
                "Gen", stats.generation + 1, effective.maxGenerations, stats.bestFitness,
                results.bestScore);
        }
    }
    catch (const std::runtime_error& e) {
        results.errorMessage = e.what();
        SLOG_ERROR("Evolution stopped: {}", results.errorMessage);
    }
    std::cerr << std::endl;

    results.durationSec =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
    results.iterationsCompleted = trainer.generation();
    results.completed =
        results.errorMessage.empty() && results.iterationsCompleted >= effective.maxGenerations;

    orchestrator.terminate();

    if (!outPath.empty() && trainer.champion().has_value()) {
        auto saveResult = PolicyStore::save(
            PolicyStore::fromChampion(*trainer.champion(), effective.layerSizes), outPath);
        if (saveResult.isError()) {
            results.errorMessage = saveResult.errorValue();
            results.completed = false;
            SLOG_ERROR("{}", results.errorMessage);
        }
        else {
            results.savedTo = outPath;
        }
    }
    return results;
}

void TrainRunner::requestStop()
{
    stopRequested_ = true;
}

void TrainRunner::displayProgress(
    const std::string& label, int iteration, int total, double score, double best)
{
    if (iteration == lastIteration_) {
        return;
    }
    lastIteration_ = iteration;

    const int barWidth = 30;
    const int filled = total > 0 ? (iteration * barWidth) / total : 0;

    std::cerr << "\r";
    std::cerr << label << " " << std::setw(4) << iteration << "/" << total << " ";
    std::cerr << "[";
    for (int i = 0; i < barWidth; ++i) {
        std::cerr << (i < filled ? "=" : " ");
    }
    std::cerr << "] ";
    std::cerr << "score=" << std::fixed << std::setprecision(2) << score << " ";
    std::cerr << "best=" << std::setprecision(2) << best;
    std::cerr << std::flush;
}

} // namespace Client
} // namespace SimPool
