#pragma once

#include "core/training/evolution/EvolutionConfig.h"
#include "core/training/ppo/PpoConfig.h"
#include "orchestrator/OrchestratorConfig.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>

namespace SimPool {

class Orchestrator;

namespace Client {

/**
 * Results from a completed training run.
 */
struct TrainResults {
    std::string method; // "ppo" or "evolution".
    int iterationsCompleted = 0;
    int iterationsRequested = 0;
    double durationSec = 0.0;

    double bestScore = 0.0;
    double lastScore = 0.0;
    int episodesCompleted = 0;

    std::filesystem::path savedTo;

    bool completed = false;
    std::string errorMessage;
};

/**
 * Runs a training loop against a locally owned orchestrator.
 *
 * Ticks are driven in lockstep from the calling thread: queue actions, one
 * physics tick, wait for the step replies, one consumption tick. Progress is
 * printed to stderr and the final policy is written with PolicyStore.
 */
class TrainRunner {
public:
    explicit TrainRunner(OrchestratorConfig orchestratorConfig);

    /**
     * @param iterations Number of PPO updates to run.
     * @param outPath Where to save the final actor (empty to skip saving).
     */
    TrainResults runPpo(
        const PpoConfig& config, int iterations, const std::filesystem::path& outPath);

    /**
     * @param outPath Where to save the all-time champion (empty to skip saving).
     */
    TrainResults runEvolution(
        const EvolutionConfig& config,
        const MutationConfig& mutation,
        const std::filesystem::path& outPath);

    /**
     * Request stop of current training (from signal handler).
     */
    void requestStop();

private:
    bool startOrchestrator(Orchestrator& orchestrator, TrainResults& results);
    bool lockstepTick(Orchestrator& orchestrator);

    void displayProgress(
        const std::string& label, int iteration, int total, double score, double best);

    OrchestratorConfig orchestratorConfig_;
    std::chrono::milliseconds stepTimeout_;
    std::atomic<bool> stopRequested_{ false };
    int lastIteration_ = -1;
};

} // namespace Client
} // namespace SimPool
