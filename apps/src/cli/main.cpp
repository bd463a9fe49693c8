#include "TrainRunner.h"
#include "core/ConfigLoader.h"
#include "core/LoggingChannels.h"
#include "core/training/PolicyStore.h"
#include "orchestrator/Orchestrator.h"

#include <args.hxx>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <thread>
#include <vector>

using namespace SimPool;

namespace {

constexpr const char* kConfigFile = "simpool.json";
constexpr const char* kLoggingConfigFile = "logging-config.json";

std::atomic<bool> g_stopRequested{ false };
Client::TrainRunner* g_runner = nullptr;

void sigintHandler(int)
{
    g_stopRequested = true;
    if (g_runner) {
        g_runner->requestStop();
    }
}

std::string getCommandListHelp()
{
    return "Command to run:\n"
           "  train-ppo   Train a Gaussian policy with PPO\n"
           "  evolve      Train a policy network with population search\n"
           "  run         Run a saved policy with real-time ticks\n"
           "  partition   Print which unit hosts each environment";
}

std::string getExamplesHelp()
{
    return "Examples:\n"
           "  simpool-cli partition --envs 10 --units 3\n"
           "  simpool-cli train-ppo --env-type pendulum --iterations 20 --out ppo.json\n"
           "  simpool-cli evolve --generations 50 --population 40 --out champion.json\n"
           "  simpool-cli run --policy champion.json --seconds 30\n"
           "  simpool-cli train-ppo --log-channels \"ppo:debug,router:trace\"";
}

// Loads one section of simpool.json. A missing file means defaults; a broken one is an error.
template <typename T>
bool loadSection(const std::string& section, T& out)
{
    if (!ConfigLoader::findConfigFile(kConfigFile).has_value()) {
        SLOG_DEBUG("No {} found, using default {} config", kConfigFile, section);
        return true;
    }
    auto result = ConfigLoader::loadSection<T>(kConfigFile, section);
    if (result.isError()) {
        std::cerr << "Error: " << result.errorValue() << std::endl;
        return false;
    }
    out = result.value();
    return true;
}

void printResults(const Client::TrainResults& results)
{
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "method: " << results.method << "\n";
    std::cout << "iterations: " << results.iterationsCompleted << "/" << results.iterationsRequested
              << "\n";
    std::cout << "duration_sec: " << results.durationSec << "\n";
    std::cout << "best_score: " << results.bestScore << "\n";
    std::cout << "last_score: " << results.lastScore << "\n";
    if (results.method == "ppo") {
        std::cout << "episodes: " << results.episodesCompleted << "\n";
    }
    if (!results.savedTo.empty()) {
        std::cout << "saved_to: " << results.savedTo.string() << "\n";
    }
}

int runPartition(const OrchestratorConfig& config)
{
    if (auto problem = validate(config)) {
        std::cerr << "Error: " << *problem << std::endl;
        return 1;
    }

    std::map<int, std::vector<int>> byUnit;
    for (int envId = 0; envId < config.numEnvironments; ++envId) {
        byUnit[Orchestrator::unitForEnvironment(envId, config.numEnvironments, config.numUnits)]
            .push_back(envId);
    }
    for (int unit = 0; unit < config.numUnits; ++unit) {
        std::cout << "unit " << unit << ":";
        for (int envId : byUnit[unit]) {
            std::cout << " " << envId;
        }
        std::cout << "\n";
    }
    return 0;
}

int runPolicy(const OrchestratorConfig& config, const std::string& policyPath, int seconds)
{
    auto loaded = PolicyStore::load(policyPath);
    if (loaded.isError()) {
        std::cerr << "Error: " << loaded.errorValue() << std::endl;
        return 1;
    }
    auto policy = PolicyStore::makePolicy(loaded.value());
    if (policy.isError()) {
        std::cerr << "Error: " << policy.errorValue() << std::endl;
        return 1;
    }
    SLOG_INFO(
        "Loaded {} policy from {} (generation {}, fitness {:.3f})",
        loaded.value().kind,
        policyPath,
        loaded.value().generation,
        loaded.value().fitness);

    Orchestrator orchestrator(config);
    auto init = orchestrator.initialize();
    if (init.isError()) {
        SLOG_WARN("{}", describe(init.errorValue()));
    }
    orchestrator.setPolicy(policy.value());
    orchestrator.startLoops();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    while (!g_stopRequested && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    orchestrator.stopLoops();

    std::cout << std::fixed << std::setprecision(3);
    for (int envId : orchestrator.environmentIds()) {
        const auto state = orchestrator.getEnvironmentState(envId);
        if (!state.has_value() || !state->initialized) {
            std::cout << "env " << envId << ": not initialized\n";
            continue;
        }
        std::cout << "env " << envId << " (unit " << state->unitId
                  << "): episodes=" << state->completedEpisodes
                  << " last_episode_reward=" << state->lastEpisodeReward
                  << " current_steps=" << state->stepCount
                  << " current_reward=" << state->episodeReward;
        if (state->lastError.has_value()) {
            std::cout << " error=\"" << *state->lastError << "\"";
        }
        std::cout << "\n";
    }

    orchestrator.terminate();
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "SimPool CLI",
        "Train and run control policies on a pool of physics simulation units.\n\n"
            + getExamplesHelp());

    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::Flag verbose(parser, "verbose", "Enable debug logging", { 'v', "verbose" });
    args::ValueFlag<int> envs(parser, "envs", "Number of environments", { "envs" });
    args::ValueFlag<int> units(parser, "units", "Number of simulation units", { "units" });
    args::ValueFlag<std::string> envType(
        parser, "type", "Environment type: humanoid, pendulum, ant or cheetah", { "env-type" });
    args::ValueFlag<uint32_t> seed(parser, "seed", "Random seed for every component", { "seed" });
    args::ValueFlag<std::string> configDir(
        parser, "dir", "Directory searched first for simpool.json", { "config-dir" });
    args::ValueFlag<std::string> logChannels(
        parser,
        "spec",
        "Per-channel log levels, e.g. \"router:debug,*:warn\"",
        { "log-channels" });

    // train-ppo flags.
    args::ValueFlag<int> iterations(
        parser, "iterations", "train-ppo: number of PPO updates (default: 10)", { "iterations" }, 10);

    // evolve flags.
    args::ValueFlag<int> generations(
        parser, "generations", "evolve: number of generations", { "generations" });
    args::ValueFlag<int> population(
        parser, "population", "evolve: population size", { "population" });

    // Shared by train-ppo and evolve.
    args::ValueFlag<std::string> out(
        parser, "path", "Where to save the trained policy", { 'o', "out" });

    // run flags.
    args::ValueFlag<std::string> policyPath(
        parser, "path", "run: policy file to load", { "policy" });
    args::ValueFlag<int> seconds(
        parser, "seconds", "run: wall-clock seconds to run (default: 10)", { "seconds" }, 10);

    args::Positional<std::string> command(parser, "command", getCommandListHelp());

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    if (configDir) {
        ConfigLoader::setConfigDir(args::get(configDir));
    }

    // Configure logging. Console output goes to stderr so stdout carries only results.
    if (auto loggingConfig = ConfigLoader::findConfigFile(kLoggingConfigFile)) {
        LoggingChannels::initializeFromConfig(loggingConfig->string(), "cli");
    }
    else {
        LoggingChannels::initialize(spdlog::level::info, spdlog::level::debug, "cli", true);
    }
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    }
    if (logChannels) {
        LoggingChannels::configureFromString(args::get(logChannels));
    }

    if (!command) {
        std::cerr << "Error: command is required\n\n";
        std::cerr << parser;
        return 1;
    }
    const std::string commandName = args::get(command);

    OrchestratorConfig orchestratorConfig;
    if (!loadSection("orchestrator", orchestratorConfig)) {
        return 1;
    }
    if (envs) {
        orchestratorConfig.numEnvironments = args::get(envs);
    }
    if (units) {
        orchestratorConfig.numUnits = args::get(units);
    }
    if (envType) {
        auto parsed = Environment::fromString(args::get(envType));
        if (!parsed.has_value()) {
            std::cerr << "Error: unknown environment type '" << args::get(envType) << "'"
                      << std::endl;
            return 1;
        }
        orchestratorConfig.environmentType = *parsed;
    }
    if (seed) {
        orchestratorConfig.seed = args::get(seed);
    }

    if (commandName == "partition") {
        return runPartition(orchestratorConfig);
    }

    std::signal(SIGINT, sigintHandler);

    try {
        if (commandName == "train-ppo") {
            PpoConfig ppoConfig;
            if (!loadSection("ppo", ppoConfig)) {
                return 1;
            }
            if (seed) {
                ppoConfig.seed = args::get(seed);
            }

            Client::TrainRunner runner(orchestratorConfig);
            g_runner = &runner;
            const auto results = runner.runPpo(
                ppoConfig,
                iterations ? args::get(iterations) : 10,
                out ? std::filesystem::path(args::get(out)) : std::filesystem::path{});
            g_runner = nullptr;

            printResults(results);
            if (!results.errorMessage.empty()) {
                std::cerr << "Error: " << results.errorMessage << std::endl;
                return 1;
            }
            return 0;
        }

        if (commandName == "evolve") {
            EvolutionConfig evolutionConfig;
            MutationConfig mutationConfig;
            if (!loadSection("evolution", evolutionConfig)
                || !loadSection("mutation", mutationConfig)) {
                return 1;
            }
            if (generations) {
                evolutionConfig.maxGenerations = args::get(generations);
            }
            if (population) {
                evolutionConfig.populationSize = args::get(population);
            }
            if (seed) {
                evolutionConfig.seed = args::get(seed);
            }

            Client::TrainRunner runner(orchestratorConfig);
            g_runner = &runner;
            const auto results = runner.runEvolution(
                evolutionConfig,
                mutationConfig,
                out ? std::filesystem::path(args::get(out)) : std::filesystem::path{});
            g_runner = nullptr;

            printResults(results);
            if (!results.errorMessage.empty()) {
                std::cerr << "Error: " << results.errorMessage << std::endl;
                return 1;
            }
            return 0;
        }

        if (commandName == "run") {
            if (!policyPath) {
                std::cerr << "Error: run requires --policy" << std::endl;
                return 1;
            }
            return runPolicy(
                orchestratorConfig, args::get(policyPath), seconds ? args::get(seconds) : 10);
        }
    }
    catch (const std::invalid_argument& e) {
        // Config validation failures from the orchestrator and trainers.
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cerr << "Error: unknown command '" << commandName << "'\n\n";
    std::cerr << parser;
    return 1;
}
