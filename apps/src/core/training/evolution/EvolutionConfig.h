#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace SimPool {

/**
 * Configuration for the population search.
 */
struct EvolutionConfig {
    int populationSize = 50;
    std::vector<int> layerSizes{ 72, 64, 32, 21 };
    double eliteFraction = 0.2; // Top fraction copied unmutated into the next generation.
    int tournamentSize = 3;     // Drawn from the top 2 x elite ranks.
    int maxGenerations = 100;

    // Evaluation settings.
    int episodesPerEvaluation = 3;
    int maxEpisodeSteps = 300;
    double explorationNoise = 0.05; // Width of the uniform noise added to evaluated actions.
    uint32_t seed = 42;

    int eliteCount() const;
};

/**
 * Configuration for bounded Gaussian mutation.
 */
struct MutationConfig {
    double rate = 0.1;              // Probability each parameter is perturbed.
    double strength = 0.05;         // Gaussian noise standard deviation for weights.
    double biasStrengthScale = 0.5; // Biases use strength * scale.
    double weightLimit = 2.0;       // Weights are clamped to [-limit, limit].
    double biasLimit = 1.0;
};

std::optional<std::string> validate(const EvolutionConfig& config);

void to_json(nlohmann::json& j, const EvolutionConfig& config);
void from_json(const nlohmann::json& j, EvolutionConfig& config);

void to_json(nlohmann::json& j, const MutationConfig& config);
void from_json(const nlohmann::json& j, MutationConfig& config);

} // namespace SimPool
