#include "EvolutionConfig.h"

#include <algorithm>
#include <cmath>

namespace SimPool {

int EvolutionConfig::eliteCount() const
{
    const int count = static_cast<int>(std::floor(populationSize * eliteFraction));
    return std::clamp(count, 1, std::max(1, populationSize));
}

std::optional<std::string> validate(const EvolutionConfig& config)
{
    if (config.populationSize < 2) {
        return "populationSize must be at least 2";
    }
    if (config.layerSizes.size() < 2) {
        return "layerSizes needs an input and an output layer";
    }
    for (int size : config.layerSizes) {
        if (size <= 0) {
            return "layerSizes must be positive";
        }
    }
    if (config.eliteFraction <= 0.0 || config.eliteFraction >= 1.0) {
        return "eliteFraction must be within (0, 1)";
    }
    if (config.tournamentSize < 1) {
        return "tournamentSize must be at least 1";
    }
    if (config.episodesPerEvaluation < 1 || config.maxEpisodeSteps < 1) {
        return "episodesPerEvaluation and maxEpisodeSteps must be at least 1";
    }
    return std::nullopt;
}

void to_json(nlohmann::json& j, const EvolutionConfig& config)
{
    j = nlohmann::json{ { "populationSize", config.populationSize },
                        { "layerSizes", config.layerSizes },
                        { "eliteFraction", config.eliteFraction },
                        { "tournamentSize", config.tournamentSize },
                        { "maxGenerations", config.maxGenerations },
                        { "episodesPerEvaluation", config.episodesPerEvaluation },
                        { "maxEpisodeSteps", config.maxEpisodeSteps },
                        { "explorationNoise", config.explorationNoise },
                        { "seed", config.seed } };
}

void from_json(const nlohmann::json& j, EvolutionConfig& config)
{
    config.populationSize = j.value("populationSize", config.populationSize);
    config.layerSizes = j.value("layerSizes", config.layerSizes);
    config.eliteFraction = j.value("eliteFraction", config.eliteFraction);
    config.tournamentSize = j.value("tournamentSize", config.tournamentSize);
    config.maxGenerations = j.value("maxGenerations", config.maxGenerations);
    config.episodesPerEvaluation = j.value("episodesPerEvaluation", config.episodesPerEvaluation);
    config.maxEpisodeSteps = j.value("maxEpisodeSteps", config.maxEpisodeSteps);
    config.explorationNoise = j.value("explorationNoise", config.explorationNoise);
    config.seed = j.value("seed", config.seed);
}

void to_json(nlohmann::json& j, const MutationConfig& config)
{
    j = nlohmann::json{ { "rate", config.rate },
                        { "strength", config.strength },
                        { "biasStrengthScale", config.biasStrengthScale },
                        { "weightLimit", config.weightLimit },
                        { "biasLimit", config.biasLimit } };
}

void from_json(const nlohmann::json& j, MutationConfig& config)
{
    config.rate = j.value("rate", config.rate);
    config.strength = j.value("strength", config.strength);
    config.biasStrengthScale = j.value("biasStrengthScale", config.biasStrengthScale);
    config.weightLimit = j.value("weightLimit", config.weightLimit);
    config.biasLimit = j.value("biasLimit", config.biasLimit);
}

} // namespace SimPool
