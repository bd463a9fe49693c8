#pragma once

#include "EvolutionConfig.h"

#include <random>
#include <vector>

namespace SimPool {

struct Genome;

struct MutationStats {
    int weightPerturbations = 0;
    int biasPerturbations = 0;

    int totalChanges() const { return weightPerturbations + biasPerturbations; }
};

/**
 * Mutate a genome by applying Gaussian noise to each parameter with probability
 * config.rate. Biases (per biasMask) use a reduced strength. Every parameter is
 * clamped to its limit afterwards, mutated or not.
 */
Genome mutate(
    const Genome& parent,
    const std::vector<bool>& biasMask,
    const MutationConfig& config,
    std::mt19937& rng,
    MutationStats* stats = nullptr);

} // namespace SimPool
