#pragma once

#include <random>
#include <vector>

namespace SimPool {

struct Genome;

// Indices ordered by descending fitness. Ties keep their original order.
std::vector<size_t> rankByFitness(const std::vector<double>& fitness);

/**
 * Tournament selection: draw tournamentSize candidates (with replacement) and
 * return the fittest. With candidatePool > 0 candidates come only from the top
 * candidatePool ranks, which biases selection towards the best individuals.
 */
Genome tournamentSelect(
    const std::vector<Genome>& population,
    const std::vector<double>& fitness,
    int tournamentSize,
    std::mt19937& rng,
    size_t candidatePool = 0);

/**
 * Per-parameter uniform crossover: each parameter comes from either parent with
 * equal probability.
 */
Genome uniformCrossover(const Genome& first, const Genome& second, std::mt19937& rng);

} // namespace SimPool
