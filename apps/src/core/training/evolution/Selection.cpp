#include "Selection.h"
#include "Genome.h"

#include <algorithm>
#include <cassert>
#include <numeric>

namespace SimPool {

std::vector<size_t> rankByFitness(const std::vector<double>& fitness)
{
    std::vector<size_t> order(fitness.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&fitness](size_t a, size_t b) {
        return fitness[a] > fitness[b];
    });
    return order;
}

Genome tournamentSelect(
    const std::vector<Genome>& population,
    const std::vector<double>& fitness,
    int tournamentSize,
    std::mt19937& rng,
    size_t candidatePool)
{
    assert(!population.empty());
    assert(population.size() == fitness.size());
    assert(tournamentSize > 0);

    const auto ranked = rankByFitness(fitness);
    size_t poolSize = population.size();
    if (candidatePool > 0) {
        poolSize = std::min(candidatePool, poolSize);
    }

    std::uniform_int_distribution<size_t> dist(0, poolSize - 1);

    size_t bestIdx = ranked[dist(rng)];
    for (int i = 1; i < tournamentSize; i++) {
        const size_t idx = ranked[dist(rng)];
        if (fitness[idx] > fitness[bestIdx]) {
            bestIdx = idx;
        }
    }

    return population[bestIdx];
}

Genome uniformCrossover(const Genome& first, const Genome& second, std::mt19937& rng)
{
    assert(first.weights.size() == second.weights.size());

    std::bernoulli_distribution pickFirst(0.5);
    Genome child = first;
    for (size_t i = 0; i < child.weights.size(); i++) {
        if (!pickFirst(rng)) {
            child.weights[i] = second.weights[i];
        }
    }
    return child;
}

} // namespace SimPool
