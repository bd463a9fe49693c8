#include "Mutation.h"
#include "Genome.h"

#include <algorithm>
#include <stdexcept>

namespace SimPool {

Genome mutate(
    const Genome& parent,
    const std::vector<bool>& biasMask,
    const MutationConfig& config,
    std::mt19937& rng,
    MutationStats* stats)
{
    if (biasMask.size() != parent.weights.size()) {
        throw std::invalid_argument("Bias mask does not match genome size");
    }
    if (stats) {
        stats->weightPerturbations = 0;
        stats->biasPerturbations = 0;
    }

    Genome child = parent;

    std::normal_distribution<double> noise(0.0, 1.0);
    std::uniform_real_distribution<double> coin(0.0, 1.0);

    for (size_t i = 0; i < child.weights.size(); i++) {
        const bool isBias = biasMask[i];
        if (coin(rng) < config.rate) {
            const double strength =
                isBias ? config.strength * config.biasStrengthScale : config.strength;
            child.weights[i] += noise(rng) * strength;
            if (stats) {
                if (isBias) {
                    stats->biasPerturbations++;
                }
                else {
                    stats->weightPerturbations++;
                }
            }
        }

        const double limit = isBias ? config.biasLimit : config.weightLimit;
        child.weights[i] = std::clamp(child.weights[i], -limit, limit);
    }

    return child;
}

} // namespace SimPool
