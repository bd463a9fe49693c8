#pragma once

#include <random>
#include <vector>

namespace SimPool {

/**
 * Flat parameter vector for an Mlp with known layer sizes, in Mlp layout.
 */
struct Genome {
    std::vector<double> weights;

    Genome() = default;
    explicit Genome(std::vector<double> weights);

    // Xavier-initialized weights, zero biases.
    static Genome random(const std::vector<int>& layerSizes, std::mt19937& rng);
    static Genome constant(const std::vector<int>& layerSizes, double value);

    bool operator==(const Genome& other) const;
};

} // namespace SimPool
