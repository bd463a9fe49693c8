#include "Genome.h"
#include "core/training/Mlp.h"

#include <utility>

namespace SimPool {

Genome::Genome(std::vector<double> weights) : weights(std::move(weights))
{}

Genome Genome::random(const std::vector<int>& layerSizes, std::mt19937& rng)
{
    Mlp network(layerSizes, Activation::Relu, Activation::Tanh);
    network.initialize(rng);
    return Genome(network.parameters());
}

Genome Genome::constant(const std::vector<int>& layerSizes, double value)
{
    return Genome(std::vector<double>(Mlp::parameterCount(layerSizes), value));
}

bool Genome::operator==(const Genome& other) const
{
    return weights == other.weights;
}

} // namespace SimPool
