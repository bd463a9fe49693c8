#include "GenomePolicy.h"

namespace SimPool {

GenomePolicy::GenomePolicy(const Genome& genome, const std::vector<int>& layerSizes)
    : network_(layerSizes, Activation::Relu, Activation::Tanh)
{
    network_.setParameters(genome.weights);
}

std::vector<double> GenomePolicy::act(const Observation& observation) const
{
    return network_.forward(toPolicyInput(observation, network_.inputSize()));
}

} // namespace SimPool
