#pragma once

#include "Genome.h"
#include "core/training/ActionPolicy.h"
#include "core/training/Mlp.h"

#include <vector>

namespace SimPool {

/**
 * Policy network built from a genome: ReLU hidden layers, tanh output. The
 * observation is flattened with toPolicyInput() to the first layer's size.
 */
class GenomePolicy : public ActionPolicy {
public:
    // Throws std::invalid_argument if the genome does not fit the layer sizes.
    GenomePolicy(const Genome& genome, const std::vector<int>& layerSizes);

    std::vector<double> act(const Observation& observation) const override;

    const Mlp& network() const { return network_; }

private:
    Mlp network_;
};

} // namespace SimPool
