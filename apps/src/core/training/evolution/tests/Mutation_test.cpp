#include "core/training/Mlp.h"
#include "core/training/evolution/EvolutionConfig.h"
#include "core/training/evolution/Genome.h"
#include "core/training/evolution/Mutation.h"

#include <cmath>
#include <gtest/gtest.h>
#include <stdexcept>

using namespace SimPool;

class MutationTest : public ::testing::Test {
protected:
    std::mt19937 rng{ 42 };
    const std::vector<int> layers{ 4, 3, 2 };
    const std::vector<bool> biasMask = Mlp::biasMask(layers);
};

TEST_F(MutationTest, MutationChangesWeights)
{
    const Genome parent = Genome::constant(layers, 0.5);
    MutationConfig config;
    config.rate = 0.5;
    config.strength = 0.1;

    MutationStats stats;
    const Genome child = mutate(parent, biasMask, config, rng, &stats);

    int changed = 0;
    for (size_t i = 0; i < parent.weights.size(); i++) {
        if (parent.weights[i] != child.weights[i]) {
            changed++;
        }
    }
    EXPECT_GT(changed, 0);
    EXPECT_EQ(changed, stats.totalChanges());
}

TEST_F(MutationTest, ZeroRateProducesIdenticalGenome)
{
    const Genome parent = Genome::constant(layers, 0.5);
    MutationConfig config;
    config.rate = 0.0;

    MutationStats stats;
    const Genome child = mutate(parent, biasMask, config, rng, &stats);

    EXPECT_EQ(parent, child);
    EXPECT_EQ(stats.totalChanges(), 0);
}

TEST_F(MutationTest, ParametersAreClampedToTheirLimits)
{
    const Genome parent = Genome::constant(layers, 5.0);
    MutationConfig config;
    config.rate = 0.0;
    config.weightLimit = 2.0;
    config.biasLimit = 1.0;

    const Genome child = mutate(parent, biasMask, config, rng);

    for (size_t i = 0; i < child.weights.size(); i++) {
        EXPECT_DOUBLE_EQ(child.weights[i], biasMask[i] ? 1.0 : 2.0);
    }
}

TEST_F(MutationTest, StrongMutationStaysWithinLimits)
{
    const Genome parent = Genome::constant(layers, 0.0);
    MutationConfig config;
    config.rate = 1.0;
    config.strength = 50.0;

    MutationStats stats;
    const Genome child = mutate(parent, biasMask, config, rng, &stats);

    EXPECT_EQ(stats.totalChanges(), static_cast<int>(parent.weights.size()));
    EXPECT_EQ(stats.biasPerturbations, 3 + 2);
    for (size_t i = 0; i < child.weights.size(); i++) {
        const double limit = biasMask[i] ? config.biasLimit : config.weightLimit;
        EXPECT_LE(std::abs(child.weights[i]), limit);
    }
}

TEST_F(MutationTest, MismatchedBiasMaskThrows)
{
    const Genome parent = Genome::constant(layers, 0.0);
    const std::vector<bool> shortMask(3, false);

    EXPECT_THROW(mutate(parent, shortMask, MutationConfig{}, rng), std::invalid_argument);
}
