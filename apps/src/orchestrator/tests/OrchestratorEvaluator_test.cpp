#include "core/training/Mlp.h"
#include "orchestrator/Orchestrator.h"
#include "orchestrator/OrchestratorEvaluator.h"

#include <cmath>
#include <gtest/gtest.h>
#include <stdexcept>

using namespace SimPool;

class OrchestratorEvaluatorTest : public ::testing::Test {
protected:
    OrchestratorConfig pendulumConfig(int envs)
    {
        OrchestratorConfig config;
        config.numEnvironments = envs;
        config.numUnits = 1;
        config.environmentType = Environment::EnumType::Pendulum;
        return config;
    }

    std::mt19937 rng{ 42 };
    const std::vector<int> layers{ 72, 4, 1 };
};

TEST_F(OrchestratorEvaluatorTest, ScoresEveryGenomeInBatches)
{
    Orchestrator orchestrator(pendulumConfig(2));
    ASSERT_TRUE(orchestrator.initialize().isValue());
    OrchestratorEvaluator evaluator(orchestrator, 5, 0.05, 7);

    std::vector<Genome> genomes;
    for (int i = 0; i < 3; i++) {
        genomes.push_back(Genome::random(layers, rng));
    }

    const auto fitness = evaluator.evaluate(genomes, layers, 2);

    ASSERT_EQ(fitness.size(), 3u);
    for (double f : fitness) {
        // Pendulum reward is cos(angle) per step, at most 5 steps per episode.
        EXPECT_TRUE(std::isfinite(f));
        EXPECT_LE(std::abs(f), 5.0);
        EXPECT_NE(f, 0.0);
    }
}

TEST_F(OrchestratorEvaluatorTest, EpisodeEndsWhenEnvironmentReportsDone)
{
    OrchestratorConfig config = pendulumConfig(1);
    config.maxEpisodeSteps = 2;
    Orchestrator orchestrator(config);
    ASSERT_TRUE(orchestrator.initialize().isValue());
    OrchestratorEvaluator evaluator(orchestrator, 50, 0.0, 7);

    const auto fitness =
        evaluator.evaluate({ Genome::constant(layers, 0.0) }, layers, 1);

    ASSERT_EQ(fitness.size(), 1u);
    // Done on the third step: three rewards of at most 1 each.
    EXPECT_LE(std::abs(fitness[0]), 3.0);
    EXPECT_EQ(orchestrator.getEnvironmentState(0)->completedEpisodes, 1);
}

TEST_F(OrchestratorEvaluatorTest, IdenticalGenomesScoreTheSameWithoutNoise)
{
    Orchestrator orchestrator(pendulumConfig(2));
    ASSERT_TRUE(orchestrator.initialize().isValue());
    OrchestratorEvaluator evaluator(orchestrator, 10, 0.0, 7);
    const Genome genome = Genome::random(layers, rng);

    const auto fitness = evaluator.evaluate({ genome, genome }, layers, 1);

    ASSERT_EQ(fitness.size(), 2u);
    EXPECT_DOUBLE_EQ(fitness[0], fitness[1]);
}

TEST_F(OrchestratorEvaluatorTest, FailsWithoutInitializedEnvironments)
{
    Orchestrator orchestrator(pendulumConfig(1));
    OrchestratorEvaluator evaluator(orchestrator, 5, 0.0, 7);

    EXPECT_THROW(
        evaluator.evaluate({ Genome::constant(layers, 0.0) }, layers, 1), std::runtime_error);
}

TEST_F(OrchestratorEvaluatorTest, ActionSinkForwardsToTheOrchestrator)
{
    Orchestrator orchestrator(pendulumConfig(1));
    ASSERT_TRUE(orchestrator.initialize().isValue());
    OrchestratorActionSink sink(orchestrator);

    EXPECT_TRUE(sink.setAction(0, { 0.3 }));
    EXPECT_FALSE(sink.setAction(3, { 0.3 }));
    EXPECT_TRUE(sink.requestReset(0));
    EXPECT_TRUE(orchestrator.getEnvironmentState(0)->awaitingReset);
    EXPECT_FALSE(sink.requestReset(3));
}
