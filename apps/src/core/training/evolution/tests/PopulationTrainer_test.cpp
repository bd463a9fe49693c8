#include "core/physics/PendulumEngine.h"
#include "core/training/evolution/PopulationTrainer.h"

#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>

using namespace SimPool;

namespace {

// Fitness peaks when every parameter equals the target.
class TargetEvaluator : public PolicyEvaluator {
public:
    explicit TargetEvaluator(double target) : target_(target) {}

    std::vector<double> evaluate(
        const std::vector<Genome>& genomes, const std::vector<int>& /*layerSizes*/, int episodes)
        override
    {
        calls++;
        lastEpisodes = episodes;
        std::vector<double> fitness;
        for (const auto& genome : genomes) {
            double error = 0.0;
            for (double w : genome.weights) {
                error += (w - target_) * (w - target_);
            }
            fitness.push_back(-error);
        }
        return fitness;
    }

    int calls = 0;
    int lastEpisodes = 0;

private:
    double target_;
};

} // namespace

class PopulationTrainerTest : public ::testing::Test {
protected:
    EvolutionConfig smallConfig()
    {
        EvolutionConfig config;
        config.populationSize = 10;
        config.layerSizes = { 4, 3, 2 };
        config.eliteFraction = 0.2;
        config.episodesPerEvaluation = 2;
        return config;
    }

    std::vector<double> ascendingFitness(size_t count)
    {
        std::vector<double> fitness;
        for (size_t i = 0; i < count; i++) {
            fitness.push_back(static_cast<double>(i));
        }
        return fitness;
    }
};

TEST_F(PopulationTrainerTest, InitialPopulationMatchesLayout)
{
    PopulationTrainer trainer(smallConfig());

    ASSERT_EQ(trainer.population().size(), 10u);
    for (const auto& genome : trainer.population()) {
        EXPECT_EQ(genome.weights.size(), 23u);
    }
    EXPECT_EQ(trainer.generation(), 0);
    EXPECT_FALSE(trainer.champion().has_value());
    EXPECT_EQ(trainer.championPolicy(), nullptr);
}

TEST_F(PopulationTrainerTest, ElitesSurviveUnchanged)
{
    PopulationTrainer trainer(smallConfig());
    const auto before = trainer.population();

    const auto stats = trainer.advance(ascendingFitness(before.size()));

    // Two elites: the genomes scored 9 and 8.
    EXPECT_EQ(trainer.population()[0], before[9]);
    EXPECT_EQ(trainer.population()[1], before[8]);
    EXPECT_EQ(trainer.population().size(), before.size());
    EXPECT_DOUBLE_EQ(stats.bestFitness, 9.0);
    EXPECT_DOUBLE_EQ(stats.worstFitness, 0.0);
    EXPECT_DOUBLE_EQ(stats.meanFitness, 4.5);
    EXPECT_EQ(trainer.generation(), 1);
}

TEST_F(PopulationTrainerTest, ChampionNeverRegresses)
{
    PopulationTrainer trainer(smallConfig());
    const auto first = trainer.advance(std::vector<double>(10, 5.0));
    EXPECT_TRUE(first.newChampion);
    const Genome championGenome = trainer.champion()->genome;

    const auto second = trainer.advance(std::vector<double>(10, 1.0));

    EXPECT_FALSE(second.newChampion);
    EXPECT_DOUBLE_EQ(trainer.champion()->fitness, 5.0);
    EXPECT_EQ(trainer.champion()->generation, 0);
    EXPECT_EQ(trainer.champion()->genome, championGenome);
}

TEST_F(PopulationTrainerTest, NonFiniteFitnessRanksLast)
{
    PopulationTrainer trainer(smallConfig());
    std::vector<double> fitness = ascendingFitness(10);
    fitness[9] = std::numeric_limits<double>::quiet_NaN();
    fitness[8] = std::numeric_limits<double>::infinity();

    const auto stats = trainer.advance(fitness);

    EXPECT_DOUBLE_EQ(stats.bestFitness, 7.0);
    EXPECT_DOUBLE_EQ(trainer.champion()->fitness, 7.0);
    EXPECT_EQ(trainer.rankedFitness().back(), std::numeric_limits<double>::lowest());
}

TEST_F(PopulationTrainerTest, FitnessCountMismatchThrows)
{
    PopulationTrainer trainer(smallConfig());

    EXPECT_THROW(trainer.advance({ 1.0, 2.0 }), std::invalid_argument);
    EXPECT_EQ(trainer.generation(), 0);
}

TEST_F(PopulationTrainerTest, SetPopulationValidatesShape)
{
    PopulationTrainer trainer(smallConfig());

    EXPECT_THROW(trainer.setPopulation({ Genome::constant({ 4, 3, 2 }, 0.0) }), std::invalid_argument);
    EXPECT_THROW(
        trainer.setPopulation(std::vector<Genome>(10, Genome::constant({ 4, 2 }, 0.0))),
        std::invalid_argument);

    trainer.setPopulation(std::vector<Genome>(10, Genome::constant({ 4, 3, 2 }, 0.25)));
    EXPECT_EQ(trainer.population()[3].weights[0], 0.25);
}

TEST_F(PopulationTrainerTest, InvalidConfigThrows)
{
    EvolutionConfig config = smallConfig();
    config.populationSize = 1;

    EXPECT_THROW(PopulationTrainer{ config }, std::invalid_argument);
}

TEST_F(PopulationTrainerTest, SearchImprovesOnASimpleObjective)
{
    PopulationTrainer trainer(smallConfig());
    TargetEvaluator evaluator(0.5);

    const double initialBest = trainer.runGeneration(evaluator).bestFitness;
    for (int i = 0; i < 40; i++) {
        trainer.runGeneration(evaluator);
    }

    EXPECT_EQ(evaluator.calls, 41);
    EXPECT_EQ(evaluator.lastEpisodes, 2);
    EXPECT_GT(trainer.champion()->fitness, initialBest);
}

TEST_F(PopulationTrainerTest, ChampionPolicyActs)
{
    PopulationTrainer trainer(smallConfig());
    trainer.advance(ascendingFitness(10));

    const auto policy = trainer.championPolicy();
    ASSERT_NE(policy, nullptr);

    PendulumEngine engine;
    const auto action = policy->act(captureObservation(engine));
    ASSERT_EQ(action.size(), 2u);
    for (double a : action) {
        EXPECT_LE(std::abs(a), 1.0);
    }
}
