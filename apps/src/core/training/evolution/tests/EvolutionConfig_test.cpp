#include "core/training/evolution/EvolutionConfig.h"

#include <gtest/gtest.h>

using namespace SimPool;

TEST(EvolutionConfigTest, DefaultsAreValid)
{
    const EvolutionConfig config;

    EXPECT_FALSE(validate(config).has_value());
    EXPECT_EQ(config.eliteCount(), 10);
    EXPECT_EQ(config.layerSizes.front(), 72);
}

TEST(EvolutionConfigTest, EliteCountIsAtLeastOne)
{
    EvolutionConfig config;
    config.populationSize = 4;
    config.eliteFraction = 0.1;

    EXPECT_EQ(config.eliteCount(), 1);
}

TEST(EvolutionConfigTest, RejectsInvalidValues)
{
    EvolutionConfig tiny;
    tiny.populationSize = 1;
    EXPECT_TRUE(validate(tiny).has_value());

    EvolutionConfig oneLayer;
    oneLayer.layerSizes = { 72 };
    EXPECT_TRUE(validate(oneLayer).has_value());

    EvolutionConfig zeroLayer;
    zeroLayer.layerSizes = { 72, 0, 21 };
    EXPECT_TRUE(validate(zeroLayer).has_value());

    EvolutionConfig allElite;
    allElite.eliteFraction = 1.0;
    EXPECT_TRUE(validate(allElite).has_value());

    EvolutionConfig noTournament;
    noTournament.tournamentSize = 0;
    EXPECT_TRUE(validate(noTournament).has_value());
}

TEST(EvolutionConfigTest, JsonKeepsDefaultsForMissingKeys)
{
    const nlohmann::json j = { { "populationSize", 12 }, { "layerSizes", { 8, 4, 1 } } };

    const auto config = j.get<EvolutionConfig>();

    EXPECT_EQ(config.populationSize, 12);
    EXPECT_EQ(config.layerSizes, (std::vector<int>{ 8, 4, 1 }));
    EXPECT_EQ(config.tournamentSize, 3);
    EXPECT_DOUBLE_EQ(config.explorationNoise, 0.05);
}

TEST(EvolutionConfigTest, MutationJsonFields)
{
    const nlohmann::json j = { { "rate", 0.3 }, { "weightLimit", 4.0 } };

    const auto config = j.get<MutationConfig>();

    EXPECT_DOUBLE_EQ(config.rate, 0.3);
    EXPECT_DOUBLE_EQ(config.weightLimit, 4.0);
    EXPECT_DOUBLE_EQ(config.strength, 0.05);
    EXPECT_DOUBLE_EQ(config.biasLimit, 1.0);

    const nlohmann::json back = config;
    EXPECT_DOUBLE_EQ(back.at("biasStrengthScale").get<double>(), 0.5);
}
