#include "core/training/ppo/PpoConfig.h"

#include <gtest/gtest.h>

using namespace SimPool;

TEST(PpoConfigTest, DefaultsAreValid)
{
    const PpoConfig config;

    EXPECT_DOUBLE_EQ(config.gamma, 0.99);
    EXPECT_DOUBLE_EQ(config.lambda, 0.95);
    EXPECT_DOUBLE_EQ(config.clipEpsilon, 0.2);
    EXPECT_EQ(config.epochs, 10);
    EXPECT_EQ(config.hiddenSize, 256);
    EXPECT_EQ(config.rolloutSize, 2048);
    EXPECT_EQ(config.stateSize, 83);
    EXPECT_FALSE(validate(config).has_value());
}

TEST(PpoConfigTest, MissingKeysKeepDefaults)
{
    const nlohmann::json json = { { "gamma", 0.9 }, { "hiddenSize", 32 } };

    const PpoConfig config = json.get<PpoConfig>();

    EXPECT_DOUBLE_EQ(config.gamma, 0.9);
    EXPECT_EQ(config.hiddenSize, 32);
    EXPECT_DOUBLE_EQ(config.clipEpsilon, 0.2);
    EXPECT_EQ(config.minibatchSize, 64);
    EXPECT_EQ(config.reward, "task");
}

TEST(PpoConfigTest, JsonCarriesEveryField)
{
    PpoConfig config;
    config.reward = "standing";
    config.seed = 7;

    const nlohmann::json json = config;
    const PpoConfig decoded = json.get<PpoConfig>();

    EXPECT_EQ(decoded.reward, "standing");
    EXPECT_EQ(decoded.seed, 7u);
    EXPECT_TRUE(json.contains("maxGradNorm"));
    EXPECT_TRUE(json.contains("initialLogStd"));
}

TEST(PpoConfigTest, InvalidValuesAreReported)
{
    PpoConfig config;
    config.gamma = 1.5;
    EXPECT_TRUE(validate(config).has_value());

    config = PpoConfig{};
    config.minibatchSize = 0;
    EXPECT_TRUE(validate(config).has_value());

    config = PpoConfig{};
    config.reward = "dancing";
    EXPECT_TRUE(validate(config).has_value());

    config = PpoConfig{};
    config.minLogStd = 3.0;
    EXPECT_TRUE(validate(config).has_value());
}
