#include "core/physics/ArticulatedBodyEngine.h"
#include "core/physics/PendulumEngine.h"
#include "core/training/ppo/StateExtractor.h"

#include <gtest/gtest.h>
#include <limits>

using namespace SimPool;
using namespace SimPool::Ppo;

TEST(StateExtractorTest, DefaultSizeIsEightyThree)
{
    EXPECT_EQ(StateExtractor::kDefaultSize, 83u);
    EXPECT_EQ(StateExtractor().size(), 83u);
}

TEST(StateExtractorTest, HumanoidLayout)
{
    ArticulatedBodyEngine engine(ArticulatedBodyEngine::humanoidSpec());
    engine.data().ctrl[0] = 1.0;
    engine.step();
    const Observation obs = captureObservation(engine);

    const auto state = StateExtractor().extract(obs);

    ASSERT_EQ(state.size(), 83u);
    EXPECT_DOUBLE_EQ(state[0], obs.qpos[0]);
    EXPECT_DOUBLE_EQ(state[27], obs.qpos[27]);
    // qpos has 28 entries, padded to 34.
    EXPECT_DOUBLE_EQ(state[28], 0.0);
    EXPECT_DOUBLE_EQ(state[34], obs.qvel[0]);
    EXPECT_DOUBLE_EQ(state[68 + 2], obs.bodyPos[2]);
    EXPECT_DOUBLE_EQ(state[71], obs.xquat[4]);
    EXPECT_DOUBLE_EQ(state[75], obs.contacts[0]);
}

TEST(StateExtractorTest, MissingQuaternionUsesIdentity)
{
    Observation obs;
    obs.qpos = { 0.3 };
    obs.qvel = { -0.1 };
    obs.bodyPos = { 0.0, 0.0, 0.6 };

    const auto state = StateExtractor().extract(obs);

    EXPECT_DOUBLE_EQ(state[71], 1.0);
    EXPECT_DOUBLE_EQ(state[72], 0.0);
    EXPECT_DOUBLE_EQ(state[73], 0.0);
    EXPECT_DOUBLE_EQ(state[74], 0.0);
}

TEST(StateExtractorTest, NonFiniteValuesBecomeZero)
{
    PendulumEngine engine;
    Observation obs = captureObservation(engine);
    obs.qvel[0] = std::numeric_limits<double>::infinity();

    const auto state = StateExtractor().extract(obs);

    EXPECT_DOUBLE_EQ(state[34], 0.0);
}

TEST(StateExtractorTest, ResizesToDeclaredSize)
{
    PendulumEngine engine;
    const Observation obs = captureObservation(engine);

    EXPECT_EQ(StateExtractor(10).extract(obs).size(), 10u);
    EXPECT_EQ(StateExtractor(100).extract(obs).size(), 100u);
    EXPECT_DOUBLE_EQ(StateExtractor(100).extract(obs)[99], 0.0);
}
