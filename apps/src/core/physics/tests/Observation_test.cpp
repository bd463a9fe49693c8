#include "core/physics/ArticulatedBodyEngine.h"
#include "core/physics/Observation.h"
#include "core/physics/PendulumEngine.h"

#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <vector>

using namespace SimPool;

TEST(ObservationTest, CaptureCopiesTorsoAndState)
{
    ArticulatedBodyEngine engine(ArticulatedBodyEngine::humanoidSpec());
    engine.data().ctrl[3] = 0.25;
    engine.step();

    const Observation obs = captureObservation(engine);

    ASSERT_EQ(obs.bodyPos.size(), 3u);
    EXPECT_DOUBLE_EQ(obs.bodyPos[2], engine.data().xpos[5]);
    EXPECT_EQ(obs.qpos, engine.data().qpos);
    EXPECT_EQ(obs.qvel, engine.data().qvel);
    EXPECT_EQ(obs.xquat.size(), engine.data().xquat.size());
    EXPECT_EQ(obs.actions.size(), 21u);
    EXPECT_DOUBLE_EQ(obs.actions[3], 0.25);
    EXPECT_DOUBLE_EQ(obs.time, engine.data().time);
    EXPECT_EQ(obs.contacts.size(), 2u);
}

TEST(ObservationTest, PolicyInputLayoutForHumanoid)
{
    ArticulatedBodyEngine engine(ArticulatedBodyEngine::humanoidSpec());
    for (int i = 0; i < 5; i++) {
        engine.data().ctrl[i] = 0.5;
        engine.step();
    }
    const Observation obs = captureObservation(engine);

    const auto input = toPolicyInput(obs);

    ASSERT_EQ(input.size(), 72u);
    EXPECT_DOUBLE_EQ(input[0], obs.bodyPos[0]);
    EXPECT_DOUBLE_EQ(input[2], obs.bodyPos[2]);
    EXPECT_DOUBLE_EQ(input[3], obs.qvel[0]);
    // Joint angles start after torso position and root linear velocity.
    EXPECT_DOUBLE_EQ(input[6], obs.qpos[7]);
    EXPECT_DOUBLE_EQ(input[26], obs.qpos[27]);
    EXPECT_DOUBLE_EQ(input[27], obs.qvel[6]);
    EXPECT_DOUBLE_EQ(input[47], obs.qvel[26]);
    for (size_t i = 48; i < input.size(); i++) {
        EXPECT_DOUBLE_EQ(input[i], 0.0);
    }
}

TEST(ObservationTest, PolicyInputPadsShortObservations)
{
    PendulumEngine engine;
    const Observation obs = captureObservation(engine);

    const auto input = toPolicyInput(obs, 10);

    ASSERT_EQ(input.size(), 10u);
    EXPECT_DOUBLE_EQ(input[0], obs.bodyPos[0]);
    EXPECT_DOUBLE_EQ(input[3], obs.qvel[0]);
    EXPECT_DOUBLE_EQ(input[6], 0.0);
}

TEST(ObservationTest, NonFiniteValuesAreDetected)
{
    PendulumEngine engine;
    Observation obs = captureObservation(engine);
    EXPECT_TRUE(isFinite(obs));

    obs.qvel[0] = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(isFinite(obs));

    obs = captureObservation(engine);
    obs.time = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(isFinite(obs));
}
