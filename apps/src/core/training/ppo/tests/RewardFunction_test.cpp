#include "core/physics/ArticulatedBodyEngine.h"
#include "core/training/ppo/RewardFunction.h"

#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>

using namespace SimPool;
using namespace SimPool::Ppo;

namespace {

RewardState standingState(double height)
{
    RewardState state;
    state.bodyPos = { 0.0, 0.0, height };
    state.bodyQuaternion = { 1.0, 0.0, 0.0, 0.0 };
    return state;
}

} // namespace

TEST(RewardFunctionTest, ThrowingRewardYieldsZeroWithoutDone)
{
    const RewardFunction throwing =
        [](const RewardState&, const std::vector<double>&) -> RewardOutcome {
        throw std::runtime_error("broken reward");
    };

    const auto evaluation = evaluateRewardSafely(throwing, standingState(1.0), { 0.0 });

    EXPECT_TRUE(evaluation.faulted);
    EXPECT_EQ(evaluation.reward, 0.0);
    EXPECT_FALSE(evaluation.done);
    EXPECT_EQ(evaluation.error, "broken reward");
}

TEST(RewardFunctionTest, NanRewardYieldsZeroWithoutDone)
{
    const RewardFunction nanReward =
        [](const RewardState&, const std::vector<double>&) -> RewardOutcome {
        return RewardWithDone{ std::numeric_limits<double>::quiet_NaN(), true };
    };

    const auto evaluation = evaluateRewardSafely(nanReward, standingState(1.0), { 0.0 });

    EXPECT_TRUE(evaluation.faulted);
    EXPECT_EQ(evaluation.reward, 0.0);
    EXPECT_FALSE(evaluation.done);
}

TEST(RewardFunctionTest, PlainAndFullOutcomesAreBothAccepted)
{
    const RewardFunction plain =
        [](const RewardState&, const std::vector<double>&) -> RewardOutcome {
        return 0.75;
    };
    const RewardFunction full =
        [](const RewardState&, const std::vector<double>&) -> RewardOutcome {
        return RewardWithDone{ -1.0, true };
    };

    const auto plainEval = evaluateRewardSafely(plain, standingState(1.0), {});
    const auto fullEval = evaluateRewardSafely(full, standingState(1.0), {});

    EXPECT_FALSE(plainEval.faulted);
    EXPECT_DOUBLE_EQ(plainEval.reward, 0.75);
    EXPECT_FALSE(plainEval.done);
    EXPECT_DOUBLE_EQ(fullEval.reward, -1.0);
    EXPECT_TRUE(fullEval.done);
}

TEST(RewardFunctionTest, StandingRewardPrefersHeightAndStillness)
{
    const auto tall = std::get<RewardWithDone>(standingReward(standingState(1.4), { 0.0, 0.0 }));
    const auto low = std::get<RewardWithDone>(standingReward(standingState(0.9), { 0.0, 0.0 }));
    const auto busy = std::get<RewardWithDone>(standingReward(standingState(1.4), { 1.0, 1.0 }));

    EXPECT_NEAR(tall.reward, 2.0 * 1.4 + 1.0 + 1.0, 1e-12);
    EXPECT_GT(tall.reward, low.reward);
    EXPECT_NEAR(tall.reward - busy.reward, 0.02, 1e-12);
    EXPECT_FALSE(tall.done);
}

TEST(RewardFunctionTest, StandingRewardEndsEpisodeWhenFallen)
{
    const auto fallen =
        std::get<RewardWithDone>(standingReward(standingState(kStandingMinHeight - 0.1), {}));

    EXPECT_TRUE(fallen.done);
}

TEST(RewardFunctionTest, RewardStateSplitsFloatingBase)
{
    ArticulatedBodyEngine engine(ArticulatedBodyEngine::humanoidSpec());
    engine.step();
    const Observation obs = captureObservation(engine);

    const RewardState state = makeRewardState(obs);

    EXPECT_EQ(state.bodyVel.size(), 3u);
    EXPECT_EQ(state.bodyQuaternion.size(), 4u);
    EXPECT_EQ(state.jointAngles.size(), 21u);
    EXPECT_EQ(state.jointVelocities.size(), 21u);
    EXPECT_EQ(state.footContacts, obs.contacts);
    EXPECT_DOUBLE_EQ(state.time, obs.time);
}

TEST(RewardFunctionTest, NamedRewardLookup)
{
    EXPECT_FALSE(static_cast<bool>(rewardFunctionByName("task")));
    EXPECT_TRUE(static_cast<bool>(rewardFunctionByName("standing")));
    EXPECT_THROW(rewardFunctionByName("dancing"), std::invalid_argument);
}
