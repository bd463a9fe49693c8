#include "orchestrator/Orchestrator.h"

#include <gtest/gtest.h>
#include <map>

using namespace SimPool;

TEST(PartitionTest, EvenSplit)
{
    // 4 environments on 2 units: 2 per unit.
    EXPECT_EQ(Orchestrator::unitForEnvironment(0, 4, 2), 0);
    EXPECT_EQ(Orchestrator::unitForEnvironment(1, 4, 2), 0);
    EXPECT_EQ(Orchestrator::unitForEnvironment(2, 4, 2), 1);
    EXPECT_EQ(Orchestrator::unitForEnvironment(3, 4, 2), 1);
}

TEST(PartitionTest, UnevenSplitFillsEarlyUnitsFirst)
{
    // ceil(10 / 3) = 4 per unit: [0..3], [4..7], [8, 9].
    std::map<int, int> perUnit;
    for (int envId = 0; envId < 10; envId++) {
        perUnit[Orchestrator::unitForEnvironment(envId, 10, 3)]++;
    }

    EXPECT_EQ(perUnit[0], 4);
    EXPECT_EQ(perUnit[1], 4);
    EXPECT_EQ(perUnit[2], 2);
}

TEST(PartitionTest, UnitsNeverExceedTheCount)
{
    for (int numUnits = 1; numUnits <= 8; numUnits++) {
        for (int numEnvs = numUnits; numEnvs <= 40; numEnvs++) {
            int previous = 0;
            for (int envId = 0; envId < numEnvs; envId++) {
                const int unit = Orchestrator::unitForEnvironment(envId, numEnvs, numUnits);
                ASSERT_GE(unit, previous);
                ASSERT_LT(unit, numUnits);
                previous = unit;
            }
        }
    }
}

TEST(PartitionTest, SingleUnitHostsEverything)
{
    for (int envId = 0; envId < 7; envId++) {
        EXPECT_EQ(Orchestrator::unitForEnvironment(envId, 7, 1), 0);
    }
}
