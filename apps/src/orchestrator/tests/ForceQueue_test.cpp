#include "core/physics/PhysicsEngine.h"
#include "orchestrator/ForceQueue.h"

#include <gtest/gtest.h>

using namespace SimPool;

class ForceQueueTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        data.xpos = { 0.0, 0.0, 0.0, 1.0, 0.0, 2.0 };
        data.xfrcApplied.assign(12, 7.0);
    }

    PhysicsData data;
    ForceQueue queue;
};

TEST_F(ForceQueueTest, NonZeroForceIsPending)
{
    EXPECT_TRUE(queue.set(1, { 0.0, 0.0, 10.0 }, { 1.0, 0.0, 2.0 }));

    EXPECT_EQ(queue.size(), 1u);

    queue.applyAndClear(data);
    EXPECT_DOUBLE_EQ(data.xfrcApplied[8], 10.0);
    EXPECT_DOUBLE_EQ(data.xfrcApplied[2], 0.0);
    EXPECT_EQ(queue.size(), 0u);
}

TEST_F(ForceQueueTest, ZeroForceClearsTheBody)
{
    queue.set(1, { 0.0, 5.0, 0.0 }, { 0.0, 0.0, 0.0 });

    EXPECT_FALSE(queue.set(1, { 0.0, 0.0, 0.0 }, { 0.0, 0.0, 0.0 }));

    EXPECT_EQ(queue.size(), 0u);

    queue.applyAndClear(data);
    for (double value : data.xfrcApplied) {
        EXPECT_DOUBLE_EQ(value, 0.0);
    }
}

TEST_F(ForceQueueTest, LaterForceReplacesEarlier)
{
    queue.set(1, { 1.0, 0.0, 0.0 }, { 1.0, 0.0, 2.0 });
    queue.set(1, { 0.0, 0.0, 3.0 }, { 1.0, 0.0, 2.0 });

    queue.applyAndClear(data);

    EXPECT_DOUBLE_EQ(data.xfrcApplied[6], 0.0);
    EXPECT_DOUBLE_EQ(data.xfrcApplied[8], 3.0);
}

TEST_F(ForceQueueTest, ApplyWritesForceAndTorqueThenForgets)
{
    // Point is offset +1 in x from body 1, force points up: torque = r x f = (0, -fz, 0).
    queue.set(1, { 0.0, 0.0, 4.0 }, { 2.0, 0.0, 2.0 });

    queue.applyAndClear(data);

    for (int i = 0; i < 6; i++) {
        EXPECT_DOUBLE_EQ(data.xfrcApplied[i], 0.0) << "body 0 index " << i;
    }
    EXPECT_DOUBLE_EQ(data.xfrcApplied[6], 0.0);
    EXPECT_DOUBLE_EQ(data.xfrcApplied[7], 0.0);
    EXPECT_DOUBLE_EQ(data.xfrcApplied[8], 4.0);
    EXPECT_DOUBLE_EQ(data.xfrcApplied[9], 0.0);
    EXPECT_DOUBLE_EQ(data.xfrcApplied[10], -4.0);
    EXPECT_DOUBLE_EQ(data.xfrcApplied[11], 0.0);
    EXPECT_EQ(queue.size(), 0u);

    // Nothing carries over to the next step.
    queue.applyAndClear(data);
    for (double value : data.xfrcApplied) {
        EXPECT_DOUBLE_EQ(value, 0.0);
    }
}

TEST_F(ForceQueueTest, OutOfRangeBodyIsIgnored)
{
    queue.set(5, { 1.0, 1.0, 1.0 }, { 0.0, 0.0, 0.0 });

    queue.applyAndClear(data);

    for (double value : data.xfrcApplied) {
        EXPECT_DOUBLE_EQ(value, 0.0);
    }
}
