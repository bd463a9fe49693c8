#include "orchestrator/MessageRouter.h"

#include <chrono>
#include <gtest/gtest.h>
#include <vector>

using namespace SimPool;
using namespace std::chrono_literals;

class MessageRouterTest : public ::testing::Test {
protected:
    MessageRouter router{ 5000ms, 5ms };
};

TEST_F(MessageRouterTest, IdsAreUniqueAndIncreasing)
{
    auto first = router.open(0, "step");
    auto second = router.open(1, "step");
    auto third = router.open(0, "reset");

    EXPECT_GT(first.id, 0u);
    EXPECT_LT(first.id, second.id);
    EXPECT_LT(second.id, third.id);
    EXPECT_EQ(router.pendingCount(), 3u);
}

TEST_F(MessageRouterTest, MatchingReplyCompletesTheFuture)
{
    auto ticket = router.open(2, "getState");

    router.dispatch(ticket.id, UnitProtocol::Initialized{ .envId = 2 });

    ASSERT_EQ(ticket.future.wait_for(0ms), std::future_status::ready);
    auto result = ticket.future.get();
    ASSERT_TRUE(result.isValue());
    EXPECT_TRUE(std::holds_alternative<UnitProtocol::Initialized>(result.value()));
    EXPECT_EQ(router.pendingCount(), 0u);
}

TEST_F(MessageRouterTest, ErrorReplyRejectsWithUnitFault)
{
    auto ticket = router.open(3, "reset");

    router.dispatch(ticket.id, UnitProtocol::Error{ .envId = -1, .error = "boom", .stack = "" });

    auto result = ticket.future.get();
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, RequestError::Kind::UnitFault);
    EXPECT_EQ(result.errorValue().message, "boom");
    // The request's env id fills in when the unit could not name one.
    EXPECT_EQ(result.errorValue().envId, 3);
}

TEST_F(MessageRouterTest, OverdueRequestTimesOutAndIsRemoved)
{
    auto ticket = router.open(1, "reset", 10ms);

    EXPECT_EQ(router.expireOverdue(MessageRouter::Clock::now()), 0u);
    EXPECT_EQ(router.expireOverdue(MessageRouter::Clock::now() + 20ms), 1u);

    auto result = ticket.future.get();
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, RequestError::Kind::Timeout);
    EXPECT_EQ(result.errorValue().envId, 1);
    EXPECT_EQ(router.pendingCount(), 0u);
}

TEST_F(MessageRouterTest, SweepThreadExpiresRequests)
{
    router.start();
    auto ticket = router.open(0, "step", 20ms);

    ASSERT_EQ(ticket.future.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(ticket.future.get().errorValue().kind, RequestError::Kind::Timeout);
    router.stop();
}

TEST_F(MessageRouterTest, LateReplyGoesToTheTypeHandler)
{
    std::vector<int> handled;
    router.setHandler("step_result", [&handled](const UnitProtocol::Reply& reply) {
        handled.push_back(UnitProtocol::envIdOf(reply));
    });
    auto ticket = router.open(4, "step", 10ms);
    router.expireOverdue(MessageRouter::Clock::now() + 1s);

    UnitProtocol::StepResult late;
    late.envId = 4;
    router.dispatch(ticket.id, late);

    ASSERT_EQ(handled.size(), 1u);
    EXPECT_EQ(handled[0], 4);
}

TEST_F(MessageRouterTest, UncorrelatedReplyGoesToTheTypeHandler)
{
    int resets = 0;
    router.setHandler("reset", [&resets](const UnitProtocol::Reply&) { resets++; });

    router.dispatch(0, UnitProtocol::ResetDone{ .envId = 1, .observation = {} });
    // No handler registered: dropped.
    router.dispatch(0, UnitProtocol::Initialized{ .envId = 1 });

    EXPECT_EQ(resets, 1);
}

TEST_F(MessageRouterTest, CancelCompletesOnce)
{
    auto ticket = router.open(0, "init");

    EXPECT_TRUE(router.cancel(
        ticket.id, RequestError{ RequestError::Kind::InvalidArgument, "bad", 0 }));
    EXPECT_FALSE(router.cancel(
        ticket.id, RequestError{ RequestError::Kind::Terminated, "again", 0 }));

    EXPECT_EQ(ticket.future.get().errorValue().kind, RequestError::Kind::InvalidArgument);
}

TEST_F(MessageRouterTest, RejectAllFailsEveryPendingRequest)
{
    auto first = router.open(0, "step");
    auto second = router.open(5, "reset");

    router.rejectAll(RequestError{ RequestError::Kind::Terminated, "shutdown" });

    const auto firstResult = first.future.get();
    const auto secondResult = second.future.get();
    EXPECT_EQ(firstResult.errorValue().kind, RequestError::Kind::Terminated);
    EXPECT_EQ(firstResult.errorValue().envId, 0);
    EXPECT_EQ(secondResult.errorValue().envId, 5);
    EXPECT_EQ(router.pendingCount(), 0u);
}
