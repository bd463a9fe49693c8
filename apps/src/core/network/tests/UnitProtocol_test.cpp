#include "core/network/BinaryProtocol.h"
#include "core/network/UnitProtocol.h"
#include "core/physics/PendulumEngine.h"

#include <gtest/gtest.h>
#include <limits>

using namespace SimPool;
using namespace SimPool::UnitProtocol;

TEST(UnitProtocolTest, StepCommandDecodesWithIdAndActions)
{
    const auto bytes = encodeCommand(7, Step{ 3, { 0.5, -0.25 } });

    const auto decoded = decodeCommand(bytes);

    ASSERT_TRUE(decoded.isValue()) << decoded.errorValue();
    EXPECT_EQ(decoded.value().id, 7u);
    ASSERT_TRUE(std::holds_alternative<Step>(decoded.value().command));
    const auto& step = std::get<Step>(decoded.value().command);
    EXPECT_EQ(step.envId, 3);
    EXPECT_EQ(step.actions, (std::vector<double>{ 0.5, -0.25 }));
}

TEST(UnitProtocolTest, StepResultCarriesObservation)
{
    PendulumEngine engine;
    engine.step();
    StepResult result;
    result.envId = 2;
    result.observation = captureObservation(engine);
    result.reward = 1.5;
    result.done = true;
    result.info = StepInfo{ 12, 9.0 };

    const auto decoded = decodeReply(encodeReply(0, result));

    ASSERT_TRUE(decoded.isValue()) << decoded.errorValue();
    EXPECT_EQ(decoded.value().id, 0u);
    const auto& reply = std::get<StepResult>(decoded.value().reply);
    EXPECT_EQ(reply.envId, 2);
    EXPECT_EQ(reply.observation.qpos, result.observation.qpos);
    EXPECT_DOUBLE_EQ(reply.reward, 1.5);
    EXPECT_TRUE(reply.done);
    EXPECT_EQ(reply.info.stepCount, 12);
}

TEST(UnitProtocolTest, MessageTypesUseWireNames)
{
    EXPECT_EQ(messageType(Command{ ApplyForce{} }), "applyForce");
    EXPECT_EQ(messageType(Command{ ClearActuators{} }), "clearActuators");
    EXPECT_EQ(messageType(Command{ GetState{} }), "getState");
    EXPECT_EQ(messageType(Reply{ StepResult{} }), "step_result");
    EXPECT_EQ(messageType(Reply{ ResetDone{} }), "reset");
    EXPECT_EQ(messageType(Reply{ StateReport{} }), "state");
}

TEST(UnitProtocolTest, UnknownTypeIsRejected)
{
    const auto bytes = Network::serialize_envelope(
        Network::make_envelope(1, "teleport", Reset{ 0 }));

    const auto decoded = decodeCommand(bytes);

    ASSERT_TRUE(decoded.isError());
    EXPECT_NE(decoded.errorValue().find("teleport"), std::string::npos);
}

TEST(UnitProtocolTest, TruncatedFrameIsRejected)
{
    auto bytes = encodeCommand(1, Step{ 0, { 0.1, 0.2, 0.3 } });
    bytes.resize(bytes.size() - 4);

    EXPECT_TRUE(decodeCommand(bytes).isError());
    EXPECT_TRUE(decodeCommand({}).isError());
}

TEST(UnitProtocolTest, NegativeEnvIdIsRejected)
{
    const auto decoded = decodeCommand(encodeCommand(1, Reset{ -2 }));

    ASSERT_TRUE(decoded.isError());
    EXPECT_NE(decoded.errorValue().find("envId"), std::string::npos);
}

TEST(UnitProtocolTest, ApplyForceNeedsThreeFiniteComponents)
{
    const std::vector<double> origin{ 0.0, 0.0, 0.0 };
    const double inf = std::numeric_limits<double>::infinity();

    const ApplyForce valid{ 0, 1, { 1.0, 0.0, 0.0 }, origin };
    const ApplyForce shortForce{ 0, 1, { 1.0, 0.0 }, origin };
    const ApplyForce infiniteForce{ 0, 1, { inf, 0.0, 0.0 }, origin };
    const ApplyForce negativeBody{ 0, -1, origin, origin };

    EXPECT_FALSE(validate(Command{ valid }).has_value());
    EXPECT_TRUE(validate(Command{ shortForce }).has_value());
    EXPECT_TRUE(validate(Command{ infiniteForce }).has_value());
    EXPECT_TRUE(validate(Command{ negativeBody }).has_value());
}

TEST(UnitProtocolTest, InitRequiresKnownEnvironmentType)
{
    EXPECT_FALSE(validate(Command{ Init{ "humanoid", 0 } }).has_value());
    EXPECT_TRUE(validate(Command{ Init{ "octopus", 0 } }).has_value());
}

TEST(UnitProtocolTest, NonFiniteActionsAreRejected)
{
    const Step step{ 0, { 0.0, std::numeric_limits<double>::quiet_NaN() } };

    EXPECT_TRUE(decodeCommand(encodeCommand(1, step)).isError());
}

TEST(UnitProtocolTest, ErrorReplyMayOmitEnvironment)
{
    const auto decoded = decodeReply(encodeReply(5, Error{ -1, "bad frame", "" }));

    ASSERT_TRUE(decoded.isValue());
    EXPECT_EQ(envIdOf(decoded.value().reply), -1);
    EXPECT_EQ(std::get<Error>(decoded.value().reply).error, "bad frame");
}
