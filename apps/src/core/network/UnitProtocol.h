#pragma once

#include "core/Result.h"
#include "core/physics/Observation.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <zpp_bits.h>

/**
 * \file
 * Closed message set exchanged with simulation units.
 *
 * Commands flow orchestrator -> unit, replies flow unit -> orchestrator. Each
 * message struct names its wire type in kMessageType. Decoding validates the
 * type, the payload and field ranges before a message reaches any handler.
 */

namespace SimPool::UnitProtocol {

// Commands.

struct Init {
    static constexpr const char* kMessageType = "init";
    std::string envType;
    int32_t envId = 0;

    using serialize = zpp::bits::members<2>;
};

struct Step {
    static constexpr const char* kMessageType = "step";
    int32_t envId = 0;
    std::vector<double> actions;

    using serialize = zpp::bits::members<2>;
};

struct Reset {
    static constexpr const char* kMessageType = "reset";
    int32_t envId = 0;

    using serialize = zpp::bits::members<1>;
};

struct ApplyForce {
    static constexpr const char* kMessageType = "applyForce";
    int32_t envId = 0;
    int32_t bodyId = 0;
    std::vector<double> force; // [fx, fy, fz]
    std::vector<double> point; // [x, y, z] in world coordinates.

    using serialize = zpp::bits::members<4>;
};

struct ClearActuators {
    static constexpr const char* kMessageType = "clearActuators";
    int32_t envId = 0;

    using serialize = zpp::bits::members<1>;
};

struct GetState {
    static constexpr const char* kMessageType = "getState";
    int32_t envId = 0;

    using serialize = zpp::bits::members<1>;
};

using Command = std::variant<Init, Step, Reset, ApplyForce, ClearActuators, GetState>;

// Replies.

struct StepInfo {
    int32_t stepCount = 0;
    double totalReward = 0.0;

    using serialize = zpp::bits::members<2>;
};

struct Initialized {
    static constexpr const char* kMessageType = "initialized";
    int32_t envId = 0;

    using serialize = zpp::bits::members<1>;
};

struct StepResult {
    static constexpr const char* kMessageType = "step_result";
    int32_t envId = 0;
    Observation observation;
    double reward = 0.0;
    bool done = false;
    StepInfo info;

    using serialize = zpp::bits::members<5>;
};

struct ResetDone {
    static constexpr const char* kMessageType = "reset";
    int32_t envId = 0;
    Observation observation;

    using serialize = zpp::bits::members<2>;
};

struct ForceApplied {
    static constexpr const char* kMessageType = "forceApplied";
    int32_t envId = 0;
    int32_t bodyId = 0;
    std::vector<double> force;
    bool active = false;

    using serialize = zpp::bits::members<4>;
};

struct StateReport {
    static constexpr const char* kMessageType = "state";
    int32_t envId = 0;
    Observation observation;
    StepInfo info;

    using serialize = zpp::bits::members<3>;
};

struct Error {
    static constexpr const char* kMessageType = "error";
    int32_t envId = -1; // -1 when the failing message carried no usable envId.
    std::string error;
    std::string stack;
    std::string command; // Type of the failing command; empty if it did not decode.

    using serialize = zpp::bits::members<4>;
};

using Reply = std::variant<Initialized, StepResult, ResetDone, ForceApplied, StateReport, Error>;

struct DecodedCommand {
    uint64_t id = 0;
    Command command;
};

struct DecodedReply {
    uint64_t id = 0;
    Reply reply;
};

std::string messageType(const Command& command);
std::string messageType(const Reply& reply);

int envIdOf(const Command& command);
int envIdOf(const Reply& reply);

/**
 * @brief Check field ranges. Returns a description of the first problem found.
 */
std::optional<std::string> validate(const Command& command);
std::optional<std::string> validate(const Reply& reply);

std::vector<std::byte> encodeCommand(uint64_t id, const Command& command);
std::vector<std::byte> encodeReply(uint64_t id, const Reply& reply);

Result<DecodedCommand, std::string> decodeCommand(const std::vector<std::byte>& bytes);
Result<DecodedReply, std::string> decodeReply(const std::vector<std::byte>& bytes);

} // namespace SimPool::UnitProtocol
