#include "UnitProtocol.h"
#include "BinaryProtocol.h"
#include "core/physics/EnvironmentType.h"

#include <algorithm>
#include <cmath>
#include <type_traits>

namespace SimPool::UnitProtocol {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

bool allFinite(const std::vector<double>& values)
{
    return std::all_of(values.begin(), values.end(), [](double v) { return std::isfinite(v); });
}

std::optional<std::string> checkEnvId(int32_t envId)
{
    if (envId < 0) {
        return "envId must be non-negative, got " + std::to_string(envId);
    }
    return std::nullopt;
}

std::optional<std::string> checkVector3(const std::vector<double>& values, const char* field)
{
    if (values.size() != 3) {
        return std::string(field) + " must have 3 components, got "
            + std::to_string(values.size());
    }
    if (!allFinite(values)) {
        return std::string(field) + " contains non-finite values";
    }
    return std::nullopt;
}

// Walks the variant alternatives and decodes the one whose kMessageType matches.
template <typename Variant, size_t Index = 0>
std::optional<Variant> decodeAlternative(
    const std::string& messageType, const std::vector<std::byte>& payload)
{
    if constexpr (Index < std::variant_size_v<Variant>) {
        using Alternative = std::variant_alternative_t<Index, Variant>;
        if (messageType == Alternative::kMessageType) {
            return Variant{ std::in_place_index<Index>,
                            Network::deserialize_payload<Alternative>(payload) };
        }
        return decodeAlternative<Variant, Index + 1>(messageType, payload);
    }
    else {
        return std::nullopt;
    }
}

template <typename Variant>
std::vector<std::byte> encodeVariant(uint64_t id, const Variant& message)
{
    return std::visit(
        [id](const auto& alternative) {
            using T = std::decay_t<decltype(alternative)>;
            return Network::serialize_envelope(
                Network::make_envelope(id, T::kMessageType, alternative));
        },
        message);
}

template <typename Decoded, typename Variant>
Result<Decoded, std::string> decodeVariant(const std::vector<std::byte>& bytes, const char* kind)
{
    using DecodeResult = Result<Decoded, std::string>;

    Network::MessageEnvelope envelope;
    std::optional<Variant> message;
    try {
        envelope = Network::deserialize_envelope(bytes);
        message = decodeAlternative<Variant>(envelope.message_type, envelope.payload);
    }
    catch (const std::exception& e) {
        return DecodeResult::error(std::string("Malformed ") + kind + " frame: " + e.what());
    }

    if (!message.has_value()) {
        return DecodeResult::error(
            std::string("Unknown ") + kind + " type '" + envelope.message_type + "'");
    }

    if (auto problem = validate(message.value())) {
        return DecodeResult::error(
            "Invalid '" + envelope.message_type + "' " + kind + ": " + problem.value());
    }

    return DecodeResult::okay(Decoded{ envelope.id, std::move(message.value()) });
}

} // namespace

std::string messageType(const Command& command)
{
    return std::visit(
        [](const auto& msg) -> std::string { return std::decay_t<decltype(msg)>::kMessageType; },
        command);
}

std::string messageType(const Reply& reply)
{
    return std::visit(
        [](const auto& msg) -> std::string { return std::decay_t<decltype(msg)>::kMessageType; },
        reply);
}

int envIdOf(const Command& command)
{
    return std::visit([](const auto& msg) { return static_cast<int>(msg.envId); }, command);
}

int envIdOf(const Reply& reply)
{
    return std::visit([](const auto& msg) { return static_cast<int>(msg.envId); }, reply);
}

std::optional<std::string> validate(const Command& command)
{
    return std::visit(
        Overloaded{
            [](const Init& msg) -> std::optional<std::string> {
                if (!Environment::fromString(msg.envType).has_value()) {
                    return "unknown envType '" + msg.envType + "'";
                }
                return checkEnvId(msg.envId);
            },
            [](const Step& msg) -> std::optional<std::string> {
                if (!allFinite(msg.actions)) {
                    return "actions contain non-finite values";
                }
                return checkEnvId(msg.envId);
            },
            [](const ApplyForce& msg) -> std::optional<std::string> {
                if (msg.bodyId < 0) {
                    return "bodyId must be non-negative";
                }
                if (auto problem = checkVector3(msg.force, "force")) {
                    return problem;
                }
                if (auto problem = checkVector3(msg.point, "point")) {
                    return problem;
                }
                return checkEnvId(msg.envId);
            },
            [](const auto& msg) -> std::optional<std::string> { return checkEnvId(msg.envId); },
        },
        command);
}

std::optional<std::string> validate(const Reply& reply)
{
    return std::visit(
        Overloaded{
            [](const StepResult& msg) -> std::optional<std::string> {
                if (!isFinite(msg.observation)) {
                    return "observation contains non-finite values";
                }
                return checkEnvId(msg.envId);
            },
            [](const ResetDone& msg) -> std::optional<std::string> {
                if (!isFinite(msg.observation)) {
                    return "observation contains non-finite values";
                }
                return checkEnvId(msg.envId);
            },
            [](const ForceApplied& msg) -> std::optional<std::string> {
                if (auto problem = checkVector3(msg.force, "force")) {
                    return problem;
                }
                return checkEnvId(msg.envId);
            },
            // Errors may originate from a frame whose envId could not be read.
            [](const Error&) -> std::optional<std::string> { return std::nullopt; },
            [](const auto& msg) -> std::optional<std::string> { return checkEnvId(msg.envId); },
        },
        reply);
}

std::vector<std::byte> encodeCommand(uint64_t id, const Command& command)
{
    return encodeVariant(id, command);
}

std::vector<std::byte> encodeReply(uint64_t id, const Reply& reply)
{
    return encodeVariant(id, reply);
}

Result<DecodedCommand, std::string> decodeCommand(const std::vector<std::byte>& bytes)
{
    return decodeVariant<DecodedCommand, Command>(bytes, "command");
}

Result<DecodedReply, std::string> decodeReply(const std::vector<std::byte>& bytes)
{
    return decodeVariant<DecodedReply, Reply>(bytes, "reply");
}

} // namespace SimPool::UnitProtocol
