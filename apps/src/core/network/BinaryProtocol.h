#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include <zpp_bits.h>

namespace SimPool::Network {

/**
 * @brief Binary frame carried between the orchestrator and simulation units.
 *
 * id correlates a reply with its request; 0 means no reply is being awaited.
 * payload holds the zpp_bits encoding of the message named by message_type.
 */
struct MessageEnvelope {
    uint64_t id = 0;
    std::string message_type;
    std::vector<std::byte> payload;

    using serialize = zpp::bits::members<3>;
};

std::vector<std::byte> serialize_envelope(const MessageEnvelope& envelope);

/**
 * @brief Decode a frame. Throws std::runtime_error on truncated or trailing bytes.
 */
MessageEnvelope deserialize_envelope(const std::vector<std::byte>& bytes);

template <typename T>
std::vector<std::byte> serialize_payload(const T& message)
{
    std::vector<std::byte> payload;
    zpp::bits::out out(payload);
    out(message).or_throw();
    return payload;
}

/**
 * @brief Decode a payload, requiring every byte to be consumed.
 */
template <typename T>
T deserialize_payload(const std::vector<std::byte>& payload)
{
    T message{};
    zpp::bits::in in(payload);
    in(message).or_throw();
    if (in.position() != payload.size()) {
        throw std::runtime_error(
            "Payload has " + std::to_string(payload.size() - in.position()) + " trailing bytes");
    }
    return message;
}

template <typename T>
MessageEnvelope make_envelope(uint64_t id, const std::string& messageType, const T& message)
{
    return MessageEnvelope{
        .id = id,
        .message_type = messageType,
        .payload = serialize_payload(message),
    };
}

} // namespace SimPool::Network
