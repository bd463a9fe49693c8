#include "BinaryProtocol.h"

namespace SimPool::Network {

std::vector<std::byte> serialize_envelope(const MessageEnvelope& envelope)
{
    std::vector<std::byte> bytes;
    zpp::bits::out out(bytes);
    out(envelope).or_throw();
    return bytes;
}

MessageEnvelope deserialize_envelope(const std::vector<std::byte>& bytes)
{
    if (bytes.empty()) {
        throw std::runtime_error("Empty message frame");
    }
    return deserialize_payload<MessageEnvelope>(bytes);
}

} // namespace SimPool::Network
