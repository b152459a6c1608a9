#pragma once

#include <cstdint>
#include <vector>

#include "protocol/cookie.hpp"
#include "protocol/envelope.hpp"
#include "protocol/messages.hpp"

namespace parley {

// Serialize message bodies to byte vectors (for envelope payloads).

std::vector<uint8_t> serialize(const ConnectedBody& body);
std::vector<uint8_t> serialize(const NewMessageBody& body);
std::vector<uint8_t> serialize(const SendMessageBody& body);
std::vector<uint8_t> serialize(const UnknownEventBody& body);
std::vector<uint8_t> serialize(const MessageReceivedBody& body);
std::vector<uint8_t> serialize(const MessageInvalidBody& body);

// Deserialize message bodies from byte vectors.
// Returns false on malformed data.

bool deserialize(const std::vector<uint8_t>& data, NewMessageBody& body);
bool deserialize(const std::vector<uint8_t>& data, SendMessageBody& body);
bool deserialize(const std::vector<uint8_t>& data, MessageReceivedBody& body);
bool deserialize(const std::vector<uint8_t>& data, MessageInvalidBody& body);

// Encode a complete envelope carrying body, with the body's default flags.
template <typename Body>
std::vector<uint8_t> build_envelope(Cookie cookie, const Body& body) {
    return encode_envelope(cookie, Body::kKind, Body::kFlags, serialize(body));
}

} // namespace parley
