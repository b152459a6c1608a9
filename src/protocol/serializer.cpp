#include "protocol/serializer.hpp"

#include "protocol/byte_io.hpp"
#include "protocol/message_format.hpp"

namespace parley {

std::vector<uint8_t> serialize(const ConnectedBody&) {
    return {};
}

std::vector<uint8_t> serialize(const UnknownEventBody&) {
    return {};
}

// --- NewMessage ---

std::vector<uint8_t> serialize(const NewMessageBody& body) {
    std::vector<uint8_t> buf;
    buf.reserve(NewMessageBody::kFixedSize + body.message.size());
    put_u64(buf, body.id);
    put_u64(buf, body.user);
    put_i64(buf, body.timestamp);
    put_bytes(buf, body.message.data(), body.message.size());
    return buf;
}

bool deserialize(const std::vector<uint8_t>& data, NewMessageBody& body) {
    ByteReader r(data.data(), data.size());

    if (!r.get_u64(body.id)) return false;
    if (!r.get_u64(body.user)) return false;
    if (!r.get_i64(body.timestamp)) return false;

    body.message = r.rest().to_vector();
    return true;
}

// --- SendMessage ---

std::vector<uint8_t> serialize(const SendMessageBody& body) {
    return body.message;
}

bool deserialize(const std::vector<uint8_t>& data, SendMessageBody& body) {
    body.message = data;
    return true;
}

// --- MessageReceived ---

std::vector<uint8_t> serialize(const MessageReceivedBody& body) {
    std::vector<uint8_t> buf;
    buf.reserve(8);
    put_u64(buf, body.id);
    return buf;
}

bool deserialize(const std::vector<uint8_t>& data, MessageReceivedBody& body) {
    ByteReader r(data.data(), data.size());
    if (!r.get_u64(body.id)) return false;
    return r.empty();
}

// --- MessageInvalid ---

std::vector<uint8_t> serialize(const MessageInvalidBody& body) {
    if (!body.message) return {};
    return std::vector<uint8_t>(body.message->begin(), body.message->end());
}

bool deserialize(const std::vector<uint8_t>& data, MessageInvalidBody& body) {
    if (data.empty()) {
        body.message.reset();
        return true;
    }
    if (!is_valid_utf8(data.data(), data.size())) return false;
    body.message = std::string(data.begin(), data.end());
    return true;
}

} // namespace parley
