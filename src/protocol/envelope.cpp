#include "protocol/envelope.hpp"

#include "core/config.hpp"
#include "protocol/byte_io.hpp"

namespace parley {

bool kind_from_u16(uint16_t code, Kind& kind) {
    switch (code) {
    case 0x0000: kind = Kind::kConnected; return true;
    case 0x0001: kind = Kind::kNewMessage; return true;
    case 0x0002: kind = Kind::kSendMessage; return true;
    case 0x8000: kind = Kind::kUnknownEvent; return true;
    case 0x8001: kind = Kind::kMessageReceived; return true;
    case 0x8002: kind = Kind::kMessageInvalid; return true;
    default: return false;
    }
}

uint16_t close_code_for(EnvelopeError err) {
    switch (err) {
    case EnvelopeError::kUnderflow:      return CLOSE_MALFORMED_ENVELOPE;
    case EnvelopeError::kLengthMismatch: return CLOSE_LENGTH_MISMATCH;
    case EnvelopeError::kTooLarge:       return CLOSE_MESSAGE_TOO_BIG;
    case EnvelopeError::kBadFlags:       return CLOSE_BAD_FLAGS;
    case EnvelopeError::kNone:           break;
    }
    return CLOSE_NORMAL;
}

const char* envelope_error_name(EnvelopeError err) {
    switch (err) {
    case EnvelopeError::kNone:           return "none";
    case EnvelopeError::kUnderflow:      return "envelope too short";
    case EnvelopeError::kLengthMismatch: return "payload length mismatch";
    case EnvelopeError::kTooLarge:       return "payload too large";
    case EnvelopeError::kBadFlags:       return "unknown flags";
    }
    return "?";
}

static std::vector<uint8_t> encode(Cookie cookie, uint16_t kind, uint16_t flags,
                                   const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> buf;
    buf.reserve(ENVELOPE_FIXED_SIZE + varint_size(payload.size()) + payload.size());
    put_u64(buf, cookie.raw());
    put_u16(buf, kind);
    put_u16(buf, flags);
    put_varint(buf, payload.size());
    put_bytes(buf, payload.data(), payload.size());
    return buf;
}

std::vector<uint8_t> encode_envelope(Cookie cookie, Kind kind, uint16_t flags,
                                     const std::vector<uint8_t>& payload) {
    return encode(cookie, static_cast<uint16_t>(kind), flags, payload);
}

std::vector<uint8_t> encode_envelope(const Envelope& env) {
    return encode(env.cookie, env.kind, env.flags, env.payload);
}

EnvelopeError parse_envelope(const uint8_t* data, size_t size, Envelope& out) {
    ByteReader r(data, size);

    uint64_t cookie;
    if (!r.get_u64(cookie)) return EnvelopeError::kUnderflow;
    if (!r.get_u16(out.kind)) return EnvelopeError::kUnderflow;
    if (!r.get_u16(out.flags)) return EnvelopeError::kUnderflow;
    out.cookie = Cookie(cookie);

    if (out.flags & ~KNOWN_FLAGS) return EnvelopeError::kBadFlags;

    uint64_t length;
    if (r.get_varint(length) != VarintStatus::kOk) return EnvelopeError::kUnderflow;
    if (length > MAX_PAYLOAD_SIZE) return EnvelopeError::kTooLarge;
    if (length != r.remaining()) return EnvelopeError::kLengthMismatch;

    ByteRange payload = r.rest();
    out.payload.assign(payload.data, payload.data + payload.size);
    return EnvelopeError::kNone;
}

} // namespace parley
