#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "protocol/cookie.hpp"

namespace parley {

// Envelope kinds. Codes with bit 15 set are responses.
enum class Kind : uint16_t {
    // Server -> Client, once after a successful join
    kConnected       = 0x0000,
    // Server -> Client, broadcast of a persisted message
    kNewMessage      = 0x0001,
    // Client -> Server, candidate message body
    kSendMessage     = 0x0002,

    // Either direction: received kind was not understood
    kUnknownEvent    = 0x8000,
    // Server -> Client, message accepted
    kMessageReceived = 0x8001,
    // Server -> Client, message rejected
    kMessageInvalid  = 0x8002,
};

// Map a wire code to a known kind. Returns false for unknown codes.
bool kind_from_u16(uint16_t code, Kind& kind);

inline bool is_response_kind(uint16_t code) { return (code & 0x8000) != 0; }

// Envelope flags (bitmask)
enum EnvelopeFlag : uint16_t {
    kMustProcess      = 0x0001,  // receiver must understand the kind or abort
    kResponseRequired = 0x0002,  // sender waits for the correlated reply
};

inline constexpr uint16_t KNOWN_FLAGS = kMustProcess | kResponseRequired;

// Fixed header: cookie (8) + kind (2) + flags (2); a varint payload length follows.
inline constexpr size_t ENVELOPE_FIXED_SIZE = 12;

// WebSocket close codes
inline constexpr uint16_t CLOSE_NORMAL             = 1000;
inline constexpr uint16_t CLOSE_UNSUPPORTED_DATA   = 1003;
inline constexpr uint16_t CLOSE_POLICY_VIOLATION   = 1008;
inline constexpr uint16_t CLOSE_MESSAGE_TOO_BIG    = 1009;
inline constexpr uint16_t CLOSE_INTERNAL_ERROR     = 1011;
inline constexpr uint16_t CLOSE_MALFORMED_ENVELOPE = 4000;
inline constexpr uint16_t CLOSE_UNSUPPORTED_KIND   = 4001;
inline constexpr uint16_t CLOSE_LENGTH_MISMATCH    = 4002;
inline constexpr uint16_t CLOSE_BAD_FLAGS          = 4004;

enum class EnvelopeError : uint8_t {
    kNone = 0,
    kUnderflow,       // shorter than the fixed header, or bad length varint
    kLengthMismatch,  // declared payload length != available bytes
    kTooLarge,        // declared payload length above MAX_PAYLOAD_SIZE
    kBadFlags,        // unknown flag bits
};

// Close code used when terminating a connection because of err.
uint16_t close_code_for(EnvelopeError err);

const char* envelope_error_name(EnvelopeError err);

struct Envelope {
    Cookie cookie;
    uint16_t kind = 0;
    uint16_t flags = 0;
    std::vector<uint8_t> payload;

    bool has_flag(EnvelopeFlag f) const { return (flags & f) != 0; }
};

// Encode an envelope into a new buffer.
std::vector<uint8_t> encode_envelope(const Envelope& env);

// Encode header + payload without building an Envelope first.
std::vector<uint8_t> encode_envelope(Cookie cookie, Kind kind, uint16_t flags,
                                     const std::vector<uint8_t>& payload);

// Parse an envelope from one transport message.
// Returns kNone on success.
EnvelopeError parse_envelope(const uint8_t* data, size_t size, Envelope& out);

} // namespace parley
