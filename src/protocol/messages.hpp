#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "protocol/envelope.hpp"

namespace parley {

// Payload bodies of the envelope kinds. Each body names its kind and the
// flags it is sent with by default.

// First event sent to a client once it has joined the conversation.
struct ConnectedBody {
    static constexpr Kind kKind = Kind::kConnected;
    static constexpr uint16_t kFlags = 0;
};

// A message added to the conversation.
// Wire: u64 id, u64 user, i64 timestamp, body bytes to the end.
struct NewMessageBody {
    static constexpr Kind kKind = Kind::kNewMessage;
    static constexpr uint16_t kFlags = kMustProcess;
    static constexpr size_t kFixedSize = 24;

    EventId id = 0;
    UserId user = 0;
    Timestamp timestamp = 0;
    std::vector<uint8_t> message;
};

// Client request to add a message to the conversation.
struct SendMessageBody {
    static constexpr Kind kKind = Kind::kSendMessage;
    static constexpr uint16_t kFlags = kMustProcess | kResponseRequired;

    std::vector<uint8_t> message;
};

// Reply to an envelope whose kind was not understood.
struct UnknownEventBody {
    static constexpr Kind kKind = Kind::kUnknownEvent;
    static constexpr uint16_t kFlags = 0;
};

// Message accepted. Wire: u64 id.
struct MessageReceivedBody {
    static constexpr Kind kKind = Kind::kMessageReceived;
    static constexpr uint16_t kFlags = 0;

    EventId id = 0;
};

// Message rejected. Wire: UTF-8 diagnostic; an empty payload means none.
struct MessageInvalidBody {
    static constexpr Kind kKind = Kind::kMessageInvalid;
    static constexpr uint16_t kFlags = 0;

    std::optional<std::string> message;
};

} // namespace parley
