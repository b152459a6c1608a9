#pragma once

#include <cstdint>
#include <memory>
#include <vector>

namespace parley {

// Identifiers are owned by the message store; this code only references them.
using ConversationId = uint64_t;
using UserId = uint64_t;
using EventId = uint64_t;

// Seconds since the Unix epoch.
using Timestamp = int64_t;

// A persisted message, broadcast read-only to every listener of its
// conversation.
struct Event {
    ConversationId conversation = 0;
    EventId id = 0;
    UserId user = 0;
    Timestamp timestamp = 0;
    std::vector<uint8_t> body;
};

using EventPtr = std::shared_ptr<const Event>;

} // namespace parley
