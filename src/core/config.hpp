#pragma once

#include <cstddef>
#include <cstdint>

namespace parley {

// Keep-alive ping interval for active sessions (seconds)
inline constexpr int DEFAULT_PING_INTERVAL = 30;

// Pending event deliveries a session accepts before reporting a full mailbox
inline constexpr size_t DEFAULT_MAILBOX_CAPACITY = 1024;

// Largest envelope payload accepted from a peer: 16 MB (sanity limit)
inline constexpr uint64_t MAX_PAYLOAD_SIZE = 16 * 1024 * 1024;

// Inbound frames a session holds back while a reply is outstanding
inline constexpr size_t DEFAULT_MAX_HELD_FRAMES = 1024;

// Total size of the held-back frames
inline constexpr size_t DEFAULT_MAX_HELD_BYTES = 4 * MAX_PAYLOAD_SIZE;

} // namespace parley
