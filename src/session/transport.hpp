#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace parley {

// Outbound half of a client connection (a WebSocket in the server).
// Inbound frames are pushed into the session by whoever owns the socket.
// Methods may be called from any thread.
class Transport {
public:
    virtual ~Transport() = default;

    virtual void send_binary(const std::vector<uint8_t>& data) = 0;
    virtual void send_ping() = 0;

    // Send a close frame and shut the connection down.
    virtual void close(uint16_t code, const std::string& reason) = 0;
};

} // namespace parley
