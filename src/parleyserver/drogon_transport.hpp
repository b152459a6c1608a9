#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <drogon/WebSocketConnection.h>

#include "session/transport.hpp"

namespace parley {

// Transport over a drogon WebSocket connection.
class DrogonTransport : public Transport {
public:
    explicit DrogonTransport(drogon::WebSocketConnectionPtr conn)
        : conn_(std::move(conn)) {}

    void send_binary(const std::vector<uint8_t>& data) override;
    void send_ping() override;
    void close(uint16_t code, const std::string& reason) override;

private:
    drogon::WebSocketConnectionPtr conn_;
};

} // namespace parley
