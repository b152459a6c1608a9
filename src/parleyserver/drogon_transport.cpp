#include "parleyserver/drogon_transport.hpp"

namespace parley {

void DrogonTransport::send_binary(const std::vector<uint8_t>& data) {
    if (!conn_->connected()) return;
    conn_->send(reinterpret_cast<const char*>(data.data()), data.size(),
                drogon::WebSocketMessageType::Binary);
}

void DrogonTransport::send_ping() {
    if (!conn_->connected()) return;
    conn_->send("", 0, drogon::WebSocketMessageType::Ping);
}

void DrogonTransport::close(uint16_t code, const std::string& reason) {
    conn_->shutdown(static_cast<drogon::CloseCode>(code), reason);
}

} // namespace parley
