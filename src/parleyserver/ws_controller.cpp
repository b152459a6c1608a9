#include "parleyserver/ws_controller.hpp"

#include <cerrno>
#include <cstdlib>

#include "parleyserver/drogon_transport.hpp"
#include "protocol/envelope.hpp"

namespace parley {

bool parse_id(const std::string& s, uint64_t& out) {
    if (s.empty() || s[0] < '0' || s[0] > '9') return false;
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE) return false;
    out = static_cast<uint64_t>(v);
    return true;
}

static FrameType frame_type_of(drogon::WebSocketMessageType type) {
    switch (type) {
    case drogon::WebSocketMessageType::Binary: return FrameType::kBinary;
    case drogon::WebSocketMessageType::Ping:   return FrameType::kPing;
    case drogon::WebSocketMessageType::Pong:   return FrameType::kPong;
    case drogon::WebSocketMessageType::Close:  return FrameType::kClose;
    default:                                   return FrameType::kText;
    }
}

void ConversationSocket::handleNewConnection(
    const drogon::HttpRequestPtr& req,
    const drogon::WebSocketConnectionPtr& conn) {

    const Logger& logger = *ctx_.logger;

    UserId user = 0;
    ConversationId conversation = 0;
    if (!parse_id(req->getHeader("x-parley-user"), user)) {
        logger.warn("Refusing connection from %s: missing or bad X-Parley-User",
                    req->peerAddr().toIpPort().c_str());
        conn->shutdown(drogon::CloseCode::kViolation, "unauthenticated");
        return;
    }
    if (!parse_id(req->getParameter("conversation"), conversation)) {
        logger.warn("Refusing connection of user %lu: bad conversation parameter",
                    user);
        conn->shutdown(drogon::CloseCode::kViolation, "bad conversation");
        return;
    }

    auto transport = std::make_shared<DrogonTransport>(conn);
    auto session = ClientSession::create(*ctx_.pool, ctx_.broker, transport,
                                         conversation, user, ctx_.options,
                                         logger, ctx_.keepalive);
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (closing_) {
            conn->shutdown(drogon::CloseCode::kEndpointGone, "server shutting down");
            return;
        }
        sessions_[session.get()] = session;
    }
    conn->setContext(session);

    if (!session->start()) {
        conn->shutdown(static_cast<drogon::CloseCode>(CLOSE_INTERNAL_ERROR),
                       "session unavailable");
    }
}

void ConversationSocket::handleNewMessage(const drogon::WebSocketConnectionPtr& conn,
                                          std::string&& message,
                                          const drogon::WebSocketMessageType& type) {
    auto session = conn->getContext<ClientSession>();
    if (!session) return;

    std::vector<uint8_t> data(message.begin(), message.end());
    if (!session->on_frame(frame_type_of(type), std::move(data)) && !closing_) {
        ctx_.logger->debug("Frame for stopped session of user %lu dropped",
                           session->user());
    }
}

void ConversationSocket::handleConnectionClosed(
    const drogon::WebSocketConnectionPtr& conn) {
    auto session = conn->getContext<ClientSession>();
    conn->clearContext();
    if (!session) return;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.erase(session.get());
    }
    session->on_closed();
}

size_t ConversationSocket::close_all() {
    std::unordered_map<const ClientSession*, std::weak_ptr<ClientSession>> live;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        closing_ = true;
        live.swap(sessions_);
    }
    size_t stopped = 0;
    for (auto& entry : live) {
        if (auto session = entry.second.lock()) {
            if (session->on_closed()) stopped++;
        }
    }
    return stopped;
}

} // namespace parley
