#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <drogon/WebSocketController.h>

#include "broker/broker.hpp"
#include "session/client_session.hpp"
#include "session/keepalive.hpp"
#include "util/logger.hpp"
#include "util/worker_pool.hpp"

namespace parley {

// What every connection needs to build its session.
struct SessionContext {
    WorkerPool* pool = nullptr;
    std::shared_ptr<Broker> broker;
    KeepAlive* keepalive = nullptr;
    SessionOptions options;
    const Logger* logger = nullptr;
};

// WebSocket endpoint of a conversation.
//
// The authenticating proxy in front of the server sets the X-Parley-User
// header; the conversation is chosen with the `conversation` query parameter.
// Each connection owns one ClientSession stored as the connection context;
// the controller also tracks live sessions so shutdown can stop them.
class ConversationSocket
    : public drogon::WebSocketController<ConversationSocket, false> {
public:
    explicit ConversationSocket(SessionContext ctx) : ctx_(std::move(ctx)) {}

    void handleNewMessage(const drogon::WebSocketConnectionPtr& conn,
                          std::string&& message,
                          const drogon::WebSocketMessageType& type) override;

    void handleNewConnection(const drogon::HttpRequestPtr& req,
                             const drogon::WebSocketConnectionPtr& conn) override;

    void handleConnectionClosed(const drogon::WebSocketConnectionPtr& conn) override;

    // Refuse new connections and stop every live session without writing to
    // its transport. Returns the number of sessions stopped.
    size_t close_all();

    WS_PATH_LIST_BEGIN
    WS_PATH_ADD("/api/v1/conversations/ws", drogon::Get);
    WS_PATH_LIST_END

private:
    SessionContext ctx_;

    std::mutex sessions_mutex_;
    std::atomic<bool> closing_{false};
    std::unordered_map<const ClientSession*, std::weak_ptr<ClientSession>> sessions_;
};

// Parse a decimal id. Returns false for empty, signed or non-numeric input.
bool parse_id(const std::string& s, uint64_t& out);

} // namespace parley
