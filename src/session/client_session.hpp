#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "broker/broker.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "protocol/cookie.hpp"
#include "protocol/envelope.hpp"
#include "session/keepalive.hpp"
#include "session/transport.hpp"
#include "util/actor.hpp"
#include "util/logger.hpp"

namespace parley {

enum class SessionState : uint8_t {
    kStarting = 0,
    kActive,
    kStopping,
    kStopped,
};

const char* session_state_name(SessionState state);

enum class FrameType : uint8_t {
    kBinary = 0,
    kText,
    kPing,
    kPong,
    kClose,
};

struct SessionOptions {
    // Queued broker events above which further deliveries are refused
    size_t mailbox_capacity = DEFAULT_MAILBOX_CAPACITY;
    // Inbound frames held back while suspended; one more closes the session
    size_t max_held_frames = DEFAULT_MAX_HELD_FRAMES;
    size_t max_held_bytes = DEFAULT_MAX_HELD_BYTES;
};

// Session mailbox messages.
struct StartRequest {};

struct TransportFrame {
    FrameType type = FrameType::kBinary;
    std::vector<uint8_t> data;
};

struct ConnectReply {
    ConnectStatus status = ConnectStatus::kOk;
};

struct SendReply {
    Cookie cookie;
    uint16_t flags = 0;  // flags of the request being answered
    NewMessageResult result;
};

struct EventDelivered {
    EventPtr event;
};

struct KeepAliveTick {};

struct StopRequest {
    uint16_t code = CLOSE_NORMAL;
    std::string reason;
    bool close_transport = false;  // false when the peer already closed
};

using SessionInput = std::variant<StartRequest, TransportFrame, ConnectReply,
                                  SendReply, EventDelivered, KeepAliveTick,
                                  StopRequest>;

// Server side of one client connection in one conversation.
//
// Inbound frames are handled in arrival order. While the session is joining
// the conversation, and while a request flagged RESPONSE_REQUIRED is waiting
// for its reply, later frames are held back and handled once the session
// resumes. Broker events are pushed to the client as NewMessage envelopes.
class ClientSession : public Actor<SessionInput>,
                      public EventListener,
                      public KeepAliveTarget {
public:
    static std::shared_ptr<ClientSession> create(WorkerPool& pool,
                                                 std::shared_ptr<Broker> broker,
                                                 std::shared_ptr<Transport> transport,
                                                 ConversationId conversation,
                                                 UserId user,
                                                 const SessionOptions& options,
                                                 const Logger& logger,
                                                 KeepAlive* keepalive = nullptr);

    ClientSession(WorkerPool& pool, std::shared_ptr<Broker> broker,
                  std::shared_ptr<Transport> transport,
                  ConversationId conversation, UserId user,
                  const SessionOptions& options, const Logger& logger,
                  KeepAlive* keepalive);

    // Join the conversation. Returns false if the session is already stopped.
    bool start();

    // Inbound frame from the transport.
    bool on_frame(FrameType type, std::vector<uint8_t> data);

    // The transport has gone away.
    bool on_closed();

    // Stop the session and close the transport with code.
    bool stop(uint16_t code, const std::string& reason);

    // EventListener
    bool deliver(const EventPtr& event) override;

    // KeepAliveTarget
    void keepalive_tick() override;

    SessionState state() const { return state_.load(std::memory_order_acquire); }
    ConversationId conversation() const { return conversation_; }
    UserId user() const { return user_; }

protected:
    void handle(SessionInput& msg) override;

private:
    std::shared_ptr<Broker> broker_;
    std::shared_ptr<Transport> transport_;
    ConversationId conversation_;
    UserId user_;
    SessionOptions options_;
    const Logger& logger_;
    KeepAlive* keepalive_;

    std::atomic<SessionState> state_{SessionState::kStarting};
    // EventDelivered messages posted but not yet handled
    std::atomic<size_t> queued_events_{0};
    CookieGenerator cookies_{Origin::kServer};

    // Inbound frames are held back while suspended_ is set.
    bool suspended_ = true;
    std::deque<TransportFrame> pending_frames_;
    size_t held_bytes_ = 0;

    std::shared_ptr<ClientSession> self();
    std::weak_ptr<ClientSession> weak_self();

    void on_start();
    void on_connect_reply(const ConnectReply& reply);
    void on_frame_input(TransportFrame& frame);
    void on_send_reply(const SendReply& reply);
    void on_event(const EventDelivered& ev);

    void process_frame(TransportFrame& frame);
    void process_envelope(Envelope& env);
    void resume();

    void send(const std::vector<uint8_t>& data);

    // Terminate with an error close code.
    void fail(uint16_t code, const std::string& reason);

    void shutdown(uint16_t code, const std::string& reason, bool close_transport);
};

} // namespace parley
