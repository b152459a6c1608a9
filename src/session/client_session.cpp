#include "session/client_session.hpp"

#include "protocol/messages.hpp"
#include "protocol/serializer.hpp"

namespace parley {

const char* session_state_name(SessionState state) {
    switch (state) {
    case SessionState::kStarting: return "starting";
    case SessionState::kActive:   return "active";
    case SessionState::kStopping: return "stopping";
    case SessionState::kStopped:  return "stopped";
    }
    return "?";
}

std::shared_ptr<ClientSession> ClientSession::create(WorkerPool& pool,
                                                     std::shared_ptr<Broker> broker,
                                                     std::shared_ptr<Transport> transport,
                                                     ConversationId conversation,
                                                     UserId user,
                                                     const SessionOptions& options,
                                                     const Logger& logger,
                                                     KeepAlive* keepalive) {
    return std::make_shared<ClientSession>(pool, std::move(broker),
                                           std::move(transport), conversation,
                                           user, options, logger, keepalive);
}

ClientSession::ClientSession(WorkerPool& pool, std::shared_ptr<Broker> broker,
                             std::shared_ptr<Transport> transport,
                             ConversationId conversation, UserId user,
                             const SessionOptions& options, const Logger& logger,
                             KeepAlive* keepalive)
    : Actor<SessionInput>(pool),
      broker_(std::move(broker)),
      transport_(std::move(transport)),
      conversation_(conversation),
      user_(user),
      options_(options),
      logger_(logger),
      keepalive_(keepalive) {}

std::shared_ptr<ClientSession> ClientSession::self() {
    return std::static_pointer_cast<ClientSession>(shared_from_this());
}

std::weak_ptr<ClientSession> ClientSession::weak_self() {
    return self();
}

bool ClientSession::start() {
    return post(StartRequest{});
}

bool ClientSession::on_frame(FrameType type, std::vector<uint8_t> data) {
    TransportFrame frame;
    frame.type = type;
    frame.data = std::move(data);
    return post(std::move(frame));
}

bool ClientSession::on_closed() {
    StopRequest req;
    req.code = CLOSE_NORMAL;
    req.close_transport = false;
    return post(std::move(req));
}

bool ClientSession::stop(uint16_t code, const std::string& reason) {
    StopRequest req;
    req.code = code;
    req.reason = reason;
    req.close_transport = true;
    return post(std::move(req));
}

bool ClientSession::deliver(const EventPtr& event) {
    if (mailbox_closed()) return false;
    size_t queued = queued_events_.load(std::memory_order_acquire);
    if (queued >= options_.mailbox_capacity) {
        logger_.warn("Session of user %lu: mailbox full (%zu events queued)",
                     user_, queued);
        return false;
    }
    queued_events_.fetch_add(1, std::memory_order_acq_rel);
    if (!post(EventDelivered{event})) {
        queued_events_.fetch_sub(1, std::memory_order_acq_rel);
        return false;
    }
    return true;
}

void ClientSession::keepalive_tick() {
    post(KeepAliveTick{});  // refused once stopped
}

void ClientSession::handle(SessionInput& msg) {
    if (state() == SessionState::kStopped) return;

    if (std::holds_alternative<StartRequest>(msg)) {
        on_start();
    } else if (auto* m = std::get_if<TransportFrame>(&msg)) {
        on_frame_input(*m);
    } else if (auto* m = std::get_if<ConnectReply>(&msg)) {
        on_connect_reply(*m);
    } else if (auto* m = std::get_if<SendReply>(&msg)) {
        on_send_reply(*m);
    } else if (auto* m = std::get_if<EventDelivered>(&msg)) {
        on_event(*m);
    } else if (std::holds_alternative<KeepAliveTick>(msg)) {
        if (state() == SessionState::kActive && transport_) transport_->send_ping();
    } else if (auto* m = std::get_if<StopRequest>(&msg)) {
        shutdown(m->code, m->reason, m->close_transport);
    }
}

void ClientSession::on_start() {
    if (state() != SessionState::kStarting) return;

    std::weak_ptr<ClientSession> weak = weak_self();
    ListenerRef listener = std::weak_ptr<EventListener>(self());
    bool posted = broker_->connect(user_, conversation_, listener,
                                   [weak](ConnectStatus status) {
                                       if (auto s = weak.lock()) {
                                           s->post(ConnectReply{status});
                                       }
                                   });
    if (!posted) {
        fail(CLOSE_INTERNAL_ERROR, "broker unavailable");
    }
}

void ClientSession::on_connect_reply(const ConnectReply& reply) {
    if (state() != SessionState::kStarting) return;

    if (reply.status != ConnectStatus::kOk) {
        logger_.warn("User %lu cannot join conversation %lu: %s",
                     user_, conversation_,
                     connect_status_name(reply.status));
        fail(CLOSE_INTERNAL_ERROR, connect_status_name(reply.status));
        return;
    }

    send(build_envelope(cookies_.next(), ConnectedBody{}));
    if (keepalive_) keepalive_->add(self());
    state_.store(SessionState::kActive, std::memory_order_release);

    logger_.info("User %lu joined conversation %lu",
                 user_, conversation_);

    suspended_ = false;
    resume();
}

void ClientSession::on_frame_input(TransportFrame& frame) {
    if (suspended_) {
        if (pending_frames_.size() >= options_.max_held_frames) {
            fail(CLOSE_POLICY_VIOLATION, "too many frames while waiting for a reply");
            return;
        }
        if (held_bytes_ + frame.data.size() > options_.max_held_bytes) {
            fail(CLOSE_MESSAGE_TOO_BIG, "too much data while waiting for a reply");
            return;
        }
        held_bytes_ += frame.data.size();
        pending_frames_.push_back(std::move(frame));
        return;
    }
    process_frame(frame);
    resume();
}

void ClientSession::resume() {
    while (!suspended_ && !pending_frames_.empty() &&
           state() == SessionState::kActive) {
        TransportFrame frame = std::move(pending_frames_.front());
        pending_frames_.pop_front();
        held_bytes_ -= frame.data.size();
        process_frame(frame);
    }
}

void ClientSession::process_frame(TransportFrame& frame) {
    switch (frame.type) {
    case FrameType::kPing:
    case FrameType::kPong:
        return;
    case FrameType::kClose:
        shutdown(CLOSE_NORMAL, "", true);
        return;
    case FrameType::kText:
        fail(CLOSE_UNSUPPORTED_DATA, "text frames are not supported");
        return;
    case FrameType::kBinary:
        break;
    }

    Envelope env;
    EnvelopeError err = parse_envelope(frame.data.data(), frame.data.size(), env);
    if (err != EnvelopeError::kNone) {
        fail(close_code_for(err), envelope_error_name(err));
        return;
    }
    process_envelope(env);
}

void ClientSession::process_envelope(Envelope& env) {
    // Replies to our own pushes carry server cookies; nothing waits for them.
    if (env.cookie.is_server()) {
        logger_.debug("Session of user %lu: ignoring reply kind 0x%04x",
                      user_, env.kind);
        return;
    }

    Kind kind;
    bool known = kind_from_u16(env.kind, kind);

    if (known && kind == Kind::kSendMessage) {
        SendMessageBody body;
        if (!deserialize(env.payload, body)) {
            fail(CLOSE_MALFORMED_ENVELOPE, "bad SendMessage body");
            return;
        }

        std::weak_ptr<ClientSession> weak = weak_self();
        Cookie cookie = env.cookie;
        uint16_t flags = env.flags;
        bool posted = broker_->new_message(
            conversation_, user_, std::move(body.message),
            [weak, cookie, flags](const NewMessageResult& result) {
                if (auto s = weak.lock()) {
                    s->post(SendReply{cookie, flags, result});
                }
            });
        if (!posted) {
            fail(CLOSE_INTERNAL_ERROR, "broker unavailable");
            return;
        }
        if (env.has_flag(kResponseRequired)) suspended_ = true;
        return;
    }

    if (known && kind == Kind::kUnknownEvent) {
        return;
    }

    if (env.has_flag(kMustProcess)) {
        logger_.warn("Session of user %lu: unsupported mandatory kind 0x%04x",
                     user_, env.kind);
        fail(CLOSE_UNSUPPORTED_KIND, "unsupported kind");
        return;
    }
    send(build_envelope(env.cookie, UnknownEventBody{}));
}

void ClientSession::on_send_reply(const SendReply& reply) {
    if (state() != SessionState::kActive) return;

    const NewMessageResult& r = reply.result;
    switch (r.status) {
    case NewMessageStatus::kOk: {
        MessageReceivedBody body;
        body.id = r.id;
        send(build_envelope(reply.cookie, body));
        break;
    }
    case NewMessageStatus::kInvalid: {
        MessageInvalidBody body;
        body.message = r.validation.to_string();
        send(build_envelope(reply.cookie, body));
        break;
    }
    case NewMessageStatus::kStoreError: {
        MessageInvalidBody body;
        body.message = std::string("internal error");
        send(build_envelope(reply.cookie, body));
        break;
    }
    }

    if (reply.flags & kResponseRequired) {
        suspended_ = false;
        resume();
    }
}

void ClientSession::on_event(const EventDelivered& ev) {
    queued_events_.fetch_sub(1, std::memory_order_acq_rel);
    if (state() != SessionState::kActive) {
        logger_.debug("Session of user %lu: dropping event %lu while %s",
                      user_, ev.event->id,
                      session_state_name(state()));
        return;
    }

    NewMessageBody body;
    body.id = ev.event->id;
    body.user = ev.event->user;
    body.timestamp = ev.event->timestamp;
    body.message = ev.event->body;
    send(build_envelope(cookies_.next(), body));
}

void ClientSession::send(const std::vector<uint8_t>& data) {
    if (transport_) transport_->send_binary(data);
}

void ClientSession::fail(uint16_t code, const std::string& reason) {
    logger_.warn("Closing session of user %lu in conversation %lu: %u %s",
                 user_, conversation_,
                 static_cast<unsigned>(code), reason.c_str());
    shutdown(code, reason, true);
}

void ClientSession::shutdown(uint16_t code, const std::string& reason,
                             bool close_transport) {
    SessionState prev = state();
    if (prev == SessionState::kStopped) return;
    state_.store(SessionState::kStopping, std::memory_order_release);

    if (keepalive_) keepalive_->remove(this);

    ListenerRef listener = std::weak_ptr<EventListener>(self());
    if (!broker_->disconnect(conversation_, listener)) {
        logger_.debug("Broker is shutting down, session of user %lu not removed",
                      user_);
    }

    if (close_transport && transport_) transport_->close(code, reason);
    transport_.reset();
    pending_frames_.clear();
    held_bytes_ = 0;
    suspended_ = false;

    close_mailbox();
    state_.store(SessionState::kStopped, std::memory_order_release);

    if (prev != SessionState::kStarting) {
        logger_.info("User %lu left conversation %lu",
                     user_, conversation_);
    }
}

} // namespace parley
