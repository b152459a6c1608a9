#include "broker/broker.hpp"

#include <algorithm>

namespace parley {

static bool same_listener(const ListenerRef& a, const ListenerRef& b) {
    return !a.owner_before(b) && !b.owner_before(a);
}

const char* connect_status_name(ConnectStatus status) {
    switch (status) {
    case ConnectStatus::kOk:         return "ok";
    case ConnectStatus::kNotMember:  return "not a member";
    case ConnectStatus::kStoreError: return "store error";
    }
    return "?";
}

std::shared_ptr<Broker> Broker::create(WorkerPool& pool,
                                       MessageStore& store,
                                       const BrokerOptions& options,
                                       const Logger& logger,
                                       MemberNotifier* notifier) {
    return std::make_shared<Broker>(pool, store, options, logger, notifier);
}

Broker::Broker(WorkerPool& pool, MessageStore& store,
               const BrokerOptions& options, const Logger& logger,
               MemberNotifier* notifier)
    : Actor<BrokerMessage>(pool),
      store_(store),
      options_(options),
      logger_(logger),
      notifier_(notifier) {}

bool Broker::connect(UserId user, ConversationId conversation,
                     ListenerRef listener, ConnectCallback done) {
    BrokerConnect msg;
    msg.user = user;
    msg.conversation = conversation;
    msg.listener = std::move(listener);
    msg.done = std::move(done);
    return post(std::move(msg));
}

bool Broker::disconnect(ConversationId conversation, ListenerRef listener) {
    BrokerDisconnect msg;
    msg.conversation = conversation;
    msg.listener = std::move(listener);
    return post(std::move(msg));
}

bool Broker::new_message(ConversationId conversation, UserId user,
                         std::vector<uint8_t> body, NewMessageCallback done) {
    BrokerNewMessage msg;
    msg.conversation = conversation;
    msg.user = user;
    msg.body = std::move(body);
    msg.done = std::move(done);
    return post(std::move(msg));
}

bool Broker::stats(ConversationId conversation, StatsCallback done) {
    BrokerStatsQuery msg;
    msg.conversation = conversation;
    msg.done = std::move(done);
    return post(std::move(msg));
}

void Broker::handle(BrokerMessage& msg) {
    if (auto* m = std::get_if<BrokerConnect>(&msg)) {
        on_connect(*m);
    } else if (auto* m = std::get_if<BrokerDisconnect>(&msg)) {
        on_disconnect(*m);
    } else if (auto* m = std::get_if<BrokerNewMessage>(&msg)) {
        on_new_message(*m);
    } else if (auto* m = std::get_if<BrokerStatsQuery>(&msg)) {
        on_stats(*m);
    }
}

void Broker::on_connect(BrokerConnect& msg) {
    if (options_.require_membership) {
        bool member = false;
        std::string err;
        if (!store_.is_member(msg.conversation, msg.user, member, err)) {
            logger_.error("Cannot check membership of user %lu in conversation %lu: %s",
                          msg.user, msg.conversation, err.c_str());
            if (msg.done) msg.done(ConnectStatus::kStoreError);
            return;
        }
        if (!member) {
            logger_.warn("User %lu is not a member of conversation %lu",
                         msg.user, msg.conversation);
            if (msg.done) msg.done(ConnectStatus::kNotMember);
            return;
        }
    }

    conversations_[msg.conversation].push_back(Listener{msg.user, msg.listener});
    logger_.debug("User %lu joined conversation %lu",
                  msg.user, msg.conversation);

    if (msg.done) msg.done(ConnectStatus::kOk);
}

void Broker::on_disconnect(BrokerDisconnect& msg) {
    auto it = conversations_.find(msg.conversation);
    if (it == conversations_.end()) return;

    auto& listeners = it->second;
    listeners.erase(std::remove_if(listeners.begin(), listeners.end(),
                                   [&](const Listener& l) {
                                       return same_listener(l.address, msg.listener);
                                   }),
                    listeners.end());

    if (listeners.empty()) {
        conversations_.erase(it);
        logger_.debug("Conversation %lu has no listeners left", msg.conversation);
    }
}

void Broker::on_new_message(BrokerNewMessage& msg) {
    NewMessageResult result;

    Validation validation;
    if (!validate_message(msg.body.data(), msg.body.size(), validation,
                          result.validation)) {
        result.status = NewMessageStatus::kInvalid;
    } else if (!validation.rest.empty()) {
        result.status = NewMessageStatus::kInvalid;
        result.validation.code = ValidationErrorCode::kTrailingBytes;
        result.validation.found = validation.rest.size;
    }

    if (result.status == NewMessageStatus::kInvalid) {
        logger_.debug("Rejected message from user %lu in conversation %lu: %s",
                      msg.user, msg.conversation,
                      result.validation.to_string().c_str());
        if (msg.done) msg.done(result);
        return;
    }

    auto event = std::make_shared<Event>();
    event->conversation = msg.conversation;
    event->user = msg.user;
    event->body = validation.body.to_vector();

    if (!store_.persist(msg.conversation, msg.user, event->body,
                        event->id, event->timestamp, result.error)) {
        logger_.error("Cannot store message from user %lu in conversation %lu: %s",
                      msg.user, msg.conversation, result.error.c_str());
        result.status = NewMessageStatus::kStoreError;
        if (msg.done) msg.done(result);
        return;
    }
    messages_++;

    EventPtr shared = event;
    const std::vector<Listener>* listeners = nullptr;

    auto it = conversations_.find(msg.conversation);
    if (it != conversations_.end()) {
        listeners = &it->second;
        for (const auto& l : it->second) {
            auto target = l.address.lock();
            if (target && target->deliver(shared)) continue;

            failed_deliveries_++;
            logger_.error("Can't send message to user %lu in conversation %lu",
                          l.user, msg.conversation);

            BrokerDisconnect drop;
            drop.conversation = msg.conversation;
            drop.listener = l.address;
            if (!post(std::move(drop))) {
                logger_.debug("Broker is shutting down, listener not removed");
            }
        }
    }

    if (notifier_) notify_absent_members(*shared, listeners);

    result.id = shared->id;
    if (msg.done) msg.done(result);
}

void Broker::notify_absent_members(const Event& event,
                                   const std::vector<Listener>* listeners) {
    std::vector<UserId> members;
    std::string err;
    if (!store_.members(event.conversation, members, err)) {
        logger_.warn("Cannot list members of conversation %lu: %s",
                     event.conversation, err.c_str());
        return;
    }

    for (UserId member : members) {
        bool listening = false;
        if (listeners) {
            listening = std::any_of(listeners->begin(), listeners->end(),
                                    [&](const Listener& l) { return l.user == member; });
        }
        if (!listening) notifier_->notify_new_message(member, event);
    }
}

void Broker::on_stats(BrokerStatsQuery& msg) {
    BrokerStats s;
    s.conversations = conversations_.size();
    for (const auto& entry : conversations_) {
        s.listeners += entry.second.size();
    }

    auto it = conversations_.find(msg.conversation);
    if (it != conversations_.end()) {
        s.has_conversation = true;
        s.conversation_listeners = it->second.size();
    }
    s.messages = messages_;
    s.failed_deliveries = failed_deliveries_;

    if (msg.done) msg.done(s);
}

} // namespace parley
