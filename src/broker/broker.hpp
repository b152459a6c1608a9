#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "broker/message_store.hpp"
#include "core/types.hpp"
#include "protocol/message_format.hpp"
#include "util/actor.hpp"
#include "util/logger.hpp"

namespace parley {

// Receiver of broadcast events. Implemented by client sessions.
class EventListener {
public:
    virtual ~EventListener() = default;

    // Hand an event to the listener's mailbox.
    // Returns false if the mailbox is closed or full.
    virtual bool deliver(const EventPtr& event) = 0;
};

using ListenerRef = std::weak_ptr<EventListener>;

enum class ConnectStatus : uint8_t {
    kOk = 0,
    kNotMember,    // user is not a member of the conversation
    kStoreError,   // membership could not be checked
};

const char* connect_status_name(ConnectStatus status);

enum class NewMessageStatus : uint8_t {
    kOk = 0,
    kInvalid,      // body failed validation; see validation
    kStoreError,   // persisting failed; see error
};

struct NewMessageResult {
    NewMessageStatus status = NewMessageStatus::kOk;
    EventId id = 0;
    ValidationError validation;
    std::string error;
};

struct BrokerStats {
    size_t conversations = 0;          // conversations with listeners
    size_t listeners = 0;              // listeners across all conversations
    bool has_conversation = false;     // queried conversation has an entry
    size_t conversation_listeners = 0; // listeners of queried conversation
    uint64_t messages = 0;             // messages accepted since start
    uint64_t failed_deliveries = 0;
};

struct BrokerOptions {
    // Refuse Connect for users who are not members of the conversation
    bool require_membership = true;
};

using ConnectCallback = std::function<void(ConnectStatus)>;
using NewMessageCallback = std::function<void(const NewMessageResult&)>;
using StatsCallback = std::function<void(const BrokerStats&)>;

// Broker mailbox messages.
struct BrokerConnect {
    UserId user = 0;
    ConversationId conversation = 0;
    ListenerRef listener;
    ConnectCallback done;
};

struct BrokerDisconnect {
    ConversationId conversation = 0;
    ListenerRef listener;
};

struct BrokerNewMessage {
    ConversationId conversation = 0;
    UserId user = 0;
    std::vector<uint8_t> body;
    NewMessageCallback done;
};

struct BrokerStatsQuery {
    ConversationId conversation = 0;
    StatsCallback done;
};

using BrokerMessage = std::variant<BrokerConnect, BrokerDisconnect,
                                   BrokerNewMessage, BrokerStatsQuery>;

// Fans conversation events out to registered listeners.
//
// One broker exists per process; it is constructed once and handed to every
// client session. All state is owned by the broker's mailbox handler, so
// Connect, Disconnect and NewMessage are totally ordered.
// Callbacks run on the broker and must not block.
class Broker : public Actor<BrokerMessage> {
public:
    static std::shared_ptr<Broker> create(WorkerPool& pool,
                                          MessageStore& store,
                                          const BrokerOptions& options,
                                          const Logger& logger,
                                          MemberNotifier* notifier = nullptr);

    // Register listener for events of conversation.
    // Returns false if the broker no longer accepts messages.
    bool connect(UserId user, ConversationId conversation, ListenerRef listener,
                 ConnectCallback done);

    // Remove every registration of listener from conversation.
    bool disconnect(ConversationId conversation, ListenerRef listener);

    // Validate, persist and broadcast a message.
    bool new_message(ConversationId conversation, UserId user,
                     std::vector<uint8_t> body, NewMessageCallback done);

    // Snapshot of broker state; conversation selects the per-conversation fields.
    bool stats(ConversationId conversation, StatsCallback done);

    Broker(WorkerPool& pool, MessageStore& store,
           const BrokerOptions& options, const Logger& logger,
           MemberNotifier* notifier);

protected:
    void handle(BrokerMessage& msg) override;

private:
    struct Listener {
        UserId user;
        ListenerRef address;
    };

    MessageStore& store_;
    BrokerOptions options_;
    const Logger& logger_;
    MemberNotifier* notifier_;

    std::unordered_map<ConversationId, std::vector<Listener>> conversations_;
    uint64_t messages_ = 0;
    uint64_t failed_deliveries_ = 0;

    void on_connect(BrokerConnect& msg);
    void on_disconnect(BrokerDisconnect& msg);
    void on_new_message(BrokerNewMessage& msg);
    void on_stats(BrokerStatsQuery& msg);

    void notify_absent_members(const Event& event,
                               const std::vector<Listener>* listeners);
};

} // namespace parley
