#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "broker/message_store.hpp"
#include "core/types.hpp"

namespace parley {

// Message store kept in process memory. Conversations and their members are
// declared up front (from the server configuration or by tests).
class InMemoryMessageStore : public MessageStore {
public:
    // Declare a conversation. Redeclaring replaces its member list.
    void add_conversation(ConversationId id, const std::vector<UserId>& members);

    bool has_conversation(ConversationId id) const;

    bool persist(ConversationId conversation, UserId user,
                 const std::vector<uint8_t>& body,
                 EventId& id, Timestamp& timestamp,
                 std::string& error_msg) override;

    bool is_member(ConversationId conversation, UserId user,
                   bool& is_member, std::string& error_msg) override;

    bool members(ConversationId conversation, std::vector<UserId>& out,
                 std::string& error_msg) override;

    // Copy of the events of a conversation, oldest first.
    std::vector<Event> events(ConversationId conversation) const;

private:
    struct Conversation {
        std::vector<UserId> members;
        std::vector<Event> events;
    };

    mutable std::mutex mutex_;
    std::unordered_map<ConversationId, Conversation> conversations_;
    EventId next_id_ = 1;
};

} // namespace parley
