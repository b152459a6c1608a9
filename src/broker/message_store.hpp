#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace parley {

// Durable storage of conversations, their members and events.
// Implementations are called from the broker only, one call at a time.
class MessageStore {
public:
    virtual ~MessageStore() = default;

    // Store a new message event. On success fills id and timestamp.
    // Returns false and sets error_msg on failure.
    virtual bool persist(ConversationId conversation, UserId user,
                         const std::vector<uint8_t>& body,
                         EventId& id, Timestamp& timestamp,
                         std::string& error_msg) = 0;

    // Membership check. Returns false and sets error_msg if the store cannot
    // answer (e.g. unknown conversation); otherwise sets is_member.
    virtual bool is_member(ConversationId conversation, UserId user,
                           bool& is_member, std::string& error_msg) = 0;

    // All members of a conversation.
    virtual bool members(ConversationId conversation, std::vector<UserId>& out,
                         std::string& error_msg) = 0;
};

// Informed about conversation members who had no live listener when a
// message arrived (e.g. to queue a notification for them).
class MemberNotifier {
public:
    virtual ~MemberNotifier() = default;

    virtual void notify_new_message(UserId member, const Event& event) = 0;
};

} // namespace parley
