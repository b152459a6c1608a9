#include "store/memory_store.hpp"

#include <algorithm>
#include <chrono>

namespace parley {

static std::string unknown_conversation(ConversationId id) {
    return "unknown conversation " + std::to_string(id);
}

void InMemoryMessageStore::add_conversation(ConversationId id,
                                            const std::vector<UserId>& members) {
    std::lock_guard<std::mutex> lock(mutex_);
    conversations_[id].members = members;
}

bool InMemoryMessageStore::has_conversation(ConversationId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return conversations_.count(id) != 0;
}

bool InMemoryMessageStore::persist(ConversationId conversation, UserId user,
                                   const std::vector<uint8_t>& body,
                                   EventId& id, Timestamp& timestamp,
                                   std::string& error_msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = conversations_.find(conversation);
    if (it == conversations_.end()) {
        error_msg = unknown_conversation(conversation);
        return false;
    }

    Event ev;
    ev.conversation = conversation;
    ev.id = next_id_++;
    ev.user = user;
    ev.timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    ev.body = body;

    id = ev.id;
    timestamp = ev.timestamp;
    it->second.events.push_back(std::move(ev));
    return true;
}

bool InMemoryMessageStore::is_member(ConversationId conversation, UserId user,
                                     bool& is_member, std::string& error_msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = conversations_.find(conversation);
    if (it == conversations_.end()) {
        error_msg = unknown_conversation(conversation);
        return false;
    }
    const auto& m = it->second.members;
    is_member = std::find(m.begin(), m.end(), user) != m.end();
    return true;
}

bool InMemoryMessageStore::members(ConversationId conversation,
                                   std::vector<UserId>& out,
                                   std::string& error_msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = conversations_.find(conversation);
    if (it == conversations_.end()) {
        error_msg = unknown_conversation(conversation);
        return false;
    }
    out = it->second.members;
    return true;
}

std::vector<Event> InMemoryMessageStore::events(ConversationId conversation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = conversations_.find(conversation);
    if (it == conversations_.end()) return {};
    return it->second.events;
}

} // namespace parley
