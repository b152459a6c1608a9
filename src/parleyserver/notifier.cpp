#include "parleyserver/notifier.hpp"

#include "protocol/message_format.hpp"

namespace parley {

void LoggingNotifier::notify_new_message(UserId member, const Event& event) {
    PlainTextRenderer text;
    ValidationError err;
    if (!render_message(event.body.data(), event.body.size(), text, err)) {
        logger_.warn("Cannot render message %lu: %s",
                     event.id, err.to_string().c_str());
        return;
    }
    logger_.info("Notify user %lu: message %lu from user %lu in conversation %lu: %s",
                 member, event.id,
                 event.user, event.conversation, text.result().c_str());
}

} // namespace parley
