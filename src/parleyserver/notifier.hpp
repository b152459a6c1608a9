#pragma once

#include "broker/message_store.hpp"
#include "util/logger.hpp"

namespace parley {

// Reports messages for members who are not connected. Stands in for a push
// notification service: logs a plain-text rendering of the message.
class LoggingNotifier : public MemberNotifier {
public:
    explicit LoggingNotifier(const Logger& logger) : logger_(logger) {}

    void notify_new_message(UserId member, const Event& event) override;

private:
    const Logger& logger_;
};

} // namespace parley
