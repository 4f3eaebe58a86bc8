#pragma once

#include "domain/events/DomainEvent.hpp"
#include "domain/value_objects/MessageRole.hpp"

#include <string>
#include <variant>
#include <vector>

namespace ses::domain {

struct SessionCreated : DomainEvent {
    static constexpr const char* kEventType = "SessionCreated";

    std::string session_id;
    std::string owner_id;
    std::string title;
};

struct MessageAdded : DomainEvent {
    static constexpr const char* kEventType = "MessageAdded";

    std::string session_id;
    std::string message_id;
    MessageRole role;
    std::string content;
    std::vector<std::string> file_keys;
};

struct SessionArchived : DomainEvent {
    static constexpr const char* kEventType = "SessionArchived";

    std::string session_id;
};

using ChatSessionEvent = std::variant<SessionCreated, MessageAdded, SessionArchived>;

} // namespace ses::domain
