#pragma once

#include "domain/events/DomainEvent.hpp"
#include "domain/value_objects/MessageRole.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <variant>

namespace ses::domain {

struct MemorySessionCreated : DomainEvent {
    static constexpr const char* kEventType = "MemorySessionCreated";

    std::string session_id;
    std::string actor_id;
    std::string title;
};

struct MemoryEventStored : DomainEvent {
    static constexpr const char* kEventType = "MemoryEventStored";

    std::string session_id;
    std::string entry_id;
    MessageRole role;
    std::string content;
    nlohmann::json metadata;    // always a JSON object
};

struct MemorySessionClosed : DomainEvent {
    static constexpr const char* kEventType = "MemorySessionClosed";

    std::string session_id;
};

using MemorySessionEvent = std::variant<MemorySessionCreated, MemoryEventStored, MemorySessionClosed>;

} // namespace ses::domain
