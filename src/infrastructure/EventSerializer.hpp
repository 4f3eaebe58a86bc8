#pragma once

#include "domain/events/ChatSessionEvents.hpp"
#include "domain/events/MemorySessionEvents.hpp"
#include "domain/events/StoredEvent.hpp"

#include <optional>

namespace ses::infrastructure {

// Maps typed domain events to and from the JSON payload stored in event_data.
// Payload keys are camelCase ("sessionId", "fileKeys", ...).
class EventSerializer {
public:
    ses::domain::UncommittedEvent encode(const ses::domain::ChatSessionEvent& event) const;
    ses::domain::UncommittedEvent encode(const ses::domain::MemorySessionEvent& event) const;

    // Returns nullopt for event types this build does not know.
    // Throws std::invalid_argument when a known type has a malformed payload.
    std::optional<ses::domain::ChatSessionEvent> decode_chat_session_event(
        const ses::domain::StoredEvent& stored) const;
    std::optional<ses::domain::MemorySessionEvent> decode_memory_session_event(
        const ses::domain::StoredEvent& stored) const;
};

} // namespace ses::infrastructure
