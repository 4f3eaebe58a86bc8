#pragma once

#include "domain/aggregates/ChatSession.hpp"
#include "domain/aggregates/MemorySession.hpp"
#include "domain/events/StoredEvent.hpp"
#include "infrastructure/EventSerializer.hpp"

#include <string>
#include <variant>
#include <vector>

namespace ses::services {

using AnyAggregate = std::variant<ses::domain::ChatSession, ses::domain::MemorySession>;

// Rebuilds aggregates from stored streams. Stateless and deterministic.
class StreamReconstructor {
public:
    // Throws NotFoundError on an empty stream and std::invalid_argument for an
    // unknown aggregate type or a stream that is not contiguous from version 1.
    AnyAggregate reconstruct(const std::string& aggregate_type,
                             const std::vector<ses::domain::StoredEvent>& events) const;

    ses::domain::ChatSession reconstruct_chat_session(
        const std::vector<ses::domain::StoredEvent>& events) const;
    ses::domain::MemorySession reconstruct_memory_session(
        const std::vector<ses::domain::StoredEvent>& events) const;

private:
    static void validate_stream(const std::vector<ses::domain::StoredEvent>& events,
                                const std::string& aggregate_type);

    ses::infrastructure::EventSerializer serializer_;
};

} // namespace ses::services
