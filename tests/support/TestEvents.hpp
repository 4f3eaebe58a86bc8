#pragma once

#include "domain/aggregates/ChatSession.hpp"
#include "domain/aggregates/MemorySession.hpp"
#include "domain/events/StoredEvent.hpp"
#include "domain/value_objects/Timestamp.hpp"
#include "infrastructure/EventSerializer.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace ses::testing {

inline domain::UncommittedEvent make_uncommitted(const std::string& event_id,
                                                 const std::string& event_type = "TestEvent",
                                                 int64_t timestamp_ms = 1000) {
    return domain::UncommittedEvent{
        event_id, event_type, nlohmann::json{{"n", event_id}}, domain::Timestamp(timestamp_ms)
    };
}

inline domain::StoredEvent make_stored(const std::string& aggregate_id, const std::string& aggregate_type,
                                       const domain::UncommittedEvent& event, uint64_t version) {
    return domain::StoredEvent{
        event.event_id, aggregate_id, aggregate_type, event.event_type, event.event_data,
        domain::EventMetadata{event.event_id, event.event_id, std::nullopt, std::nullopt},
        version, event.occurred_at
    };
}

// Stores a batch of typed events as versions 1..N of one stream.
template <typename Event>
std::vector<domain::StoredEvent> to_stream(const std::string& aggregate_id,
                                           const std::string& aggregate_type,
                                           const std::vector<Event>& events) {
    infrastructure::EventSerializer serializer;
    std::vector<domain::StoredEvent> stored;
    uint64_t version = 0;
    for (const auto& event : events) {
        stored.push_back(make_stored(aggregate_id, aggregate_type, serializer.encode(event), ++version));
    }
    return stored;
}

inline std::vector<domain::StoredEvent> to_stream(const domain::ChatSession& session) {
    return to_stream(session.id(), domain::ChatSession::kAggregateType, session.uncommitted_events());
}

inline std::vector<domain::StoredEvent> to_stream(const domain::MemorySession& session) {
    return to_stream(session.id(), domain::MemorySession::kAggregateType, session.uncommitted_events());
}

} // namespace ses::testing
