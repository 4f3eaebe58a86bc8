#pragma once

#include "domain/events/EventMetadata.hpp"
#include "domain/value_objects/Timestamp.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace ses::domain {

// A serialized domain event that has not been assigned a version yet.
struct UncommittedEvent {
    std::string event_id;
    std::string event_type;
    nlohmann::json event_data;
    Timestamp occurred_at;
};

// Envelope of a persisted event. Versions are contiguous per aggregate, starting at 1.
struct StoredEvent {
    std::string event_id;
    std::string aggregate_id;
    std::string aggregate_type;
    std::string event_type;
    nlohmann::json event_data;
    EventMetadata metadata;
    uint64_t version;
    Timestamp timestamp;

    bool operator==(const StoredEvent&) const = default;
};

struct EventStream {
    std::string aggregate_id;
    std::vector<StoredEvent> events;    // ascending version
    uint64_t version;                   // version of the last event
};

} // namespace ses::domain
