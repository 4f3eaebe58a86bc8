#pragma once

#include "domain/events/EventMetadata.hpp"
#include "domain/events/StoredEvent.hpp"
#include "domain/value_objects/Timestamp.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ses::repositories {

// Pull-based iteration over stored events. Destroying the cursor ends the scan.
class IEventCursor {
public:
    virtual std::optional<ses::domain::StoredEvent> next() = 0;

    virtual ~IEventCursor() = default;
};

class IEventStore {
public:
    // Atomically appends events as versions expected_version+1..expected_version+N.
    // Throws ConcurrencyError, storing nothing, if the stream is not at expected_version.
    virtual std::vector<ses::domain::StoredEvent> append(
        const std::string& aggregate_id, const std::string& aggregate_type,
        const std::vector<ses::domain::UncommittedEvent>& events, uint64_t expected_version,
        const ses::domain::EventMetadata& metadata = {}) = 0;

    virtual std::optional<ses::domain::EventStream> get_stream(
        const std::string& aggregate_id) const = 0;

    // Events with version strictly greater than `version`, ascending.
    virtual std::vector<ses::domain::StoredEvent> get_events_after_version(
        const std::string& aggregate_id, uint64_t version) const = 0;

    // Every stored event, optionally only those with timestamp > after_timestamp.
    // Version order holds within an aggregate; cross-aggregate order is unspecified.
    virtual std::unique_ptr<IEventCursor> scan_all_events(
        std::optional<ses::domain::Timestamp> after_timestamp = std::nullopt) const = 0;

    // 0 when the aggregate has no events.
    virtual uint64_t current_version(const std::string& aggregate_id) const = 0;

    virtual ~IEventStore() = default;
};

// Builds envelopes for a batch about to be committed at expected_version.
// correlation_id defaults to the event's own id, causation_id to the correlation id.
inline std::vector<ses::domain::StoredEvent> make_stored_events(
    const std::string& aggregate_id, const std::string& aggregate_type,
    const std::vector<ses::domain::UncommittedEvent>& events, uint64_t expected_version,
    const ses::domain::EventMetadata& metadata) {
    std::vector<ses::domain::StoredEvent> stored;
    stored.reserve(events.size());
    uint64_t version = expected_version;
    for (const auto& event : events) {
        ses::domain::EventMetadata resolved = metadata;
        if (resolved.correlation_id.empty()) resolved.correlation_id = event.event_id;
        if (resolved.causation_id.empty()) resolved.causation_id = resolved.correlation_id;

        stored.push_back(ses::domain::StoredEvent{
            event.event_id, aggregate_id, aggregate_type, event.event_type,
            event.event_data, std::move(resolved), ++version, event.occurred_at
        });
    }
    return stored;
}

} // namespace ses::repositories
