#include "services/StreamReconstructor.hpp"

#include "domain/errors/DomainErrors.hpp"

#include <stdexcept>

using namespace ses::domain;

namespace ses::services {

AnyAggregate StreamReconstructor::reconstruct(const std::string& aggregate_type,
                                              const std::vector<StoredEvent>& events) const {
    if (aggregate_type == ChatSession::kAggregateType) {
        return reconstruct_chat_session(events);
    }
    if (aggregate_type == MemorySession::kAggregateType) {
        return reconstruct_memory_session(events);
    }
    throw std::invalid_argument("Unknown aggregate type: " + aggregate_type);
}

ChatSession StreamReconstructor::reconstruct_chat_session(const std::vector<StoredEvent>& events) const {
    validate_stream(events, ChatSession::kAggregateType);

    std::vector<ChatSessionEvent> decoded;
    decoded.reserve(events.size());
    for (const auto& stored : events) {
        // Unknown types come from newer writers; skip them but keep their version.
        if (auto event = serializer_.decode_chat_session_event(stored)) {
            decoded.push_back(std::move(*event));
        }
    }
    return ChatSession::from_history(decoded, events.back().version);
}

MemorySession StreamReconstructor::reconstruct_memory_session(const std::vector<StoredEvent>& events) const {
    validate_stream(events, MemorySession::kAggregateType);

    std::vector<MemorySessionEvent> decoded;
    decoded.reserve(events.size());
    for (const auto& stored : events) {
        if (auto event = serializer_.decode_memory_session_event(stored)) {
            decoded.push_back(std::move(*event));
        }
    }
    return MemorySession::from_history(decoded, events.back().version);
}

void StreamReconstructor::validate_stream(const std::vector<StoredEvent>& events,
                                          const std::string& aggregate_type) {
    if (events.empty()) {
        throw NotFoundError("");
    }

    const auto& aggregate_id = events.front().aggregate_id;
    uint64_t expected_version = 1;
    for (const auto& event : events) {
        if (event.aggregate_id != aggregate_id) {
            throw std::invalid_argument("Stream mixes aggregates " + aggregate_id + " and "
                                        + event.aggregate_id);
        }
        if (event.aggregate_type != aggregate_type) {
            throw std::invalid_argument("Event " + event.event_id + " belongs to a "
                                        + event.aggregate_type + ", not a " + aggregate_type);
        }
        if (event.version != expected_version) {
            throw std::invalid_argument("Stream " + aggregate_id + " expected version "
                                        + std::to_string(expected_version) + ", got "
                                        + std::to_string(event.version));
        }
        ++expected_version;
    }
}

} // namespace ses::services
