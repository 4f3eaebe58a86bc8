#pragma once

#include "domain/events/StoredEvent.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace ses::infrastructure {

// Wire form of a stored event:
//
//   {"eventId", "aggregateId", "aggregateType", "eventType", "eventData",
//    "metadata": {"correlationId", "causationId", "userId"?, "traceId"?},
//    "version", "timestamp": "YYYY-MM-DDTHH:MM:SS.mmmZ"}
class EnvelopeCodec {
public:
    static nlohmann::json to_json(const ses::domain::StoredEvent& event);

    // Throws std::invalid_argument on a missing field, wrong type or bad timestamp.
    static ses::domain::StoredEvent from_json(const nlohmann::json& envelope);
    static ses::domain::StoredEvent from_string(const std::string& text);
};

} // namespace ses::infrastructure
