#include "infrastructure/EnvelopeCodec.hpp"

#include <stdexcept>

using json = nlohmann::json;
using namespace ses::domain;

namespace ses::infrastructure {

namespace {

std::string required_string(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        throw std::invalid_argument(std::string("Envelope field '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

std::optional<std::string> optional_string(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw std::invalid_argument(std::string("Envelope field '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

} // namespace

json EnvelopeCodec::to_json(const StoredEvent& event) {
    json metadata = {
        {"correlationId", event.metadata.correlation_id},
        {"causationId", event.metadata.causation_id},
    };
    if (event.metadata.user_id) metadata["userId"] = *event.metadata.user_id;
    if (event.metadata.trace_id) metadata["traceId"] = *event.metadata.trace_id;

    return {
        {"eventId", event.event_id},
        {"aggregateId", event.aggregate_id},
        {"aggregateType", event.aggregate_type},
        {"eventType", event.event_type},
        {"eventData", event.event_data},
        {"metadata", std::move(metadata)},
        {"version", event.version},
        {"timestamp", event.timestamp.to_iso8601()},
    };
}

StoredEvent EnvelopeCodec::from_json(const json& envelope) {
    if (!envelope.is_object()) {
        throw std::invalid_argument("Envelope must be a JSON object");
    }

    auto data = envelope.find("eventData");
    if (data == envelope.end() || !data->is_object()) {
        throw std::invalid_argument("Envelope field 'eventData' must be an object");
    }
    auto metadata = envelope.find("metadata");
    if (metadata == envelope.end() || !metadata->is_object()) {
        throw std::invalid_argument("Envelope field 'metadata' must be an object");
    }
    auto version = envelope.find("version");
    if (version == envelope.end() || !version->is_number_unsigned() || version->get<uint64_t>() == 0) {
        throw std::invalid_argument("Envelope field 'version' must be a positive integer");
    }

    return StoredEvent{
        required_string(envelope, "eventId"),
        required_string(envelope, "aggregateId"),
        required_string(envelope, "aggregateType"),
        required_string(envelope, "eventType"),
        *data,
        EventMetadata{
            required_string(*metadata, "correlationId"),
            required_string(*metadata, "causationId"),
            optional_string(*metadata, "userId"),
            optional_string(*metadata, "traceId"),
        },
        version->get<uint64_t>(),
        Timestamp::from_iso8601(required_string(envelope, "timestamp")),
    };
}

StoredEvent EnvelopeCodec::from_string(const std::string& text) {
    json envelope;
    try {
        envelope = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::invalid_argument(std::string("Envelope is not valid JSON: ") + e.what());
    }
    return from_json(envelope);
}

} // namespace ses::infrastructure
