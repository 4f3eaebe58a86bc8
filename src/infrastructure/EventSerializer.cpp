#include "infrastructure/EventSerializer.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

using json = nlohmann::json;
using namespace ses::domain;

namespace ses::infrastructure {

namespace {

json payload(const SessionCreated& e) {
    return {{"sessionId", e.session_id}, {"ownerId", e.owner_id}, {"title", e.title}};
}

json payload(const MessageAdded& e) {
    return {
        {"sessionId", e.session_id},
        {"messageId", e.message_id},
        {"role", to_string(e.role)},
        {"content", e.content},
        {"fileKeys", e.file_keys},
    };
}

json payload(const SessionArchived& e) {
    return {{"sessionId", e.session_id}};
}

json payload(const MemorySessionCreated& e) {
    return {{"sessionId", e.session_id}, {"actorId", e.actor_id}, {"title", e.title}};
}

json payload(const MemoryEventStored& e) {
    return {
        {"sessionId", e.session_id},
        {"entryId", e.entry_id},
        {"role", to_string(e.role)},
        {"content", e.content},
        {"metadata", e.metadata.is_null() ? json::object() : e.metadata},
    };
}

json payload(const MemorySessionClosed& e) {
    return {{"sessionId", e.session_id}};
}

template <typename Variant>
UncommittedEvent encode_variant(const Variant& event) {
    return std::visit([](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        return UncommittedEvent{e.event_id, T::kEventType, payload(e), e.occurred_at};
    }, event);
}

DomainEvent header(const StoredEvent& stored) {
    return DomainEvent{stored.event_id, stored.timestamp};
}

// Wraps nlohmann's type/key errors so callers only see std::invalid_argument.
template <typename Fn>
auto decode_payload(const StoredEvent& stored, Fn&& fn) {
    if (!stored.event_data.is_object()) {
        throw std::invalid_argument("Event " + stored.event_id + " (" + stored.event_type
                                    + ") has a non-object payload");
    }
    try {
        return fn(stored.event_data);
    } catch (const json::exception& e) {
        throw std::invalid_argument("Malformed " + stored.event_type + " payload in event "
                                    + stored.event_id + ": " + e.what());
    }
}

} // namespace

UncommittedEvent EventSerializer::encode(const ChatSessionEvent& event) const {
    return encode_variant(event);
}

UncommittedEvent EventSerializer::encode(const MemorySessionEvent& event) const {
    return encode_variant(event);
}

std::optional<ChatSessionEvent> EventSerializer::decode_chat_session_event(
    const StoredEvent& stored) const {
    const auto& type = stored.event_type;

    if (type == SessionCreated::kEventType) {
        return decode_payload(stored, [&](const json& data) -> ChatSessionEvent {
            return SessionCreated{
                header(stored),
                data.at("sessionId").get<std::string>(),
                data.at("ownerId").get<std::string>(),
                data.at("title").get<std::string>(),
            };
        });
    }
    if (type == MessageAdded::kEventType) {
        return decode_payload(stored, [&](const json& data) -> ChatSessionEvent {
            return MessageAdded{
                header(stored),
                data.at("sessionId").get<std::string>(),
                data.at("messageId").get<std::string>(),
                message_role_from_string(data.at("role").get<std::string>()),
                data.at("content").get<std::string>(),
                data.value("fileKeys", std::vector<std::string>{}),
            };
        });
    }
    if (type == SessionArchived::kEventType) {
        return decode_payload(stored, [&](const json& data) -> ChatSessionEvent {
            return SessionArchived{header(stored), data.at("sessionId").get<std::string>()};
        });
    }
    return std::nullopt;
}

std::optional<MemorySessionEvent> EventSerializer::decode_memory_session_event(
    const StoredEvent& stored) const {
    const auto& type = stored.event_type;

    if (type == MemorySessionCreated::kEventType) {
        return decode_payload(stored, [&](const json& data) -> MemorySessionEvent {
            return MemorySessionCreated{
                header(stored),
                data.at("sessionId").get<std::string>(),
                data.at("actorId").get<std::string>(),
                data.at("title").get<std::string>(),
            };
        });
    }
    if (type == MemoryEventStored::kEventType) {
        return decode_payload(stored, [&](const json& data) -> MemorySessionEvent {
            json metadata = data.value("metadata", json::object());
            if (!metadata.is_object()) {
                throw std::invalid_argument("Memory entry metadata must be a JSON object in event "
                                            + stored.event_id);
            }
            return MemoryEventStored{
                header(stored),
                data.at("sessionId").get<std::string>(),
                data.at("entryId").get<std::string>(),
                message_role_from_string(data.at("role").get<std::string>()),
                data.at("content").get<std::string>(),
                std::move(metadata),
            };
        });
    }
    if (type == MemorySessionClosed::kEventType) {
        return decode_payload(stored, [&](const json& data) -> MemorySessionEvent {
            return MemorySessionClosed{header(stored), data.at("sessionId").get<std::string>()};
        });
    }
    return std::nullopt;
}

} // namespace ses::infrastructure
