#include "projections/ChatProjector.hpp"

#include "domain/aggregates/ChatSession.hpp"

#include <type_traits>
#include <variant>

using namespace ses::domain;

namespace ses::projections {

ChatProjector::ChatProjector(ChatReadModelStore& store)
    : store_(store) {
}

void ChatProjector::project(const StoredEvent& event) {
    if (event.aggregate_type != ChatSession::kAggregateType) return;

    auto decoded = serializer_.decode_chat_session_event(event);
    if (!decoded) return;

    // Timestamps come from the event, so a replay writes the same values.
    std::visit([this](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, SessionCreated>) {
            store_.insert_session(ChatSessionRow{
                e.session_id, e.owner_id, e.title, to_string(SessionStatus::ACTIVE), 0,
                e.occurred_at, e.occurred_at
            });
        } else if constexpr (std::is_same_v<T, MessageAdded>) {
            store_.append_message(ChatMessageRow{
                e.message_id, e.session_id, e.role, e.content, e.file_keys, e.occurred_at
            });
        } else if constexpr (std::is_same_v<T, SessionArchived>) {
            store_.update_session_status(e.session_id, to_string(SessionStatus::ARCHIVED), e.occurred_at);
        }
    }, *decoded);
}

void ChatProjector::reset() {
    store_.clear();
}

} // namespace ses::projections
