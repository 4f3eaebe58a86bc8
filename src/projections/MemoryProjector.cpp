#include "projections/MemoryProjector.hpp"

#include "domain/aggregates/MemorySession.hpp"

#include <type_traits>
#include <variant>

using namespace ses::domain;

namespace ses::projections {

MemoryProjector::MemoryProjector(MemoryReadModelStore& store)
    : store_(store) {
}

void MemoryProjector::project(const StoredEvent& event) {
    if (event.aggregate_type != MemorySession::kAggregateType) return;

    auto decoded = serializer_.decode_memory_session_event(event);
    if (!decoded) return;

    std::visit([this](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, MemorySessionCreated>) {
            store_.insert_session(MemorySessionRow{
                e.session_id, e.actor_id, e.title, to_string(MemorySessionStatus::ACTIVE), 0,
                e.occurred_at, e.occurred_at
            });
        } else if constexpr (std::is_same_v<T, MemoryEventStored>) {
            store_.append_entry(MemoryEntryRow{
                e.entry_id, e.session_id, e.role, e.content, e.metadata, e.occurred_at
            });
        } else if constexpr (std::is_same_v<T, MemorySessionClosed>) {
            store_.update_session_status(e.session_id, to_string(MemorySessionStatus::CLOSED),
                                         e.occurred_at);
        }
    }, *decoded);
}

void MemoryProjector::reset() {
    store_.clear();
}

} // namespace ses::projections
