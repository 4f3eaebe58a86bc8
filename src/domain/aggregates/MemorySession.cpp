#include "domain/aggregates/MemorySession.hpp"

#include "domain/errors/DomainErrors.hpp"
#include "domain/value_objects/Uuid.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <variant>

namespace ses::domain {

std::string to_string(MemorySessionStatus status) {
    switch (status) {
        case MemorySessionStatus::ACTIVE: return "active";
        case MemorySessionStatus::CLOSED: return "closed";
    }
    throw std::invalid_argument("Unknown MemorySessionStatus value");
}

void MemorySessionState::when(const MemorySessionEvent& event) {
    std::visit([this](const auto& e) { on(e); }, event);
}

void MemorySessionState::on(const MemorySessionCreated& event) {
    session_id = event.session_id;
    actor_id = event.actor_id;
    title = event.title;
    status = MemorySessionStatus::ACTIVE;
    entries.clear();
    created_at = event.occurred_at;
    last_activity_at = event.occurred_at;
}

void MemorySessionState::on(const MemoryEventStored& event) {
    entries.push_back(MemoryEntry{
        event.entry_id, event.role, event.content, event.occurred_at, event.metadata
    });
    last_activity_at = std::max(last_activity_at, event.occurred_at);
}

void MemorySessionState::on(const MemorySessionClosed& event) {
    status = MemorySessionStatus::CLOSED;
    last_activity_at = std::max(last_activity_at, event.occurred_at);
}

MemorySession MemorySession::create(const SessionId& id, std::string actor_id,
                                    std::optional<std::string> title) {
    if (actor_id.empty()) {
        throw std::invalid_argument("MemorySession actor_id must not be empty");
    }

    std::string resolved_title = title.value_or("Session " + id.value().substr(0, 8));

    MemorySession session;
    session.root_.apply(MemorySessionCreated{
        DomainEvent::raise(), id.value(), std::move(actor_id), std::move(resolved_title)
    });
    return session;
}

MemorySession MemorySession::from_history(const std::vector<MemorySessionEvent>& events,
                                          uint64_t stream_version) {
    if (events.empty() || !std::holds_alternative<MemorySessionCreated>(events.front())) {
        throw std::invalid_argument("MemorySession history must start with MemorySessionCreated");
    }
    MemorySession session;
    session.root_.load_from_history(events, stream_version);
    return session;
}

void MemorySession::store_entry(MessageRole role, const std::string& content,
                                nlohmann::json metadata) {
    ensure_active();
    if (content.empty()) {
        throw EmptyMessageError();
    }
    if (metadata.is_null()) {
        metadata = nlohmann::json::object();
    } else if (!metadata.is_object()) {
        throw std::invalid_argument("Memory entry metadata must be a JSON object");
    }
    root_.apply(MemoryEventStored{
        DomainEvent::raise(), id(), Uuid::generate().str(), role, content, std::move(metadata)
    });
}

void MemorySession::close() {
    ensure_active();
    root_.apply(MemorySessionClosed{DomainEvent::raise(), id()});
}

std::vector<MemoryEntry> MemorySession::recent_entries(std::size_t limit) const {
    const auto& all = entries();
    auto first = all.size() > limit ? all.end() - static_cast<std::ptrdiff_t>(limit) : all.begin();
    return {first, all.end()};
}

std::vector<MemoryEntry> MemorySession::search_entries(const std::string& query) const {
    auto lower = [](std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    };
    std::string needle = lower(query);

    std::vector<MemoryEntry> matches;
    for (const auto& entry : entries()) {
        if (lower(entry.content).find(needle) != std::string::npos) {
            matches.push_back(entry);
        }
    }
    return matches;
}

void MemorySession::ensure_active() const {
    if (status() != MemorySessionStatus::ACTIVE) {
        throw InvalidStateError(id(), to_string(status()));
    }
}

} // namespace ses::domain
