#include "domain/aggregates/ChatSession.hpp"

#include "domain/errors/DomainErrors.hpp"
#include "domain/value_objects/Uuid.hpp"

#include <stdexcept>
#include <variant>

namespace ses::domain {

std::string to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::ACTIVE: return "active";
        case SessionStatus::ARCHIVED: return "archived";
    }
    throw std::invalid_argument("Unknown SessionStatus value");
}

// --- State transitions ---

void ChatSessionState::when(const ChatSessionEvent& event) {
    std::visit([this](const auto& e) { on(e); }, event);
}

void ChatSessionState::on(const SessionCreated& event) {
    session_id = event.session_id;
    owner_id = event.owner_id;
    title = event.title;
    status = SessionStatus::ACTIVE;
    messages.clear();
    created_at = event.occurred_at;
}

void ChatSessionState::on(const MessageAdded& event) {
    messages.push_back(ChatMessage{
        event.message_id, event.role, event.content, event.occurred_at, event.file_keys
    });
}

void ChatSessionState::on(const SessionArchived&) {
    status = SessionStatus::ARCHIVED;
}

// --- Factory ---

ChatSession ChatSession::create(const SessionId& id, std::string owner_id,
                                std::optional<std::string> title) {
    if (owner_id.empty()) {
        throw std::invalid_argument("ChatSession owner_id must not be empty");
    }

    auto header = DomainEvent::raise();
    std::string resolved_title = title.value_or("Chat " + header.occurred_at.date_string());

    ChatSession session;
    session.root_.apply(SessionCreated{
        std::move(header), id.value(), std::move(owner_id), std::move(resolved_title)
    });
    return session;
}

ChatSession ChatSession::from_history(const std::vector<ChatSessionEvent>& events,
                                      uint64_t stream_version) {
    if (events.empty() || !std::holds_alternative<SessionCreated>(events.front())) {
        throw std::invalid_argument("ChatSession history must start with SessionCreated");
    }
    ChatSession session;
    session.root_.load_from_history(events, stream_version);
    return session;
}

// --- Commands ---

void ChatSession::add_message(const MessageContent& content, MessageRole role,
                              std::vector<std::string> file_keys) {
    ensure_active();
    root_.apply(MessageAdded{
        DomainEvent::raise(), id(), Uuid::generate().str(), role, content.text(), std::move(file_keys)
    });
}

void ChatSession::archive() {
    ensure_active();
    root_.apply(SessionArchived{DomainEvent::raise(), id()});
}

std::optional<Timestamp> ChatSession::last_message_at() const {
    const auto& messages = root_.state().messages;
    if (messages.empty()) return std::nullopt;
    return messages.back().timestamp;
}

void ChatSession::ensure_active() const {
    if (status() != SessionStatus::ACTIVE) {
        throw InvalidStateError(id(), to_string(status()));
    }
}

} // namespace ses::domain
