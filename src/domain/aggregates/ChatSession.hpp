#pragma once

#include "domain/aggregates/AggregateRoot.hpp"
#include "domain/events/ChatSessionEvents.hpp"
#include "domain/value_objects/MessageContent.hpp"
#include "domain/value_objects/MessageRole.hpp"
#include "domain/value_objects/SessionId.hpp"
#include "domain/value_objects/Timestamp.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ses::domain {

enum class SessionStatus { ACTIVE, ARCHIVED };

std::string to_string(SessionStatus status);

struct ChatMessage {
    std::string message_id;
    MessageRole role;
    std::string content;
    Timestamp timestamp;
    std::vector<std::string> file_keys;

    bool operator==(const ChatMessage&) const = default;
};

struct ChatSessionState {
    std::string session_id;
    std::string owner_id;
    std::string title;
    SessionStatus status = SessionStatus::ACTIVE;
    std::vector<ChatMessage> messages;    // append-only
    Timestamp created_at{0};

    void when(const ChatSessionEvent& event);

    bool operator==(const ChatSessionState&) const = default;

private:
    void on(const SessionCreated& event);
    void on(const MessageAdded& event);
    void on(const SessionArchived& event);
};

// Chat session aggregate. Only ACTIVE sessions accept messages; archiving is one-way.
class ChatSession {
public:
    static constexpr const char* kAggregateType = "ChatSession";

    // Default title is "Chat YYYY-MM-DD" of the creation instant.
    static ChatSession create(const SessionId& id, std::string owner_id,
                              std::optional<std::string> title = std::nullopt);

    static ChatSession from_history(const std::vector<ChatSessionEvent>& events,
                                    uint64_t stream_version);

    // Commands
    void add_message(const MessageContent& content, MessageRole role,
                     std::vector<std::string> file_keys = {});
    void archive();

    // Queries
    const std::string& id() const noexcept { return root_.state().session_id; }
    const std::string& owner_id() const noexcept { return root_.state().owner_id; }
    const std::string& title() const noexcept { return root_.state().title; }
    SessionStatus status() const noexcept { return root_.state().status; }
    const std::vector<ChatMessage>& messages() const noexcept { return root_.state().messages; }
    std::size_t message_count() const noexcept { return root_.state().messages.size(); }
    Timestamp created_at() const noexcept { return root_.state().created_at; }
    std::optional<Timestamp> last_message_at() const;
    const ChatSessionState& state() const noexcept { return root_.state(); }

    // Event-sourcing surface
    uint64_t version() const noexcept { return root_.version(); }
    const std::vector<ChatSessionEvent>& uncommitted_events() const noexcept {
        return root_.uncommitted_events();
    }
    void clear_uncommitted_events() noexcept { root_.clear_uncommitted_events(); }

private:
    ChatSession() = default;

    void ensure_active() const;

    AggregateRoot<ChatSessionState, ChatSessionEvent> root_;
};

} // namespace ses::domain
