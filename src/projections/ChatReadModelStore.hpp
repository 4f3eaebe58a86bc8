#pragma once

#include "domain/value_objects/MessageRole.hpp"
#include "domain/value_objects/Timestamp.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ses::projections {

struct ChatSessionRow {
    std::string id;
    std::string user_id;
    std::string title;
    std::string status;
    size_t message_count{0};
    ses::domain::Timestamp created_at{0};
    ses::domain::Timestamp updated_at{0};

    bool operator==(const ChatSessionRow&) const = default;
};

struct ChatMessageRow {
    std::string id;
    std::string session_id;
    ses::domain::MessageRole role;
    std::string content;
    std::vector<std::string> file_keys;
    ses::domain::Timestamp created_at{0};

    bool operator==(const ChatMessageRow&) const = default;
};

// Query-side tables for chat sessions. Writes are keyed by row identity so
// replaying an event leaves the tables unchanged.
class ChatReadModelStore {
public:
    // Returns false if a session with this id already exists.
    bool insert_session(const ChatSessionRow& row);

    // Inserts the message and bumps the owning session's message_count and
    // updated_at in one step. Returns false if the message id is already known.
    // Throws std::runtime_error if the session row does not exist.
    bool append_message(const ChatMessageRow& row);

    // Throws std::runtime_error if the session row does not exist.
    void update_session_status(const std::string& session_id, const std::string& status,
                               ses::domain::Timestamp at);

    void clear();

    std::optional<ChatSessionRow> find_session(const std::string& session_id) const;
    // Most recently updated first.
    std::vector<ChatSessionRow> sessions_for_user(const std::string& user_id) const;
    // In the order the messages were added.
    std::vector<ChatMessageRow> messages_for_session(const std::string& session_id) const;

    size_t session_count() const;
    size_t message_count() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, ChatSessionRow> sessions_;
    std::map<std::string, std::vector<ChatMessageRow>> messages_by_session_;
    std::set<std::string> message_ids_;
};

} // namespace ses::projections
