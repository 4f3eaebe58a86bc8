#include "projections/ChatReadModelStore.hpp"

#include <algorithm>
#include <stdexcept>

namespace ses::projections {

bool ChatReadModelStore::insert_session(const ChatSessionRow& row) {
    std::lock_guard lock(mutex_);
    return sessions_.emplace(row.id, row).second;
}

bool ChatReadModelStore::append_message(const ChatMessageRow& row) {
    std::lock_guard lock(mutex_);
    auto session = sessions_.find(row.session_id);
    if (session == sessions_.end()) {
        throw std::runtime_error("No session row " + row.session_id + " for message " + row.id);
    }
    if (!message_ids_.insert(row.id).second) {
        return false;
    }
    messages_by_session_[row.session_id].push_back(row);
    session->second.message_count += 1;
    session->second.updated_at = std::max(session->second.updated_at, row.created_at);
    return true;
}

void ChatReadModelStore::update_session_status(const std::string& session_id, const std::string& status,
                                               ses::domain::Timestamp at) {
    std::lock_guard lock(mutex_);
    auto session = sessions_.find(session_id);
    if (session == sessions_.end()) {
        throw std::runtime_error("No session row " + session_id);
    }
    session->second.status = status;
    session->second.updated_at = std::max(session->second.updated_at, at);
}

void ChatReadModelStore::clear() {
    std::lock_guard lock(mutex_);
    sessions_.clear();
    messages_by_session_.clear();
    message_ids_.clear();
}

std::optional<ChatSessionRow> ChatReadModelStore::find_session(const std::string& session_id) const {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return std::nullopt;
    return it->second;
}

std::vector<ChatSessionRow> ChatReadModelStore::sessions_for_user(const std::string& user_id) const {
    std::lock_guard lock(mutex_);
    std::vector<ChatSessionRow> result;
    for (const auto& [id, row] : sessions_) {
        if (row.user_id == user_id) result.push_back(row);
    }
    std::stable_sort(result.begin(), result.end(), [](const ChatSessionRow& a, const ChatSessionRow& b) {
        return a.updated_at > b.updated_at;
    });
    return result;
}

std::vector<ChatMessageRow> ChatReadModelStore::messages_for_session(const std::string& session_id) const {
    std::lock_guard lock(mutex_);
    auto it = messages_by_session_.find(session_id);
    if (it == messages_by_session_.end()) return {};
    return it->second;
}

size_t ChatReadModelStore::session_count() const {
    std::lock_guard lock(mutex_);
    return sessions_.size();
}

size_t ChatReadModelStore::message_count() const {
    std::lock_guard lock(mutex_);
    return message_ids_.size();
}

} // namespace ses::projections
