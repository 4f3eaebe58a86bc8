#include "projections/MemoryReadModelStore.hpp"

#include <algorithm>
#include <stdexcept>

namespace ses::projections {

bool MemoryReadModelStore::insert_session(const MemorySessionRow& row) {
    std::lock_guard lock(mutex_);
    return sessions_.emplace(row.id, row).second;
}

bool MemoryReadModelStore::append_entry(const MemoryEntryRow& row) {
    std::lock_guard lock(mutex_);
    auto session = sessions_.find(row.session_id);
    if (session == sessions_.end()) {
        throw std::runtime_error("No memory session row " + row.session_id + " for entry " + row.id);
    }
    if (!entry_ids_.insert(row.id).second) {
        return false;
    }
    entries_by_session_[row.session_id].push_back(row);
    session->second.entry_count += 1;
    session->second.last_activity_at = std::max(session->second.last_activity_at, row.created_at);
    return true;
}

void MemoryReadModelStore::update_session_status(const std::string& session_id, const std::string& status,
                                                 ses::domain::Timestamp at) {
    std::lock_guard lock(mutex_);
    auto session = sessions_.find(session_id);
    if (session == sessions_.end()) {
        throw std::runtime_error("No memory session row " + session_id);
    }
    session->second.status = status;
    session->second.last_activity_at = std::max(session->second.last_activity_at, at);
}

void MemoryReadModelStore::clear() {
    std::lock_guard lock(mutex_);
    sessions_.clear();
    entries_by_session_.clear();
    entry_ids_.clear();
}

std::optional<MemorySessionRow> MemoryReadModelStore::find_memory_session(const std::string& session_id) const {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return std::nullopt;
    return it->second;
}

std::vector<MemorySessionRow> MemoryReadModelStore::memory_sessions_for_actor(const std::string& actor_id) const {
    std::lock_guard lock(mutex_);
    std::vector<MemorySessionRow> result;
    for (const auto& [id, row] : sessions_) {
        if (row.actor_id == actor_id) result.push_back(row);
    }
    std::stable_sort(result.begin(), result.end(), [](const MemorySessionRow& a, const MemorySessionRow& b) {
        return a.last_activity_at > b.last_activity_at;
    });
    return result;
}

std::vector<MemoryEntryRow> MemoryReadModelStore::entries_for_session(const std::string& session_id) const {
    std::lock_guard lock(mutex_);
    auto it = entries_by_session_.find(session_id);
    if (it == entries_by_session_.end()) return {};
    return it->second;
}

size_t MemoryReadModelStore::session_count() const {
    std::lock_guard lock(mutex_);
    return sessions_.size();
}

size_t MemoryReadModelStore::entry_count() const {
    std::lock_guard lock(mutex_);
    return entry_ids_.size();
}

} // namespace ses::projections
