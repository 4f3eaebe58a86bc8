#pragma once

#include "domain/value_objects/MessageRole.hpp"
#include "domain/value_objects/Timestamp.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ses::projections {

struct MemorySessionRow {
    std::string id;
    std::string actor_id;
    std::string title;
    std::string status;
    size_t entry_count{0};
    ses::domain::Timestamp created_at{0};
    ses::domain::Timestamp last_activity_at{0};

    bool operator==(const MemorySessionRow&) const = default;
};

struct MemoryEntryRow {
    std::string id;
    std::string session_id;
    ses::domain::MessageRole role;
    std::string content;
    nlohmann::json metadata;
    ses::domain::Timestamp created_at{0};

    bool operator==(const MemoryEntryRow&) const = default;
};

// Query-side tables for memory sessions, keyed by session and entry id.
class MemoryReadModelStore {
public:
    bool insert_session(const MemorySessionRow& row);
    // Returns false if the entry id is already known. Throws std::runtime_error
    // if the session row does not exist.
    bool append_entry(const MemoryEntryRow& row);
    void update_session_status(const std::string& session_id, const std::string& status,
                               ses::domain::Timestamp at);
    void clear();

    std::optional<MemorySessionRow> find_memory_session(const std::string& session_id) const;
    std::vector<MemorySessionRow> memory_sessions_for_actor(const std::string& actor_id) const;
    std::vector<MemoryEntryRow> entries_for_session(const std::string& session_id) const;

    size_t session_count() const;
    size_t entry_count() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, MemorySessionRow> sessions_;
    std::map<std::string, std::vector<MemoryEntryRow>> entries_by_session_;
    std::set<std::string> entry_ids_;
};

} // namespace ses::projections
