#pragma once

#include "domain/aggregates/AggregateRoot.hpp"
#include "domain/events/MemorySessionEvents.hpp"
#include "domain/value_objects/MessageRole.hpp"
#include "domain/value_objects/SessionId.hpp"
#include "domain/value_objects/Timestamp.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ses::domain {

enum class MemorySessionStatus { ACTIVE, CLOSED };

std::string to_string(MemorySessionStatus status);

struct MemoryEntry {
    std::string entry_id;
    MessageRole role;
    std::string content;
    Timestamp timestamp;
    nlohmann::json metadata;

    bool operator==(const MemoryEntry&) const = default;
};

struct MemorySessionState {
    std::string session_id;
    std::string actor_id;
    std::string title;
    MemorySessionStatus status = MemorySessionStatus::ACTIVE;
    std::vector<MemoryEntry> entries;
    Timestamp created_at{0};
    Timestamp last_activity_at{0};

    void when(const MemorySessionEvent& event);

    bool operator==(const MemorySessionState&) const = default;

private:
    void on(const MemorySessionCreated& event);
    void on(const MemoryEventStored& event);
    void on(const MemorySessionClosed& event);
};

// Agent-memory conversation log. Entries can be stored until the session is closed.
class MemorySession {
public:
    static constexpr const char* kAggregateType = "MemorySession";

    // Default title is "Session " followed by the first 8 characters of the id.
    static MemorySession create(const SessionId& id, std::string actor_id,
                                std::optional<std::string> title = std::nullopt);

    static MemorySession from_history(const std::vector<MemorySessionEvent>& events,
                                      uint64_t stream_version);

    // metadata must be a JSON object; null is treated as {}.
    void store_entry(MessageRole role, const std::string& content,
                     nlohmann::json metadata = nlohmann::json::object());
    void close();

    const std::string& id() const noexcept { return root_.state().session_id; }
    const std::string& actor_id() const noexcept { return root_.state().actor_id; }
    const std::string& title() const noexcept { return root_.state().title; }
    MemorySessionStatus status() const noexcept { return root_.state().status; }
    const std::vector<MemoryEntry>& entries() const noexcept { return root_.state().entries; }
    std::size_t entry_count() const noexcept { return root_.state().entries.size(); }
    Timestamp created_at() const noexcept { return root_.state().created_at; }
    // Creation time until the first entry; storing an entry or closing moves it.
    Timestamp last_activity_at() const noexcept { return root_.state().last_activity_at; }
    const MemorySessionState& state() const noexcept { return root_.state(); }

    // The last `limit` entries, oldest first.
    std::vector<MemoryEntry> recent_entries(std::size_t limit = 50) const;
    // Entries whose content contains query, ignoring ASCII case.
    std::vector<MemoryEntry> search_entries(const std::string& query) const;

    uint64_t version() const noexcept { return root_.version(); }
    const std::vector<MemorySessionEvent>& uncommitted_events() const noexcept {
        return root_.uncommitted_events();
    }
    void clear_uncommitted_events() noexcept { root_.clear_uncommitted_events(); }

private:
    MemorySession() = default;

    void ensure_active() const;

    AggregateRoot<MemorySessionState, MemorySessionEvent> root_;
};

} // namespace ses::domain
