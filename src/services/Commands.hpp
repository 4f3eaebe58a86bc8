#pragma once

#include "domain/value_objects/MessageRole.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ses::services {

// --- ChatSession ---

struct CreateSession {
    std::string owner_id;
    std::optional<std::string> title;
};

struct AddMessage {
    std::string content;
    ses::domain::MessageRole role = ses::domain::MessageRole::USER;
    std::vector<std::string> file_keys;
};

struct ArchiveSession {};

using ChatSessionCommand = std::variant<CreateSession, AddMessage, ArchiveSession>;

// --- MemorySession ---

struct CreateMemorySession {
    std::string actor_id;
    std::optional<std::string> title;
};

struct StoreMemoryEntry {
    ses::domain::MessageRole role = ses::domain::MessageRole::USER;
    std::string content;
    nlohmann::json metadata = nlohmann::json::object();
};

struct CloseMemorySession {};

using MemorySessionCommand = std::variant<CreateMemorySession, StoreMemoryEntry, CloseMemorySession>;

using Command = std::variant<ChatSessionCommand, MemorySessionCommand>;

// Context carried onto every event a command produces.
struct CommandMetadata {
    std::optional<std::string> correlation_id;    // defaults to a fresh command id
    std::optional<std::string> causation_id;      // defaults to the correlation id
    std::optional<std::string> user_id;
    std::optional<std::string> trace_id;
};

} // namespace ses::services
