#pragma once

#include <stdexcept>
#include <string>

namespace ses::domain {

enum class MessageRole { USER, ASSISTANT, SYSTEM };

inline MessageRole message_role_from_string(const std::string& str) {
    if (str == "user") return MessageRole::USER;
    if (str == "assistant") return MessageRole::ASSISTANT;
    if (str == "system") return MessageRole::SYSTEM;
    throw std::invalid_argument("Invalid message role: " + str);
}

inline std::string to_string(MessageRole role) {
    switch (role) {
        case MessageRole::USER: return "user";
        case MessageRole::ASSISTANT: return "assistant";
        case MessageRole::SYSTEM: return "system";
    }
    throw std::invalid_argument("Unknown MessageRole value");
}

} // namespace ses::domain
