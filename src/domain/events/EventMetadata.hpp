#pragma once

#include <optional>
#include <string>

namespace ses::domain {

struct EventMetadata {
    std::string correlation_id;
    std::string causation_id;
    std::optional<std::string> user_id;
    std::optional<std::string> trace_id;

    bool operator==(const EventMetadata&) const = default;
};

} // namespace ses::domain
