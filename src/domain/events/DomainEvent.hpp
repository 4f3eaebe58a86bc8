#pragma once

#include "domain/value_objects/Timestamp.hpp"
#include "domain/value_objects/Uuid.hpp"

#include <string>

namespace ses::domain {

// Common header of every domain event raised by an aggregate.
struct DomainEvent {
    std::string event_id;
    Timestamp occurred_at;

    static DomainEvent raise() {
        return DomainEvent{Uuid::generate().str(), Timestamp::now()};
    }

    bool operator==(const DomainEvent&) const = default;
};

} // namespace ses::domain
