#pragma once

#include "domain/events/StoredEvent.hpp"

#include <string>

namespace ses::projections {

// Builds a read model from stored events. project() must be idempotent since
// delivery is at-least-once, and must ignore event types it does not handle.
class IProjector {
public:
    virtual const std::string& name() const = 0;
    virtual void project(const ses::domain::StoredEvent& event) = 0;
    // Drops everything the projector has built, before a rebuild.
    virtual void reset() = 0;
    virtual ~IProjector() = default;
};

} // namespace ses::projections
