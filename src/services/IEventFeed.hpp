#pragma once

#include "domain/events/StoredEvent.hpp"

#include <functional>

namespace ses::services {

// Source of committed events for live projection.
class IEventFeed {
public:
    using EventCallback = std::function<void(const ses::domain::StoredEvent&)>;

    virtual void set_on_event(EventCallback callback) = 0;
    virtual void start() = 0;
    virtual void stop() = 0;
    virtual ~IEventFeed() = default;
};

} // namespace ses::services
