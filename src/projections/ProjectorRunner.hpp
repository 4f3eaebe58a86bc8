#pragma once

#include "projections/DeadLetterQueue.hpp"
#include "projections/IProjector.hpp"
#include "repositories/IEventStore.hpp"
#include "services/IEventFeed.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace ses::projections {

// Fans each event out to every projector. A failing projector is logged and
// its event dead-lettered; the other projectors still see the event.
class ProjectorRunner {
public:
    ProjectorRunner(std::vector<std::reference_wrapper<IProjector>> projectors,
                    DeadLetterQueue& dead_letters);

    // Returns the number of projectors that failed on this event.
    size_t process_event(const ses::domain::StoredEvent& event);

    // Resets every projector and the dead-letter queue, then replays the cursor.
    // Stops early once keep_running reads false. Returns the events processed.
    size_t rebuild(ses::repositories::IEventCursor& cursor,
                   const std::atomic<bool>* keep_running = nullptr);

    // Routes a live feed into process_event.
    void attach(ses::services::IEventFeed& feed);

    uint64_t processed_count() const noexcept { return processed_; }

private:
    void dead_letter(const IProjector& projector, const ses::domain::StoredEvent& event,
                     const std::string& cause);

    std::vector<std::reference_wrapper<IProjector>> projectors_;
    DeadLetterQueue& dead_letters_;
    std::mutex mutex_;
    std::atomic<uint64_t> processed_{0};
};

} // namespace ses::projections
