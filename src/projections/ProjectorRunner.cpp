#include "projections/ProjectorRunner.hpp"

#include "domain/errors/DomainErrors.hpp"

#include <iostream>

using namespace ses::domain;

namespace ses::projections {

ProjectorRunner::ProjectorRunner(std::vector<std::reference_wrapper<IProjector>> projectors,
                                 DeadLetterQueue& dead_letters)
    : projectors_(std::move(projectors))
    , dead_letters_(dead_letters) {
}

void ProjectorRunner::dead_letter(const IProjector& projector, const StoredEvent& event,
                                  const std::string& cause) {
    ProjectionError error(projector.name(), event.event_id, cause);
    std::cerr << "[projector-runner] " << error.what()
              << " (type=" << event.event_type << ", aggregate=" << event.aggregate_id
              << ", version=" << event.version << ")" << std::endl;
    dead_letters_.push(DeadLetter{projector.name(), event, error.what(), Timestamp::now()});
}

size_t ProjectorRunner::process_event(const StoredEvent& event) {
    std::lock_guard lock(mutex_);

    size_t failures = 0;
    for (IProjector& projector : projectors_) {
        try {
            projector.project(event);
        } catch (const std::exception& e) {
            dead_letter(projector, event, e.what());
            ++failures;
        } catch (...) {
            dead_letter(projector, event, "unknown exception");
            ++failures;
        }
    }
    ++processed_;
    return failures;
}

size_t ProjectorRunner::rebuild(ses::repositories::IEventCursor& cursor,
                                const std::atomic<bool>* keep_running) {
    {
        std::lock_guard lock(mutex_);
        for (IProjector& projector : projectors_) {
            projector.reset();
        }
        dead_letters_.clear();
    }

    size_t count = 0;
    while (keep_running == nullptr || keep_running->load()) {
        auto event = cursor.next();
        if (!event) break;
        process_event(*event);
        ++count;
    }

    std::cout << "[projector-runner] Rebuilt read models from " << count << " events, "
              << dead_letters_.size() << " dead-lettered" << std::endl;
    return count;
}

void ProjectorRunner::attach(ses::services::IEventFeed& feed) {
    feed.set_on_event([this](const StoredEvent& event) {
        process_event(event);
    });
}

} // namespace ses::projections
