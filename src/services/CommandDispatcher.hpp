#pragma once

#include "config/Settings.hpp"
#include "domain/events/StoredEvent.hpp"
#include "infrastructure/EventSerializer.hpp"
#include "repositories/IEventStore.hpp"
#include "services/Commands.hpp"
#include "services/StreamReconstructor.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace ses::services {

struct DispatchResult {
    std::string aggregate_id;
    uint64_t produced_version;
    std::vector<ses::domain::StoredEvent> events;
};

// Command side: load, execute, append.
//
// Create commands append at expected version 0 and are never retried; a
// conflict means the id is already taken. Other commands re-read and retry on
// ConcurrencyError up to DispatchSettings::max_retries times. Domain errors
// (InvalidStateError, NotFoundError, validation) propagate unchanged.
class CommandDispatcher {
public:
    using CommittedCallback = std::function<void(const std::vector<ses::domain::StoredEvent>&)>;

    CommandDispatcher(ses::repositories::IEventStore& store,
                      const ses::config::DispatchSettings& settings);

    DispatchResult dispatch(const std::string& aggregate_id, const ChatSessionCommand& command,
                            const CommandMetadata& metadata = {});
    DispatchResult dispatch(const std::string& aggregate_id, const MemorySessionCommand& command,
                            const CommandMetadata& metadata = {});

    // Throws std::invalid_argument if aggregate_type does not match the command family.
    DispatchResult dispatch(const std::string& aggregate_id, const std::string& aggregate_type,
                            const Command& command, const CommandMetadata& metadata = {});

    // Called after every successful append, e.g. to publish to a live feed.
    void set_on_committed(CommittedCallback callback);

    uint64_t conflict_count() const noexcept { return conflicts_; }

private:
    template <typename Aggregate, typename AggregateCommand>
    DispatchResult execute_with_retry(const std::string& aggregate_id,
                                      const AggregateCommand& command,
                                      const ses::domain::EventMetadata& metadata);

    template <typename Aggregate>
    DispatchResult commit(const std::string& aggregate_id, Aggregate& aggregate,
                          uint64_t expected_version, const ses::domain::EventMetadata& metadata);

    static ses::domain::EventMetadata resolve(const CommandMetadata& metadata);

    ses::repositories::IEventStore& store_;
    ses::config::DispatchSettings settings_;
    ses::infrastructure::EventSerializer serializer_;
    StreamReconstructor reconstructor_;
    CommittedCallback on_committed_;
    std::atomic<uint64_t> conflicts_{0};
};

} // namespace ses::services
