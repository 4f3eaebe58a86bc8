#include "services/CommandDispatcher.hpp"

#include "domain/errors/DomainErrors.hpp"
#include "domain/value_objects/MessageContent.hpp"
#include "domain/value_objects/SessionId.hpp"
#include "domain/value_objects/Uuid.hpp"

#include <iostream>
#include <stdexcept>
#include <type_traits>
#include <variant>

using namespace ses::domain;

namespace ses::services {

namespace {

void run(ChatSession&, const CreateSession&) {
    throw std::logic_error("CreateSession cannot target an existing stream");
}

void run(ChatSession& session, const AddMessage& command) {
    session.add_message(MessageContent::create(command.content), command.role, command.file_keys);
}

void run(ChatSession& session, const ArchiveSession&) {
    session.archive();
}

void run(MemorySession&, const CreateMemorySession&) {
    throw std::logic_error("CreateMemorySession cannot target an existing stream");
}

void run(MemorySession& session, const StoreMemoryEntry& command) {
    session.store_entry(command.role, command.content, command.metadata);
}

void run(MemorySession& session, const CloseMemorySession&) {
    session.close();
}

} // namespace

CommandDispatcher::CommandDispatcher(ses::repositories::IEventStore& store,
                                     const ses::config::DispatchSettings& settings)
    : store_(store)
    , settings_(settings) {
}

void CommandDispatcher::set_on_committed(CommittedCallback callback) {
    on_committed_ = std::move(callback);
}

DispatchResult CommandDispatcher::dispatch(const std::string& aggregate_id,
                                           const ChatSessionCommand& command,
                                           const CommandMetadata& metadata) {
    auto resolved = resolve(metadata);
    if (const auto* create = std::get_if<CreateSession>(&command)) {
        auto session = ChatSession::create(SessionId::from_string(aggregate_id),
                                           create->owner_id, create->title);
        return commit(aggregate_id, session, 0, resolved);
    }
    return execute_with_retry<ChatSession>(aggregate_id, command, resolved);
}

DispatchResult CommandDispatcher::dispatch(const std::string& aggregate_id,
                                           const MemorySessionCommand& command,
                                           const CommandMetadata& metadata) {
    auto resolved = resolve(metadata);
    if (const auto* create = std::get_if<CreateMemorySession>(&command)) {
        auto session = MemorySession::create(SessionId::from_string(aggregate_id),
                                             create->actor_id, create->title);
        return commit(aggregate_id, session, 0, resolved);
    }
    return execute_with_retry<MemorySession>(aggregate_id, command, resolved);
}

DispatchResult CommandDispatcher::dispatch(const std::string& aggregate_id,
                                           const std::string& aggregate_type,
                                           const Command& command,
                                           const CommandMetadata& metadata) {
    return std::visit([&](const auto& family) {
        using T = std::decay_t<decltype(family)>;
        const char* expected_type = std::is_same_v<T, ChatSessionCommand>
            ? ChatSession::kAggregateType
            : MemorySession::kAggregateType;
        if (aggregate_type != expected_type) {
            throw std::invalid_argument("Command targets a " + std::string(expected_type)
                                        + ", not a " + aggregate_type);
        }
        return dispatch(aggregate_id, family, metadata);
    }, command);
}

template <typename Aggregate, typename AggregateCommand>
DispatchResult CommandDispatcher::execute_with_retry(const std::string& aggregate_id,
                                                     const AggregateCommand& command,
                                                     const EventMetadata& metadata) {
    for (int attempt = 0;; ++attempt) {
        auto stream = store_.get_stream(aggregate_id);
        if (!stream) {
            throw NotFoundError(aggregate_id);
        }

        auto aggregate = [&]() {
            if constexpr (std::is_same_v<Aggregate, ChatSession>) {
                return reconstructor_.reconstruct_chat_session(stream->events);
            } else {
                return reconstructor_.reconstruct_memory_session(stream->events);
            }
        }();
        std::visit([&aggregate](const auto& c) { run(aggregate, c); }, command);

        try {
            return commit(aggregate_id, aggregate, stream->version, metadata);
        } catch (const ConcurrencyError& e) {
            ++conflicts_;
            if (attempt >= settings_.max_retries) {
                std::cerr << "[dispatch] Giving up on " << aggregate_id << " after "
                          << attempt + 1 << " attempts: " << e.what() << std::endl;
                throw;
            }
            std::cerr << "[dispatch] " << e.what() << ", retrying ("
                      << attempt + 1 << "/" << settings_.max_retries << ")" << std::endl;
        }
    }
}

template <typename Aggregate>
DispatchResult CommandDispatcher::commit(const std::string& aggregate_id, Aggregate& aggregate,
                                         uint64_t expected_version, const EventMetadata& metadata) {
    std::vector<UncommittedEvent> batch;
    batch.reserve(aggregate.uncommitted_events().size());
    for (const auto& event : aggregate.uncommitted_events()) {
        batch.push_back(serializer_.encode(event));
    }

    auto stored = store_.append(aggregate_id, Aggregate::kAggregateType, batch,
                                expected_version, metadata);
    aggregate.clear_uncommitted_events();

    if (on_committed_ && !stored.empty()) {
        on_committed_(stored);
    }

    uint64_t produced_version = stored.empty() ? expected_version : stored.back().version;
    return DispatchResult{aggregate_id, produced_version, std::move(stored)};
}

EventMetadata CommandDispatcher::resolve(const CommandMetadata& metadata) {
    std::string correlation_id = metadata.correlation_id.value_or(Uuid::generate().str());
    std::string causation_id = metadata.causation_id.value_or(correlation_id);
    return EventMetadata{std::move(correlation_id), std::move(causation_id),
                         metadata.user_id, metadata.trace_id};
}

} // namespace ses::services
