#include "config/Settings.hpp"
#include "domain/errors/DomainErrors.hpp"
#include "domain/value_objects/SessionId.hpp"
#include "infrastructure/EnvelopeCodec.hpp"
#include "infrastructure/InProcessEventBus.hpp"
#include "projections/ChatProjector.hpp"
#include "projections/ChatReadModelStore.hpp"
#include "projections/DeadLetterQueue.hpp"
#include "projections/MemoryProjector.hpp"
#include "projections/MemoryReadModelStore.hpp"
#include "projections/ProjectorRunner.hpp"
#include "repositories/IEventStore.hpp"
#include "repositories/InMemoryEventStore.hpp"
#include "services/CommandDispatcher.hpp"
#include "services/StreamReconstructor.hpp"

#ifdef SES_HAS_PARQUET
#include "repositories/parquet/ParquetEventStore.hpp"
#endif

#include <nlohmann/json.hpp>

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace ses;

static std::atomic<bool> running{true};

void signal_handler(int) {
    running = false;
}

namespace {

void print_usage() {
    std::cerr << "Usage: session_event_store <command>" << std::endl;
    std::cerr << "  demo               create sample sessions and print their streams" << std::endl;
    std::cerr << "  dump               print every stored event as one JSON envelope per line" << std::endl;
    std::cerr << "  rebuild            rebuild all read models from the event log" << std::endl;
    std::cerr << "  show <aggregate>   print one event stream" << std::endl;
    std::cerr << "Set SES_STORAGE_BACKEND=parquet and SES_DATA_DIRECTORY to persist events." << std::endl;
}

void print_stream(const repositories::IEventStore& store, const std::string& aggregate_id) {
    auto stream = store.get_stream(aggregate_id);
    if (!stream) {
        throw domain::NotFoundError(aggregate_id);
    }
    for (const auto& event : stream->events) {
        std::cout << infrastructure::EnvelopeCodec::to_json(event).dump(2) << std::endl;
    }
}

void print_read_models(const projections::ChatReadModelStore& chat,
                       const projections::MemoryReadModelStore& memory,
                       const std::string& user_id) {
    for (const auto& row : chat.sessions_for_user(user_id)) {
        std::cout << "[chat] " << row.id << " \"" << row.title << "\" status=" << row.status
                  << " messages=" << row.message_count
                  << " updated_at=" << row.updated_at.to_iso8601() << std::endl;
        for (const auto& message : chat.messages_for_session(row.id)) {
            std::cout << "    " << domain::to_string(message.role) << ": " << message.content << std::endl;
        }
    }
    for (const auto& row : memory.memory_sessions_for_actor(user_id)) {
        std::cout << "[memory] " << row.id << " \"" << row.title << "\" status=" << row.status
                  << " entries=" << row.entry_count
                  << " last_activity_at=" << row.last_activity_at.to_iso8601() << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }
    std::string command = argv[1];

    auto settings = config::Settings::from_environment();

    std::unique_ptr<repositories::IEventStore> store;
    if (settings.storage.backend == "parquet") {
#ifdef SES_HAS_PARQUET
        auto fs = repositories::pq::ParquetEventStore::make_local_fs(settings.storage.data_directory);
        store = std::make_unique<repositories::pq::ParquetEventStore>(fs);
        std::cout << "[engine] Parquet event store at " << settings.storage.data_directory << std::endl;
#else
        std::cerr << "Parquet backend requested but not compiled in. "
                  << "Rebuild with Apache Arrow installed." << std::endl;
        return 1;
#endif
    } else if (settings.storage.backend == "memory") {
        store = std::make_unique<repositories::InMemoryEventStore>();
    } else {
        std::cerr << "Unknown storage backend: " << settings.storage.backend << std::endl;
        return 1;
    }

    projections::ChatReadModelStore chat_read_model;
    projections::MemoryReadModelStore memory_read_model;
    projections::ChatProjector chat_projector(chat_read_model);
    projections::MemoryProjector memory_projector(memory_read_model);
    projections::DeadLetterQueue dead_letters(settings.projection.dead_letter_capacity);
    projections::ProjectorRunner runner({chat_projector, memory_projector}, dead_letters);

    std::signal(SIGINT, signal_handler);

    try {
        if (command == "demo") {
            infrastructure::InProcessEventBus bus;
            services::CommandDispatcher dispatcher(*store, settings.dispatch);
            if (settings.projection.live_feed) {
                runner.attach(bus);
                dispatcher.set_on_committed([&bus](const std::vector<domain::StoredEvent>& events) {
                    bus.publish(events);
                });
                bus.start();
            }

            const std::string user_id = "demo-user";
            services::CommandMetadata metadata{std::nullopt, std::nullopt, user_id, std::nullopt};

            auto chat_id = domain::SessionId::generate().value();
            dispatcher.dispatch(chat_id, services::CreateSession{user_id, "Demo chat"}, metadata);
            dispatcher.dispatch(chat_id, services::AddMessage{"Hello there", domain::MessageRole::USER, {}}, metadata);
            dispatcher.dispatch(chat_id, services::AddMessage{"Hi! How can I help?", domain::MessageRole::ASSISTANT, {}}, metadata);
            dispatcher.dispatch(chat_id, services::ArchiveSession{}, metadata);

            auto memory_id = domain::SessionId::generate().value();
            dispatcher.dispatch(memory_id, services::CreateMemorySession{user_id, std::nullopt}, metadata);
            dispatcher.dispatch(memory_id, services::StoreMemoryEntry{
                domain::MessageRole::USER, "Remember that I prefer short answers",
                nlohmann::json{{"source", "demo"}}}, metadata);
            dispatcher.dispatch(memory_id, services::CloseMemorySession{}, metadata);

            if (settings.projection.live_feed) {
                bus.drain();
                bus.stop();
            } else {
                auto cursor = store->scan_all_events();
                runner.rebuild(*cursor, &running);
            }

            print_stream(*store, chat_id);
            print_stream(*store, memory_id);

            services::StreamReconstructor reconstructor;
            auto session = reconstructor.reconstruct_chat_session(store->get_stream(chat_id)->events);
            std::cout << "[engine] Reconstructed " << session.id() << " at version " << session.version()
                      << " with " << session.message_count() << " messages, status "
                      << domain::to_string(session.status()) << std::endl;

            auto notes = reconstructor.reconstruct_memory_session(store->get_stream(memory_id)->events);
            for (const auto& entry : notes.search_entries("short answers")) {
                std::cout << "[engine] Memory match " << entry.entry_id << ": " << entry.content << std::endl;
            }
            std::cout << "[engine] " << notes.recent_entries(10).size() << " recent memory entries, last activity "
                      << notes.last_activity_at().to_iso8601() << std::endl;

            print_read_models(chat_read_model, memory_read_model, user_id);
        } else if (command == "dump") {
            auto cursor = store->scan_all_events();
            while (running) {
                auto event = cursor->next();
                if (!event) break;
                std::cout << infrastructure::EnvelopeCodec::to_json(*event).dump() << std::endl;
            }
        } else if (command == "rebuild") {
            auto cursor = store->scan_all_events();
            auto count = runner.rebuild(*cursor, &running);
            std::cout << "[engine] Replayed " << count << " events: "
                      << chat_read_model.session_count() << " chat sessions, "
                      << chat_read_model.message_count() << " messages, "
                      << memory_read_model.session_count() << " memory sessions, "
                      << memory_read_model.entry_count() << " memory entries" << std::endl;
            for (const auto& letter : dead_letters.entries()) {
                std::cerr << "[engine] Dead letter: " << letter.projector << " " << letter.event.event_id
                          << ": " << letter.error << std::endl;
            }
        } else if (command == "show") {
            if (argc < 3) {
                print_usage();
                return 1;
            }
            print_stream(*store, argv[2]);
        } else {
            print_usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "[engine] " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
