#include "domain/errors/DomainErrors.hpp"
#include "repositories/InMemoryEventStore.hpp"
#include "support/TestEvents.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace ses::domain;
using ses::repositories::InMemoryEventStore;
using ses::testing::make_uncommitted;

class InMemoryEventStoreTest : public ::testing::Test {
protected:
    InMemoryEventStore store;

    std::vector<StoredEvent> append(const std::string& id, std::vector<std::string> event_ids,
                                    uint64_t expected, int64_t timestamp_ms = 1000) {
        std::vector<UncommittedEvent> batch;
        for (const auto& event_id : event_ids) {
            batch.push_back(make_uncommitted(event_id, "TestEvent", timestamp_ms));
        }
        return store.append(id, "ChatSession", batch, expected);
    }

    std::vector<StoredEvent> drain_scan(std::optional<Timestamp> after = std::nullopt) {
        std::vector<StoredEvent> events;
        auto cursor = store.scan_all_events(after);
        while (auto event = cursor->next()) {
            events.push_back(*event);
        }
        return events;
    }
};

// --- Append ---

TEST_F(InMemoryEventStoreTest, AppendAssignsContiguousVersions) {
    auto first = append("a", {"e1", "e2"}, 0);
    auto second = append("a", {"e3"}, 2);

    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0].version, 1u);
    EXPECT_EQ(first[1].version, 2u);
    EXPECT_EQ(second[0].version, 3u);
    EXPECT_EQ(store.current_version("a"), 3u);
    EXPECT_EQ(store.event_count(), 3u);
}

TEST_F(InMemoryEventStoreTest, AppendFillsEnvelope) {
    auto stored = append("a", {"e1"}, 0);
    EXPECT_EQ(stored[0].event_id, "e1");
    EXPECT_EQ(stored[0].aggregate_id, "a");
    EXPECT_EQ(stored[0].aggregate_type, "ChatSession");
    EXPECT_EQ(stored[0].event_type, "TestEvent");
    EXPECT_EQ(stored[0].event_data["n"], "e1");
    EXPECT_EQ(stored[0].timestamp, Timestamp(1000));
}

TEST_F(InMemoryEventStoreTest, MetadataDefaultsToEventId) {
    auto stored = append("a", {"e1"}, 0);
    EXPECT_EQ(stored[0].metadata.correlation_id, "e1");
    EXPECT_EQ(stored[0].metadata.causation_id, "e1");
    EXPECT_FALSE(stored[0].metadata.user_id.has_value());
}

TEST_F(InMemoryEventStoreTest, ExplicitMetadataIsCopiedToEveryEvent) {
    EventMetadata metadata{"corr-1", "", std::string("user-9"), std::nullopt};
    auto stored = store.append("a", "ChatSession",
                               {make_uncommitted("e1"), make_uncommitted("e2")}, 0, metadata);

    for (const auto& event : stored) {
        EXPECT_EQ(event.metadata.correlation_id, "corr-1");
        EXPECT_EQ(event.metadata.causation_id, "corr-1");
        EXPECT_EQ(event.metadata.user_id, std::optional<std::string>("user-9"));
    }
}

TEST_F(InMemoryEventStoreTest, EmptyBatchIsNoOp) {
    auto stored = store.append("a", "ChatSession", {}, 0);
    EXPECT_TRUE(stored.empty());
    EXPECT_EQ(store.stream_count(), 0u);
}

TEST_F(InMemoryEventStoreTest, StaleExpectedVersionThrowsAndStoresNothing) {
    append("a", {"e1", "e2"}, 0);

    try {
        append("a", {"e3", "e4"}, 1);
        FAIL() << "expected ConcurrencyError";
    } catch (const ConcurrencyError& e) {
        EXPECT_EQ(e.aggregate_id(), "a");
        EXPECT_EQ(e.expected_version(), 1u);
        EXPECT_EQ(e.actual_version(), 2u);
    }
    EXPECT_EQ(store.current_version("a"), 2u);
    EXPECT_EQ(store.event_count(), 2u);
}

TEST_F(InMemoryEventStoreTest, NewStreamRequiresExpectedVersionZero) {
    EXPECT_THROW(append("a", {"e1"}, 1), ConcurrencyError);
    EXPECT_EQ(store.stream_count(), 0u);
}

TEST_F(InMemoryEventStoreTest, RejectsAggregateTypeChange) {
    append("a", {"e1"}, 0);
    EXPECT_THROW(store.append("a", "MemorySession", {make_uncommitted("e2")}, 1), std::invalid_argument);
}

TEST_F(InMemoryEventStoreTest, ExactlyOneConcurrentWriterWins) {
    append("a", {"e1"}, 0);

    constexpr int kWriters = 8;
    std::atomic<int> winners{0};
    std::atomic<int> conflicts{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kWriters; ++i) {
        threads.emplace_back([&, i]() {
            try {
                store.append("a", "ChatSession", {make_uncommitted("w" + std::to_string(i))}, 1);
                ++winners;
            } catch (const ConcurrencyError& e) {
                if (e.expected_version() == 1 && e.actual_version() == 2) ++conflicts;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(conflicts.load(), kWriters - 1);
    EXPECT_EQ(store.current_version("a"), 2u);
}

TEST_F(InMemoryEventStoreTest, WritersOnDifferentAggregatesAllSucceed) {
    constexpr int kWriters = 16;
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kWriters; ++i) {
        threads.emplace_back([&, i]() {
            std::string id = "agg-" + std::to_string(i);
            store.append(id, "ChatSession", {make_uncommitted(id + "-1"), make_uncommitted(id + "-2")}, 0);
            store.append(id, "ChatSession", {make_uncommitted(id + "-3")}, 2);
            ++winners;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(winners.load(), kWriters);
    EXPECT_EQ(store.stream_count(), static_cast<size_t>(kWriters));
    EXPECT_EQ(store.event_count(), static_cast<size_t>(kWriters * 3));
    EXPECT_EQ(drain_scan().size(), static_cast<size_t>(kWriters * 3));
}

TEST_F(InMemoryEventStoreTest, RejectedFirstAppendLeavesNoStream) {
    EXPECT_THROW(append("a", {"e1"}, 3), ConcurrencyError);

    EXPECT_FALSE(store.get_stream("a").has_value());
    EXPECT_EQ(store.current_version("a"), 0u);
    EXPECT_TRUE(drain_scan().empty());

    append("a", {"e1"}, 0);
    EXPECT_EQ(store.current_version("a"), 1u);
}

// --- Reads ---

TEST_F(InMemoryEventStoreTest, GetStreamReturnsEventsInVersionOrder) {
    append("a", {"e1", "e2"}, 0);
    append("a", {"e3"}, 2);

    auto stream = store.get_stream("a");
    ASSERT_TRUE(stream.has_value());
    EXPECT_EQ(stream->aggregate_id, "a");
    EXPECT_EQ(stream->version, 3u);
    ASSERT_EQ(stream->events.size(), 3u);
    for (size_t i = 0; i < stream->events.size(); ++i) {
        EXPECT_EQ(stream->events[i].version, i + 1);
    }
}

TEST_F(InMemoryEventStoreTest, GetStreamOfUnknownAggregateIsEmpty) {
    EXPECT_FALSE(store.get_stream("missing").has_value());
    EXPECT_EQ(store.current_version("missing"), 0u);
}

TEST_F(InMemoryEventStoreTest, EventsAfterVersionIsStrict) {
    append("a", {"e1", "e2", "e3"}, 0);

    auto events = store.get_events_after_version("a", 1);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].version, 2u);
    EXPECT_EQ(events[1].version, 3u);
    EXPECT_TRUE(store.get_events_after_version("a", 3).empty());
    EXPECT_TRUE(store.get_events_after_version("missing", 0).empty());
}

// --- Scan ---

TEST_F(InMemoryEventStoreTest, ScanVisitsEveryEventInPerAggregateOrder) {
    append("a", {"a1", "a2"}, 0);
    append("b", {"b1"}, 0);
    append("a", {"a3"}, 2);

    auto events = drain_scan();
    ASSERT_EQ(events.size(), 4u);

    uint64_t last_a = 0;
    for (const auto& event : events) {
        if (event.aggregate_id == "a") {
            EXPECT_GT(event.version, last_a);
            last_a = event.version;
        }
    }
    EXPECT_EQ(last_a, 3u);
}

TEST_F(InMemoryEventStoreTest, ScanFiltersStrictlyAfterTimestamp) {
    append("a", {"old"}, 0, 1000);
    append("a", {"edge"}, 1, 2000);
    append("b", {"new"}, 0, 3000);

    auto events = drain_scan(Timestamp(2000));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event_id, "new");
}

TEST_F(InMemoryEventStoreTest, ScanOfEmptyStoreEndsImmediately) {
    auto cursor = store.scan_all_events();
    EXPECT_FALSE(cursor->next().has_value());
    EXPECT_FALSE(cursor->next().has_value());
}

TEST_F(InMemoryEventStoreTest, ExhaustedCursorStaysExhausted) {
    append("a", {"e1"}, 0);
    auto cursor = store.scan_all_events();
    ASSERT_TRUE(cursor->next().has_value());
    EXPECT_FALSE(cursor->next().has_value());
    append("b", {"e2"}, 0);
    EXPECT_FALSE(cursor->next().has_value());
}

TEST_F(InMemoryEventStoreTest, ConsumerCanStopEarly) {
    append("a", {"e1", "e2", "e3"}, 0);
    auto cursor = store.scan_all_events();
    ASSERT_TRUE(cursor->next().has_value());
    cursor.reset();
    // appends still work after an abandoned scan
    append("a", {"e4"}, 3);
    EXPECT_EQ(store.current_version("a"), 4u);
}
