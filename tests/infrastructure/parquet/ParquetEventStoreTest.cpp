#include "domain/errors/DomainErrors.hpp"
#include "repositories/parquet/ParquetEventStore.hpp"
#include "support/TestEvents.hpp"

#include <arrow/filesystem/api.h>
#include <arrow/filesystem/mockfs.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <functional>
#include <thread>

using namespace ses::domain;
using ses::repositories::pq::ParquetEventStore;
using ses::testing::make_uncommitted;

// --- Test fake ---

// Mock filesystem that can fail batch writes, or run a rival writer right
// before the next Move so it lands between our version check and our commit.
class HookedFileSystem : public arrow::fs::SubTreeFileSystem {
public:
    using arrow::fs::SubTreeFileSystem::SubTreeFileSystem;

    bool fail_writes = false;
    std::function<void()> before_move;

    arrow::Result<std::shared_ptr<arrow::io::OutputStream>> OpenOutputStream(
        const std::string& path,
        const std::shared_ptr<const arrow::KeyValueMetadata>& metadata = {}) override {
        if (fail_writes) return arrow::Status::IOError("disk full: ", path);
        return arrow::fs::SubTreeFileSystem::OpenOutputStream(path, metadata);
    }

    arrow::Status Move(const std::string& src, const std::string& dest) override {
        if (before_move) {
            auto hook = std::move(before_move);
            before_move = nullptr;
            hook();
        }
        return arrow::fs::SubTreeFileSystem::Move(src, dest);
    }
};

// --- Fixture ---

class ParquetEventStoreTest : public ::testing::Test {
protected:
    std::shared_ptr<HookedFileSystem> fs_;

    void SetUp() override {
        auto mock_fs = std::make_shared<arrow::fs::internal::MockFileSystem>(
            arrow::fs::TimePoint(std::chrono::seconds(0)));
        fs_ = std::make_shared<HookedFileSystem>("/", mock_fs);
    }

    std::vector<UncommittedEvent> batch(std::initializer_list<std::string> event_ids,
                                        int64_t timestamp_ms = 1000) {
        std::vector<UncommittedEvent> events;
        for (const auto& event_id : event_ids) {
            events.push_back(make_uncommitted(event_id, "TestEvent", timestamp_ms));
        }
        return events;
    }

    std::vector<std::string> list_entries(const std::string& dir, arrow::fs::FileType type) {
        arrow::fs::FileSelector selector;
        selector.base_dir = dir;
        selector.allow_not_found = true;
        selector.recursive = true;
        std::vector<std::string> paths;
        for (const auto& info : fs_->GetFileInfo(selector).ValueOrDie()) {
            if (info.type() == type) paths.push_back(info.path());
        }
        std::sort(paths.begin(), paths.end());
        return paths;
    }

    std::vector<std::string> list_files(const std::string& dir) {
        return list_entries(dir, arrow::fs::FileType::File);
    }

    const std::string aggregate_id = "3f2504e0-4f89-41d3-9a0c-0305e82c3301";
};

TEST_F(ParquetEventStoreTest, AppendAndReadStreamRoundtrip) {
    ParquetEventStore store(fs_);

    EventMetadata metadata{"corr-1", "cause-1", std::string("user-1"), std::nullopt};
    auto stored = store.append(aggregate_id, "ChatSession", batch({"e1", "e2"}), 0, metadata);
    ASSERT_EQ(stored.size(), 2u);

    auto stream = store.get_stream(aggregate_id);
    ASSERT_TRUE(stream.has_value());
    EXPECT_EQ(stream->version, 2u);
    ASSERT_EQ(stream->events.size(), 2u);
    EXPECT_EQ(stream->events[0], stored[0]);
    EXPECT_EQ(stream->events[1], stored[1]);

    EXPECT_EQ(stream->events[0].metadata.user_id, std::optional<std::string>("user-1"));
    EXPECT_FALSE(stream->events[0].metadata.trace_id.has_value());
    EXPECT_EQ(stream->events[1].event_data["n"], "e2");
}

TEST_F(ParquetEventStoreTest, WritesOneFilePerBatch) {
    ParquetEventStore store(fs_);
    store.append(aggregate_id, "ChatSession", batch({"e1", "e2"}), 0);
    store.append(aggregate_id, "ChatSession", batch({"e3"}), 2);

    auto files = list_files("events");
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0], "events/3f/" + aggregate_id + "/0000000001/0000000001_0000000002.parquet");
    EXPECT_EQ(files[1], "events/3f/" + aggregate_id + "/0000000003/0000000003_0000000003.parquet");
}

TEST_F(ParquetEventStoreTest, StaleExpectedVersionThrowsAndWritesNothing) {
    ParquetEventStore store(fs_);
    store.append(aggregate_id, "ChatSession", batch({"e1", "e2"}), 0);

    EXPECT_THROW(store.append(aggregate_id, "ChatSession", batch({"e3"}), 1), ConcurrencyError);
    EXPECT_EQ(store.current_version(aggregate_id), 2u);
    EXPECT_EQ(list_files("events").size(), 1u);
}

TEST_F(ParquetEventStoreTest, EmptyBatchIsNoOp) {
    ParquetEventStore store(fs_);
    EXPECT_TRUE(store.append(aggregate_id, "ChatSession", {}, 0).empty());
    EXPECT_TRUE(list_files("events").empty());
}

TEST_F(ParquetEventStoreTest, RejectsAggregateTypeChange) {
    ParquetEventStore store(fs_);
    store.append(aggregate_id, "ChatSession", batch({"e1"}), 0);
    EXPECT_THROW(store.append(aggregate_id, "MemorySession", batch({"e2"}), 1), std::invalid_argument);
}

TEST_F(ParquetEventStoreTest, RejectsIdsThatAreNotPathSafe) {
    ParquetEventStore store(fs_);
    EXPECT_THROW(store.append("../escape", "ChatSession", batch({"e1"}), 0), std::invalid_argument);
    EXPECT_THROW(store.get_stream(""), std::invalid_argument);
}

TEST_F(ParquetEventStoreTest, PersistsAcrossStoreInstances) {
    {
        ParquetEventStore writer(fs_);
        writer.append(aggregate_id, "ChatSession", batch({"e1", "e2"}), 0);
    }

    ParquetEventStore reader(fs_);
    EXPECT_EQ(reader.current_version(aggregate_id), 2u);
    reader.append(aggregate_id, "ChatSession", batch({"e3"}), 2);

    auto stream = reader.get_stream(aggregate_id);
    ASSERT_TRUE(stream.has_value());
    EXPECT_EQ(stream->events.back().event_id, "e3");
    EXPECT_EQ(stream->events.back().version, 3u);
}

TEST_F(ParquetEventStoreTest, EventsAfterVersionSpansBatches) {
    ParquetEventStore store(fs_);
    store.append(aggregate_id, "ChatSession", batch({"e1", "e2"}), 0);
    store.append(aggregate_id, "ChatSession", batch({"e3", "e4"}), 2);

    auto events = store.get_events_after_version(aggregate_id, 1);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].version, 2u);
    EXPECT_EQ(events[2].version, 4u);
    EXPECT_TRUE(store.get_events_after_version("missing", 0).empty());
}

TEST_F(ParquetEventStoreTest, UnknownAggregateHasNoStream) {
    ParquetEventStore store(fs_);
    EXPECT_FALSE(store.get_stream(aggregate_id).has_value());
    EXPECT_EQ(store.current_version(aggregate_id), 0u);
}

TEST_F(ParquetEventStoreTest, ScanReturnsAllEventsWithTimestampFilter) {
    ParquetEventStore store(fs_);
    const std::string other_id = "9b2c1d4e-1111-4abc-8def-0123456789ab";
    store.append(aggregate_id, "ChatSession", batch({"a1"}, 1000), 0);
    store.append(aggregate_id, "ChatSession", batch({"a2"}, 3000), 1);
    store.append(other_id, "MemorySession", batch({"b1"}, 2000), 0);

    std::vector<std::string> all;
    auto cursor = store.scan_all_events();
    while (auto event = cursor->next()) all.push_back(event->event_id);
    EXPECT_EQ(all.size(), 3u);
    // per-aggregate order holds
    auto a1 = std::find(all.begin(), all.end(), "a1");
    auto a2 = std::find(all.begin(), all.end(), "a2");
    EXPECT_LT(a1, a2);

    std::vector<std::string> recent;
    auto filtered = store.scan_all_events(Timestamp(1000));
    while (auto event = filtered->next()) recent.push_back(event->event_id);
    std::sort(recent.begin(), recent.end());
    EXPECT_EQ(recent, (std::vector<std::string>{"a2", "b1"}));
}

TEST_F(ParquetEventStoreTest, IgnoresLeftoverStagingDirectories) {
    ParquetEventStore store(fs_);
    store.append(aggregate_id, "ChatSession", batch({"e1"}), 0);

    std::string staging = "events/3f/" + aggregate_id + "/0000000002.crashed.tmp";
    auto out = fs_->OpenOutputStream(staging + "/0000000002_0000000002.parquet").ValueOrDie();
    ASSERT_TRUE(out->Write("partial", 7).ok());
    ASSERT_TRUE(out->Close().ok());

    EXPECT_EQ(store.current_version(aggregate_id), 1u);
    store.append(aggregate_id, "ChatSession", batch({"e2"}), 1);
    EXPECT_EQ(store.current_version(aggregate_id), 2u);

    size_t scanned = 0;
    auto cursor = store.scan_all_events();
    while (cursor->next()) ++scanned;
    EXPECT_EQ(scanned, 2u);
}

// --- Atomic batches ---

TEST_F(ParquetEventStoreTest, FailedWriteLeavesNothingBehind) {
    ParquetEventStore store(fs_);
    store.append(aggregate_id, "ChatSession", batch({"e1"}), 0);

    fs_->fail_writes = true;
    EXPECT_THROW(store.append(aggregate_id, "ChatSession", batch({"e2", "e3"}), 1), std::runtime_error);
    fs_->fail_writes = false;

    EXPECT_EQ(store.current_version(aggregate_id), 1u);
    EXPECT_EQ(list_files("events").size(), 1u);
    EXPECT_EQ(list_entries("events/3f/" + aggregate_id, arrow::fs::FileType::Directory),
              (std::vector<std::string>{"events/3f/" + aggregate_id + "/0000000001"}));

    store.append(aggregate_id, "ChatSession", batch({"e2", "e3"}), 1);
    EXPECT_EQ(store.get_stream(aggregate_id)->events.size(), 3u);
}

// --- Concurrency ---

TEST_F(ParquetEventStoreTest, WriterThatLosesCommitRaceGetsConcurrencyError) {
    ParquetEventStore ours(fs_);
    ParquetEventStore theirs(fs_);
    ours.append(aggregate_id, "ChatSession", batch({"e1", "e2", "e3"}), 0);

    // both pass the version check at 3; theirs commits first
    fs_->before_move = [&]() {
        theirs.append(aggregate_id, "ChatSession", batch({"theirs"}), 3);
    };
    try {
        ours.append(aggregate_id, "ChatSession", batch({"ours"}), 3);
        FAIL() << "expected ConcurrencyError";
    } catch (const ConcurrencyError& e) {
        EXPECT_EQ(e.expected_version(), 3u);
        EXPECT_EQ(e.actual_version(), 4u);
    }

    auto stream = ours.get_stream(aggregate_id);
    ASSERT_TRUE(stream.has_value());
    EXPECT_EQ(stream->version, 4u);
    EXPECT_EQ(stream->events.back().event_id, "theirs");
}

TEST_F(ParquetEventStoreTest, RacingBatchesOfDifferentSizesKeepStreamReadable) {
    ParquetEventStore ours(fs_);
    ParquetEventStore theirs(fs_);
    ours.append(aggregate_id, "ChatSession", batch({"e1", "e2", "e3"}), 0);

    fs_->before_move = [&]() {
        theirs.append(aggregate_id, "ChatSession", batch({"t4", "t5"}), 3);
    };
    EXPECT_THROW(ours.append(aggregate_id, "ChatSession", batch({"o4"}), 3), ConcurrencyError);

    auto stream = theirs.get_stream(aggregate_id);
    ASSERT_TRUE(stream.has_value());
    ASSERT_EQ(stream->events.size(), 5u);
    EXPECT_EQ(stream->events[3].event_id, "t4");
    EXPECT_EQ(stream->events[4].event_id, "t5");
    EXPECT_EQ(list_files("events").size(), 2u);
}

TEST_F(ParquetEventStoreTest, ExactlyOneConcurrentStoreInstanceWins) {
    ParquetEventStore seed(fs_);
    seed.append(aggregate_id, "ChatSession", batch({"e1"}), 0);

    constexpr int kWriters = 8;
    std::atomic<int> winners{0};
    std::atomic<int> conflicts{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kWriters; ++i) {
        threads.emplace_back([&, i]() {
            ParquetEventStore store(fs_);
            std::vector<UncommittedEvent> events{make_uncommitted("w" + std::to_string(i))};
            if (i % 2 == 1) events.push_back(make_uncommitted("w" + std::to_string(i) + "b"));
            try {
                store.append(aggregate_id, "ChatSession", events, 1);
                ++winners;
            } catch (const ConcurrencyError& e) {
                if (e.expected_version() == 1 && e.actual_version() > 1) ++conflicts;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(conflicts.load(), kWriters - 1);

    auto stream = seed.get_stream(aggregate_id);
    ASSERT_TRUE(stream.has_value());
    EXPECT_EQ(stream->version, stream->events.size());
    EXPECT_GE(stream->version, 2u);
    EXPECT_LE(stream->version, 3u);
}
