#pragma once

#include "domain/errors/DomainErrors.hpp"
#include "repositories/IEventStore.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ses::repositories {

// Each stream carries its own mutex; the version check and the insert happen
// in one critical section on that stream. index_mutex_ only guards the id ->
// stream map, so appends to different aggregates do not contend.
class InMemoryEventStore : public ses::repositories::IEventStore {
public:
    std::vector<ses::domain::StoredEvent> append(
        const std::string& aggregate_id, const std::string& aggregate_type,
        const std::vector<ses::domain::UncommittedEvent>& events, uint64_t expected_version,
        const ses::domain::EventMetadata& metadata = {}) override {
        if (events.empty()) return {};

        auto stream = stream_for_append(aggregate_id);
        std::lock_guard<std::mutex> lock(stream->mutex);
        uint64_t actual = stream->events.size();
        if (actual != expected_version) {
            throw ses::domain::ConcurrencyError(aggregate_id, expected_version, actual);
        }
        if (actual > 0 && stream->aggregate_type != aggregate_type) {
            throw std::invalid_argument("Aggregate " + aggregate_id + " is a "
                                        + stream->aggregate_type + ", not a " + aggregate_type);
        }

        auto stored = make_stored_events(aggregate_id, aggregate_type, events, expected_version, metadata);
        stream->aggregate_type = aggregate_type;
        stream->events.insert(stream->events.end(), stored.begin(), stored.end());
        event_count_ += stored.size();
        return stored;
    }

    std::optional<ses::domain::EventStream> get_stream(const std::string& aggregate_id) const override {
        auto stream = find_stream(aggregate_id);
        if (!stream) return std::nullopt;
        std::lock_guard<std::mutex> lock(stream->mutex);
        if (stream->events.empty()) return std::nullopt;
        return ses::domain::EventStream{aggregate_id, stream->events, stream->events.size()};
    }

    std::vector<ses::domain::StoredEvent> get_events_after_version(
        const std::string& aggregate_id, uint64_t version) const override {
        auto stream = find_stream(aggregate_id);
        if (!stream) return {};
        std::lock_guard<std::mutex> lock(stream->mutex);
        if (version >= stream->events.size()) return {};
        // versions are 1-based and contiguous, so version N sits at index N-1
        return {stream->events.begin() + static_cast<std::ptrdiff_t>(version), stream->events.end()};
    }

    std::unique_ptr<IEventCursor> scan_all_events(
        std::optional<ses::domain::Timestamp> after_timestamp = std::nullopt) const override {
        return std::make_unique<Cursor>(*this, after_timestamp);
    }

    uint64_t current_version(const std::string& aggregate_id) const override {
        auto stream = find_stream(aggregate_id);
        if (!stream) return 0;
        std::lock_guard<std::mutex> lock(stream->mutex);
        return stream->events.size();
    }

    // Test helpers
    size_t event_count() const { return event_count_; }
    size_t stream_count() const {
        std::shared_lock<std::shared_mutex> index_lock(index_mutex_);
        size_t count = 0;
        for (const auto& [id, stream] : streams_) {
            std::lock_guard<std::mutex> lock(stream->mutex);
            if (!stream->events.empty()) ++count;
        }
        return count;
    }

private:
    struct Stream {
        std::mutex mutex;
        std::string aggregate_type;
        std::vector<ses::domain::StoredEvent> events;
    };

    std::shared_ptr<Stream> find_stream(const std::string& aggregate_id) const {
        std::shared_lock<std::shared_mutex> lock(index_mutex_);
        auto it = streams_.find(aggregate_id);
        return it == streams_.end() ? nullptr : it->second;
    }

    // A stream whose first append loses stays empty and is invisible to readers.
    std::shared_ptr<Stream> stream_for_append(const std::string& aggregate_id) {
        if (auto existing = find_stream(aggregate_id)) return existing;
        std::unique_lock<std::shared_mutex> lock(index_mutex_);
        auto& slot = streams_[aggregate_id];
        if (!slot) slot = std::make_shared<Stream>();
        return slot;
    }

    // First stream in id order, or the one after `after`.
    std::pair<std::string, std::shared_ptr<Stream>> next_stream(const std::optional<std::string>& after) const {
        std::shared_lock<std::shared_mutex> lock(index_mutex_);
        auto it = after ? streams_.upper_bound(*after) : streams_.begin();
        if (it == streams_.end()) return {};
        return *it;
    }

    // Walks streams in id order, locking one stream per step so appends are not
    // blocked for the lifetime of the scan. Events appended mid-scan may or may
    // not be seen.
    class Cursor : public IEventCursor {
    public:
        Cursor(const InMemoryEventStore& store, std::optional<ses::domain::Timestamp> after)
            : store_(store), after_(after) {}

        std::optional<ses::domain::StoredEvent> next() override {
            while (!exhausted_) {
                if (!stream_) {
                    auto [id, stream] = store_.next_stream(aggregate_id_);
                    if (!stream) {
                        exhausted_ = true;
                        break;
                    }
                    aggregate_id_ = std::move(id);
                    stream_ = std::move(stream);
                    index_ = 0;
                }
                {
                    std::lock_guard<std::mutex> lock(stream_->mutex);
                    while (index_ < stream_->events.size()) {
                        const auto& event = stream_->events[index_++];
                        if (!after_ || event.timestamp > *after_) return event;
                    }
                }
                stream_.reset();
            }
            return std::nullopt;
        }

    private:
        const InMemoryEventStore& store_;
        std::optional<ses::domain::Timestamp> after_;
        std::optional<std::string> aggregate_id_;
        std::shared_ptr<Stream> stream_;
        size_t index_{0};
        bool exhausted_{false};
    };

    mutable std::shared_mutex index_mutex_;
    std::map<std::string, std::shared_ptr<Stream>> streams_;
    std::atomic<size_t> event_count_{0};
};

} // namespace ses::repositories
