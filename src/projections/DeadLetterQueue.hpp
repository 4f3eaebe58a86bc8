#pragma once

#include "domain/events/StoredEvent.hpp"
#include "domain/value_objects/Timestamp.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace ses::projections {

struct DeadLetter {
    std::string projector;
    ses::domain::StoredEvent event;
    std::string error;
    ses::domain::Timestamp failed_at;
};

// Bounded record of events a projector could not handle. When full, the
// oldest entry is dropped.
class DeadLetterQueue {
public:
    explicit DeadLetterQueue(size_t capacity);

    void push(DeadLetter letter);

    std::vector<DeadLetter> entries() const;
    size_t size() const;
    size_t capacity() const noexcept { return capacity_; }
    uint64_t dropped_count() const;
    void clear();

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<DeadLetter> letters_;
    uint64_t dropped_{0};
};

} // namespace ses::projections
