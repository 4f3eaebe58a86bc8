#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ses::domain {

// Event-sourcing bookkeeping held by value inside an aggregate.
//
// State must be default-constructible and provide `void when(const Event&)`,
// the single place where an event changes state. Live commands go through
// apply(); replay goes through load_from_history(). Both run the same `when`,
// so a replayed aggregate ends in the same state as one built live.
template <typename State, typename Event>
class AggregateRoot {
public:
    const State& state() const noexcept { return state_; }
    uint64_t version() const noexcept { return version_; }

    const std::vector<Event>& uncommitted_events() const noexcept { return uncommitted_; }
    void clear_uncommitted_events() noexcept { uncommitted_.clear(); }

    void apply(Event event) {
        state_.when(event);
        uncommitted_.push_back(std::move(event));
        ++version_;
    }

    void load_from_history(const std::vector<Event>& events) {
        load_from_history(events, static_cast<uint64_t>(events.size()));
    }

    // stream_version may exceed events.size() when the stream carries event
    // types this build does not know; those are skipped but still count.
    void load_from_history(const std::vector<Event>& events, uint64_t stream_version) {
        if (version_ != 0 || !uncommitted_.empty()) {
            throw std::logic_error("History can only be loaded into a fresh aggregate");
        }
        if (stream_version < events.size()) {
            throw std::invalid_argument(
                "Stream version " + std::to_string(stream_version) + " is lower than the "
                + std::to_string(events.size()) + " events replayed");
        }
        for (const auto& event : events) {
            state_.when(event);
        }
        version_ = stream_version;
    }

private:
    State state_{};
    uint64_t version_{0};
    std::vector<Event> uncommitted_;
};

} // namespace ses::domain
