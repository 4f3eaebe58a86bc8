#include "domain/aggregates/AggregateRoot.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <variant>
#include <vector>

using ses::domain::AggregateRoot;

namespace {

struct Added { int amount; };
struct Cleared {};
using CounterEvent = std::variant<Added, Cleared>;

struct CounterState {
    int total = 0;
    int changes = 0;

    void when(const CounterEvent& event) {
        if (const auto* added = std::get_if<Added>(&event)) {
            total += added->amount;
        } else {
            total = 0;
        }
        ++changes;
    }
};

using Counter = AggregateRoot<CounterState, CounterEvent>;

} // namespace

TEST(AggregateRoot, StartsEmptyAtVersionZero) {
    Counter counter;
    EXPECT_EQ(counter.version(), 0u);
    EXPECT_TRUE(counter.uncommitted_events().empty());
    EXPECT_EQ(counter.state().total, 0);
}

TEST(AggregateRoot, ApplyMutatesStateAndRecordsEvent) {
    Counter counter;
    counter.apply(Added{5});
    counter.apply(Added{2});

    EXPECT_EQ(counter.state().total, 7);
    EXPECT_EQ(counter.version(), 2u);
    ASSERT_EQ(counter.uncommitted_events().size(), 2u);
    EXPECT_EQ(std::get<Added>(counter.uncommitted_events()[1]).amount, 2);
}

TEST(AggregateRoot, ClearingUncommittedKeepsVersionAndState) {
    Counter counter;
    counter.apply(Added{5});
    counter.clear_uncommitted_events();

    EXPECT_TRUE(counter.uncommitted_events().empty());
    EXPECT_EQ(counter.version(), 1u);
    EXPECT_EQ(counter.state().total, 5);
}

TEST(AggregateRoot, ReplayMatchesLiveApplication) {
    std::vector<CounterEvent> history{Added{3}, Cleared{}, Added{4}};

    Counter live;
    for (const auto& event : history) live.apply(event);

    Counter replayed;
    replayed.load_from_history(history);

    EXPECT_EQ(replayed.state().total, live.state().total);
    EXPECT_EQ(replayed.state().changes, live.state().changes);
    EXPECT_EQ(replayed.version(), live.version());
    EXPECT_TRUE(replayed.uncommitted_events().empty());
}

TEST(AggregateRoot, StreamVersionMayCoverSkippedEvents) {
    Counter counter;
    counter.load_from_history({Added{1}}, 3);
    EXPECT_EQ(counter.version(), 3u);
    EXPECT_EQ(counter.state().total, 1);
}

TEST(AggregateRoot, RejectsStreamVersionBelowEventCount) {
    Counter counter;
    EXPECT_THROW(counter.load_from_history({Added{1}, Added{2}}, 1), std::invalid_argument);
}

TEST(AggregateRoot, RejectsLoadingHistoryTwice) {
    Counter counter;
    counter.load_from_history({Added{1}});
    EXPECT_THROW(counter.load_from_history({Added{1}}), std::logic_error);
}
