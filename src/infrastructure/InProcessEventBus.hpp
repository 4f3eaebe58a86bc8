#pragma once

#include "services/IEventFeed.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

namespace ses::infrastructure {

// Live feed of committed events. publish() enqueues; a worker thread delivers
// to the callback in publish order.
class InProcessEventBus : public ses::services::IEventFeed {
public:
    InProcessEventBus() = default;
    ~InProcessEventBus() override;

    InProcessEventBus(const InProcessEventBus&) = delete;
    InProcessEventBus& operator=(const InProcessEventBus&) = delete;

    void set_on_event(EventCallback callback) override;
    void start() override;
    // Delivers everything already queued, then joins the worker.
    void stop() override;

    void publish(const std::vector<ses::domain::StoredEvent>& events);

    // Blocks until every published event has been delivered.
    void drain();

    size_t delivered_count() const;

private:
    void run();

    EventCallback on_event_;
    std::mutex callback_mutex_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<ses::domain::StoredEvent> queue_;
    bool running_{false};
    bool delivering_{false};
    size_t delivered_{0};

    std::thread worker_;
};

} // namespace ses::infrastructure
