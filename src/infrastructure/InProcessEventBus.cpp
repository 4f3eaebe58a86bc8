#include "infrastructure/InProcessEventBus.hpp"

#include <iostream>

namespace ses::infrastructure {

InProcessEventBus::~InProcessEventBus() {
    stop();
}

void InProcessEventBus::set_on_event(EventCallback callback) {
    std::lock_guard lock(callback_mutex_);
    on_event_ = std::move(callback);
}

void InProcessEventBus::start() {
    std::lock_guard lock(queue_mutex_);
    if (running_) return;
    running_ = true;
    worker_ = std::thread([this]() { run(); });
}

void InProcessEventBus::stop() {
    {
        std::lock_guard lock(queue_mutex_);
        if (!running_) return;
        running_ = false;
    }
    queue_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void InProcessEventBus::publish(const std::vector<ses::domain::StoredEvent>& events) {
    if (events.empty()) return;
    {
        std::lock_guard lock(queue_mutex_);
        queue_.insert(queue_.end(), events.begin(), events.end());
    }
    queue_cv_.notify_one();
}

void InProcessEventBus::drain() {
    std::unique_lock lock(queue_mutex_);
    if (!running_) return;
    idle_cv_.wait(lock, [this]() { return (queue_.empty() && !delivering_) || !running_; });
}

size_t InProcessEventBus::delivered_count() const {
    std::lock_guard lock(queue_mutex_);
    return delivered_;
}

void InProcessEventBus::run() {
    std::unique_lock lock(queue_mutex_);
    while (true) {
        queue_cv_.wait(lock, [this]() { return !queue_.empty() || !running_; });
        if (queue_.empty()) break;    // stopped and fully delivered

        auto event = std::move(queue_.front());
        queue_.pop_front();
        delivering_ = true;
        lock.unlock();

        {
            std::lock_guard callback_lock(callback_mutex_);
            if (on_event_) {
                try {
                    on_event_(event);
                } catch (const std::exception& e) {
                    std::cerr << "[event-bus] Subscriber failed on event " << event.event_id
                              << " (" << event.event_type << "): " << e.what() << std::endl;
                } catch (...) {
                    std::cerr << "[event-bus] Subscriber failed on event " << event.event_id
                              << " (" << event.event_type << "): unknown exception" << std::endl;
                }
            }
        }

        lock.lock();
        delivering_ = false;
        ++delivered_;
        if (queue_.empty()) {
            idle_cv_.notify_all();
        }
    }
    idle_cv_.notify_all();
}

} // namespace ses::infrastructure
