#include "projections/DeadLetterQueue.hpp"

#include <stdexcept>

namespace ses::projections {

DeadLetterQueue::DeadLetterQueue(size_t capacity)
    : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("DeadLetterQueue capacity must be positive");
    }
}

void DeadLetterQueue::push(DeadLetter letter) {
    std::lock_guard lock(mutex_);
    if (letters_.size() == capacity_) {
        letters_.pop_front();
        ++dropped_;
    }
    letters_.push_back(std::move(letter));
}

std::vector<DeadLetter> DeadLetterQueue::entries() const {
    std::lock_guard lock(mutex_);
    return {letters_.begin(), letters_.end()};
}

size_t DeadLetterQueue::size() const {
    std::lock_guard lock(mutex_);
    return letters_.size();
}

uint64_t DeadLetterQueue::dropped_count() const {
    std::lock_guard lock(mutex_);
    return dropped_;
}

void DeadLetterQueue::clear() {
    std::lock_guard lock(mutex_);
    letters_.clear();
    dropped_ = 0;
}

} // namespace ses::projections
