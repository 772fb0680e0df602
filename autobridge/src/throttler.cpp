#include "throttler.hpp"

#include "error_envelope.hpp"

#include <algorithm>
#include <chrono>

namespace autobridge {

namespace {
constexpr auto kCancelPollInterval = std::chrono::milliseconds(20);
}

RequestThrottler::Permit& RequestThrottler::Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        reset();
        owner_ = other.owner_;
        other.owner_ = nullptr;
    }
    return *this;
}

void RequestThrottler::Permit::reset() {
    if (owner_) {
        owner_->release();
        owner_ = nullptr;
    }
}

RequestThrottler::RequestThrottler(size_t max_concurrent)
    : max_concurrent_(max_concurrent > 0 ? max_concurrent : 1) {}

void RequestThrottler::acquire(const ShouldCancel& should_cancel) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (in_flight_ < max_concurrent_ && waiters_.empty()) {
        ++in_flight_;
        return;
    }

    auto waiter = std::make_shared<Waiter>();
    waiters_.push_back(waiter);

    while (!waiter->admitted) {
        if (should_cancel) {
            waiter->cv.wait_for(lock, kCancelPollInterval);
            if (!waiter->admitted && should_cancel()) {
                waiters_.erase(std::find(waiters_.begin(), waiters_.end(), waiter));
                throw OperationCancelled("throttle admission");
            }
        } else {
            waiter->cv.wait(lock);
        }
    }
    // release() already counted this waiter in in_flight_.
}

void RequestThrottler::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!waiters_.empty()) {
        // The slot passes to the oldest waiter; in_flight_ stays the same.
        auto next = waiters_.front();
        waiters_.pop_front();
        next->admitted = true;
        next->cv.notify_one();
        return;
    }
    if (in_flight_ > 0) {
        --in_flight_;
    }
}

RequestThrottler::Permit RequestThrottler::admit(const ShouldCancel& should_cancel) {
    acquire(should_cancel);
    return Permit(this);
}

size_t RequestThrottler::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

size_t RequestThrottler::waiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiters_.size();
}

} // namespace autobridge
