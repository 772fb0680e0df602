#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>

namespace autobridge {

/**
 * Counting gate that admits at most max_concurrent holders at once.
 *
 * Callers beyond the limit queue and are admitted strictly in arrival order: a
 * release hands its slot straight to the oldest waiter instead of letting any
 * caller race for it.
 */
class RequestThrottler {
public:
    /// Polled while waiting; returning true abandons the wait.
    using ShouldCancel = std::function<bool()>;

    /// Releases its slot when destroyed.
    class Permit {
    public:
        Permit() = default;
        explicit Permit(RequestThrottler* owner) : owner_(owner) {}
        ~Permit() { reset(); }

        Permit(Permit&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Permit& operator=(Permit&& other) noexcept;
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        void reset();
        bool held() const { return owner_ != nullptr; }

    private:
        RequestThrottler* owner_ = nullptr;
    };

    explicit RequestThrottler(size_t max_concurrent);

    RequestThrottler(const RequestThrottler&) = delete;
    RequestThrottler& operator=(const RequestThrottler&) = delete;

    /// Block until admitted. Throws OperationCancelled if should_cancel fires first.
    void acquire(const ShouldCancel& should_cancel = {});
    void release();

    /// acquire() wrapped in a Permit.
    Permit admit(const ShouldCancel& should_cancel = {});

    size_t max_concurrent() const { return max_concurrent_; }
    size_t in_flight() const;
    size_t waiting() const;

private:
    struct Waiter {
        std::condition_variable cv;
        bool admitted = false;
    };

    const size_t max_concurrent_;
    size_t in_flight_ = 0;
    std::deque<std::shared_ptr<Waiter>> waiters_;
    mutable std::mutex mutex_;
};

} // namespace autobridge
