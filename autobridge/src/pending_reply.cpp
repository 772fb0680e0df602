#include "pending_reply.hpp"

#include "error_envelope.hpp"

#include <chrono>

namespace autobridge {

namespace {

constexpr auto kCancelPollInterval = std::chrono::milliseconds(20);

class DroppedReplyGuard {
public:
    explicit DroppedReplyGuard(std::shared_ptr<PendingReply> pending) : pending_(std::move(pending)) {}

    ~DroppedReplyGuard() {
        pending_->fail(std::make_exception_ptr(ConnectionInvalidated("reply callback dropped")));
    }

    DroppedReplyGuard(const DroppedReplyGuard&) = delete;
    DroppedReplyGuard& operator=(const DroppedReplyGuard&) = delete;

    void deliver(std::string reply, std::exception_ptr error) {
        if (error) {
            pending_->fail(std::move(error));
        } else {
            pending_->resolve(std::move(reply));
        }
    }

private:
    std::shared_ptr<PendingReply> pending_;
};

} // namespace

bool PendingReply::resolve(std::string reply) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (settled_) {
        return false;
    }
    settled_ = true;
    promise_.set_value(std::move(reply));
    return true;
}

bool PendingReply::fail(std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (settled_) {
        return false;
    }
    settled_ = true;
    promise_.set_exception(std::move(error));
    return true;
}

bool PendingReply::settled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settled_;
}

std::string PendingReply::wait(const std::function<bool()>& should_cancel) {
    if (should_cancel) {
        while (future_.wait_for(kCancelPollInterval) != std::future_status::ready) {
            if (should_cancel()) {
                fail(std::make_exception_ptr(OperationCancelled("reply")));
            }
        }
    }
    return future_.get();
}

ReplyHandler make_reply_handler(std::shared_ptr<PendingReply> pending) {
    auto guard = std::make_shared<DroppedReplyGuard>(std::move(pending));
    return [guard](std::string reply, std::exception_ptr error) { guard->deliver(std::move(reply), std::move(error)); };
}

} // namespace autobridge
