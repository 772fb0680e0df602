#pragma once

#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>

namespace autobridge {

/// Invoked once per request with either the reply bytes or the reason there is none.
using ReplyHandler = std::function<void(std::string reply, std::exception_ptr error)>;

/**
 * Single-resolution slot for one outstanding call.
 *
 * The first resolve() or fail() wins; later ones are ignored, so a reply racing
 * a cancellation or an invalidated channel still settles the call exactly once.
 */
class PendingReply {
public:
    PendingReply() : future_(promise_.get_future()) {}

    PendingReply(const PendingReply&) = delete;
    PendingReply& operator=(const PendingReply&) = delete;

    bool resolve(std::string reply);
    bool fail(std::exception_ptr error);
    bool settled() const;

    /// Block for the outcome. Throws the failure, or OperationCancelled when should_cancel fires first.
    std::string wait(const std::function<bool()>& should_cancel = {});

private:
    mutable std::mutex mutex_;
    bool settled_ = false;
    std::promise<std::string> promise_;
    std::future<std::string> future_;
};

/// Wrap a pending call in a transport callback. If every copy of the callback is
/// destroyed without being invoked, the call fails with ConnectionInvalidated.
ReplyHandler make_reply_handler(std::shared_ptr<PendingReply> pending);

} // namespace autobridge
