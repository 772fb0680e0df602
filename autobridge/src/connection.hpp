#pragma once

#include "pending_reply.hpp"

#include <atomic>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace autobridge {

/**
 * Client side of a request/reply channel.
 *
 * send() hands over one encoded request and a handler the channel invokes exactly
 * once: with the reply, or with ConnectionInvalidated when the channel dies first.
 * Replies are delivered in request order.
 */
class Connection {
public:
    virtual ~Connection() = default;

    virtual void send(const std::string& request_bytes, ReplyHandler on_reply) = 0;
    virtual void invalidate(const std::string& reason) = 0;
    virtual bool is_valid() const = 0;
};

namespace ipc {

/// Connection over a connected Unix stream socket, framed as in ipc_framing.hpp.
class SocketConnection : public Connection {
public:
    /// Takes ownership of fd and starts the reader.
    explicit SocketConnection(int fd);
    ~SocketConnection() override;

    SocketConnection(const SocketConnection&) = delete;
    SocketConnection& operator=(const SocketConnection&) = delete;

    void send(const std::string& request_bytes, ReplyHandler on_reply) override;
    void invalidate(const std::string& reason) override;
    bool is_valid() const override { return valid_.load(); }

private:
    int fd_;
    std::atomic<bool> valid_{true};
    std::string invalid_reason_;
    std::deque<ReplyHandler> pending_;
    std::mutex mutex_;
    std::mutex write_mutex_;
    std::thread reader_;

    void read_loop();
};

/// Connect to a named host. Throws std::system_error on failure.
int connect_unix_socket(const std::string& socket_path);

} // namespace ipc

} // namespace autobridge
