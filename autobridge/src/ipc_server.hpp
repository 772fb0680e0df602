#pragma once

#include "connection_context.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace autobridge::ipc {

class IpcServer {
public:
    /// Turns one request frame into one reply frame. Must not throw.
    using RequestHandler = std::function<std::string(const std::string& request_bytes, ConnectionContext& context)>;

    /**
     * Construct a server listening on a Unix domain socket.
     *
     * @param socket_path Path of the socket file; replaced if it exists
     * @param handler Request handler
     * @param thread_pool_size Number of worker threads
     */
    IpcServer(std::string socket_path, RequestHandler handler, size_t thread_pool_size = 4);

    /// Construct a server without a listener; connections arrive via adopt_connection().
    explicit IpcServer(RequestHandler handler, size_t thread_pool_size = 4);

    ~IpcServer();

    IpcServer(const IpcServer&) = delete;
    IpcServer& operator=(const IpcServer&) = delete;

    static constexpr std::chrono::milliseconds kDefaultRequestTimeout{10000};

    bool start();
    void stop();

    /// Bound on how long a peer may sit on a partial frame, and on each blocking reply write.
    /// Takes effect for connections registered after the call.
    void set_request_timeout(std::chrono::milliseconds timeout) { request_timeout_ms_ = timeout.count(); }
    std::chrono::milliseconds request_timeout() const { return std::chrono::milliseconds(request_timeout_ms_.load()); }

    /// Serve an already connected socket. The server takes ownership of fd.
    bool adopt_connection(int fd);

    bool is_running() const { return running_.load(); }
    const std::string& socket_path() const { return socket_path_; }
    size_t connection_count() const;

private:
    struct Connection {
        int fd = -1;
        ConnectionContext context;
        // Bytes received but not yet forming a whole frame. Only the serving worker touches it.
        std::string inbox;
        // Steady-clock milliseconds when the pending partial frame started, 0 when none.
        std::atomic<int64_t> partial_since_ms{0};
    };

    std::string socket_path_;
    RequestHandler handler_;
    size_t thread_pool_size_;
    int server_fd_ = -1;
    int epoll_fd_ = -1;
    std::atomic<bool> running_{false};
    std::atomic<int64_t> request_timeout_ms_{kDefaultRequestTimeout.count()};

    std::thread accept_thread_;

    std::vector<std::thread> worker_threads_;
    std::queue<std::shared_ptr<Connection>> task_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::atomic<bool> pool_running_{false};

    std::unordered_map<int, std::shared_ptr<Connection>> connections_;
    mutable std::mutex connections_mutex_;

    bool setup_socket();
    void close_listener();
    void accept_loop();
    void accept_client();
    bool register_connection(int fd);
    void close_connection(const std::shared_ptr<Connection>& connection);
    bool rearm(const Connection& connection);
    void worker_thread_func();
    void serve_request(const std::shared_ptr<Connection>& connection);
    void expire_stalled_connections();
};

} // namespace autobridge::ipc
