#include "ipc_server.hpp"

#include "ipc_framing.hpp"
#include "logger.hpp"

#include <sys/epoll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <optional>

#include <log4cplus/loggingmacros.h>

namespace autobridge::ipc {

namespace {

int64_t steady_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

std::optional<PeerCredentials> peer_credentials(int fd) {
    ucred cred{};
    socklen_t length = sizeof(cred);
    if (::getsockopt(fd, SOL_SOCKET, SO_PEERCRED, &cred, &length) < 0) {
        LOG4CPLUS_WARN(server_logger(), "SO_PEERCRED failed on fd " << fd << ": " << std::strerror(errno));
        return std::nullopt;
    }
    return PeerCredentials{cred.pid, cred.uid, cred.gid};
}

} // namespace

IpcServer::IpcServer(std::string socket_path, RequestHandler handler, size_t thread_pool_size)
    : socket_path_(std::move(socket_path)),
      handler_(std::move(handler)),
      thread_pool_size_(thread_pool_size > 0 ? thread_pool_size : 4) {}

IpcServer::IpcServer(RequestHandler handler, size_t thread_pool_size)
    : IpcServer(std::string(), std::move(handler), thread_pool_size) {}

IpcServer::~IpcServer() {
    stop();
}

bool IpcServer::setup_socket() {
    sockaddr_un addr{};
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        LOG4CPLUS_ERROR(server_logger(), "Socket path too long: " << socket_path_);
        return false;
    }

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        LOG4CPLUS_ERROR(server_logger(), "socket: " << std::strerror(errno));
        return false;
    }

    ::unlink(socket_path_.c_str());

    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", socket_path_.c_str());

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG4CPLUS_ERROR(server_logger(), "bind " << socket_path_ << ": " << std::strerror(errno));
        close_listener();
        return false;
    }

    // Only the owning user may connect.
    if (::chmod(socket_path_.c_str(), S_IRUSR | S_IWUSR) < 0) {
        LOG4CPLUS_ERROR(server_logger(), "chmod " << socket_path_ << ": " << std::strerror(errno));
        close_listener();
        return false;
    }

    if (::listen(server_fd_, SOMAXCONN) < 0) {
        LOG4CPLUS_ERROR(server_logger(), "listen: " << std::strerror(errno));
        close_listener();
        return false;
    }

    return true;
}

void IpcServer::close_listener() {
    if (server_fd_ >= 0) {
        ::shutdown(server_fd_, SHUT_RDWR);
        ::close(server_fd_);
        server_fd_ = -1;
    }
}

bool IpcServer::start() {
    if (running_) {
        return true;
    }

    if (!socket_path_.empty() && !setup_socket()) {
        return false;
    }

    epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        LOG4CPLUS_ERROR(server_logger(), "epoll_create1: " << std::strerror(errno));
        close_listener();
        return false;
    }

    if (server_fd_ >= 0) {
        epoll_event ev{};
        ev.events = EPOLLIN;
        ev.data.fd = server_fd_;
        if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, server_fd_, &ev) < 0) {
            LOG4CPLUS_ERROR(server_logger(), "epoll_ctl ADD listener: " << std::strerror(errno));
            ::close(epoll_fd_);
            epoll_fd_ = -1;
            close_listener();
            return false;
        }
    }

    running_ = true;

    pool_running_ = true;
    for (size_t i = 0; i < thread_pool_size_; ++i) {
        worker_threads_.emplace_back(&IpcServer::worker_thread_func, this);
    }

    accept_thread_ = std::thread(&IpcServer::accept_loop, this);

    if (socket_path_.empty()) {
        LOG4CPLUS_INFO(server_logger(), "IPC server started without listener, workers=" << thread_pool_size_);
    } else {
        LOG4CPLUS_INFO(server_logger(), "IPC server listening at " << socket_path_ << ", workers=" << thread_pool_size_);
    }
    return true;
}

void IpcServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    close_listener();

    // Unblock any worker still reading a partial frame.
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto& entry : connections_) {
            ::shutdown(entry.first, SHUT_RDWR);
        }
    }

    pool_running_ = false;
    queue_cv_.notify_all();
    for (auto& t : worker_threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    worker_threads_.clear();
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        std::queue<std::shared_ptr<Connection>>().swap(task_queue_);
    }

    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto& entry : connections_) {
            ::close(entry.first);
            entry.second->fd = -1;
        }
        connections_.clear();
    }

    if (epoll_fd_ >= 0) {
        ::close(epoll_fd_);
        epoll_fd_ = -1;
    }

    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
    }
    LOG4CPLUS_INFO(server_logger(), "IPC server stopped");
}

bool IpcServer::adopt_connection(int fd) {
    if (!running_) {
        LOG4CPLUS_ERROR(server_logger(), "Cannot adopt fd " << fd << ": server not running");
        ::close(fd);
        return false;
    }
    return register_connection(fd);
}

size_t IpcServer::connection_count() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

bool IpcServer::register_connection(int fd) {
    auto connection = std::make_shared<Connection>();
    connection->fd = fd;
    connection->context.peer = peer_credentials(fd);

    if (connection->context.peer) {
        LOG4CPLUS_DEBUG(server_logger(), "Connection fd=" << fd << " pid=" << connection->context.peer->pid
                                                          << " uid=" << connection->context.peer->uid);
    }

    // Replies are written blocking; a peer that stops reading must not pin a worker.
    int64_t timeout_ms = request_timeout_ms_.load();
    timeval send_timeout{};
    send_timeout.tv_sec = static_cast<time_t>(timeout_ms / 1000);
    send_timeout.tv_usec = static_cast<suseconds_t>((timeout_ms % 1000) * 1000);
    if (::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &send_timeout, sizeof(send_timeout)) < 0) {
        LOG4CPLUS_WARN(server_logger(), "SO_SNDTIMEO on fd " << fd << ": " << std::strerror(errno));
    }

    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_[fd] = connection;
    }

    epoll_event ev{};
    ev.events = EPOLLIN | EPOLLRDHUP | EPOLLONESHOT;
    ev.data.fd = fd;
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
        LOG4CPLUS_ERROR(server_logger(), "epoll_ctl ADD fd " << fd << ": " << std::strerror(errno));
        close_connection(connection);
        return false;
    }
    return true;
}

void IpcServer::close_connection(const std::shared_ptr<Connection>& connection) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    if (connection->fd < 0) {
        return;
    }
    auto it = connections_.find(connection->fd);
    if (it != connections_.end() && it->second == connection) {
        connections_.erase(it);
    }
    if (epoll_fd_ >= 0) {
        ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, connection->fd, nullptr);
    }
    ::close(connection->fd);
    connection->fd = -1;
}

bool IpcServer::rearm(const Connection& connection) {
    epoll_event ev{};
    ev.events = EPOLLIN | EPOLLRDHUP | EPOLLONESHOT;
    ev.data.fd = connection.fd;
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, connection.fd, &ev) < 0) {
        LOG4CPLUS_ERROR(server_logger(), "epoll_ctl MOD fd " << connection.fd << ": " << std::strerror(errno));
        return false;
    }
    return true;
}

void IpcServer::accept_client() {
    int client_fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (client_fd < 0) {
        if (running_ && errno != EINTR && errno != EAGAIN) {
            LOG4CPLUS_ERROR(server_logger(), "accept: " << std::strerror(errno));
        }
        return;
    }
    register_connection(client_fd);
}

void IpcServer::serve_request(const std::shared_ptr<Connection>& connection) {
    // Take whatever the peer has sent so far without waiting for the rest, so a peer
    // that stalls mid-frame never holds a worker.
    bool peer_closed = false;
    char chunk[16384];
    while (connection->inbox.size() <= kMaxFrameSize + sizeof(uint32_t)) {
        ssize_t received = ::recv(connection->fd, chunk, sizeof(chunk), MSG_DONTWAIT);
        if (received > 0) {
            connection->inbox.append(chunk, static_cast<size_t>(received));
            continue;
        }
        if (received == 0) {
            peer_closed = true;
            break;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            break;
        }
        LOG4CPLUS_WARN(server_logger(), "recv on fd " << connection->fd << ": " << std::strerror(errno));
        close_connection(connection);
        return;
    }

    std::string request;
    while (true) {
        FrameStatus status = take_frame(connection->inbox, request);
        if (status == FrameStatus::incomplete) {
            break;
        }
        if (status == FrameStatus::too_large) {
            LOG4CPLUS_WARN(server_logger(), "Oversized frame on fd " << connection->fd << ", closing");
            close_connection(connection);
            return;
        }

        std::string response;
        try {
            response = handler_(request, connection->context);
        } catch (const std::exception& exc) {
            LOG4CPLUS_ERROR(server_logger(), "Request handler failed on fd " << connection->fd << ": " << exc.what());
            close_connection(connection);
            return;
        }

        if (!write_frame(connection->fd, response)) {
            close_connection(connection);
            return;
        }
    }

    if (connection->inbox.empty()) {
        connection->partial_since_ms = 0;
    } else if (connection->partial_since_ms == 0) {
        connection->partial_since_ms = steady_now_ms();
    }

    if (peer_closed || !rearm(*connection)) {
        close_connection(connection);
    }
}

void IpcServer::expire_stalled_connections() {
    const int64_t now = steady_now_ms();
    const int64_t timeout = request_timeout_ms_.load();

    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto& entry : connections_) {
        int64_t since = entry.second->partial_since_ms.load();
        if (since != 0 && now - since > timeout) {
            LOG4CPLUS_WARN(server_logger(), "Partial frame on fd " << entry.first << " timed out after "
                                                                  << (now - since) << " ms, closing");
            entry.second->partial_since_ms = 0;
            // Wakes the connection as readable; the worker sees end of stream and closes it.
            ::shutdown(entry.first, SHUT_RDWR);
        }
    }
}

void IpcServer::worker_thread_func() {
    while (true) {
        std::shared_ptr<Connection> connection;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !task_queue_.empty() || !pool_running_; });

            if (!pool_running_) {
                return;
            }

            connection = std::move(task_queue_.front());
            task_queue_.pop();
        }

        serve_request(connection);
    }
}

void IpcServer::accept_loop() {
    // One-shot registration keeps each connection with a single worker until it re-arms.
    const int kMaxEvents = 32;
    epoll_event events[kMaxEvents];

    while (running_) {
        expire_stalled_connections();

        int nfds = ::epoll_wait(epoll_fd_, events, kMaxEvents, 200);
        if (nfds < 0) {
            if (running_ && errno != EINTR) {
                LOG4CPLUS_ERROR(server_logger(), "epoll_wait: " << std::strerror(errno));
            }
            continue;
        }

        for (int i = 0; i < nfds; ++i) {
            int fd = events[i].data.fd;

            if (fd == server_fd_) {
                accept_client();
                continue;
            }

            std::shared_ptr<Connection> connection;
            {
                std::lock_guard<std::mutex> lock(connections_mutex_);
                auto it = connections_.find(fd);
                if (it == connections_.end()) {
                    continue;
                }
                connection = it->second;
            }

            if (events[i].events & EPOLLIN) {
                {
                    std::lock_guard<std::mutex> lock(queue_mutex_);
                    task_queue_.push(std::move(connection));
                }
                queue_cv_.notify_one();
            } else if (events[i].events & (EPOLLRDHUP | EPOLLERR | EPOLLHUP)) {
                close_connection(connection);
            }
        }
    }
}

} // namespace autobridge::ipc
