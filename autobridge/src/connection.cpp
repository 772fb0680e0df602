#include "connection.hpp"

#include "error_envelope.hpp"
#include "ipc_framing.hpp"
#include "logger.hpp"

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <system_error>

#include <log4cplus/loggingmacros.h>

namespace autobridge::ipc {

SocketConnection::SocketConnection(int fd) : fd_(fd) {
    reader_ = std::thread(&SocketConnection::read_loop, this);
}

SocketConnection::~SocketConnection() {
    invalidate("connection closed");
    if (reader_.joinable()) {
        reader_.join();
    }
    ::close(fd_);
}

void SocketConnection::send(const std::string& request_bytes, ReplyHandler on_reply) {
    std::lock_guard<std::mutex> write_lock(write_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!valid_) {
            std::string reason = invalid_reason_;
            on_reply(std::string(), std::make_exception_ptr(ConnectionInvalidated(reason)));
            return;
        }
        pending_.push_back(std::move(on_reply));
    }

    // The handler is queued before the frame goes out, so the reader can never see
    // a reply without its handler.
    if (!write_frame(fd_, request_bytes)) {
        invalidate("write failed");
    }
}

void SocketConnection::invalidate(const std::string& reason) {
    std::deque<ReplyHandler> orphaned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!valid_) {
            return;
        }
        valid_ = false;
        invalid_reason_ = reason;
        orphaned.swap(pending_);
    }

    LOG4CPLUS_DEBUG(client_logger(), "Connection fd=" << fd_ << " invalidated: " << reason << ", "
                                                      << orphaned.size() << " call(s) pending");
    ::shutdown(fd_, SHUT_RDWR);

    for (auto& handler : orphaned) {
        handler(std::string(), std::make_exception_ptr(ConnectionInvalidated(reason)));
    }
}

void SocketConnection::read_loop() {
    while (true) {
        std::string reply;
        if (!read_frame(fd_, reply)) {
            invalidate("peer closed the connection");
            return;
        }

        ReplyHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (pending_.empty()) {
                LOG4CPLUS_WARN(client_logger(), "Dropping unsolicited reply on fd " << fd_);
                continue;
            }
            handler = std::move(pending_.front());
            pending_.pop_front();
        }
        handler(std::move(reply), nullptr);
    }
}

int connect_unix_socket(const std::string& socket_path) {
    sockaddr_un addr{};
    if (socket_path.size() >= sizeof(addr.sun_path)) {
        throw std::system_error(std::make_error_code(std::errc::filename_too_long), socket_path);
    }

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "socket");
    }

    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", socket_path.c_str());
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int error = errno;
        ::close(fd);
        throw std::system_error(error, std::generic_category(), "connect " + socket_path);
    }
    return fd;
}

} // namespace autobridge::ipc
