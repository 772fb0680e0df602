#include "ipc_framing.hpp"

#include "logger.hpp"

#include <arpa/inet.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include <log4cplus/loggingmacros.h>

namespace autobridge::ipc {

namespace {

bool read_exact(int fd, char* data, size_t length) {
    size_t offset = 0;
    while (offset < length) {
        ssize_t chunk = ::read(fd, data + offset, length - offset);
        if (chunk < 0 && errno == EINTR) {
            continue;
        }
        if (chunk <= 0) {
            return false;
        }
        offset += static_cast<size_t>(chunk);
    }
    return true;
}

bool write_exact(int fd, const char* data, size_t length) {
    size_t offset = 0;
    while (offset < length) {
        ssize_t chunk = ::send(fd, data + offset, length - offset, MSG_NOSIGNAL);
        if (chunk < 0 && errno == EINTR) {
            continue;
        }
        if (chunk <= 0) {
            return false;
        }
        offset += static_cast<size_t>(chunk);
    }
    return true;
}

} // namespace

bool read_frame(int fd, std::string& body) {
    uint32_t length_be = 0;
    if (!read_exact(fd, reinterpret_cast<char*>(&length_be), sizeof(length_be))) {
        return false;
    }

    uint32_t length = ntohl(length_be);
    if (length > kMaxFrameSize) {
        LOG4CPLUS_WARN(server_logger(), "Frame of " << length << " bytes exceeds limit on fd " << fd);
        return false;
    }

    body.assign(length, '\0');
    if (length == 0) {
        return true;
    }
    return read_exact(fd, &body[0], length);
}

FrameStatus take_frame(std::string& buffer, std::string& body) {
    uint32_t length_be = 0;
    if (buffer.size() < sizeof(length_be)) {
        return FrameStatus::incomplete;
    }
    std::memcpy(&length_be, buffer.data(), sizeof(length_be));

    uint32_t length = ntohl(length_be);
    if (length > kMaxFrameSize) {
        return FrameStatus::too_large;
    }
    if (buffer.size() - sizeof(length_be) < length) {
        return FrameStatus::incomplete;
    }

    body.assign(buffer, sizeof(length_be), length);
    buffer.erase(0, sizeof(length_be) + length);
    return FrameStatus::complete;
}

bool write_frame(int fd, const std::string& body) {
    if (body.size() > kMaxFrameSize) {
        LOG4CPLUS_ERROR(server_logger(), "Refusing to send frame of " << body.size() << " bytes");
        return false;
    }

    uint32_t length_be = htonl(static_cast<uint32_t>(body.size()));
    if (!write_exact(fd, reinterpret_cast<const char*>(&length_be), sizeof(length_be))) {
        return false;
    }
    return body.empty() || write_exact(fd, body.data(), body.size());
}

} // namespace autobridge::ipc
