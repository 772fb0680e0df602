#include "bootstrap.hpp"

#include "logger.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

#include <log4cplus/loggingmacros.h>

namespace autobridge {

int ListenerEndpoint::open_connection() {
    int fds[2] = {-1, -1};
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) < 0) {
        throw std::system_error(errno, std::generic_category(), "socketpair");
    }
    // adopt_connection() owns fds[0] from here on, even when it fails.
    if (!server_->adopt_connection(fds[0])) {
        ::close(fds[1]);
        throw std::system_error(std::make_error_code(std::errc::not_connected), "host is not running");
    }
    return fds[1];
}

BridgeHost::BridgeHost(BootstrapMode mode, std::shared_ptr<const Router> router, std::string socket_path,
                       size_t workers)
    : mode_(mode),
      router_(std::move(router)),
      server_(std::move(socket_path),
              [shared_router = router_](const std::string& request_bytes, ConnectionContext& context) {
                  return shared_router->handle(request_bytes, context);
              },
              workers) {}

std::unique_ptr<BridgeHost> BridgeHost::named(std::shared_ptr<const Router> router, std::string socket_path,
                                              size_t workers) {
    return std::unique_ptr<BridgeHost>(
        new BridgeHost(BootstrapMode::named, std::move(router), std::move(socket_path), workers));
}

std::unique_ptr<BridgeHost> BridgeHost::embedded(std::shared_ptr<const Router> router, size_t workers) {
    return std::unique_ptr<BridgeHost>(new BridgeHost(BootstrapMode::embedded, std::move(router), std::string(), workers));
}

std::unique_ptr<BridgeHost> BridgeHost::embedded(ServiceProvider services, size_t workers) {
    return embedded(std::make_shared<Router>(std::move(services), RouterOptions::in_process()), workers);
}

BridgeHost::~BridgeHost() {
    stop();
}

bool BridgeHost::start() {
    if (!server_.start()) {
        LOG4CPLUS_ERROR(core_logger(), "Failed to start bridge host");
        return false;
    }
    LOG4CPLUS_INFO(core_logger(), "Bridge host up (" << (mode_ == BootstrapMode::named ? "named" : "embedded")
                                                     << "), " << router_->offered_operations().size()
                                                     << " operations offered");
    return true;
}

void BridgeHost::stop() {
    server_.stop();
}

std::unique_ptr<BridgeClient> BridgeHost::connect(size_t max_concurrent_requests) {
    if (mode_ == BootstrapMode::named) {
        return connect_to_host(server_.socket_path(), max_concurrent_requests);
    }
    ListenerEndpoint listener = endpoint();
    return connect_to_endpoint(listener, max_concurrent_requests);
}

std::unique_ptr<BridgeClient> connect_to_host(const std::string& socket_path, size_t max_concurrent_requests) {
    int fd = ipc::connect_unix_socket(socket_path);
    LOG4CPLUS_DEBUG(client_logger(), "Connected to " << socket_path);
    return std::make_unique<BridgeClient>(std::make_shared<ipc::SocketConnection>(fd), max_concurrent_requests);
}

std::unique_ptr<BridgeClient> connect_to_endpoint(ListenerEndpoint& endpoint, size_t max_concurrent_requests) {
    int fd = endpoint.open_connection();
    return std::make_unique<BridgeClient>(std::make_shared<ipc::SocketConnection>(fd), max_concurrent_requests);
}

} // namespace autobridge
