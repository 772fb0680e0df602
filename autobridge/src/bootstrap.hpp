#pragma once

#include "bridge_client.hpp"
#include "ipc_server.hpp"
#include "router.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace autobridge {

enum class BootstrapMode {
    named,
    embedded,
};

/**
 * Hands out connected socket pairs to a running host: one end is adopted by the
 * host, the other goes back to the caller. Works in both bootstrap modes.
 */
class ListenerEndpoint {
public:
    explicit ListenerEndpoint(ipc::IpcServer& server) : server_(&server) {}

    /// Returns the client end. Throws std::system_error when no pair can be made.
    int open_connection();

private:
    ipc::IpcServer* server_;
};

/**
 * A router served over local sockets.
 *
 * Named hosts listen on a socket path that separately launched clients connect to;
 * embedded hosts have no listener and are reached only through their endpoint.
 */
class BridgeHost {
public:
    static std::unique_ptr<BridgeHost> named(std::shared_ptr<const Router> router, std::string socket_path,
                                             size_t workers = 4);
    static std::unique_ptr<BridgeHost> embedded(std::shared_ptr<const Router> router, size_t workers = 4);
    /// Embedded host over a router built with RouterOptions::in_process().
    static std::unique_ptr<BridgeHost> embedded(ServiceProvider services, size_t workers = 4);

    ~BridgeHost();

    BridgeHost(const BridgeHost&) = delete;
    BridgeHost& operator=(const BridgeHost&) = delete;

    bool start();
    void stop();

    /// See IpcServer::set_request_timeout(). Call before start().
    void set_request_timeout(std::chrono::milliseconds timeout) { server_.set_request_timeout(timeout); }

    bool is_running() const { return server_.is_running(); }
    BootstrapMode mode() const { return mode_; }
    const std::string& socket_path() const { return server_.socket_path(); }
    size_t connection_count() const { return server_.connection_count(); }
    const Router& router() const { return *router_; }

    ListenerEndpoint endpoint() { return ListenerEndpoint(server_); }

    /// A client on a fresh connection to this host, through the socket in named mode
    /// and through the endpoint otherwise.
    std::unique_ptr<BridgeClient> connect(size_t max_concurrent_requests = BridgeClient::kDefaultMaxConcurrentRequests);

private:
    BridgeHost(BootstrapMode mode, std::shared_ptr<const Router> router, std::string socket_path, size_t workers);

    BootstrapMode mode_;
    std::shared_ptr<const Router> router_;
    ipc::IpcServer server_;
};

/// Client for a named host running in another process. Throws std::system_error.
std::unique_ptr<BridgeClient> connect_to_host(
    const std::string& socket_path = kDefaultSocketPath,
    size_t max_concurrent_requests = BridgeClient::kDefaultMaxConcurrentRequests);

/// Client on a connection obtained from an endpoint.
std::unique_ptr<BridgeClient> connect_to_endpoint(
    ListenerEndpoint& endpoint,
    size_t max_concurrent_requests = BridgeClient::kDefaultMaxConcurrentRequests);

} // namespace autobridge
