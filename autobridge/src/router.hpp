#pragma once

#include "connection_context.hpp"
#include "messages.hpp"
#include "service_provider.hpp"

#include <set>
#include <string>

namespace autobridge {

struct RouterOptions {
    OperationSet allowed_operations = remote_default_allowlist();
    // Empty means unrestricted.
    std::set<std::string> allowed_bundles;
    std::set<std::string> allowed_teams;
    HostKind host_kind = HostKind::helper;
    // Reject peers whose SO_PEERCRED uid differs from ours.
    bool require_same_user = true;
    VersionRange supported_versions = kSupportedVersionRange;

    /// Defaults for a router hosted inside the client's own process: every operation, in-process kind.
    static RouterOptions in_process();
};

/**
 * Turns request bytes into response bytes.
 *
 * Read-only after construction, so one router serves every connection and worker.
 * Nothing thrown below it escapes handle(): decode failures, rejections and
 * collaborator errors all come back as an encoded error response.
 */
class Router {
public:
    Router(ServiceProvider services, RouterOptions options);

    /// Handle a request that did not arrive over a connection (no peer credentials).
    /// Each call starts from a fresh context, so a handshake does not carry over to the
    /// next call; with bundle or team allowlists set, only handshakes succeed here.
    std::string handle(const std::string& request_bytes) const;
    std::string handle(const std::string& request_bytes, ConnectionContext& context) const;

    /// Authorize and dispatch an already decoded request.
    Response route(const Request& request, ConnectionContext& context) const;

    const RouterOptions& options() const { return options_; }

    /// Allowed operations this router can actually serve with its collaborators.
    const OperationSet& offered_operations() const { return offered_; }

private:
    ServiceProvider services_;
    RouterOptions options_;
    OperationSet offered_;

    HandshakeResponse handshake(const HandshakeRequest& request, ConnectionContext& context) const;
    void authorize(Operation operation, const ConnectionContext& context) const;
};

} // namespace autobridge
