#include "router.hpp"

#include "action/dispatch.hpp"
#include "logger.hpp"
#include "msgpack_codec.hpp"

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <type_traits>

#include <log4cplus/loggingmacros.h>

namespace autobridge {

namespace {

std::string seconds_since(std::chrono::steady_clock::time_point start) {
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    std::ostringstream out;
    out << std::fixed << std::setprecision(3) << elapsed.count() << "s";
    return out.str();
}

int32_t caller_pid(const ConnectionContext& context) {
    if (context.identity) {
        return context.identity->pid;
    }
    if (context.peer) {
        return static_cast<int32_t>(context.peer->pid);
    }
    return 0;
}

// Errors the router raises itself, as opposed to ones a collaborator reports.
bool is_rejection(ErrorCode code) {
    switch (code) {
        case ErrorCode::unauthorized_client:
        case ErrorCode::operation_not_supported:
        case ErrorCode::permission_denied:
        case ErrorCode::version_mismatch:
            return true;
        default:
            return false;
    }
}

std::vector<PermissionKind> permission_tags(Operation operation) {
    PermissionSet required = required_permissions(operation);
    std::vector<PermissionKind> tags(required.begin(), required.end());
    std::sort(tags.begin(), tags.end(), [](PermissionKind lhs, PermissionKind rhs) {
        return std::strcmp(to_wire(lhs), to_wire(rhs)) < 0;
    });
    return tags;
}

} // namespace

RouterOptions RouterOptions::in_process() {
    RouterOptions options;
    options.allowed_operations = full_allowlist();
    options.host_kind = HostKind::in_process;
    return options;
}

Router::Router(ServiceProvider services, RouterOptions options)
    : services_(std::move(services)), options_(std::move(options)), offered_(options_.allowed_operations) {
    if (!services_.daemon) {
        for (auto it = offered_.begin(); it != offered_.end();) {
            it = is_daemon_operation(*it) ? offered_.erase(it) : std::next(it);
        }
    }
}

std::string Router::handle(const std::string& request_bytes) const {
    ConnectionContext context;
    return handle(request_bytes, context);
}

std::string Router::handle(const std::string& request_bytes, ConnectionContext& context) const {
    Response response;
    try {
        Request request = codec::decode_request(request_bytes);
        response = route(request, context);
    } catch (const codec::DecodeError& exc) {
        LOG4CPLUS_WARN(server_logger(), "pid=" << caller_pid(context) << " decode failed: " << exc.what());
        response = make_error(ErrorCode::decoding_failed, "Failed to decode request", std::string(exc.what()));
    }
    return codec::encode_response(response);
}

Response Router::route(const Request& request, ConnectionContext& context) const {
    const auto start = std::chrono::steady_clock::now();
    const std::string op = request_case_name(request);

    try {
        Response response = std::visit([this, &context](const auto& payload) -> Response {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, HandshakeRequest>) {
                return HandshakeResult{handshake(payload, context)};
            } else {
                authorize(T::kOperation, context);
                return actions::dispatch(services_, payload);
            }
        }, request);

        LOG4CPLUS_DEBUG(server_logger(),
                        "op=" << op << " pid=" << caller_pid(context) << " ok in " << seconds_since(start));
        return response;
    } catch (const ErrorEnvelope& envelope) {
        if (is_rejection(envelope.code())) {
            LOG4CPLUS_WARN(server_logger(), "op=" << op << " pid=" << caller_pid(context)
                                                  << " rejected: " << envelope.what());
        } else {
            LOG4CPLUS_ERROR(server_logger(), "op=" << op << " pid=" << caller_pid(context) << " failed in "
                                                   << seconds_since(start) << ": " << envelope.what());
        }
        return ErrorResponse{envelope};
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(server_logger(), "op=" << op << " pid=" << caller_pid(context) << " failed in "
                                               << seconds_since(start) << ": " << exc.what());
        return make_error(ErrorCode::internal_error, "Operation " + op + " failed", std::string(exc.what()));
    }
}

void Router::authorize(Operation operation, const ConnectionContext& context) const {
    const std::string name = to_wire(operation);

    if (offered_.count(operation) == 0) {
        throw ErrorEnvelope(ErrorCode::operation_not_supported, "Operation " + name + " is not supported by this host");
    }

    // An identity allowlist only means something once the client has presented an identity.
    bool restricted = !options_.allowed_bundles.empty() || !options_.allowed_teams.empty();
    if (restricted && !context.handshake_complete()) {
        throw ErrorEnvelope(ErrorCode::unauthorized_client, "Handshake required before " + name);
    }

    PermissionsStatus permissions = services_.permissions->current();
    if (!permissions.allows(operation)) {
        throw ErrorEnvelope(ErrorCode::permission_denied,
                            "Operation " + name + " is not allowed with current permissions");
    }
}

HandshakeResponse Router::handshake(const HandshakeRequest& request, ConnectionContext& context) const {
    const VersionRange& range = options_.supported_versions;
    if (!range.contains(request.protocol_version)) {
        throw ErrorEnvelope(ErrorCode::version_mismatch,
                            "Protocol version " + request.protocol_version.to_string() + " is not supported",
                            "supported " + range.lower.to_string() + " through " + range.upper.to_string());
    }

    const ClientIdentity& client = request.client;
    if (!options_.allowed_bundles.empty()) {
        if (!client.bundle_id || options_.allowed_bundles.count(*client.bundle_id) == 0) {
            throw ErrorEnvelope(ErrorCode::unauthorized_client,
                                "Bundle " + client.bundle_id.value_or("<none>") + " is not allowed");
        }
    }
    if (!options_.allowed_teams.empty()) {
        if (!client.team_id || options_.allowed_teams.count(*client.team_id) == 0) {
            throw ErrorEnvelope(ErrorCode::unauthorized_client,
                                "Team " + client.team_id.value_or("<none>") + " is not allowed");
        }
    }

    if (context.peer) {
        if (options_.require_same_user && context.peer->uid != ::getuid()) {
            throw ErrorEnvelope(ErrorCode::unauthorized_client,
                                "Peer uid " + std::to_string(context.peer->uid) + " does not own this host");
        }
        if (client.pid != static_cast<int32_t>(context.peer->pid)) {
            throw ErrorEnvelope(ErrorCode::unauthorized_client,
                                "Claimed pid " + std::to_string(client.pid) + " does not match peer pid " +
                                    std::to_string(context.peer->pid));
        }
    }

    HandshakeResponse response;
    response.negotiated_version = range.clamp(request.protocol_version);
    response.host_kind = request.requested_host_kind.value_or(options_.host_kind);
    response.build = build_identifier();
    response.supported_operations = sorted_by_name(offered_);
    for (Operation operation : response.supported_operations) {
        response.permission_tags.emplace(to_wire(operation), permission_tags(operation));
    }

    PermissionsStatus permissions = services_.permissions->current();
    std::vector<Operation> enabled;
    for (Operation operation : response.supported_operations) {
        if (permissions.allows(operation)) {
            enabled.push_back(operation);
        }
    }
    response.permissions = permissions;
    response.enabled_operations = std::move(enabled);

    context.identity = client;
    context.negotiated_version = response.negotiated_version;

    LOG4CPLUS_INFO(server_logger(), "Handshake from pid " << client.pid << " bundle "
                                                         << client.bundle_id.value_or("<none>") << " negotiated "
                                                         << response.negotiated_version.to_string());
    return response;
}

} // namespace autobridge
