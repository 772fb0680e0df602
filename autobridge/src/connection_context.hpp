#pragma once

#include "protocol.hpp"

#include <sys/types.h>

#include <optional>

namespace autobridge {

/// Kernel-reported credentials of the process on the other end of a socket.
struct PeerCredentials {
    pid_t pid = 0;
    uid_t uid = 0;
    gid_t gid = 0;
};

/**
 * Per-connection state kept by the server.
 *
 * Owned by the IPC server and touched only by the worker currently serving the
 * connection, which is at most one at a time.
 */
struct ConnectionContext {
    std::optional<PeerCredentials> peer;
    std::optional<ClientIdentity> identity;
    std::optional<ProtocolVersion> negotiated_version;

    bool handshake_complete() const { return identity.has_value(); }
};

} // namespace autobridge
