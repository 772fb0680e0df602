#pragma once

#include "ipc_server.hpp"
#include "router.hpp"

#include <log4cplus/helpers/property.h>

#include <chrono>
#include <stdexcept>
#include <string>

namespace autobridge {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Everything a helper process needs to bring up its host.
struct HostConfig {
    std::string socket_path = kDefaultSocketPath;
    size_t workers = 4;
    std::chrono::milliseconds request_timeout = ipc::IpcServer::kDefaultRequestTimeout;
    RouterOptions router;
};

/**
 * Read host settings from properties. Recognized keys:
 *
 *   autobridge.socket             socket path
 *   autobridge.host_kind          gui | helper | on-demand | in-process
 *   autobridge.workers            worker threads, at least 1
 *   autobridge.request_timeout_ms longest a peer may stall mid-request, at least 1
 *   autobridge.allow.bundles      comma-separated bundle ids; empty allows any
 *   autobridge.allow.teams        comma-separated team ids; empty allows any
 *   autobridge.operations         remote | all | comma-separated operation names
 *   autobridge.require_same_user  true | false
 *
 * Missing keys keep their defaults. Throws ConfigError on values it cannot use.
 */
HostConfig parse_host_config(const log4cplus::helpers::Properties& properties);

/// parse_host_config() on a properties file. Throws ConfigError if it cannot be read.
HostConfig load_host_config(const std::string& path);

} // namespace autobridge
