#pragma once

#include "service_provider.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace autobridge {

/**
 * DaemonControl for a helper process: reports this process and the bridge it serves,
 * and hands stop requests to a callback the owner supplies (the helper raises SIGTERM
 * on itself so its signal loop shuts the host down).
 */
class ProcessDaemonControl : public DaemonControl {
public:
    ProcessDaemonControl(DaemonBridgeStatus bridge, std::shared_ptr<PermissionService> permissions,
                         std::string mode, std::function<void()> on_stop);

    DaemonStatus status() override;
    bool request_stop() override;

    bool stop_requested() const { return stop_requested_.load(); }

private:
    DaemonBridgeStatus bridge_;
    std::shared_ptr<PermissionService> permissions_;
    std::string mode_;
    std::function<void()> on_stop_;
    Timestamp started_at_;
    std::atomic<bool> stop_requested_{false};
};

} // namespace autobridge
