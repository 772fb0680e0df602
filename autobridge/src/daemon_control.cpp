#include "daemon_control.hpp"

#include "logger.hpp"

#include <unistd.h>

#include <log4cplus/loggingmacros.h>

namespace autobridge {

ProcessDaemonControl::ProcessDaemonControl(DaemonBridgeStatus bridge, std::shared_ptr<PermissionService> permissions,
                                           std::string mode, std::function<void()> on_stop)
    : bridge_(std::move(bridge)),
      permissions_(std::move(permissions)),
      mode_(std::move(mode)),
      on_stop_(std::move(on_stop)),
      started_at_(Timestamp::now()) {}

DaemonStatus ProcessDaemonControl::status() {
    DaemonStatus status;
    status.running = !stop_requested_.load();
    status.pid = static_cast<int32_t>(::getpid());
    status.started_at = started_at_;
    status.mode = mode_;
    status.bridge = bridge_;
    if (permissions_) {
        status.permissions = permissions_->current();
    }
    return status;
}

bool ProcessDaemonControl::request_stop() {
    if (stop_requested_.exchange(true)) {
        // Already on its way down.
        return true;
    }
    LOG4CPLUS_INFO(core_logger(), "Stop requested over the bridge");
    if (on_stop_) {
        on_stop_();
    }
    return true;
}

} // namespace autobridge
