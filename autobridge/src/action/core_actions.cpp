#include "dispatch.hpp"

namespace autobridge::actions {

Response dispatch(const ServiceProvider& services, const PermissionsStatusRequest&) {
    return PermissionsStatusResponse{services.permissions->current()};
}

Response dispatch(const ServiceProvider& services, const ScriptingProbeRequest&) {
    if (!services.permissions->current().scripting) {
        throw ErrorEnvelope(ErrorCode::permission_denied, "Scripting permission not granted");
    }
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const DaemonStatusRequest&) {
    if (!services.daemon) {
        throw ErrorEnvelope(ErrorCode::operation_not_supported, "Daemon status is not supported by this host");
    }
    return DaemonStatusResponse{services.daemon->status()};
}

Response dispatch(const ServiceProvider& services, const DaemonStopRequest&) {
    if (!services.daemon) {
        throw ErrorEnvelope(ErrorCode::operation_not_supported, "Daemon stop is not supported by this host");
    }
    return BoolResponse{services.daemon->request_stop()};
}

} // namespace autobridge::actions
