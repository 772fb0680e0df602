#include "dispatch.hpp"

namespace autobridge::actions {

Response dispatch(const ServiceProvider& services, const ListWindowsRequest& request) {
    return WindowsResponse{services.windows->list_windows(request.target)};
}

Response dispatch(const ServiceProvider& services, const FocusWindowRequest& request) {
    services.windows->focus_window(request.target);
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const MoveWindowRequest& request) {
    services.windows->move_window(request.target, request.position);
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const ResizeWindowRequest& request) {
    services.windows->resize_window(request.target, request.size);
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const SetWindowBoundsRequest& request) {
    services.windows->set_window_bounds(request.target, request.bounds);
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const CloseWindowRequest& request) {
    services.windows->close_window(request.target);
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const MinimizeWindowRequest& request) {
    services.windows->minimize_window(request.target);
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const MaximizeWindowRequest& request) {
    services.windows->maximize_window(request.target);
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const GetFocusedWindowRequest&) {
    return WindowResponse{services.windows->focused_window()};
}

} // namespace autobridge::actions
