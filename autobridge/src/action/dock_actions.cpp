#include "dispatch.hpp"

namespace autobridge::actions {

Response dispatch(const ServiceProvider& services, const ListDockItemsRequest& request) {
    return DockItemsResponse{services.dock->list_dock_items(request.include_all)};
}

Response dispatch(const ServiceProvider& services, const LaunchDockItemRequest& request) {
    services.dock->launch_dock_item(request.app_name);
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const RightClickDockItemRequest& request) {
    services.dock->right_click_dock_item(request.app_name, request.menu_item);
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const HideDockRequest&) {
    services.dock->hide_dock();
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const ShowDockRequest&) {
    services.dock->show_dock();
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const IsDockHiddenRequest&) {
    return BoolResponse{services.dock->is_dock_hidden()};
}

Response dispatch(const ServiceProvider& services, const FindDockItemRequest& request) {
    return DockItemResponse{services.dock->find_dock_item(request.name)};
}

} // namespace autobridge::actions
