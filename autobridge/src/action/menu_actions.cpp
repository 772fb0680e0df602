#include "dispatch.hpp"

namespace autobridge::actions {

Response dispatch(const ServiceProvider& services, const ListMenusRequest& request) {
    return MenuStructureResponse{services.menus->list_menus(request.app_identifier)};
}

Response dispatch(const ServiceProvider& services, const ListFrontmostMenusRequest&) {
    return MenuStructureResponse{services.menus->list_frontmost_menus()};
}

Response dispatch(const ServiceProvider& services, const ClickMenuItemRequest& request) {
    services.menus->click_menu_item(request.app_identifier, request.item_path);
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const ClickMenuItemByNameRequest& request) {
    services.menus->click_menu_item_by_name(request.app_identifier, request.item_name);
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const ListMenuExtrasRequest&) {
    return MenuExtrasResponse{services.menus->list_menu_extras()};
}

Response dispatch(const ServiceProvider& services, const ClickMenuExtraRequest& request) {
    services.menus->click_menu_extra(request.name);
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const MenuExtraOpenMenuFrameRequest& request) {
    return RectResponse{services.menus->menu_extra_open_menu_frame(request.title, request.owner_pid)};
}

Response dispatch(const ServiceProvider& services, const ListMenuBarItemsRequest& request) {
    return MenuBarItemsResponse{services.menus->list_menu_bar_items(request.include_raw_debug)};
}

Response dispatch(const ServiceProvider& services, const ClickMenuBarItemNamedRequest& request) {
    return ClickResultResponse{services.menus->click_menu_bar_item_named(request.name)};
}

Response dispatch(const ServiceProvider& services, const ClickMenuBarItemIndexRequest& request) {
    return ClickResultResponse{services.menus->click_menu_bar_item_at(request.index)};
}

} // namespace autobridge::actions
