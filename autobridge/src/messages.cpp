#include "messages.hpp"

namespace autobridge {

Operation operation_of(const Request& request) {
    return std::visit([](const auto& payload) { return std::decay_t<decltype(payload)>::kOperation; }, request);
}

std::string request_case_name(const Request& request) {
    return std::visit([](const auto& payload) -> std::string {
        return request_case_name_of<std::decay_t<decltype(payload)>>();
    }, request);
}

ResponseCase response_case(const Response& response) {
    return std::visit([](const auto& value) { return std::decay_t<decltype(value)>::kCase; }, response);
}

const std::vector<std::pair<ResponseCase, const char*>>& WireEnum<ResponseCase>::entries() {
    static const std::vector<std::pair<ResponseCase, const char*>> values = {
        {ResponseCase::ok, "ok"},
        {ResponseCase::boolean, "bool"},
        {ResponseCase::integer, "int"},
        {ResponseCase::handshake, "handshake"},
        {ResponseCase::permissions_status, "permissions-status"},
        {ResponseCase::daemon_status, "daemon-status"},
        {ResponseCase::capture, "capture"},
        {ResponseCase::element_detection, "element-detection"},
        {ResponseCase::wait_result, "wait-result"},
        {ResponseCase::windows, "windows"},
        {ResponseCase::window, "window"},
        {ResponseCase::applications, "applications"},
        {ResponseCase::application, "application"},
        {ResponseCase::type_result, "type-result"},
        {ResponseCase::click_result, "click-result"},
        {ResponseCase::menu_structure, "menu-structure"},
        {ResponseCase::menu_extras, "menu-extras"},
        {ResponseCase::menu_bar_items, "menu-bar-items"},
        {ResponseCase::dock_items, "dock-items"},
        {ResponseCase::dock_item, "dock-item"},
        {ResponseCase::rect, "rect"},
        {ResponseCase::dialog_info, "dialog-info"},
        {ResponseCase::dialog_elements, "dialog-elements"},
        {ResponseCase::dialog_result, "dialog-result"},
        {ResponseCase::session_id, "session-id"},
        {ResponseCase::sessions, "sessions"},
        {ResponseCase::detection, "detection"},
        {ResponseCase::error, "error"},
    };
    return values;
}

} // namespace autobridge
