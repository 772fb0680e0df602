#include "protocol.hpp"

#include <algorithm>
#include <cstring>

#ifndef AUTOBRIDGE_VERSION_STRING
#define AUTOBRIDGE_VERSION_STRING "0.0.0"
#endif

#ifndef AUTOBRIDGE_GIT_VERSION_STRING
#define AUTOBRIDGE_GIT_VERSION_STRING "unknown"
#endif

namespace autobridge {

const ProtocolVersion kProtocolVersion{1, 0};
const VersionRange kSupportedVersionRange{{1, 0}, {1, 0}};
const char* const kDefaultSocketPath = "/tmp/autobridge.sock";

std::string ProtocolVersion::to_string() const {
    return std::to_string(major) + "." + std::to_string(minor);
}

ProtocolVersion VersionRange::clamp(const ProtocolVersion& version) const {
    return std::min(std::max(version, lower), upper);
}

const std::vector<std::pair<PermissionKind, const char*>>& WireEnum<PermissionKind>::entries() {
    static const std::vector<std::pair<PermissionKind, const char*>> values = {
        {PermissionKind::screen_recording, "screen-recording"},
        {PermissionKind::accessibility, "accessibility"},
        {PermissionKind::scripting, "scripting"},
    };
    return values;
}

const std::vector<std::pair<HostKind, const char*>>& WireEnum<HostKind>::entries() {
    static const std::vector<std::pair<HostKind, const char*>> values = {
        {HostKind::gui, "gui"},
        {HostKind::helper, "helper"},
        {HostKind::on_demand, "on-demand"},
        {HostKind::in_process, "in-process"},
    };
    return values;
}

const std::vector<std::pair<Operation, const char*>>& WireEnum<Operation>::entries() {
    static const std::vector<std::pair<Operation, const char*>> values = {
        {Operation::permissions_status, "permissions-status"},
        {Operation::daemon_status, "daemon-status"},
        {Operation::daemon_stop, "daemon-stop"},
        {Operation::capture_screen, "capture-screen"},
        {Operation::capture_window, "capture-window"},
        {Operation::capture_frontmost, "capture-frontmost"},
        {Operation::capture_area, "capture-area"},
        {Operation::detect_elements, "detect-elements"},
        {Operation::click, "click"},
        {Operation::type, "type"},
        {Operation::type_actions, "type-actions"},
        {Operation::scroll, "scroll"},
        {Operation::hotkey, "hotkey"},
        {Operation::swipe, "swipe"},
        {Operation::drag, "drag"},
        {Operation::move_mouse, "move-mouse"},
        {Operation::wait_for_element, "wait-for-element"},
        {Operation::list_windows, "list-windows"},
        {Operation::focus_window, "focus-window"},
        {Operation::move_window, "move-window"},
        {Operation::resize_window, "resize-window"},
        {Operation::set_window_bounds, "set-window-bounds"},
        {Operation::close_window, "close-window"},
        {Operation::minimize_window, "minimize-window"},
        {Operation::maximize_window, "maximize-window"},
        {Operation::get_focused_window, "get-focused-window"},
        {Operation::list_applications, "list-applications"},
        {Operation::find_application, "find-application"},
        {Operation::get_frontmost_application, "get-frontmost-application"},
        {Operation::is_application_running, "is-application-running"},
        {Operation::launch_application, "launch-application"},
        {Operation::activate_application, "activate-application"},
        {Operation::quit_application, "quit-application"},
        {Operation::hide_application, "hide-application"},
        {Operation::unhide_application, "unhide-application"},
        {Operation::hide_other_applications, "hide-other-applications"},
        {Operation::show_all_applications, "show-all-applications"},
        {Operation::list_menus, "list-menus"},
        {Operation::list_frontmost_menus, "list-frontmost-menus"},
        {Operation::click_menu_item, "click-menu-item"},
        {Operation::click_menu_item_by_name, "click-menu-item-by-name"},
        {Operation::list_menu_extras, "list-menu-extras"},
        {Operation::click_menu_extra, "click-menu-extra"},
        {Operation::menu_extra_open_menu_frame, "menu-extra-open-menu-frame"},
        {Operation::list_menu_bar_items, "list-menu-bar-items"},
        {Operation::click_menu_bar_item_named, "click-menu-bar-item-named"},
        {Operation::click_menu_bar_item_index, "click-menu-bar-item-index"},
        {Operation::list_dock_items, "list-dock-items"},
        {Operation::launch_dock_item, "launch-dock-item"},
        {Operation::right_click_dock_item, "right-click-dock-item"},
        {Operation::hide_dock, "hide-dock"},
        {Operation::show_dock, "show-dock"},
        {Operation::is_dock_hidden, "is-dock-hidden"},
        {Operation::find_dock_item, "find-dock-item"},
        {Operation::dialog_find_active, "dialog-find-active"},
        {Operation::dialog_click_button, "dialog-click-button"},
        {Operation::dialog_enter_text, "dialog-enter-text"},
        {Operation::dialog_handle_file, "dialog-handle-file"},
        {Operation::dialog_dismiss, "dialog-dismiss"},
        {Operation::dialog_list_elements, "dialog-list-elements"},
        {Operation::create_session, "create-session"},
        {Operation::store_detection_result, "store-detection-result"},
        {Operation::get_detection_result, "get-detection-result"},
        {Operation::store_screenshot, "store-screenshot"},
        {Operation::store_annotated_screenshot, "store-annotated-screenshot"},
        {Operation::list_sessions, "list-sessions"},
        {Operation::get_most_recent_session, "get-most-recent-session"},
        {Operation::clean_session, "clean-session"},
        {Operation::clean_sessions_older_than, "clean-sessions-older-than"},
        {Operation::clean_all_sessions, "clean-all-sessions"},
        {Operation::scripting_probe, "scripting-probe"},
    };
    return values;
}

PermissionSet required_permissions(Operation operation) {
    switch (operation) {
        case Operation::capture_screen:
        case Operation::capture_window:
        case Operation::capture_frontmost:
        case Operation::capture_area:
        case Operation::detect_elements:
            return {PermissionKind::screen_recording};

        case Operation::click:
        case Operation::type:
        case Operation::type_actions:
        case Operation::scroll:
        case Operation::hotkey:
        case Operation::swipe:
        case Operation::drag:
        case Operation::move_mouse:
        case Operation::wait_for_element:
        case Operation::list_windows:
        case Operation::focus_window:
        case Operation::move_window:
        case Operation::resize_window:
        case Operation::set_window_bounds:
        case Operation::close_window:
        case Operation::minimize_window:
        case Operation::maximize_window:
        case Operation::get_focused_window:
        case Operation::list_menus:
        case Operation::list_frontmost_menus:
        case Operation::click_menu_item:
        case Operation::click_menu_item_by_name:
        case Operation::list_menu_extras:
        case Operation::click_menu_extra:
        case Operation::menu_extra_open_menu_frame:
        case Operation::list_menu_bar_items:
        case Operation::click_menu_bar_item_named:
        case Operation::click_menu_bar_item_index:
        case Operation::list_dock_items:
        case Operation::launch_dock_item:
        case Operation::right_click_dock_item:
        case Operation::hide_dock:
        case Operation::show_dock:
        case Operation::is_dock_hidden:
        case Operation::find_dock_item:
        case Operation::dialog_find_active:
        case Operation::dialog_click_button:
        case Operation::dialog_enter_text:
        case Operation::dialog_handle_file:
        case Operation::dialog_dismiss:
        case Operation::dialog_list_elements:
            return {PermissionKind::accessibility};

        case Operation::launch_application:
        case Operation::activate_application:
        case Operation::quit_application:
        case Operation::hide_application:
        case Operation::unhide_application:
        case Operation::hide_other_applications:
        case Operation::show_all_applications:
            return {PermissionKind::scripting};

        case Operation::permissions_status:
        case Operation::daemon_status:
        case Operation::daemon_stop:
        case Operation::list_applications:
        case Operation::find_application:
        case Operation::get_frontmost_application:
        case Operation::is_application_running:
        case Operation::create_session:
        case Operation::store_detection_result:
        case Operation::get_detection_result:
        case Operation::store_screenshot:
        case Operation::store_annotated_screenshot:
        case Operation::list_sessions:
        case Operation::get_most_recent_session:
        case Operation::clean_session:
        case Operation::clean_sessions_older_than:
        case Operation::clean_all_sessions:
        case Operation::scripting_probe:
            return {};
    }
    return {};
}

const std::vector<Operation>& all_operations() {
    static const std::vector<Operation> operations = [] {
        std::vector<Operation> ops;
        for (const auto& entry : WireEnum<Operation>::entries()) {
            ops.push_back(entry.first);
        }
        return ops;
    }();
    return operations;
}

const OperationSet& remote_default_allowlist() {
    // A helper exposes everything it knows; the scripting check is still gated on the scripting grant.
    static const OperationSet allowlist(all_operations().begin(), all_operations().end());
    return allowlist;
}

bool is_daemon_operation(Operation operation) {
    return operation == Operation::daemon_status || operation == Operation::daemon_stop;
}

const OperationSet& full_allowlist() {
    static const OperationSet allowlist(all_operations().begin(), all_operations().end());
    return allowlist;
}

std::vector<Operation> sorted_by_name(const OperationSet& operations) {
    std::vector<Operation> sorted(operations.begin(), operations.end());
    std::sort(sorted.begin(), sorted.end(), [](Operation lhs, Operation rhs) {
        return std::strcmp(to_wire(lhs), to_wire(rhs)) < 0;
    });
    return sorted;
}

const std::string& build_identifier() {
    static const std::string identifier =
        std::string(AUTOBRIDGE_VERSION_STRING) + " (" + AUTOBRIDGE_GIT_VERSION_STRING + ")";
    return identifier;
}

} // namespace autobridge
