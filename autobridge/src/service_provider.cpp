#include "service_provider.hpp"

namespace autobridge {

namespace {

[[noreturn]] void unsupported(Operation operation) {
    throw ErrorEnvelope(ErrorCode::operation_not_supported,
                        std::string("Operation ") + to_wire(operation) + " is not supported by this host");
}

} // namespace

PermissionsStatus PermissionService::current() {
    return PermissionsStatus{};
}

CaptureResult CaptureService::capture_screen(const CaptureScreenRequest&) { unsupported(Operation::capture_screen); }
CaptureResult CaptureService::capture_window(const CaptureWindowRequest&) { unsupported(Operation::capture_window); }
CaptureResult CaptureService::capture_frontmost(const CaptureFrontmostRequest&) {
    unsupported(Operation::capture_frontmost);
}
CaptureResult CaptureService::capture_area(const CaptureAreaRequest&) { unsupported(Operation::capture_area); }

ElementDetectionResult AutomationService::detect_elements(const DetectElementsRequest&) {
    unsupported(Operation::detect_elements);
}
void AutomationService::click(const ClickRequest&) { unsupported(Operation::click); }
void AutomationService::type(const TypeRequest&) { unsupported(Operation::type); }
TypeResult AutomationService::type_actions(const TypeActionsRequest&) { unsupported(Operation::type_actions); }
void AutomationService::scroll(const ScrollParameters&) { unsupported(Operation::scroll); }
void AutomationService::hotkey(const std::string&, int) { unsupported(Operation::hotkey); }
void AutomationService::swipe(const SwipeRequest&) { unsupported(Operation::swipe); }
void AutomationService::drag(const DragRequest&) { unsupported(Operation::drag); }
void AutomationService::move_mouse(const MoveMouseRequest&) { unsupported(Operation::move_mouse); }
WaitForElementResult AutomationService::wait_for_element(const WaitForElementRequest&) {
    unsupported(Operation::wait_for_element);
}

std::vector<WindowInfo> WindowService::list_windows(const WindowTarget&) { unsupported(Operation::list_windows); }
void WindowService::focus_window(const WindowTarget&) { unsupported(Operation::focus_window); }
void WindowService::move_window(const WindowTarget&, const Point&) { unsupported(Operation::move_window); }
void WindowService::resize_window(const WindowTarget&, const Size&) { unsupported(Operation::resize_window); }
void WindowService::set_window_bounds(const WindowTarget&, const Rect&) { unsupported(Operation::set_window_bounds); }
void WindowService::close_window(const WindowTarget&) { unsupported(Operation::close_window); }
void WindowService::minimize_window(const WindowTarget&) { unsupported(Operation::minimize_window); }
void WindowService::maximize_window(const WindowTarget&) { unsupported(Operation::maximize_window); }
std::optional<WindowInfo> WindowService::focused_window() { unsupported(Operation::get_focused_window); }

std::vector<ApplicationInfo> ApplicationService::list_applications() { unsupported(Operation::list_applications); }
ApplicationInfo ApplicationService::find_application(const std::string&) { unsupported(Operation::find_application); }
ApplicationInfo ApplicationService::frontmost_application() { unsupported(Operation::get_frontmost_application); }
bool ApplicationService::is_application_running(const std::string&) {
    unsupported(Operation::is_application_running);
}
ApplicationInfo ApplicationService::launch_application(const std::string&) {
    unsupported(Operation::launch_application);
}
void ApplicationService::activate_application(const std::string&) { unsupported(Operation::activate_application); }
bool ApplicationService::quit_application(const std::string&, bool) { unsupported(Operation::quit_application); }
void ApplicationService::hide_application(const std::string&) { unsupported(Operation::hide_application); }
void ApplicationService::unhide_application(const std::string&) { unsupported(Operation::unhide_application); }
void ApplicationService::hide_other_applications(const std::string&) {
    unsupported(Operation::hide_other_applications);
}
void ApplicationService::show_all_applications() { unsupported(Operation::show_all_applications); }

MenuStructure MenuService::list_menus(const std::string&) { unsupported(Operation::list_menus); }
MenuStructure MenuService::list_frontmost_menus() { unsupported(Operation::list_frontmost_menus); }
void MenuService::click_menu_item(const std::string&, const std::string&) { unsupported(Operation::click_menu_item); }
void MenuService::click_menu_item_by_name(const std::string&, const std::string&) {
    unsupported(Operation::click_menu_item_by_name);
}
std::vector<MenuExtraInfo> MenuService::list_menu_extras() { unsupported(Operation::list_menu_extras); }
void MenuService::click_menu_extra(const std::string&) { unsupported(Operation::click_menu_extra); }
std::optional<Rect> MenuService::menu_extra_open_menu_frame(const std::string&, const std::optional<int32_t>&) {
    unsupported(Operation::menu_extra_open_menu_frame);
}
std::vector<MenuBarItemInfo> MenuService::list_menu_bar_items(bool) { unsupported(Operation::list_menu_bar_items); }
ClickResult MenuService::click_menu_bar_item_named(const std::string&) {
    unsupported(Operation::click_menu_bar_item_named);
}
ClickResult MenuService::click_menu_bar_item_at(int) { unsupported(Operation::click_menu_bar_item_index); }

std::vector<DockItem> DockService::list_dock_items(bool) { unsupported(Operation::list_dock_items); }
void DockService::launch_dock_item(const std::string&) { unsupported(Operation::launch_dock_item); }
void DockService::right_click_dock_item(const std::string&, const std::optional<std::string>&) {
    unsupported(Operation::right_click_dock_item);
}
void DockService::hide_dock() { unsupported(Operation::hide_dock); }
void DockService::show_dock() { unsupported(Operation::show_dock); }
bool DockService::is_dock_hidden() { unsupported(Operation::is_dock_hidden); }
std::optional<DockItem> DockService::find_dock_item(const std::string&) { unsupported(Operation::find_dock_item); }

DialogInfo DialogService::find_active_dialog(const std::optional<std::string>&, const std::optional<std::string>&) {
    unsupported(Operation::dialog_find_active);
}
DialogActionResult DialogService::click_button(const DialogClickButtonRequest&) {
    unsupported(Operation::dialog_click_button);
}
DialogActionResult DialogService::enter_text(const DialogEnterTextRequest&) {
    unsupported(Operation::dialog_enter_text);
}
DialogActionResult DialogService::handle_file_dialog(const DialogHandleFileRequest&) {
    unsupported(Operation::dialog_handle_file);
}
DialogActionResult DialogService::dismiss_dialog(const DialogDismissRequest&) {
    unsupported(Operation::dialog_dismiss);
}
DialogElements DialogService::list_dialog_elements(const std::optional<std::string>&,
                                                   const std::optional<std::string>&) {
    unsupported(Operation::dialog_list_elements);
}

std::string SessionService::create_session() { unsupported(Operation::create_session); }
void SessionService::store_detection_result(const std::string&, const ElementDetectionResult&) {
    unsupported(Operation::store_detection_result);
}
std::optional<ElementDetectionResult> SessionService::detection_result(const std::string&) {
    unsupported(Operation::get_detection_result);
}
void SessionService::store_screenshot(const StoreScreenshotRequest&) { unsupported(Operation::store_screenshot); }
void SessionService::store_annotated_screenshot(const std::string&, const std::string&) {
    unsupported(Operation::store_annotated_screenshot);
}
std::vector<SessionInfo> SessionService::list_sessions() { unsupported(Operation::list_sessions); }
std::optional<std::string> SessionService::most_recent_session(const std::optional<std::string>&) {
    unsupported(Operation::get_most_recent_session);
}
void SessionService::clean_session(const std::string&) { unsupported(Operation::clean_session); }
int64_t SessionService::clean_sessions_older_than(int) { unsupported(Operation::clean_sessions_older_than); }
int64_t SessionService::clean_all_sessions() { unsupported(Operation::clean_all_sessions); }

} // namespace autobridge
