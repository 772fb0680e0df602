#pragma once

#include "automation_types.hpp"
#include "messages.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace autobridge {

// Collaborator interfaces the router dispatches into. Every method defaults to
// throwing ErrorEnvelope(operation-not-supported); a host overrides what it can do.
// Implementations must synchronize themselves: workers call them concurrently.

class PermissionService {
public:
    virtual ~PermissionService() = default;

    /// Grants currently held. The default reports none.
    virtual PermissionsStatus current();
};

class CaptureService {
public:
    virtual ~CaptureService() = default;

    virtual CaptureResult capture_screen(const CaptureScreenRequest& request);
    virtual CaptureResult capture_window(const CaptureWindowRequest& request);
    virtual CaptureResult capture_frontmost(const CaptureFrontmostRequest& request);
    virtual CaptureResult capture_area(const CaptureAreaRequest& request);
};

class AutomationService {
public:
    virtual ~AutomationService() = default;

    virtual ElementDetectionResult detect_elements(const DetectElementsRequest& request);
    virtual void click(const ClickRequest& request);
    virtual void type(const TypeRequest& request);
    virtual TypeResult type_actions(const TypeActionsRequest& request);
    virtual void scroll(const ScrollParameters& parameters);
    virtual void hotkey(const std::string& keys, int hold_duration);
    virtual void swipe(const SwipeRequest& request);
    virtual void drag(const DragRequest& request);
    virtual void move_mouse(const MoveMouseRequest& request);
    virtual WaitForElementResult wait_for_element(const WaitForElementRequest& request);
};

class WindowService {
public:
    virtual ~WindowService() = default;

    virtual std::vector<WindowInfo> list_windows(const WindowTarget& target);
    virtual void focus_window(const WindowTarget& target);
    virtual void move_window(const WindowTarget& target, const Point& position);
    virtual void resize_window(const WindowTarget& target, const Size& size);
    virtual void set_window_bounds(const WindowTarget& target, const Rect& bounds);
    virtual void close_window(const WindowTarget& target);
    virtual void minimize_window(const WindowTarget& target);
    virtual void maximize_window(const WindowTarget& target);
    virtual std::optional<WindowInfo> focused_window();
};

class ApplicationService {
public:
    virtual ~ApplicationService() = default;

    virtual std::vector<ApplicationInfo> list_applications();
    virtual ApplicationInfo find_application(const std::string& identifier);
    virtual ApplicationInfo frontmost_application();
    virtual bool is_application_running(const std::string& identifier);
    virtual ApplicationInfo launch_application(const std::string& identifier);
    virtual void activate_application(const std::string& identifier);
    virtual bool quit_application(const std::string& identifier, bool force);
    virtual void hide_application(const std::string& identifier);
    virtual void unhide_application(const std::string& identifier);
    virtual void hide_other_applications(const std::string& identifier);
    virtual void show_all_applications();
};

class MenuService {
public:
    virtual ~MenuService() = default;

    virtual MenuStructure list_menus(const std::string& app_identifier);
    virtual MenuStructure list_frontmost_menus();
    virtual void click_menu_item(const std::string& app_identifier, const std::string& item_path);
    virtual void click_menu_item_by_name(const std::string& app_identifier, const std::string& item_name);
    virtual std::vector<MenuExtraInfo> list_menu_extras();
    virtual void click_menu_extra(const std::string& title);
    /// Frame of the menu a menu extra has open, if any.
    virtual std::optional<Rect> menu_extra_open_menu_frame(const std::string& title,
                                                           const std::optional<int32_t>& owner_pid);
    virtual std::vector<MenuBarItemInfo> list_menu_bar_items(bool include_raw_debug);
    virtual ClickResult click_menu_bar_item_named(const std::string& name);
    virtual ClickResult click_menu_bar_item_at(int index);
};

class DockService {
public:
    virtual ~DockService() = default;

    virtual std::vector<DockItem> list_dock_items(bool include_all);
    virtual void launch_dock_item(const std::string& app_name);
    virtual void right_click_dock_item(const std::string& app_name, const std::optional<std::string>& menu_item);
    virtual void hide_dock();
    virtual void show_dock();
    virtual bool is_dock_hidden();
    virtual std::optional<DockItem> find_dock_item(const std::string& name);
};

class DialogService {
public:
    virtual ~DialogService() = default;

    virtual DialogInfo find_active_dialog(const std::optional<std::string>& window_title,
                                          const std::optional<std::string>& app_name);
    virtual DialogActionResult click_button(const DialogClickButtonRequest& request);
    virtual DialogActionResult enter_text(const DialogEnterTextRequest& request);
    virtual DialogActionResult handle_file_dialog(const DialogHandleFileRequest& request);
    virtual DialogActionResult dismiss_dialog(const DialogDismissRequest& request);
    virtual DialogElements list_dialog_elements(const std::optional<std::string>& window_title,
                                                const std::optional<std::string>& app_name);
};

class SessionService {
public:
    virtual ~SessionService() = default;

    virtual std::string create_session();
    virtual void store_detection_result(const std::string& session_id, const ElementDetectionResult& result);
    virtual std::optional<ElementDetectionResult> detection_result(const std::string& session_id);
    virtual void store_screenshot(const StoreScreenshotRequest& request);
    virtual void store_annotated_screenshot(const std::string& session_id, const std::string& path);
    virtual std::vector<SessionInfo> list_sessions();
    virtual std::optional<std::string> most_recent_session(const std::optional<std::string>& application_bundle_id);
    virtual void clean_session(const std::string& session_id);
    virtual int64_t clean_sessions_older_than(int days);
    virtual int64_t clean_all_sessions();
};

/**
 * Lifecycle control of a long-running host. Optional: a provider without one neither
 * advertises nor serves the daemon operations.
 */
class DaemonControl {
public:
    virtual ~DaemonControl() = default;

    virtual DaemonStatus status() = 0;
    /// Ask the host to shut down after replying. False if it declined.
    virtual bool request_stop() = 0;
};

/**
 * The collaborator bundle a router serves.
 *
 * A default-constructed provider grants no permissions and rejects every operation;
 * swap in concrete services before handing it to a router.
 */
struct ServiceProvider {
    std::shared_ptr<PermissionService> permissions = std::make_shared<PermissionService>();
    std::shared_ptr<CaptureService> capture = std::make_shared<CaptureService>();
    std::shared_ptr<AutomationService> automation = std::make_shared<AutomationService>();
    std::shared_ptr<WindowService> windows = std::make_shared<WindowService>();
    std::shared_ptr<ApplicationService> applications = std::make_shared<ApplicationService>();
    std::shared_ptr<MenuService> menus = std::make_shared<MenuService>();
    std::shared_ptr<DockService> dock = std::make_shared<DockService>();
    std::shared_ptr<DialogService> dialogs = std::make_shared<DialogService>();
    std::shared_ptr<SessionService> sessions = std::make_shared<SessionService>();
    std::shared_ptr<DaemonControl> daemon;
};

} // namespace autobridge
