#pragma once

#include "connection.hpp"
#include "messages.hpp"
#include "throttler.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace autobridge {

/**
 * Typed front end for a bridge host.
 *
 * Every call encodes one request, waits for its reply and maps the reply onto the
 * method's return type. ErrorResponse replies are rethrown as ErrorEnvelope; a reply
 * of the wrong kind becomes ErrorEnvelope(invalid-request). At most
 * max_concurrent_requests calls are on the wire at once; the rest queue in order.
 *
 * Thread-safe: calls may be issued from any number of threads.
 */
class BridgeClient {
public:
    static constexpr size_t kDefaultMaxConcurrentRequests = 4;

    using ShouldCancel = RequestThrottler::ShouldCancel;

    explicit BridgeClient(std::shared_ptr<Connection> connection,
                          size_t max_concurrent_requests = kDefaultMaxConcurrentRequests);

    /// Round-trip a request. The reply comes back undecoded by kind, errors included.
    Response send(const Request& request, const ShouldCancel& should_cancel = {});

    /// Round-trip a request whose only successful reply is ok.
    void send_expect_ok(const Request& request, const ShouldCancel& should_cancel = {});

    HandshakeResponse handshake(const ClientIdentity& identity,
                                std::optional<HostKind> requested_host_kind = std::nullopt,
                                const ProtocolVersion& version = kProtocolVersion);

    const std::shared_ptr<Connection>& connection() const { return connection_; }

    // Core
    PermissionsStatus permissions_status();
    DaemonStatus daemon_status();
    /// True when the host agreed to shut down.
    bool daemon_stop();
    void scripting_probe();

    // Capture
    CaptureResult capture_screen(const CaptureScreenRequest& request);
    CaptureResult capture_window(const CaptureWindowRequest& request);
    CaptureResult capture_frontmost(const CaptureFrontmostRequest& request);
    CaptureResult capture_area(const CaptureAreaRequest& request);
    ElementDetectionResult detect_elements(const DetectElementsRequest& request);

    // Input
    void click(const ClickRequest& request);
    void type(const TypeRequest& request);
    TypeResult type_actions(const TypeActionsRequest& request);
    void scroll(const ScrollParameters& parameters);
    void hotkey(const std::string& keys, int hold_duration);
    void swipe(const SwipeRequest& request);
    void drag(const DragRequest& request);
    void move_mouse(const MoveMouseRequest& request);
    WaitForElementResult wait_for_element(const WaitForElementRequest& request);

    // Windows
    std::vector<WindowInfo> list_windows(const WindowTarget& target);
    void focus_window(const WindowTarget& target);
    void move_window(const WindowTarget& target, const Point& position);
    void resize_window(const WindowTarget& target, const Size& size);
    void set_window_bounds(const WindowTarget& target, const Rect& bounds);
    void close_window(const WindowTarget& target);
    void minimize_window(const WindowTarget& target);
    void maximize_window(const WindowTarget& target);
    std::optional<WindowInfo> focused_window();

    // Applications
    std::vector<ApplicationInfo> list_applications();
    ApplicationInfo find_application(const std::string& identifier);
    ApplicationInfo frontmost_application();
    bool is_application_running(const std::string& identifier);
    ApplicationInfo launch_application(const std::string& identifier);
    void activate_application(const std::string& identifier);
    bool quit_application(const std::string& identifier, bool force);
    void hide_application(const std::string& identifier);
    void unhide_application(const std::string& identifier);
    void hide_other_applications(const std::string& identifier);
    void show_all_applications();

    // Menus
    MenuStructure list_menus(const std::string& app_identifier);
    MenuStructure list_frontmost_menus();
    void click_menu_item(const std::string& app_identifier, const std::string& item_path);
    void click_menu_item_by_name(const std::string& app_identifier, const std::string& item_name);
    std::vector<MenuExtraInfo> list_menu_extras();
    void click_menu_extra(const std::string& title);
    std::optional<Rect> menu_extra_open_menu_frame(const std::string& title,
                                                   std::optional<int32_t> owner_pid = std::nullopt);
    std::vector<MenuBarItemInfo> list_menu_bar_items(bool include_raw_debug = false);
    ClickResult click_menu_bar_item_named(const std::string& name);
    ClickResult click_menu_bar_item_at(int index);

    // Dock
    std::vector<DockItem> list_dock_items(bool include_all = false);
    void launch_dock_item(const std::string& app_name);
    void right_click_dock_item(const std::string& app_name, const std::optional<std::string>& menu_item);
    void hide_dock();
    void show_dock();
    bool is_dock_hidden();
    std::optional<DockItem> find_dock_item(const std::string& name);

    // Dialogs
    DialogInfo find_active_dialog(const std::optional<std::string>& window_title,
                                  const std::optional<std::string>& app_name);
    DialogActionResult click_dialog_button(const DialogClickButtonRequest& request);
    DialogActionResult enter_dialog_text(const DialogEnterTextRequest& request);
    DialogActionResult handle_file_dialog(const DialogHandleFileRequest& request);
    DialogActionResult dismiss_dialog(const DialogDismissRequest& request);
    DialogElements list_dialog_elements(const std::optional<std::string>& window_title,
                                        const std::optional<std::string>& app_name);

    // Sessions
    std::string create_session();
    void store_detection_result(const std::string& session_id, const ElementDetectionResult& result);
    ElementDetectionResult detection_result(const std::string& session_id);
    void store_screenshot(const StoreScreenshotRequest& request);
    void store_annotated_screenshot(const std::string& session_id, const std::string& path);
    std::vector<SessionInfo> list_sessions();
    std::string most_recent_session(const std::optional<std::string>& application_bundle_id = std::nullopt);
    void clean_session(const std::string& session_id);
    int64_t clean_sessions_older_than(int days);
    int64_t clean_all_sessions();

private:
    std::shared_ptr<Connection> connection_;
    RequestThrottler throttler_;

    template <typename T>
    typename T::value_type expect(const Request& request);
};

} // namespace autobridge
