#include "bridge_client.hpp"

#include "logger.hpp"
#include "msgpack_codec.hpp"

#include <log4cplus/loggingmacros.h>

namespace autobridge {

namespace {

[[noreturn]] void throw_unexpected(const Response& response, const Request& request) {
    if (const auto* error = std::get_if<ErrorResponse>(&response)) {
        throw error->value;
    }
    throw ErrorEnvelope(ErrorCode::invalid_request, "Unexpected " + std::string(response_case_name(response)) +
                                                        " response to " + request_case_name(request));
}

} // namespace

BridgeClient::BridgeClient(std::shared_ptr<Connection> connection, size_t max_concurrent_requests)
    : connection_(std::move(connection)), throttler_(max_concurrent_requests) {}

Response BridgeClient::send(const Request& request, const ShouldCancel& should_cancel) {
    RequestThrottler::Permit permit = throttler_.admit(should_cancel);

    auto pending = std::make_shared<PendingReply>();
    connection_->send(codec::encode_request(request), make_reply_handler(pending));
    std::string reply = pending->wait(should_cancel);

    try {
        return codec::decode_response(reply);
    } catch (const codec::DecodeError& exc) {
        LOG4CPLUS_ERROR(client_logger(), "Undecodable reply to " << request_case_name(request) << ": " << exc.what());
        throw ErrorEnvelope(ErrorCode::decoding_failed, "Failed to decode response", std::string(exc.what()));
    }
}

void BridgeClient::send_expect_ok(const Request& request, const ShouldCancel& should_cancel) {
    Response response = send(request, should_cancel);
    if (!std::holds_alternative<OkResponse>(response)) {
        throw_unexpected(response, request);
    }
}

template <typename T>
typename T::value_type BridgeClient::expect(const Request& request) {
    Response response = send(request);
    if (auto* value = std::get_if<T>(&response)) {
        return std::move(value->value);
    }
    throw_unexpected(response, request);
}

HandshakeResponse BridgeClient::handshake(const ClientIdentity& identity, std::optional<HostKind> requested_host_kind,
                                          const ProtocolVersion& version) {
    HandshakeResponse response = expect<HandshakeResult>(HandshakeRequest{version, identity, requested_host_kind});
    LOG4CPLUS_DEBUG(client_logger(), "Negotiated protocol " << response.negotiated_version.to_string() << " with "
                                                            << to_wire(response.host_kind) << " host");
    return response;
}

// Core

PermissionsStatus BridgeClient::permissions_status() {
    return expect<PermissionsStatusResponse>(PermissionsStatusRequest{});
}

DaemonStatus BridgeClient::daemon_status() {
    return expect<DaemonStatusResponse>(DaemonStatusRequest{});
}

bool BridgeClient::daemon_stop() {
    return expect<BoolResponse>(DaemonStopRequest{});
}

void BridgeClient::scripting_probe() {
    send_expect_ok(ScriptingProbeRequest{});
}

// Capture

CaptureResult BridgeClient::capture_screen(const CaptureScreenRequest& request) {
    return expect<CaptureResponse>(request);
}

CaptureResult BridgeClient::capture_window(const CaptureWindowRequest& request) {
    return expect<CaptureResponse>(request);
}

CaptureResult BridgeClient::capture_frontmost(const CaptureFrontmostRequest& request) {
    return expect<CaptureResponse>(request);
}

CaptureResult BridgeClient::capture_area(const CaptureAreaRequest& request) {
    return expect<CaptureResponse>(request);
}

ElementDetectionResult BridgeClient::detect_elements(const DetectElementsRequest& request) {
    return expect<ElementDetectionResponse>(request);
}

// Input

void BridgeClient::click(const ClickRequest& request) {
    send_expect_ok(request);
}

void BridgeClient::type(const TypeRequest& request) {
    send_expect_ok(request);
}

TypeResult BridgeClient::type_actions(const TypeActionsRequest& request) {
    return expect<TypeResultResponse>(request);
}

void BridgeClient::scroll(const ScrollParameters& parameters) {
    send_expect_ok(ScrollRequest{parameters});
}

void BridgeClient::hotkey(const std::string& keys, int hold_duration) {
    send_expect_ok(HotkeyRequest{keys, hold_duration});
}

void BridgeClient::swipe(const SwipeRequest& request) {
    send_expect_ok(request);
}

void BridgeClient::drag(const DragRequest& request) {
    send_expect_ok(request);
}

void BridgeClient::move_mouse(const MoveMouseRequest& request) {
    send_expect_ok(request);
}

WaitForElementResult BridgeClient::wait_for_element(const WaitForElementRequest& request) {
    return expect<WaitResultResponse>(request);
}

// Windows

std::vector<WindowInfo> BridgeClient::list_windows(const WindowTarget& target) {
    return expect<WindowsResponse>(ListWindowsRequest{target});
}

void BridgeClient::focus_window(const WindowTarget& target) {
    send_expect_ok(FocusWindowRequest{target});
}

void BridgeClient::move_window(const WindowTarget& target, const Point& position) {
    send_expect_ok(MoveWindowRequest{target, position});
}

void BridgeClient::resize_window(const WindowTarget& target, const Size& size) {
    send_expect_ok(ResizeWindowRequest{target, size});
}

void BridgeClient::set_window_bounds(const WindowTarget& target, const Rect& bounds) {
    send_expect_ok(SetWindowBoundsRequest{target, bounds});
}

void BridgeClient::close_window(const WindowTarget& target) {
    send_expect_ok(CloseWindowRequest{target});
}

void BridgeClient::minimize_window(const WindowTarget& target) {
    send_expect_ok(MinimizeWindowRequest{target});
}

void BridgeClient::maximize_window(const WindowTarget& target) {
    send_expect_ok(MaximizeWindowRequest{target});
}

std::optional<WindowInfo> BridgeClient::focused_window() {
    return expect<WindowResponse>(GetFocusedWindowRequest{});
}

// Applications

std::vector<ApplicationInfo> BridgeClient::list_applications() {
    return expect<ApplicationsResponse>(ListApplicationsRequest{});
}

ApplicationInfo BridgeClient::find_application(const std::string& identifier) {
    return expect<ApplicationResponse>(FindApplicationRequest{identifier});
}

ApplicationInfo BridgeClient::frontmost_application() {
    return expect<ApplicationResponse>(GetFrontmostApplicationRequest{});
}

bool BridgeClient::is_application_running(const std::string& identifier) {
    return expect<BoolResponse>(IsApplicationRunningRequest{identifier});
}

ApplicationInfo BridgeClient::launch_application(const std::string& identifier) {
    return expect<ApplicationResponse>(LaunchApplicationRequest{identifier});
}

void BridgeClient::activate_application(const std::string& identifier) {
    send_expect_ok(ActivateApplicationRequest{identifier});
}

bool BridgeClient::quit_application(const std::string& identifier, bool force) {
    return expect<BoolResponse>(QuitApplicationRequest{identifier, force});
}

void BridgeClient::hide_application(const std::string& identifier) {
    send_expect_ok(HideApplicationRequest{identifier});
}

void BridgeClient::unhide_application(const std::string& identifier) {
    send_expect_ok(UnhideApplicationRequest{identifier});
}

void BridgeClient::hide_other_applications(const std::string& identifier) {
    send_expect_ok(HideOtherApplicationsRequest{identifier});
}

void BridgeClient::show_all_applications() {
    send_expect_ok(ShowAllApplicationsRequest{});
}

// Menus

MenuStructure BridgeClient::list_menus(const std::string& app_identifier) {
    return expect<MenuStructureResponse>(ListMenusRequest{app_identifier});
}

MenuStructure BridgeClient::list_frontmost_menus() {
    return expect<MenuStructureResponse>(ListFrontmostMenusRequest{});
}

void BridgeClient::click_menu_item(const std::string& app_identifier, const std::string& item_path) {
    send_expect_ok(ClickMenuItemRequest{app_identifier, item_path});
}

void BridgeClient::click_menu_item_by_name(const std::string& app_identifier, const std::string& item_name) {
    send_expect_ok(ClickMenuItemByNameRequest{app_identifier, item_name});
}

std::vector<MenuExtraInfo> BridgeClient::list_menu_extras() {
    return expect<MenuExtrasResponse>(ListMenuExtrasRequest{});
}

void BridgeClient::click_menu_extra(const std::string& title) {
    send_expect_ok(ClickMenuExtraRequest{title});
}

std::optional<Rect> BridgeClient::menu_extra_open_menu_frame(const std::string& title,
                                                             std::optional<int32_t> owner_pid) {
    return expect<RectResponse>(MenuExtraOpenMenuFrameRequest{title, owner_pid});
}

std::vector<MenuBarItemInfo> BridgeClient::list_menu_bar_items(bool include_raw_debug) {
    return expect<MenuBarItemsResponse>(ListMenuBarItemsRequest{include_raw_debug});
}

ClickResult BridgeClient::click_menu_bar_item_named(const std::string& name) {
    return expect<ClickResultResponse>(ClickMenuBarItemNamedRequest{name});
}

ClickResult BridgeClient::click_menu_bar_item_at(int index) {
    return expect<ClickResultResponse>(ClickMenuBarItemIndexRequest{index});
}

// Dock

std::vector<DockItem> BridgeClient::list_dock_items(bool include_all) {
    return expect<DockItemsResponse>(ListDockItemsRequest{include_all});
}

void BridgeClient::launch_dock_item(const std::string& app_name) {
    send_expect_ok(LaunchDockItemRequest{app_name});
}

void BridgeClient::right_click_dock_item(const std::string& app_name, const std::optional<std::string>& menu_item) {
    send_expect_ok(RightClickDockItemRequest{app_name, menu_item});
}

void BridgeClient::hide_dock() {
    send_expect_ok(HideDockRequest{});
}

void BridgeClient::show_dock() {
    send_expect_ok(ShowDockRequest{});
}

bool BridgeClient::is_dock_hidden() {
    return expect<BoolResponse>(IsDockHiddenRequest{});
}

std::optional<DockItem> BridgeClient::find_dock_item(const std::string& name) {
    return expect<DockItemResponse>(FindDockItemRequest{name});
}

// Dialogs

DialogInfo BridgeClient::find_active_dialog(const std::optional<std::string>& window_title,
                                            const std::optional<std::string>& app_name) {
    return expect<DialogInfoResponse>(DialogFindActiveRequest{window_title, app_name});
}

DialogActionResult BridgeClient::click_dialog_button(const DialogClickButtonRequest& request) {
    return expect<DialogResultResponse>(request);
}

DialogActionResult BridgeClient::enter_dialog_text(const DialogEnterTextRequest& request) {
    return expect<DialogResultResponse>(request);
}

DialogActionResult BridgeClient::handle_file_dialog(const DialogHandleFileRequest& request) {
    return expect<DialogResultResponse>(request);
}

DialogActionResult BridgeClient::dismiss_dialog(const DialogDismissRequest& request) {
    return expect<DialogResultResponse>(request);
}

DialogElements BridgeClient::list_dialog_elements(const std::optional<std::string>& window_title,
                                                  const std::optional<std::string>& app_name) {
    return expect<DialogElementsResponse>(DialogListElementsRequest{window_title, app_name});
}

// Sessions

std::string BridgeClient::create_session() {
    return expect<SessionIdResponse>(CreateSessionRequest{});
}

void BridgeClient::store_detection_result(const std::string& session_id, const ElementDetectionResult& result) {
    send_expect_ok(StoreDetectionResultRequest{session_id, result});
}

ElementDetectionResult BridgeClient::detection_result(const std::string& session_id) {
    return expect<DetectionResponse>(GetDetectionResultRequest{session_id});
}

void BridgeClient::store_screenshot(const StoreScreenshotRequest& request) {
    send_expect_ok(request);
}

void BridgeClient::store_annotated_screenshot(const std::string& session_id, const std::string& path) {
    send_expect_ok(StoreAnnotatedScreenshotRequest{session_id, path});
}

std::vector<SessionInfo> BridgeClient::list_sessions() {
    return expect<SessionsResponse>(ListSessionsRequest{});
}

std::string BridgeClient::most_recent_session(const std::optional<std::string>& application_bundle_id) {
    return expect<SessionIdResponse>(GetMostRecentSessionRequest{application_bundle_id});
}

void BridgeClient::clean_session(const std::string& session_id) {
    send_expect_ok(CleanSessionRequest{session_id});
}

int64_t BridgeClient::clean_sessions_older_than(int days) {
    return expect<IntResponse>(CleanSessionsOlderThanRequest{days});
}

int64_t BridgeClient::clean_all_sessions() {
    return expect<IntResponse>(CleanAllSessionsRequest{});
}

} // namespace autobridge
