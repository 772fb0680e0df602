#pragma once

#include "automation_types.hpp"
#include "error_envelope.hpp"
#include "msgpack_adaptors.hpp"
#include "protocol.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace autobridge {

// Every request payload carries the operation it belongs to as kOperation, so the
// request's operation is fixed by its type. Payload structs without members travel
// with the payload key omitted.

template <Operation Op>
struct EmptyPayload {
    static constexpr Operation kOperation = Op;
};

struct HandshakeRequest {
    // Answered before any gating; shares the permission-status slot.
    static constexpr Operation kOperation = Operation::permissions_status;

    ProtocolVersion protocol_version;
    ClientIdentity client;
    std::optional<HostKind> requested_host_kind;

    MSGPACK_DEFINE_MAP(protocol_version, client, requested_host_kind);
};

struct HandshakeResponse {
    ProtocolVersion negotiated_version;
    HostKind host_kind = HostKind::helper;
    std::optional<std::string> build;
    std::vector<Operation> supported_operations;
    std::map<std::string, std::vector<PermissionKind>> permission_tags;
    std::optional<PermissionsStatus> permissions;
    std::optional<std::vector<Operation>> enabled_operations;

    MSGPACK_DEFINE_MAP(negotiated_version, host_kind, build, supported_operations, permission_tags, permissions,
                       enabled_operations);
};

// Capture

struct CaptureScreenRequest {
    static constexpr Operation kOperation = Operation::capture_screen;

    std::optional<int> display_index;
    CaptureVisualizerMode visualizer_mode = CaptureVisualizerMode::screenshot_flash;
    CaptureScale scale = CaptureScale::logical_1x;

    MSGPACK_DEFINE_MAP(display_index, visualizer_mode, scale);
};

struct CaptureWindowRequest {
    static constexpr Operation kOperation = Operation::capture_window;

    std::string app_identifier;
    std::optional<int> window_index;
    std::optional<int64_t> window_id;
    CaptureVisualizerMode visualizer_mode = CaptureVisualizerMode::screenshot_flash;
    CaptureScale scale = CaptureScale::logical_1x;

    MSGPACK_DEFINE_MAP(app_identifier, window_index, window_id, visualizer_mode, scale);
};

struct CaptureFrontmostRequest {
    static constexpr Operation kOperation = Operation::capture_frontmost;

    CaptureVisualizerMode visualizer_mode = CaptureVisualizerMode::screenshot_flash;
    CaptureScale scale = CaptureScale::logical_1x;

    MSGPACK_DEFINE_MAP(visualizer_mode, scale);
};

struct CaptureAreaRequest {
    static constexpr Operation kOperation = Operation::capture_area;

    Rect rect;
    CaptureVisualizerMode visualizer_mode = CaptureVisualizerMode::screenshot_flash;
    CaptureScale scale = CaptureScale::logical_1x;

    MSGPACK_DEFINE_MAP(rect, visualizer_mode, scale);
};

struct DetectElementsRequest {
    static constexpr Operation kOperation = Operation::detect_elements;

    std::vector<uint8_t> image_data;
    std::optional<std::string> session_id;
    std::optional<WindowContext> window_context;

    MSGPACK_DEFINE_MAP(image_data, session_id, window_context);
};

// Input

struct ClickRequest {
    static constexpr Operation kOperation = Operation::click;

    ClickTarget target;
    ClickType click_type = ClickType::single;
    std::optional<std::string> session_id;

    MSGPACK_DEFINE_MAP(target, click_type, session_id);
};

struct TypeRequest {
    static constexpr Operation kOperation = Operation::type;

    std::string text;
    std::optional<std::string> target;
    bool clear_existing = false;
    int typing_delay = 0;
    std::optional<std::string> session_id;

    MSGPACK_DEFINE_MAP(text, target, clear_existing, typing_delay, session_id);
};

struct TypeActionsRequest {
    static constexpr Operation kOperation = Operation::type_actions;

    std::vector<TypeAction> actions;
    TypingCadence cadence;
    std::optional<std::string> session_id;

    MSGPACK_DEFINE_MAP(actions, cadence, session_id);
};

struct ScrollRequest {
    static constexpr Operation kOperation = Operation::scroll;

    ScrollParameters request;

    MSGPACK_DEFINE_MAP(request);
};

struct HotkeyRequest {
    static constexpr Operation kOperation = Operation::hotkey;

    std::string keys;
    int hold_duration = 0;

    MSGPACK_DEFINE_MAP(keys, hold_duration);
};

struct SwipeRequest {
    static constexpr Operation kOperation = Operation::swipe;

    Point from;
    Point to;
    int duration = 0;
    int steps = 0;
    MouseMovementProfile profile = MouseMovementProfile::linear;

    MSGPACK_DEFINE_MAP(from, to, duration, steps, profile);
};

struct DragRequest {
    static constexpr Operation kOperation = Operation::drag;

    Point from;
    Point to;
    int duration = 0;
    int steps = 0;
    std::optional<std::string> modifiers;
    MouseMovementProfile profile = MouseMovementProfile::linear;

    MSGPACK_DEFINE_MAP(from, to, duration, steps, modifiers, profile);
};

struct MoveMouseRequest {
    static constexpr Operation kOperation = Operation::move_mouse;

    Point to;
    int duration = 0;
    int steps = 0;
    MouseMovementProfile profile = MouseMovementProfile::linear;

    MSGPACK_DEFINE_MAP(to, duration, steps, profile);
};

struct WaitForElementRequest {
    static constexpr Operation kOperation = Operation::wait_for_element;

    ClickTarget target;
    double timeout = 0.0;
    std::optional<std::string> session_id;

    MSGPACK_DEFINE_MAP(target, timeout, session_id);
};

// Windows

template <Operation Op>
struct WindowTargetPayload {
    static constexpr Operation kOperation = Op;

    WindowTarget target;

    MSGPACK_DEFINE_MAP(target);
};

using ListWindowsRequest = WindowTargetPayload<Operation::list_windows>;
using FocusWindowRequest = WindowTargetPayload<Operation::focus_window>;
using CloseWindowRequest = WindowTargetPayload<Operation::close_window>;
using MinimizeWindowRequest = WindowTargetPayload<Operation::minimize_window>;
using MaximizeWindowRequest = WindowTargetPayload<Operation::maximize_window>;
using GetFocusedWindowRequest = EmptyPayload<Operation::get_focused_window>;

struct MoveWindowRequest {
    static constexpr Operation kOperation = Operation::move_window;

    WindowTarget target;
    Point position;

    MSGPACK_DEFINE_MAP(target, position);
};

struct ResizeWindowRequest {
    static constexpr Operation kOperation = Operation::resize_window;

    WindowTarget target;
    Size size;

    MSGPACK_DEFINE_MAP(target, size);
};

struct SetWindowBoundsRequest {
    static constexpr Operation kOperation = Operation::set_window_bounds;

    WindowTarget target;
    Rect bounds;

    MSGPACK_DEFINE_MAP(target, bounds);
};

// Applications

template <Operation Op>
struct AppIdentifierPayload {
    static constexpr Operation kOperation = Op;

    std::string identifier;

    MSGPACK_DEFINE_MAP(identifier);
};

using ListApplicationsRequest = EmptyPayload<Operation::list_applications>;
using FindApplicationRequest = AppIdentifierPayload<Operation::find_application>;
using GetFrontmostApplicationRequest = EmptyPayload<Operation::get_frontmost_application>;
using IsApplicationRunningRequest = AppIdentifierPayload<Operation::is_application_running>;
using LaunchApplicationRequest = AppIdentifierPayload<Operation::launch_application>;
using ActivateApplicationRequest = AppIdentifierPayload<Operation::activate_application>;
using HideApplicationRequest = AppIdentifierPayload<Operation::hide_application>;
using UnhideApplicationRequest = AppIdentifierPayload<Operation::unhide_application>;
using HideOtherApplicationsRequest = AppIdentifierPayload<Operation::hide_other_applications>;
using ShowAllApplicationsRequest = EmptyPayload<Operation::show_all_applications>;

struct QuitApplicationRequest {
    static constexpr Operation kOperation = Operation::quit_application;

    std::string identifier;
    bool force = false;

    MSGPACK_DEFINE_MAP(identifier, force);
};

// Menus

template <Operation Op>
struct MenuBarNamePayload {
    static constexpr Operation kOperation = Op;

    std::string name;

    MSGPACK_DEFINE_MAP(name);
};

struct ListMenusRequest {
    static constexpr Operation kOperation = Operation::list_menus;

    std::string app_identifier;

    MSGPACK_DEFINE_MAP(app_identifier);
};

using ListFrontmostMenusRequest = EmptyPayload<Operation::list_frontmost_menus>;

struct ClickMenuItemRequest {
    static constexpr Operation kOperation = Operation::click_menu_item;

    std::string app_identifier;
    std::string item_path;

    MSGPACK_DEFINE_MAP(app_identifier, item_path);
};

struct ClickMenuItemByNameRequest {
    static constexpr Operation kOperation = Operation::click_menu_item_by_name;

    std::string app_identifier;
    std::string item_name;

    MSGPACK_DEFINE_MAP(app_identifier, item_name);
};

using ListMenuExtrasRequest = EmptyPayload<Operation::list_menu_extras>;
using ClickMenuExtraRequest = MenuBarNamePayload<Operation::click_menu_extra>;

struct MenuExtraOpenMenuFrameRequest {
    static constexpr Operation kOperation = Operation::menu_extra_open_menu_frame;

    std::string title;
    std::optional<int32_t> owner_pid;

    MSGPACK_DEFINE_MAP(title, owner_pid);
};

struct ListMenuBarItemsRequest {
    static constexpr Operation kOperation = Operation::list_menu_bar_items;

    bool include_raw_debug = false;

    MSGPACK_DEFINE_MAP(include_raw_debug);
};

using ClickMenuBarItemNamedRequest = MenuBarNamePayload<Operation::click_menu_bar_item_named>;

struct ClickMenuBarItemIndexRequest {
    static constexpr Operation kOperation = Operation::click_menu_bar_item_index;

    int index = 0;

    MSGPACK_DEFINE_MAP(index);
};

// Dock

struct ListDockItemsRequest {
    static constexpr Operation kOperation = Operation::list_dock_items;

    bool include_all = false;

    MSGPACK_DEFINE_MAP(include_all);
};

struct LaunchDockItemRequest {
    static constexpr Operation kOperation = Operation::launch_dock_item;

    std::string app_name;

    MSGPACK_DEFINE_MAP(app_name);
};

struct RightClickDockItemRequest {
    static constexpr Operation kOperation = Operation::right_click_dock_item;

    std::string app_name;
    std::optional<std::string> menu_item;

    MSGPACK_DEFINE_MAP(app_name, menu_item);
};

using HideDockRequest = EmptyPayload<Operation::hide_dock>;
using ShowDockRequest = EmptyPayload<Operation::show_dock>;
using IsDockHiddenRequest = EmptyPayload<Operation::is_dock_hidden>;

struct FindDockItemRequest {
    static constexpr Operation kOperation = Operation::find_dock_item;

    std::string name;

    MSGPACK_DEFINE_MAP(name);
};

// Dialogs

template <Operation Op>
struct DialogLocatorPayload {
    static constexpr Operation kOperation = Op;

    std::optional<std::string> window_title;
    std::optional<std::string> app_name;

    MSGPACK_DEFINE_MAP(window_title, app_name);
};

using DialogFindActiveRequest = DialogLocatorPayload<Operation::dialog_find_active>;
using DialogListElementsRequest = DialogLocatorPayload<Operation::dialog_list_elements>;

struct DialogClickButtonRequest {
    static constexpr Operation kOperation = Operation::dialog_click_button;

    std::string button_text;
    std::optional<std::string> window_title;
    std::optional<std::string> app_name;

    MSGPACK_DEFINE_MAP(button_text, window_title, app_name);
};

struct DialogEnterTextRequest {
    static constexpr Operation kOperation = Operation::dialog_enter_text;

    std::string text;
    std::optional<std::string> field_identifier;
    bool clear_existing = false;
    std::optional<std::string> window_title;
    std::optional<std::string> app_name;

    MSGPACK_DEFINE_MAP(text, field_identifier, clear_existing, window_title, app_name);
};

struct DialogHandleFileRequest {
    static constexpr Operation kOperation = Operation::dialog_handle_file;

    std::optional<std::string> path;
    std::optional<std::string> filename;
    std::optional<std::string> action_button;
    std::optional<bool> ensure_expanded;
    std::optional<std::string> app_name;

    MSGPACK_DEFINE_MAP(path, filename, action_button, ensure_expanded, app_name);
};

struct DialogDismissRequest {
    static constexpr Operation kOperation = Operation::dialog_dismiss;

    bool force = false;
    std::optional<std::string> window_title;
    std::optional<std::string> app_name;

    MSGPACK_DEFINE_MAP(force, window_title, app_name);
};

// Sessions

template <Operation Op>
struct SessionIdPayload {
    static constexpr Operation kOperation = Op;

    std::string session_id;

    MSGPACK_DEFINE_MAP(session_id);
};

using CreateSessionRequest = EmptyPayload<Operation::create_session>;
using GetDetectionResultRequest = SessionIdPayload<Operation::get_detection_result>;
using CleanSessionRequest = SessionIdPayload<Operation::clean_session>;
using ListSessionsRequest = EmptyPayload<Operation::list_sessions>;
using CleanAllSessionsRequest = EmptyPayload<Operation::clean_all_sessions>;

struct StoreDetectionResultRequest {
    static constexpr Operation kOperation = Operation::store_detection_result;

    std::string session_id;
    ElementDetectionResult result;

    MSGPACK_DEFINE_MAP(session_id, result);
};

struct StoreScreenshotRequest {
    static constexpr Operation kOperation = Operation::store_screenshot;

    std::string session_id;
    std::string screenshot_path;
    std::optional<std::string> application_bundle_id;
    std::optional<int32_t> application_process_id;
    std::optional<std::string> application_name;
    std::optional<std::string> window_title;
    std::optional<Rect> window_bounds;

    MSGPACK_DEFINE_MAP(session_id, screenshot_path, application_bundle_id, application_process_id, application_name,
                       window_title, window_bounds);
};

struct StoreAnnotatedScreenshotRequest {
    static constexpr Operation kOperation = Operation::store_annotated_screenshot;

    std::string session_id;
    std::string annotated_screenshot_path;

    MSGPACK_DEFINE_MAP(session_id, annotated_screenshot_path);
};

struct GetMostRecentSessionRequest {
    static constexpr Operation kOperation = Operation::get_most_recent_session;

    std::optional<std::string> application_bundle_id;

    MSGPACK_DEFINE_MAP(application_bundle_id);
};

struct CleanSessionsOlderThanRequest {
    static constexpr Operation kOperation = Operation::clean_sessions_older_than;

    int days = 0;

    MSGPACK_DEFINE_MAP(days);
};

using PermissionsStatusRequest = EmptyPayload<Operation::permissions_status>;
using DaemonStatusRequest = EmptyPayload<Operation::daemon_status>;
using DaemonStopRequest = EmptyPayload<Operation::daemon_stop>;
using ScriptingProbeRequest = EmptyPayload<Operation::scripting_probe>;

using Request = std::variant<
    HandshakeRequest,
    PermissionsStatusRequest,
    DaemonStatusRequest,
    DaemonStopRequest,
    CaptureScreenRequest,
    CaptureWindowRequest,
    CaptureFrontmostRequest,
    CaptureAreaRequest,
    DetectElementsRequest,
    ClickRequest,
    TypeRequest,
    TypeActionsRequest,
    ScrollRequest,
    HotkeyRequest,
    SwipeRequest,
    DragRequest,
    MoveMouseRequest,
    WaitForElementRequest,
    ListWindowsRequest,
    FocusWindowRequest,
    MoveWindowRequest,
    ResizeWindowRequest,
    SetWindowBoundsRequest,
    CloseWindowRequest,
    MinimizeWindowRequest,
    MaximizeWindowRequest,
    GetFocusedWindowRequest,
    ListApplicationsRequest,
    FindApplicationRequest,
    GetFrontmostApplicationRequest,
    IsApplicationRunningRequest,
    LaunchApplicationRequest,
    ActivateApplicationRequest,
    QuitApplicationRequest,
    HideApplicationRequest,
    UnhideApplicationRequest,
    HideOtherApplicationsRequest,
    ShowAllApplicationsRequest,
    ListMenusRequest,
    ListFrontmostMenusRequest,
    ClickMenuItemRequest,
    ClickMenuItemByNameRequest,
    ListMenuExtrasRequest,
    ClickMenuExtraRequest,
    MenuExtraOpenMenuFrameRequest,
    ListMenuBarItemsRequest,
    ClickMenuBarItemNamedRequest,
    ClickMenuBarItemIndexRequest,
    ListDockItemsRequest,
    LaunchDockItemRequest,
    RightClickDockItemRequest,
    HideDockRequest,
    ShowDockRequest,
    IsDockHiddenRequest,
    FindDockItemRequest,
    DialogFindActiveRequest,
    DialogClickButtonRequest,
    DialogEnterTextRequest,
    DialogHandleFileRequest,
    DialogDismissRequest,
    DialogListElementsRequest,
    CreateSessionRequest,
    StoreDetectionResultRequest,
    GetDetectionResultRequest,
    StoreScreenshotRequest,
    StoreAnnotatedScreenshotRequest,
    ListSessionsRequest,
    GetMostRecentSessionRequest,
    CleanSessionRequest,
    CleanSessionsOlderThanRequest,
    CleanAllSessionsRequest,
    ScriptingProbeRequest>;

/// The operation a request is gated on.
Operation operation_of(const Request& request);

/// Wire discriminant of a request: "handshake" or the operation's name.
std::string request_case_name(const Request& request);

template <typename T>
const char* request_case_name_of() {
    if constexpr (std::is_same_v<T, HandshakeRequest>) {
        return "handshake";
    } else {
        return to_wire(T::kOperation);
    }
}

enum class ResponseCase {
    ok,
    boolean,
    integer,
    handshake,
    permissions_status,
    daemon_status,
    capture,
    element_detection,
    wait_result,
    windows,
    window,
    applications,
    application,
    type_result,
    click_result,
    menu_structure,
    menu_extras,
    menu_bar_items,
    dock_items,
    dock_item,
    rect,
    dialog_info,
    dialog_elements,
    dialog_result,
    session_id,
    sessions,
    detection,
    error,
};

template <>
struct WireEnum<ResponseCase> {
    static const std::vector<std::pair<ResponseCase, const char*>>& entries();
};

template <ResponseCase Case>
struct ResponseMarker {
    static constexpr ResponseCase kCase = Case;
};

template <ResponseCase Case, typename T>
struct ResponseValue {
    static constexpr ResponseCase kCase = Case;
    using value_type = T;

    T value;
};

using OkResponse = ResponseMarker<ResponseCase::ok>;
using BoolResponse = ResponseValue<ResponseCase::boolean, bool>;
using IntResponse = ResponseValue<ResponseCase::integer, int64_t>;
using HandshakeResult = ResponseValue<ResponseCase::handshake, HandshakeResponse>;
using PermissionsStatusResponse = ResponseValue<ResponseCase::permissions_status, PermissionsStatus>;
using DaemonStatusResponse = ResponseValue<ResponseCase::daemon_status, DaemonStatus>;
using CaptureResponse = ResponseValue<ResponseCase::capture, CaptureResult>;
using ElementDetectionResponse = ResponseValue<ResponseCase::element_detection, ElementDetectionResult>;
using WaitResultResponse = ResponseValue<ResponseCase::wait_result, WaitForElementResult>;
using WindowsResponse = ResponseValue<ResponseCase::windows, std::vector<WindowInfo>>;
using WindowResponse = ResponseValue<ResponseCase::window, std::optional<WindowInfo>>;
using ApplicationsResponse = ResponseValue<ResponseCase::applications, std::vector<ApplicationInfo>>;
using ApplicationResponse = ResponseValue<ResponseCase::application, ApplicationInfo>;
using TypeResultResponse = ResponseValue<ResponseCase::type_result, TypeResult>;
using ClickResultResponse = ResponseValue<ResponseCase::click_result, ClickResult>;
using MenuStructureResponse = ResponseValue<ResponseCase::menu_structure, MenuStructure>;
using MenuExtrasResponse = ResponseValue<ResponseCase::menu_extras, std::vector<MenuExtraInfo>>;
using MenuBarItemsResponse = ResponseValue<ResponseCase::menu_bar_items, std::vector<MenuBarItemInfo>>;
using DockItemsResponse = ResponseValue<ResponseCase::dock_items, std::vector<DockItem>>;
using DockItemResponse = ResponseValue<ResponseCase::dock_item, std::optional<DockItem>>;
using RectResponse = ResponseValue<ResponseCase::rect, std::optional<Rect>>;
using DialogInfoResponse = ResponseValue<ResponseCase::dialog_info, DialogInfo>;
using DialogElementsResponse = ResponseValue<ResponseCase::dialog_elements, DialogElements>;
using DialogResultResponse = ResponseValue<ResponseCase::dialog_result, DialogActionResult>;
using SessionIdResponse = ResponseValue<ResponseCase::session_id, std::string>;
using SessionsResponse = ResponseValue<ResponseCase::sessions, std::vector<SessionInfo>>;
using DetectionResponse = ResponseValue<ResponseCase::detection, ElementDetectionResult>;
using ErrorResponse = ResponseValue<ResponseCase::error, ErrorEnvelope>;

using Response = std::variant<
    OkResponse,
    BoolResponse,
    IntResponse,
    HandshakeResult,
    PermissionsStatusResponse,
    DaemonStatusResponse,
    CaptureResponse,
    ElementDetectionResponse,
    WaitResultResponse,
    WindowsResponse,
    WindowResponse,
    ApplicationsResponse,
    ApplicationResponse,
    TypeResultResponse,
    ClickResultResponse,
    MenuStructureResponse,
    MenuExtrasResponse,
    MenuBarItemsResponse,
    DockItemsResponse,
    DockItemResponse,
    RectResponse,
    DialogInfoResponse,
    DialogElementsResponse,
    DialogResultResponse,
    SessionIdResponse,
    SessionsResponse,
    DetectionResponse,
    ErrorResponse>;

ResponseCase response_case(const Response& response);

inline const char* response_case_name(const Response& response) {
    return to_wire(response_case(response));
}

inline Response make_error(ErrorCode code, std::string message, std::optional<std::string> details = std::nullopt) {
    return ErrorResponse{ErrorEnvelope(code, std::move(message), std::move(details))};
}

} // namespace autobridge
