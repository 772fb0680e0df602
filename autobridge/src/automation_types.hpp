#pragma once

#include "msgpack_adaptors.hpp"
#include "protocol.hpp"
#include "timestamp.hpp"
#include "wire_enum.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Values exchanged with the automation collaborator. The core only carries them;
// their meaning belongs to the service provider behind the router.

namespace autobridge {

struct Point {
    double x = 0.0;
    double y = 0.0;

    MSGPACK_DEFINE_MAP(x, y);
};

struct Size {
    double width = 0.0;
    double height = 0.0;

    MSGPACK_DEFINE_MAP(width, height);
};

struct Rect {
    Point origin;
    Size size;

    MSGPACK_DEFINE_MAP(origin, size);
};

enum class CaptureVisualizerMode { screenshot_flash, watch_capture, none };
enum class CaptureScale { logical_1x, native };
enum class CaptureMode { screen, window, frontmost, area };
enum class ClickType { single, right, double_click };
enum class ClickTargetKind { element_id, coordinates, query };
enum class MouseMovementProfile { linear, human };
enum class TypeActionKind { text, key, clear };
enum class TypingCadenceKind { fixed, human };
enum class ScrollDirection { up, down, left, right };
enum class WindowTargetKind { application, title, index, frontmost, window_id };
enum class DockItemType { application, folder, file, url, separator, minimized_window, trash, unknown };
enum class DialogActionType { click_button, enter_text, handle_file, dismiss };

template <> struct WireEnum<CaptureVisualizerMode> { static const std::vector<std::pair<CaptureVisualizerMode, const char*>>& entries(); };
template <> struct WireEnum<CaptureScale> { static const std::vector<std::pair<CaptureScale, const char*>>& entries(); };
template <> struct WireEnum<CaptureMode> { static const std::vector<std::pair<CaptureMode, const char*>>& entries(); };
template <> struct WireEnum<ClickType> { static const std::vector<std::pair<ClickType, const char*>>& entries(); };
template <> struct WireEnum<ClickTargetKind> { static const std::vector<std::pair<ClickTargetKind, const char*>>& entries(); };
template <> struct WireEnum<MouseMovementProfile> { static const std::vector<std::pair<MouseMovementProfile, const char*>>& entries(); };
template <> struct WireEnum<TypeActionKind> { static const std::vector<std::pair<TypeActionKind, const char*>>& entries(); };
template <> struct WireEnum<TypingCadenceKind> { static const std::vector<std::pair<TypingCadenceKind, const char*>>& entries(); };
template <> struct WireEnum<ScrollDirection> { static const std::vector<std::pair<ScrollDirection, const char*>>& entries(); };
template <> struct WireEnum<WindowTargetKind> { static const std::vector<std::pair<WindowTargetKind, const char*>>& entries(); };
template <> struct WireEnum<DockItemType> { static const std::vector<std::pair<DockItemType, const char*>>& entries(); };
template <> struct WireEnum<DialogActionType> { static const std::vector<std::pair<DialogActionType, const char*>>& entries(); };

/// What a click, wait or scroll aims at: a detected element, a point, or a text query.
struct ClickTarget {
    ClickTargetKind kind = ClickTargetKind::element_id;
    std::optional<std::string> element_id;
    std::optional<Point> coordinates;
    std::optional<std::string> query;

    static ClickTarget element(std::string id);
    static ClickTarget at(Point point);
    static ClickTarget matching(std::string text);

    MSGPACK_DEFINE_MAP(kind, element_id, coordinates, query);
};

struct TypeAction {
    TypeActionKind kind = TypeActionKind::text;
    std::optional<std::string> text;
    std::optional<std::string> key;

    MSGPACK_DEFINE_MAP(kind, text, key);
};

struct TypingCadence {
    TypingCadenceKind kind = TypingCadenceKind::fixed;
    std::optional<int> milliseconds;
    std::optional<int> words_per_minute;

    MSGPACK_DEFINE_MAP(kind, milliseconds, words_per_minute);
};

struct ScrollParameters {
    ScrollDirection direction = ScrollDirection::down;
    int amount = 0;
    std::optional<ClickTarget> target;
    bool smooth = false;
    int delay = 0;
    std::optional<std::string> session_id;

    MSGPACK_DEFINE_MAP(direction, amount, target, smooth, delay, session_id);
};

struct WindowTarget {
    WindowTargetKind kind = WindowTargetKind::frontmost;
    std::optional<std::string> application;
    std::optional<std::string> title;
    std::optional<int> index;
    std::optional<int64_t> window_id;

    static WindowTarget frontmost();
    static WindowTarget of_application(std::string application);
    static WindowTarget titled(std::string title);
    static WindowTarget with_id(int64_t window_id);

    MSGPACK_DEFINE_MAP(kind, application, title, index, window_id);
};

struct ApplicationInfo {
    int32_t process_identifier = 0;
    std::optional<std::string> bundle_identifier;
    std::string name;
    std::optional<std::string> bundle_path;
    bool is_active = false;
    bool is_hidden = false;
    int window_count = 0;

    MSGPACK_DEFINE_MAP(process_identifier, bundle_identifier, name, bundle_path, is_active, is_hidden, window_count);
};

struct WindowInfo {
    int64_t window_id = 0;
    std::string title;
    Rect bounds;
    bool is_minimized = false;
    bool is_main_window = false;
    int index = 0;
    std::optional<int64_t> space_id;

    MSGPACK_DEFINE_MAP(window_id, title, bounds, is_minimized, is_main_window, index, space_id);
};

struct CaptureMetadata {
    Size size;
    CaptureMode mode = CaptureMode::screen;
    std::optional<ApplicationInfo> application;
    std::optional<WindowInfo> window;
    std::optional<int> display_index;
    Timestamp captured_at;

    MSGPACK_DEFINE_MAP(size, mode, application, window, display_index, captured_at);
};

struct CaptureResult {
    std::vector<uint8_t> image_data;
    std::optional<std::string> saved_path;
    CaptureMetadata metadata;

    MSGPACK_DEFINE_MAP(image_data, saved_path, metadata);
};

struct WindowContext {
    std::optional<std::string> application_name;
    std::optional<std::string> window_title;
    std::optional<Rect> window_bounds;

    MSGPACK_DEFINE_MAP(application_name, window_title, window_bounds);
};

struct DetectedElement {
    std::string id;
    std::string role;
    std::optional<std::string> label;
    std::optional<std::string> value;
    Rect bounds;
    bool is_enabled = true;

    MSGPACK_DEFINE_MAP(id, role, label, value, bounds, is_enabled);
};

struct ElementDetectionResult {
    std::string session_id;
    std::string screenshot_path;
    std::vector<DetectedElement> elements;
    double processing_time = 0.0;
    std::optional<WindowContext> window_context;

    MSGPACK_DEFINE_MAP(session_id, screenshot_path, elements, processing_time, window_context);
};

struct WaitForElementResult {
    bool found = false;
    std::optional<DetectedElement> element;
    double wait_time = 0.0;

    MSGPACK_DEFINE_MAP(found, element, wait_time);
};

struct TypeResult {
    int total_characters = 0;
    int key_presses = 0;

    MSGPACK_DEFINE_MAP(total_characters, key_presses);
};

struct ClickResult {
    std::string element_description;
    std::optional<Point> location;

    MSGPACK_DEFINE_MAP(element_description, location);
};

struct MenuItem {
    std::string title;
    std::string path;
    std::optional<std::string> key_equivalent;
    bool is_enabled = true;
    bool is_checked = false;
    std::vector<MenuItem> submenu;

    MSGPACK_DEFINE_MAP(title, path, key_equivalent, is_enabled, is_checked, submenu);
};

struct Menu {
    std::string title;
    bool is_enabled = true;
    std::vector<MenuItem> items;

    MSGPACK_DEFINE_MAP(title, is_enabled, items);
};

struct MenuStructure {
    ApplicationInfo application;
    std::vector<Menu> menus;

    MSGPACK_DEFINE_MAP(application, menus);
};

struct MenuExtraInfo {
    std::string title;
    Point position;
    std::optional<std::string> owner_name;
    bool is_visible = true;

    MSGPACK_DEFINE_MAP(title, position, owner_name, is_visible);
};

struct MenuBarItemInfo {
    std::optional<std::string> title;
    int index = 0;
    bool is_visible = true;
    std::optional<std::string> description;
    std::optional<std::string> raw_title;

    MSGPACK_DEFINE_MAP(title, index, is_visible, description, raw_title);
};

struct DockItem {
    int index = 0;
    std::string title;
    DockItemType item_type = DockItemType::unknown;
    std::optional<bool> is_running;
    std::optional<std::string> bundle_identifier;
    std::optional<Point> position;
    std::optional<Size> size;

    MSGPACK_DEFINE_MAP(index, title, item_type, is_running, bundle_identifier, position, size);
};

struct DialogInfo {
    std::string title;
    std::string role;
    std::optional<std::string> subrole;
    bool is_file_dialog = false;
    Rect bounds;

    MSGPACK_DEFINE_MAP(title, role, subrole, is_file_dialog, bounds);
};

struct DialogButton {
    std::string title;
    bool is_enabled = true;
    bool is_default = false;

    MSGPACK_DEFINE_MAP(title, is_enabled, is_default);
};

struct DialogTextField {
    std::optional<std::string> title;
    std::optional<std::string> value;
    std::optional<std::string> placeholder;
    int index = 0;
    bool is_enabled = true;

    MSGPACK_DEFINE_MAP(title, value, placeholder, index, is_enabled);
};

struct DialogElements {
    DialogInfo dialog_info;
    std::vector<DialogButton> buttons;
    std::vector<DialogTextField> text_fields;
    std::vector<std::string> static_texts;

    MSGPACK_DEFINE_MAP(dialog_info, buttons, text_fields, static_texts);
};

struct DialogActionResult {
    bool success = false;
    DialogActionType action = DialogActionType::dismiss;
    std::map<std::string, std::string> details;

    MSGPACK_DEFINE_MAP(success, action, details);
};

struct SessionInfo {
    std::string id;
    int32_t process_id = 0;
    Timestamp created_at;
    Timestamp last_accessed_at;
    int64_t size_in_bytes = 0;
    int screenshot_count = 0;
    bool is_active = false;

    MSGPACK_DEFINE_MAP(id, process_id, created_at, last_accessed_at, size_in_bytes, screenshot_count, is_active);
};

/// OS-level grants the helper currently holds.
struct PermissionsStatus {
    bool screen_recording = false;
    bool accessibility = false;
    bool scripting = false;

    PermissionSet granted() const;
    bool allows(Operation operation) const;

    MSGPACK_DEFINE_MAP(screen_recording, accessibility, scripting);
};

struct DaemonBridgeStatus {
    std::string socket_path;
    HostKind host_kind = HostKind::helper;
    std::vector<Operation> allowed_operations;

    MSGPACK_DEFINE_MAP(socket_path, host_kind, allowed_operations);
};

/// What a long-running host reports about itself.
struct DaemonStatus {
    bool running = false;
    std::optional<int32_t> pid;
    std::optional<Timestamp> started_at;
    // How the daemon was started, e.g. "manual"; free-form.
    std::optional<std::string> mode;
    std::optional<DaemonBridgeStatus> bridge;
    std::optional<PermissionsStatus> permissions;

    MSGPACK_DEFINE_MAP(running, pid, started_at, mode, bridge, permissions);
};

} // namespace autobridge
