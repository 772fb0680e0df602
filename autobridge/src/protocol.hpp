#pragma once

#include "msgpack_adaptors.hpp"
#include "wire_enum.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace autobridge {

struct ProtocolVersion {
    uint32_t major = 0;
    uint32_t minor = 0;

    std::string to_string() const;

    MSGPACK_DEFINE_MAP(major, minor);
};

inline bool operator==(const ProtocolVersion& lhs, const ProtocolVersion& rhs) {
    return lhs.major == rhs.major && lhs.minor == rhs.minor;
}
inline bool operator!=(const ProtocolVersion& lhs, const ProtocolVersion& rhs) { return !(lhs == rhs); }
inline bool operator<(const ProtocolVersion& lhs, const ProtocolVersion& rhs) {
    if (lhs.major != rhs.major) {
        return lhs.major < rhs.major;
    }
    return lhs.minor < rhs.minor;
}
inline bool operator>(const ProtocolVersion& lhs, const ProtocolVersion& rhs) { return rhs < lhs; }
inline bool operator<=(const ProtocolVersion& lhs, const ProtocolVersion& rhs) { return !(rhs < lhs); }
inline bool operator>=(const ProtocolVersion& lhs, const ProtocolVersion& rhs) { return !(lhs < rhs); }

/// Closed range [lower, upper] of protocol versions a host accepts.
struct VersionRange {
    ProtocolVersion lower;
    ProtocolVersion upper;

    bool contains(const ProtocolVersion& version) const { return lower <= version && version <= upper; }
    ProtocolVersion clamp(const ProtocolVersion& version) const;
};

enum class PermissionKind {
    screen_recording,
    accessibility,
    scripting,
};

enum class HostKind {
    gui,
    helper,
    on_demand,
    in_process,
};

enum class Operation {
    // Core
    permissions_status,
    daemon_status,
    daemon_stop,
    // Capture
    capture_screen,
    capture_window,
    capture_frontmost,
    capture_area,
    detect_elements,
    // Input
    click,
    type,
    type_actions,
    scroll,
    hotkey,
    swipe,
    drag,
    move_mouse,
    wait_for_element,
    // Windows
    list_windows,
    focus_window,
    move_window,
    resize_window,
    set_window_bounds,
    close_window,
    minimize_window,
    maximize_window,
    get_focused_window,
    // Applications
    list_applications,
    find_application,
    get_frontmost_application,
    is_application_running,
    launch_application,
    activate_application,
    quit_application,
    hide_application,
    unhide_application,
    hide_other_applications,
    show_all_applications,
    // Menus
    list_menus,
    list_frontmost_menus,
    click_menu_item,
    click_menu_item_by_name,
    list_menu_extras,
    click_menu_extra,
    menu_extra_open_menu_frame,
    list_menu_bar_items,
    click_menu_bar_item_named,
    click_menu_bar_item_index,
    // Dock
    list_dock_items,
    launch_dock_item,
    right_click_dock_item,
    hide_dock,
    show_dock,
    is_dock_hidden,
    find_dock_item,
    // Dialogs
    dialog_find_active,
    dialog_click_button,
    dialog_enter_text,
    dialog_handle_file,
    dialog_dismiss,
    dialog_list_elements,
    // Sessions
    create_session,
    store_detection_result,
    get_detection_result,
    store_screenshot,
    store_annotated_screenshot,
    list_sessions,
    get_most_recent_session,
    clean_session,
    clean_sessions_older_than,
    clean_all_sessions,
    // Diagnostics
    scripting_probe,
};

template <>
struct WireEnum<PermissionKind> {
    static const std::vector<std::pair<PermissionKind, const char*>>& entries();
};

template <>
struct WireEnum<HostKind> {
    static const std::vector<std::pair<HostKind, const char*>>& entries();
};

template <>
struct WireEnum<Operation> {
    static const std::vector<std::pair<Operation, const char*>>& entries();
};

using PermissionSet = std::set<PermissionKind>;
using OperationSet = std::set<Operation>;

/// OS-level grants an operation relies on. Empty for operations that need none.
PermissionSet required_permissions(Operation operation);

/// Every operation, in declaration order.
const std::vector<Operation>& all_operations();

/// Operations a separately launched helper exposes by default.
const OperationSet& remote_default_allowlist();

/// Operations that need a daemon control collaborator to be offered at all.
bool is_daemon_operation(Operation operation);

/// Every operation; used when the router is hosted in-process.
const OperationSet& full_allowlist();

/// Operations sorted by wire name, the order advertised in a handshake.
std::vector<Operation> sorted_by_name(const OperationSet& operations);

/**
 * Identity a client claims in its handshake.
 * Captured once per connection and only consulted for authorization.
 */
struct ClientIdentity {
    std::optional<std::string> bundle_id;
    std::optional<std::string> team_id;
    int32_t pid = 0;
    std::optional<std::string> hostname;

    MSGPACK_DEFINE_MAP(bundle_id, team_id, pid, hostname);
};

extern const ProtocolVersion kProtocolVersion;
extern const VersionRange kSupportedVersionRange;
extern const char* const kDefaultSocketPath;

/// Build identifier reported in handshakes, e.g. "1.0.0 (a1b2c3d)".
const std::string& build_identifier();

} // namespace autobridge
