#include "automation_types.hpp"

#include <algorithm>

namespace autobridge {

const std::vector<std::pair<CaptureVisualizerMode, const char*>>& WireEnum<CaptureVisualizerMode>::entries() {
    static const std::vector<std::pair<CaptureVisualizerMode, const char*>> values = {
        {CaptureVisualizerMode::screenshot_flash, "screenshot-flash"},
        {CaptureVisualizerMode::watch_capture, "watch-capture"},
        {CaptureVisualizerMode::none, "none"},
    };
    return values;
}

const std::vector<std::pair<CaptureScale, const char*>>& WireEnum<CaptureScale>::entries() {
    static const std::vector<std::pair<CaptureScale, const char*>> values = {
        {CaptureScale::logical_1x, "logical-1x"},
        {CaptureScale::native, "native"},
    };
    return values;
}

const std::vector<std::pair<CaptureMode, const char*>>& WireEnum<CaptureMode>::entries() {
    static const std::vector<std::pair<CaptureMode, const char*>> values = {
        {CaptureMode::screen, "screen"},
        {CaptureMode::window, "window"},
        {CaptureMode::frontmost, "frontmost"},
        {CaptureMode::area, "area"},
    };
    return values;
}

const std::vector<std::pair<ClickType, const char*>>& WireEnum<ClickType>::entries() {
    static const std::vector<std::pair<ClickType, const char*>> values = {
        {ClickType::single, "single"},
        {ClickType::right, "right"},
        {ClickType::double_click, "double"},
    };
    return values;
}

const std::vector<std::pair<ClickTargetKind, const char*>>& WireEnum<ClickTargetKind>::entries() {
    static const std::vector<std::pair<ClickTargetKind, const char*>> values = {
        {ClickTargetKind::element_id, "element-id"},
        {ClickTargetKind::coordinates, "coordinates"},
        {ClickTargetKind::query, "query"},
    };
    return values;
}

const std::vector<std::pair<MouseMovementProfile, const char*>>& WireEnum<MouseMovementProfile>::entries() {
    static const std::vector<std::pair<MouseMovementProfile, const char*>> values = {
        {MouseMovementProfile::linear, "linear"},
        {MouseMovementProfile::human, "human"},
    };
    return values;
}

const std::vector<std::pair<TypeActionKind, const char*>>& WireEnum<TypeActionKind>::entries() {
    static const std::vector<std::pair<TypeActionKind, const char*>> values = {
        {TypeActionKind::text, "text"},
        {TypeActionKind::key, "key"},
        {TypeActionKind::clear, "clear"},
    };
    return values;
}

const std::vector<std::pair<TypingCadenceKind, const char*>>& WireEnum<TypingCadenceKind>::entries() {
    static const std::vector<std::pair<TypingCadenceKind, const char*>> values = {
        {TypingCadenceKind::fixed, "fixed"},
        {TypingCadenceKind::human, "human"},
    };
    return values;
}

const std::vector<std::pair<ScrollDirection, const char*>>& WireEnum<ScrollDirection>::entries() {
    static const std::vector<std::pair<ScrollDirection, const char*>> values = {
        {ScrollDirection::up, "up"},
        {ScrollDirection::down, "down"},
        {ScrollDirection::left, "left"},
        {ScrollDirection::right, "right"},
    };
    return values;
}

const std::vector<std::pair<WindowTargetKind, const char*>>& WireEnum<WindowTargetKind>::entries() {
    static const std::vector<std::pair<WindowTargetKind, const char*>> values = {
        {WindowTargetKind::application, "application"},
        {WindowTargetKind::title, "title"},
        {WindowTargetKind::index, "index"},
        {WindowTargetKind::frontmost, "frontmost"},
        {WindowTargetKind::window_id, "window-id"},
    };
    return values;
}

const std::vector<std::pair<DockItemType, const char*>>& WireEnum<DockItemType>::entries() {
    static const std::vector<std::pair<DockItemType, const char*>> values = {
        {DockItemType::application, "application"},
        {DockItemType::folder, "folder"},
        {DockItemType::file, "file"},
        {DockItemType::url, "url"},
        {DockItemType::separator, "separator"},
        {DockItemType::minimized_window, "minimized-window"},
        {DockItemType::trash, "trash"},
        {DockItemType::unknown, "unknown"},
    };
    return values;
}

const std::vector<std::pair<DialogActionType, const char*>>& WireEnum<DialogActionType>::entries() {
    static const std::vector<std::pair<DialogActionType, const char*>> values = {
        {DialogActionType::click_button, "click-button"},
        {DialogActionType::enter_text, "enter-text"},
        {DialogActionType::handle_file, "handle-file"},
        {DialogActionType::dismiss, "dismiss"},
    };
    return values;
}

ClickTarget ClickTarget::element(std::string id) {
    ClickTarget target;
    target.kind = ClickTargetKind::element_id;
    target.element_id = std::move(id);
    return target;
}

ClickTarget ClickTarget::at(Point point) {
    ClickTarget target;
    target.kind = ClickTargetKind::coordinates;
    target.coordinates = point;
    return target;
}

ClickTarget ClickTarget::matching(std::string text) {
    ClickTarget target;
    target.kind = ClickTargetKind::query;
    target.query = std::move(text);
    return target;
}

WindowTarget WindowTarget::frontmost() {
    return WindowTarget{};
}

WindowTarget WindowTarget::of_application(std::string application) {
    WindowTarget target;
    target.kind = WindowTargetKind::application;
    target.application = std::move(application);
    return target;
}

WindowTarget WindowTarget::titled(std::string title) {
    WindowTarget target;
    target.kind = WindowTargetKind::title;
    target.title = std::move(title);
    return target;
}

WindowTarget WindowTarget::with_id(int64_t window_id) {
    WindowTarget target;
    target.kind = WindowTargetKind::window_id;
    target.window_id = window_id;
    return target;
}

PermissionSet PermissionsStatus::granted() const {
    PermissionSet result;
    if (screen_recording) {
        result.insert(PermissionKind::screen_recording);
    }
    if (accessibility) {
        result.insert(PermissionKind::accessibility);
    }
    if (scripting) {
        result.insert(PermissionKind::scripting);
    }
    return result;
}

bool PermissionsStatus::allows(Operation operation) const {
    const PermissionSet have = granted();
    const PermissionSet need = required_permissions(operation);
    return std::includes(have.begin(), have.end(), need.begin(), need.end());
}

} // namespace autobridge
