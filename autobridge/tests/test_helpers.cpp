#include "test_helpers.hpp"

#include "error_envelope.hpp"
#include "msgpack_codec.hpp"

#include <unistd.h>

#include <algorithm>
#include <iterator>

namespace autobridge::test {

namespace {

void maybe_fail(const std::exception_ptr& failure) {
    if (failure) {
        std::rethrow_exception(failure);
    }
}

} // namespace

PermissionsStatus all_permissions() {
    PermissionsStatus status;
    status.screen_recording = true;
    status.accessibility = true;
    status.scripting = true;
    return status;
}

std::string temp_socket_path(const std::string& tag) {
    return "/tmp/autobridge-test-" + std::to_string(::getpid()) + "-" + tag + ".sock";
}

// Permissions

PermissionsStatus FakePermissionService::current() {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

void FakePermissionService::set(PermissionsStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = status;
}

// Automation

void FakeAutomationService::click(const ClickRequest&) {
    ++clicks;
}

void FakeAutomationService::hotkey(const std::string&, int) {
    ++hotkeys;
}

TypeResult FakeAutomationService::type_actions(const TypeActionsRequest& request) {
    TypeResult result;
    for (const auto& action : request.actions) {
        if (action.text) {
            result.total_characters += static_cast<int>(action.text->size());
            result.key_presses += static_cast<int>(action.text->size());
        } else {
            ++result.key_presses;
        }
    }
    return result;
}

ElementDetectionResult FakeAutomationService::detect_elements(const DetectElementsRequest& request) {
    ElementDetectionResult result;
    result.session_id = request.session_id.value_or("detached");
    result.screenshot_path = "/tmp/capture.png";
    DetectedElement button;
    button.id = "B1";
    button.role = "button";
    button.label = std::string("OK");
    button.bounds = Rect{Point{10, 20}, Size{80, 24}};
    result.elements.push_back(button);
    result.processing_time = 0.25;
    return result;
}

// Windows

std::vector<WindowInfo> FakeWindowService::list_windows(const WindowTarget&) {
    ++calls;
    maybe_fail(fail_with);
    return windows;
}

void FakeWindowService::focus_window(const WindowTarget&) {
    ++calls;
    maybe_fail(fail_with);
}

std::optional<WindowInfo> FakeWindowService::focused_window() {
    ++calls;
    maybe_fail(fail_with);
    if (windows.empty()) {
        return std::nullopt;
    }
    return windows.front();
}

// Applications

std::vector<ApplicationInfo> FakeApplicationService::list_applications() {
    ++calls;
    return applications;
}

ApplicationInfo FakeApplicationService::find_application(const std::string& identifier) {
    ++calls;
    for (const auto& app : applications) {
        if (app.name == identifier || app.bundle_identifier == identifier) {
            return app;
        }
    }
    throw ErrorEnvelope(ErrorCode::not_found, "Application " + identifier + " not found");
}

bool FakeApplicationService::is_application_running(const std::string& identifier) {
    ++calls;
    return std::any_of(applications.begin(), applications.end(),
                       [&identifier](const ApplicationInfo& app) { return app.name == identifier; });
}

bool FakeApplicationService::quit_application(const std::string& identifier, bool) {
    ++calls;
    return is_application_running(identifier);
}

// Menus

std::optional<Rect> FakeMenuService::menu_extra_open_menu_frame(const std::string& title,
                                                                const std::optional<int32_t>&) {
    auto it = open_menus.find(title);
    if (it == open_menus.end()) {
        return std::nullopt;
    }
    return it->second;
}

// Dock

std::vector<DockItem> FakeDockService::list_dock_items(bool include_all) {
    if (include_all) {
        return items;
    }
    std::vector<DockItem> visible;
    std::copy_if(items.begin(), items.end(), std::back_inserter(visible),
                 [](const DockItem& item) { return item.item_type != DockItemType::separator; });
    return visible;
}

std::optional<DockItem> FakeDockService::find_dock_item(const std::string& name) {
    for (const auto& item : items) {
        if (item.title == name) {
            return item;
        }
    }
    return std::nullopt;
}

// Sessions

std::string InMemorySessionService::create_session() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id = "session-" + std::to_string(next_id_++);
    order_.push_back(id);
    sessions_[id] = std::nullopt;
    return id;
}

void InMemorySessionService::store_detection_result(const std::string& session_id,
                                                    const ElementDetectionResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        throw ErrorEnvelope(ErrorCode::not_found, "Session " + session_id + " not found");
    }
    it->second = result;
}

std::optional<ElementDetectionResult> InMemorySessionService::detection_result(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<SessionInfo> InMemorySessionService::list_sessions() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionInfo> infos;
    for (const auto& id : order_) {
        SessionInfo info;
        info.id = id;
        info.process_id = static_cast<int32_t>(::getpid());
        info.is_active = true;
        infos.push_back(info);
    }
    return infos;
}

std::optional<std::string> InMemorySessionService::most_recent_session(const std::optional<std::string>&) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (order_.empty()) {
        return std::nullopt;
    }
    return order_.back();
}

void InMemorySessionService::clean_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(session_id);
    order_.erase(std::remove(order_.begin(), order_.end(), session_id), order_.end());
}

int64_t InMemorySessionService::clean_all_sessions() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto removed = static_cast<int64_t>(order_.size());
    order_.clear();
    sessions_.clear();
    return removed;
}

// Provider

ServiceProvider FakeServices::provider() const {
    ServiceProvider services;
    services.permissions = permissions;
    services.automation = automation;
    services.windows = windows;
    services.applications = applications;
    services.menus = menus;
    services.dock = dock;
    services.sessions = sessions;
    services.daemon = daemon;
    return services;
}

int FakeServices::collaborator_calls() const {
    return automation->clicks + automation->hotkeys + windows->calls + applications->calls + dock->shows;
}

// ScriptedConnection

void ScriptedConnection::set_mode(Mode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    mode_ = mode;
}

void ScriptedConnection::push_reply(const Response& response) {
    push_raw_reply(codec::encode_response(response));
}

void ScriptedConnection::push_raw_reply(std::string bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    replies_.push_back(std::move(bytes));
}

void ScriptedConnection::send(const std::string& request_bytes, ReplyHandler on_reply) {
    std::unique_lock<std::mutex> lock(mutex_);
    sent_.push_back(codec::decode_request(request_bytes));

    if (!valid_) {
        lock.unlock();
        on_reply(std::string(), std::make_exception_ptr(ConnectionInvalidated("scripted connection closed")));
        return;
    }

    switch (mode_) {
        case Mode::reply: {
            std::string reply = codec::encode_response(OkResponse{});
            if (!replies_.empty()) {
                reply = std::move(replies_.front());
                replies_.pop_front();
            }
            lock.unlock();
            on_reply(std::move(reply), nullptr);
            return;
        }
        case Mode::hold:
            held_.push_back(std::move(on_reply));
            held_cv_.notify_all();
            return;
        case Mode::drop:
            lock.unlock();
            // on_reply goes out of scope uncalled.
            return;
    }
}

void ScriptedConnection::invalidate(const std::string& reason) {
    std::deque<ReplyHandler> orphaned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        valid_ = false;
        orphaned.swap(held_);
    }
    for (auto& handler : orphaned) {
        handler(std::string(), std::make_exception_ptr(ConnectionInvalidated(reason)));
    }
}

bool ScriptedConnection::is_valid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return valid_;
}

bool ScriptedConnection::complete_next(const Response& response) {
    ReplyHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (held_.empty()) {
            return false;
        }
        handler = std::move(held_.front());
        held_.pop_front();
    }
    handler(codec::encode_response(response), nullptr);
    return true;
}

bool ScriptedConnection::wait_for_held(size_t count, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return held_cv_.wait_for(lock, timeout, [this, count] { return held_.size() >= count; });
}

size_t ScriptedConnection::held_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.size();
}

std::vector<Request> ScriptedConnection::sent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
}

} // namespace autobridge::test
