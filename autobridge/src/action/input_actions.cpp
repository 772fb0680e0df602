#include "dispatch.hpp"

namespace autobridge::actions {

Response dispatch(const ServiceProvider& services, const ClickRequest& request) {
    services.automation->click(request);
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const TypeRequest& request) {
    services.automation->type(request);
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const TypeActionsRequest& request) {
    return TypeResultResponse{services.automation->type_actions(request)};
}

Response dispatch(const ServiceProvider& services, const ScrollRequest& request) {
    services.automation->scroll(request.request);
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const HotkeyRequest& request) {
    services.automation->hotkey(request.keys, request.hold_duration);
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const SwipeRequest& request) {
    services.automation->swipe(request);
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const DragRequest& request) {
    services.automation->drag(request);
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const MoveMouseRequest& request) {
    services.automation->move_mouse(request);
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const WaitForElementRequest& request) {
    return WaitResultResponse{services.automation->wait_for_element(request)};
}

} // namespace autobridge::actions
