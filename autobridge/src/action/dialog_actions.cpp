#include "dispatch.hpp"

namespace autobridge::actions {

Response dispatch(const ServiceProvider& services, const DialogFindActiveRequest& request) {
    return DialogInfoResponse{services.dialogs->find_active_dialog(request.window_title, request.app_name)};
}

Response dispatch(const ServiceProvider& services, const DialogClickButtonRequest& request) {
    return DialogResultResponse{services.dialogs->click_button(request)};
}

Response dispatch(const ServiceProvider& services, const DialogEnterTextRequest& request) {
    return DialogResultResponse{services.dialogs->enter_text(request)};
}

Response dispatch(const ServiceProvider& services, const DialogHandleFileRequest& request) {
    return DialogResultResponse{services.dialogs->handle_file_dialog(request)};
}

Response dispatch(const ServiceProvider& services, const DialogDismissRequest& request) {
    return DialogResultResponse{services.dialogs->dismiss_dialog(request)};
}

Response dispatch(const ServiceProvider& services, const DialogListElementsRequest& request) {
    return DialogElementsResponse{services.dialogs->list_dialog_elements(request.window_title, request.app_name)};
}

} // namespace autobridge::actions
