#include "dispatch.hpp"

namespace autobridge::actions {

Response dispatch(const ServiceProvider& services, const CreateSessionRequest&) {
    return SessionIdResponse{services.sessions->create_session()};
}

Response dispatch(const ServiceProvider& services, const StoreDetectionResultRequest& request) {
    services.sessions->store_detection_result(request.session_id, request.result);
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const GetDetectionResultRequest& request) {
    auto result = services.sessions->detection_result(request.session_id);
    if (!result) {
        throw ErrorEnvelope(ErrorCode::not_found, "No detection result for session " + request.session_id);
    }
    return DetectionResponse{std::move(*result)};
}

Response dispatch(const ServiceProvider& services, const StoreScreenshotRequest& request) {
    services.sessions->store_screenshot(request);
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const StoreAnnotatedScreenshotRequest& request) {
    services.sessions->store_annotated_screenshot(request.session_id, request.annotated_screenshot_path);
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const ListSessionsRequest&) {
    return SessionsResponse{services.sessions->list_sessions()};
}

Response dispatch(const ServiceProvider& services, const GetMostRecentSessionRequest& request) {
    auto session_id = services.sessions->most_recent_session(request.application_bundle_id);
    if (!session_id) {
        throw ErrorEnvelope(ErrorCode::not_found, "No recent session found");
    }
    return SessionIdResponse{std::move(*session_id)};
}

Response dispatch(const ServiceProvider& services, const CleanSessionRequest& request) {
    services.sessions->clean_session(request.session_id);
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const CleanSessionsOlderThanRequest& request) {
    return IntResponse{services.sessions->clean_sessions_older_than(request.days)};
}

Response dispatch(const ServiceProvider& services, const CleanAllSessionsRequest&) {
    return IntResponse{services.sessions->clean_all_sessions()};
}

} // namespace autobridge::actions
