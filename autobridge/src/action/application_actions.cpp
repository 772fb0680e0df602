#include "dispatch.hpp"

namespace autobridge::actions {

Response dispatch(const ServiceProvider& services, const ListApplicationsRequest&) {
    return ApplicationsResponse{services.applications->list_applications()};
}

Response dispatch(const ServiceProvider& services, const FindApplicationRequest& request) {
    return ApplicationResponse{services.applications->find_application(request.identifier)};
}

Response dispatch(const ServiceProvider& services, const GetFrontmostApplicationRequest&) {
    return ApplicationResponse{services.applications->frontmost_application()};
}

Response dispatch(const ServiceProvider& services, const IsApplicationRunningRequest& request) {
    return BoolResponse{services.applications->is_application_running(request.identifier)};
}

Response dispatch(const ServiceProvider& services, const LaunchApplicationRequest& request) {
    return ApplicationResponse{services.applications->launch_application(request.identifier)};
}

Response dispatch(const ServiceProvider& services, const ActivateApplicationRequest& request) {
    services.applications->activate_application(request.identifier);
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const QuitApplicationRequest& request) {
    return BoolResponse{services.applications->quit_application(request.identifier, request.force)};
}

Response dispatch(const ServiceProvider& services, const HideApplicationRequest& request) {
    services.applications->hide_application(request.identifier);
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const UnhideApplicationRequest& request) {
    services.applications->unhide_application(request.identifier);
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const HideOtherApplicationsRequest& request) {
    services.applications->hide_other_applications(request.identifier);
    return OkResponse{};
}

Response dispatch(const ServiceProvider& services, const ShowAllApplicationsRequest&) {
    services.applications->show_all_applications();
    return OkResponse{};
}

} // namespace autobridge::actions
