#include "dispatch.hpp"

namespace autobridge::actions {

Response dispatch(const ServiceProvider& services, const CaptureScreenRequest& request) {
    return CaptureResponse{services.capture->capture_screen(request)};
}

Response dispatch(const ServiceProvider& services, const CaptureWindowRequest& request) {
    return CaptureResponse{services.capture->capture_window(request)};
}

Response dispatch(const ServiceProvider& services, const CaptureFrontmostRequest& request) {
    return CaptureResponse{services.capture->capture_frontmost(request)};
}

Response dispatch(const ServiceProvider& services, const CaptureAreaRequest& request) {
    return CaptureResponse{services.capture->capture_area(request)};
}

Response dispatch(const ServiceProvider& services, const DetectElementsRequest& request) {
    return ElementDetectionResponse{services.automation->detect_elements(request)};
}

} // namespace autobridge::actions
