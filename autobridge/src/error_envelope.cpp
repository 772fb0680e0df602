#include "error_envelope.hpp"

namespace autobridge {

const std::vector<std::pair<ErrorCode, const char*>>& WireEnum<ErrorCode>::entries() {
    static const std::vector<std::pair<ErrorCode, const char*>> values = {
        {ErrorCode::permission_denied, "permission-denied"},
        {ErrorCode::not_found, "not-found"},
        {ErrorCode::timeout, "timeout"},
        {ErrorCode::invalid_request, "invalid-request"},
        {ErrorCode::operation_not_supported, "operation-not-supported"},
        {ErrorCode::server_busy, "server-busy"},
        {ErrorCode::version_mismatch, "version-mismatch"},
        {ErrorCode::unauthorized_client, "unauthorized-client"},
        {ErrorCode::decoding_failed, "decoding-failed"},
        {ErrorCode::internal_error, "internal-error"},
    };
    return values;
}

ErrorEnvelope::ErrorEnvelope(ErrorCode code, std::string message, std::optional<std::string> details)
    : code_(code),
      message_(std::move(message)),
      details_(std::move(details)) {
    what_ = std::string(to_wire(code_)) + ": " + message_;
    if (details_) {
        what_ += " (" + *details_ + ")";
    }
}

bool operator==(const ErrorEnvelope& lhs, const ErrorEnvelope& rhs) {
    return lhs.code() == rhs.code() && lhs.message() == rhs.message() && lhs.details() == rhs.details();
}

} // namespace autobridge
