#pragma once

#include "wire_enum.hpp"

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace autobridge {

enum class ErrorCode {
    permission_denied,
    not_found,
    timeout,
    invalid_request,
    operation_not_supported,
    server_busy,
    version_mismatch,
    unauthorized_client,
    decoding_failed,
    internal_error,
};

template <>
struct WireEnum<ErrorCode> {
    static const std::vector<std::pair<ErrorCode, const char*>>& entries();
};

/**
 * The only error representation that crosses the process boundary.
 *
 * A server-side handler throws it, the router encodes it as Response::error, and
 * the client rethrows the decoded value, so both sides branch on the same code.
 */
class ErrorEnvelope : public std::exception {
public:
    ErrorEnvelope() = default;
    ErrorEnvelope(ErrorCode code, std::string message, std::optional<std::string> details = std::nullopt);

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::optional<std::string>& details() const { return details_; }

    const char* what() const noexcept override { return what_.c_str(); }

private:
    ErrorCode code_ = ErrorCode::internal_error;
    std::string message_;
    std::optional<std::string> details_;
    std::string what_;
};

bool operator==(const ErrorEnvelope& lhs, const ErrorEnvelope& rhs);
inline bool operator!=(const ErrorEnvelope& lhs, const ErrorEnvelope& rhs) { return !(lhs == rhs); }

/// Raised on every call still pending when its channel goes away.
class ConnectionInvalidated : public std::runtime_error {
public:
    explicit ConnectionInvalidated(const std::string& reason)
        : std::runtime_error("connection invalidated: " + reason) {}
};

/// Raised when a caller's cancellation predicate fires while it waits.
class OperationCancelled : public std::runtime_error {
public:
    explicit OperationCancelled(const std::string& what_waited)
        : std::runtime_error("cancelled while waiting for " + what_waited) {}
};

} // namespace autobridge
