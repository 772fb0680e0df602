#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace autobridge {

/**
 * Wall-clock instant; travels as an ISO-8601 UTC string with milliseconds.
 * Stored at millisecond precision, so a decoded value compares equal to the one sent.
 */
class Timestamp {
public:
    using Clock = std::chrono::system_clock;

    Timestamp() = default;
    explicit Timestamp(Clock::time_point time)
        : time_(std::chrono::floor<std::chrono::milliseconds>(time)) {}

    static Timestamp now() { return Timestamp(Clock::now()); }
    static std::optional<Timestamp> parse_iso8601(const std::string& text);

    Clock::time_point time() const { return time_; }
    std::string to_iso8601() const;

private:
    Clock::time_point time_{};
};

inline bool operator==(const Timestamp& lhs, const Timestamp& rhs) { return lhs.time() == rhs.time(); }
inline bool operator!=(const Timestamp& lhs, const Timestamp& rhs) { return !(lhs == rhs); }

} // namespace autobridge
