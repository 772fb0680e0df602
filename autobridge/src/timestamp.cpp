#include "timestamp.hpp"

#include <cstdio>
#include <ctime>

namespace autobridge {

std::string Timestamp::to_iso8601() const {
    auto seconds = std::chrono::floor<std::chrono::seconds>(time_);
    std::time_t tt = Clock::to_time_t(seconds);
    auto remainder = std::chrono::duration_cast<std::chrono::milliseconds>(time_ - seconds);

    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buffer[32] = {0};
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm);

    char result[40] = {0};
    std::snprintf(result, sizeof(result), "%s.%03lldZ", buffer, static_cast<long long>(remainder.count()));
    return result;
}

std::optional<Timestamp> Timestamp::parse_iso8601(const std::string& text) {
    std::tm tm{};
    int millis = 0;
    int consumed = 0;
    int fields = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                             &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                             &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed);
    if (fields != 6) {
        return std::nullopt;
    }

    std::string rest = text.substr(static_cast<size_t>(consumed));
    if (!rest.empty() && rest[0] == '.') {
        int digits = 0;
        if (std::sscanf(rest.c_str(), ".%3d%n", &millis, &digits) != 1) {
            return std::nullopt;
        }
        for (int i = digits - 1; i < 3; ++i) {
            millis *= 10;
        }
        rest = rest.substr(static_cast<size_t>(digits));
    }
    if (rest != "Z") {
        return std::nullopt;
    }

    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    std::time_t tt = timegm(&tm);
    if (tt == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return Timestamp(Clock::from_time_t(tt) + std::chrono::milliseconds(millis));
}

} // namespace autobridge
