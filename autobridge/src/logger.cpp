#include "logger.hpp"

#include <filesystem>
#include <system_error>

#include <log4cplus/configurator.h>
#include <log4cplus/helpers/loglog.h>

namespace autobridge {

log4cplus::Logger& core_logger() {
    static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("autobridge"));
    return logger;
}

log4cplus::Logger& server_logger() {
    static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("autobridge.server"));
    return logger;
}

log4cplus::Logger& client_logger() {
    static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("autobridge.client"));
    return logger;
}

static std::filesystem::path resolve_config_path(const std::string& config_path) {
    std::filesystem::path path(config_path);
    if (path.is_absolute()) {
        return path;
    }
    return std::filesystem::current_path() / path;
}

void init_logging(const std::string& config_path) {
    if (!config_path.empty()) {
        std::error_code ec;
        auto resolved = resolve_config_path(config_path);
        if (std::filesystem::exists(resolved, ec)) {
            try {
                log4cplus::PropertyConfigurator::doConfigure(LOG4CPLUS_STRING_TO_TSTRING(resolved.string()));
                return;
            } catch (const std::exception& exc) {
                log4cplus::helpers::LogLog::getLogLog()->error(
                    LOG4CPLUS_TEXT("Failed to load logging config: ") + LOG4CPLUS_STRING_TO_TSTRING(exc.what()));
            }
        }
    }

    log4cplus::BasicConfigurator fallback;
    fallback.configure();
    log4cplus::Logger::getRoot().setLogLevel(log4cplus::INFO_LOG_LEVEL);
}

} // namespace autobridge
