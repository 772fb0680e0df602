#pragma once

#include <string>
#include <log4cplus/logger.h>

namespace autobridge {

log4cplus::Logger& core_logger();
log4cplus::Logger& server_logger();
log4cplus::Logger& client_logger();

/// Loads a log4cplus properties file; falls back to a console logger at INFO.
void init_logging(const std::string& config_path);

} // namespace autobridge
