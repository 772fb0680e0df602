#include "bootstrap.hpp"
#include "daemon_control.hpp"
#include "host_config.hpp"
#include "logger.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <signal.h>
#include <sys/prctl.h>
#include <unistd.h>

using namespace autobridge;

int main(int argc, char** argv) {
    // Block before log4cplus or the host start any thread, so every thread inherits
    // the mask and only sigwait() below sees these signals.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    log4cplus::Initializer log_initializer;

    bool enable_pdeathsig = false;
    std::optional<std::string> socket_override;
    std::string config_path = "log4cplus.ini";
    std::string host_config_path;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "Version: " << AUTOBRIDGE_VERSION_STRING << std::endl;
            std::cout << "Commit: " << AUTOBRIDGE_GIT_VERSION_STRING << std::endl;
            std::cout << "Build Time: " << AUTOBRIDGE_BUILD_TIMESTAMP << std::endl;
            std::cout << "Protocol: " << kProtocolVersion.to_string() << std::endl;
            return 0;
        }

        if (strcmp(argv[i], "--pdeathsig") == 0) {
            enable_pdeathsig = true;
            continue;
        }

        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--config=", 9) == 0) {
            config_path = argv[i] + 9;
            continue;
        }

        if (strcmp(argv[i], "--host-config") == 0 && i + 1 < argc) {
            host_config_path = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--host-config=", 14) == 0) {
            host_config_path = argv[i] + 14;
            continue;
        }

        if (strcmp(argv[i], "--socket") == 0 && i + 1 < argc) {
            socket_override = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--socket=", 9) == 0) {
            socket_override = argv[i] + 9;
            continue;
        }

        if (argv[i][0] != '-') {
            socket_override = argv[i];
        }
    }

#ifdef __linux__
    if (enable_pdeathsig) {
        prctl(PR_SET_PDEATHSIG, SIGTERM);
        if (getppid() == 1) {
            return 1;
        }
    }
#endif

    init_logging(config_path);

    HostConfig config;
    if (!host_config_path.empty()) {
        try {
            config = load_host_config(host_config_path);
        } catch (const ConfigError& exc) {
            LOG4CPLUS_FATAL(core_logger(), "Invalid host config: " << exc.what());
            return 2;
        }
    }
    if (socket_override) {
        config.socket_path = *socket_override;
    }

    LOG4CPLUS_INFO(core_logger(), "autobridge_helper starting");
    LOG4CPLUS_INFO(core_logger(), "Version: " << AUTOBRIDGE_VERSION_STRING << ", Commit: " << AUTOBRIDGE_GIT_VERSION_STRING);
    LOG4CPLUS_INFO(core_logger(), "Build Time: " << AUTOBRIDGE_BUILD_TIMESTAMP);
    LOG4CPLUS_INFO(core_logger(), "Socket: " << config.socket_path);
    LOG4CPLUS_INFO(core_logger(), "Host kind: " << to_wire(config.router.host_kind) << ", workers: " << config.workers
                                                  << ", request timeout: " << config.request_timeout.count() << " ms");
    LOG4CPLUS_INFO(core_logger(), "Parent death signal: " << (enable_pdeathsig ? "enabled" : "disabled"));

    ServiceProvider services;
    DaemonBridgeStatus bridge;
    bridge.socket_path = config.socket_path;
    bridge.host_kind = config.router.host_kind;
    bridge.allowed_operations = sorted_by_name(config.router.allowed_operations);
    // SIGTERM is blocked everywhere, so raising it just wakes the sigwait() below.
    services.daemon = std::make_shared<ProcessDaemonControl>(std::move(bridge), services.permissions, "manual",
                                                             []() {
                                                                 if (::kill(::getpid(), SIGTERM) != 0) {
                                                                     LOG4CPLUS_ERROR(core_logger(), "Cannot raise SIGTERM: "
                                                                                                        << strerror(errno));
                                                                 }
                                                             });

    auto router = std::make_shared<const Router>(std::move(services), config.router);
    auto host = BridgeHost::named(router, config.socket_path, config.workers);
    host->set_request_timeout(config.request_timeout);
    if (!host->start()) {
        LOG4CPLUS_ERROR(core_logger(), "Failed to start bridge host");
        return 1;
    }

    int received = 0;
    sigwait(&signals, &received);
    LOG4CPLUS_INFO(core_logger(), "Received " << strsignal(received) << ", shutting down");

    host->stop();
    return 0;
}
