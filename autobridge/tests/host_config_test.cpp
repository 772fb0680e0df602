#include <gtest/gtest.h>

#include "host_config.hpp"
#include "logger.hpp"

#include <log4cplus/tstring.h>

#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

using namespace autobridge;

namespace {

class LoggingEnvironment final : public ::testing::Environment {
public:
    void SetUp() override {
        static std::once_flag once;
        std::call_once(once, []() { init_logging("../src/log4cplus.ini"); });
    }
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());

HostConfig parse(const std::string& text) {
    log4cplus::tistringstream input(LOG4CPLUS_STRING_TO_TSTRING(text));
    log4cplus::helpers::Properties properties(input);
    return parse_host_config(properties);
}

std::string config_error(const std::string& text) {
    try {
        parse(text);
    } catch (const ConfigError& error) {
        return error.what();
    }
    ADD_FAILURE() << "expected ConfigError for:\n" << text;
    return std::string();
}

} // namespace

TEST(HostConfig, DefaultsWhenNothingIsSet) {
    HostConfig config = parse("log4cplus.rootLogger=INFO\n");

    EXPECT_EQ(config.socket_path, kDefaultSocketPath);
    EXPECT_EQ(config.workers, 4u);
    EXPECT_EQ(config.request_timeout, std::chrono::milliseconds(10000));
    EXPECT_EQ(config.router.host_kind, HostKind::helper);
    EXPECT_EQ(config.router.allowed_operations, remote_default_allowlist());
    EXPECT_TRUE(config.router.allowed_bundles.empty());
    EXPECT_TRUE(config.router.allowed_teams.empty());
    EXPECT_TRUE(config.router.require_same_user);
}

TEST(HostConfig, ReadsEveryKey) {
    HostConfig config = parse(
        "autobridge.socket=/tmp/bridge.sock\n"
        "autobridge.host_kind=on-demand\n"
        "autobridge.workers=8\n"
        "autobridge.request_timeout_ms=2500\n"
        "autobridge.allow.bundles=com.example.cli, com.example.agent\n"
        "autobridge.allow.teams=TEAM123\n"
        "autobridge.operations=list-windows, click,permissions-status\n"
        "autobridge.require_same_user=no\n");

    EXPECT_EQ(config.socket_path, "/tmp/bridge.sock");
    EXPECT_EQ(config.router.host_kind, HostKind::on_demand);
    EXPECT_EQ(config.workers, 8u);
    EXPECT_EQ(config.request_timeout, std::chrono::milliseconds(2500));
    EXPECT_EQ(config.router.allowed_bundles, (std::set<std::string>{"com.example.agent", "com.example.cli"}));
    EXPECT_EQ(config.router.allowed_teams, std::set<std::string>{"TEAM123"});
    EXPECT_EQ(config.router.allowed_operations,
              (OperationSet{Operation::list_windows, Operation::click, Operation::permissions_status}));
    EXPECT_FALSE(config.router.require_same_user);
}

TEST(HostConfig, OperationPresets) {
    EXPECT_EQ(parse("autobridge.operations=all\n").router.allowed_operations, full_allowlist());
    EXPECT_EQ(parse("autobridge.operations=remote\n").router.allowed_operations, remote_default_allowlist());
    EXPECT_EQ(parse("autobridge.operations=remote\n").router.allowed_operations.count(Operation::scripting_probe), 1u);
}

TEST(HostConfig, RejectsUnusableValues) {
    EXPECT_EQ(config_error("autobridge.operations=click,teleport\n"),
              "autobridge.operations: unknown operation 'teleport'");
    EXPECT_EQ(config_error("autobridge.host_kind=daemon\n"), "autobridge.host_kind: unknown host kind 'daemon'");
    EXPECT_EQ(config_error("autobridge.require_same_user=maybe\n"),
              "autobridge.require_same_user: expected true or false, got 'maybe'");
    EXPECT_EQ(config_error("autobridge.socket=\n"), "autobridge.socket: path is empty");

    EXPECT_NE(config_error("autobridge.workers=0\n"), "");
    EXPECT_NE(config_error("autobridge.workers=-2\n"), "");
    EXPECT_NE(config_error("autobridge.workers=4x\n"), "");

    EXPECT_EQ(config_error("autobridge.request_timeout_ms=0\n"),
              "autobridge.request_timeout_ms: expected a positive integer, got '0'");
    EXPECT_NE(config_error("autobridge.request_timeout_ms=-100\n"), "");
    EXPECT_NE(config_error("autobridge.request_timeout_ms=1.5\n"), "");
}

TEST(HostConfig, LoadsFromFile) {
    std::string path = "/tmp/autobridge-test-" + std::to_string(::getpid()) + "-host.properties";
    {
        std::ofstream out(path);
        out << "autobridge.socket=/tmp/from-file.sock\n"
            << "autobridge.workers=2\n";
    }

    HostConfig config = load_host_config(path);
    std::remove(path.c_str());

    EXPECT_EQ(config.socket_path, "/tmp/from-file.sock");
    EXPECT_EQ(config.workers, 2u);
}

TEST(HostConfig, MissingFileIsConfigError) {
    EXPECT_THROW(load_host_config("/nonexistent/autobridge/host.properties"), ConfigError);
}
