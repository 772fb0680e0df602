#include <gtest/gtest.h>

#include "bootstrap.hpp"
#include "daemon_control.hpp"
#include "ipc_framing.hpp"
#include "logger.hpp"
#include "msgpack_codec.hpp"
#include "test_helpers.hpp"

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <variant>
#include <vector>

using namespace autobridge;
using autobridge::test::FakeServices;
using namespace std::chrono_literals;

namespace {

class LoggingEnvironment final : public ::testing::Environment {
public:
    void SetUp() override {
        static std::once_flag once;
        std::call_once(once, []() { init_logging("../src/log4cplus.ini"); });
    }
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());

ClientIdentity this_process() {
    ClientIdentity identity;
    identity.bundle_id = std::string("com.example.tests");
    identity.pid = static_cast<int32_t>(::getpid());
    return identity;
}

ClickRequest click_at(double x, double y) {
    ClickRequest click;
    click.target = ClickTarget::at(Point{x, y});
    return click;
}

// Opens a raw connection and sends only the length prefix of a 10-byte frame.
int open_half_frame(BridgeHost& host) {
    int fd = host.endpoint().open_connection();
    uint32_t length = htonl(10);
    EXPECT_EQ(::write(fd, &length, sizeof(length)), static_cast<ssize_t>(sizeof(length)));
    return fd;
}

// True once the host has closed its end of fd, i.e. a read sees end of stream.
bool closed_by_host(int fd, std::chrono::milliseconds within) {
    auto deadline = std::chrono::steady_clock::now() + within;
    while (std::chrono::steady_clock::now() < deadline) {
        pollfd ready{fd, POLLIN, 0};
        if (::poll(&ready, 1, 50) > 0) {
            char byte = 0;
            return ::recv(fd, &byte, 1, MSG_DONTWAIT) == 0;
        }
    }
    return false;
}

} // namespace

class BridgeHostTest : public ::testing::Test {
protected:
    FakeServices fakes;

    std::shared_ptr<const Router> make_router(RouterOptions options = RouterOptions{}) {
        return std::make_shared<const Router>(fakes.provider(), std::move(options));
    }
};

TEST_F(BridgeHostTest, NamedHostServesSeparateClient) {
    ApplicationInfo finder;
    finder.name = "Finder";
    fakes.applications->applications = {finder};

    std::string path = test::temp_socket_path("named");
    auto host = BridgeHost::named(make_router(), path, 2);
    ASSERT_TRUE(host->start());
    EXPECT_EQ(host->mode(), BootstrapMode::named);
    EXPECT_EQ(host->socket_path(), path);

    auto client = connect_to_host(path);
    HandshakeResponse handshake = client->handshake(this_process());
    EXPECT_EQ(handshake.negotiated_version, kProtocolVersion);
    EXPECT_EQ(handshake.host_kind, HostKind::helper);

    std::vector<ApplicationInfo> applications = client->list_applications();
    ASSERT_EQ(applications.size(), 1u);
    EXPECT_EQ(applications[0].name, "Finder");

    client->click(click_at(40, 60));
    EXPECT_EQ(fakes.automation->clicks, 1);
    EXPECT_EQ(host->connection_count(), 1u);

    host->stop();
    EXPECT_FALSE(host->is_running());
    EXPECT_NE(::access(path.c_str(), F_OK), 0);
}

TEST_F(BridgeHostTest, EmbeddedHostIsReachedThroughEndpoint) {
    auto host = BridgeHost::embedded(make_router(), 2);
    ASSERT_TRUE(host->start());
    EXPECT_EQ(host->mode(), BootstrapMode::embedded);
    EXPECT_TRUE(host->socket_path().empty());

    auto client = host->connect();
    client->handshake(this_process(), HostKind::in_process);
    client->hotkey("cmd,space", 0);
    EXPECT_EQ(fakes.automation->hotkeys, 1);

    ListenerEndpoint endpoint = host->endpoint();
    auto second = connect_to_endpoint(endpoint);
    EXPECT_EQ(second->create_session(), "session-1");
    EXPECT_EQ(host->connection_count(), 2u);
}

TEST_F(BridgeHostTest, RejectionsTravelBackAsErrors) {
    RouterOptions options;
    options.allowed_operations = {Operation::list_windows};
    auto host = BridgeHost::embedded(make_router(options));
    ASSERT_TRUE(host->start());
    auto client = host->connect();

    try {
        client->click(click_at(1, 2));
        FAIL() << "click should have been rejected";
    } catch (const ErrorEnvelope& error) {
        EXPECT_EQ(error.code(), ErrorCode::operation_not_supported);
    }
    EXPECT_EQ(fakes.collaborator_calls(), 0);

    try {
        client->handshake(this_process(), std::nullopt, ProtocolVersion{9, 0});
        FAIL() << "handshake should have been rejected";
    } catch (const ErrorEnvelope& error) {
        EXPECT_EQ(error.code(), ErrorCode::version_mismatch);
    }

    // The connection survives rejections.
    EXPECT_TRUE(client->list_windows(WindowTarget::frontmost()).empty());
}

TEST_F(BridgeHostTest, ConcurrentCallersShareOneConnection) {
    auto host = BridgeHost::embedded(make_router(), 4);
    ASSERT_TRUE(host->start());
    auto client = host->connect(2);

    std::atomic<int> succeeded{0};
    std::vector<std::thread> callers;
    for (int i = 0; i < 8; ++i) {
        callers.emplace_back([&client, &succeeded, i]() {
            ClickRequest click;
            click.target = ClickTarget::at(Point{static_cast<double>(i), 0});
            client->click(click);
            if (!client->is_dock_hidden()) {
                ++succeeded;
            }
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }

    EXPECT_EQ(succeeded, 8);
    EXPECT_EQ(fakes.automation->clicks, 8);
}

TEST_F(BridgeHostTest, StoppingHostInvalidatesClients) {
    auto host = BridgeHost::embedded(make_router());
    ASSERT_TRUE(host->start());
    auto client = host->connect();
    client->show_dock();

    host->stop();

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (client->connection()->is_valid() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_FALSE(client->connection()->is_valid());
    EXPECT_THROW(client->show_dock(), ConnectionInvalidated);
}

TEST_F(BridgeHostTest, StoppedHostRefusesNewConnections) {
    auto host = BridgeHost::embedded(make_router());
    ASSERT_TRUE(host->start());
    host->stop();

    ListenerEndpoint endpoint = host->endpoint();
    EXPECT_THROW(endpoint.open_connection(), std::system_error);
    EXPECT_THROW(connect_to_host(test::temp_socket_path("absent")), std::system_error);
}

TEST(BridgeHost, UnconfiguredProviderAnswersNotSupported) {
    auto router = std::make_shared<const Router>(ServiceProvider{}, RouterOptions{});
    auto host = BridgeHost::embedded(router, 1);
    ASSERT_TRUE(host->start());
    auto client = host->connect();

    try {
        client->list_sessions();
        FAIL() << "expected operation-not-supported";
    } catch (const ErrorEnvelope& error) {
        EXPECT_EQ(error.code(), ErrorCode::operation_not_supported);
    }
    EXPECT_FALSE(client->permissions_status().accessibility);
}

TEST_F(BridgeHostTest, HalfFramePeersDoNotStarveWorkers) {
    auto host = BridgeHost::embedded(make_router(), 2);
    ASSERT_TRUE(host->start());

    int first = open_half_frame(*host);
    int second = open_half_frame(*host);

    auto client = host->connect();
    auto started = std::chrono::steady_clock::now();
    client->show_dock();
    EXPECT_TRUE(client->list_windows(WindowTarget::frontmost()).empty());
    EXPECT_LT(std::chrono::steady_clock::now() - started, 3s);
    EXPECT_EQ(host->connection_count(), 3u);

    ::close(first);
    ::close(second);
}

TEST_F(BridgeHostTest, StalledPartialFrameIsClosedAfterRequestTimeout) {
    auto host = BridgeHost::embedded(make_router(), 1);
    host->set_request_timeout(200ms);
    ASSERT_TRUE(host->start());

    int stalled = open_half_frame(*host);
    EXPECT_TRUE(closed_by_host(stalled, 2s));
    ::close(stalled);

    // The host keeps serving other peers.
    auto client = host->connect();
    client->show_dock();
    EXPECT_EQ(fakes.dock->shows, 1);
}

TEST_F(BridgeHostTest, FrameSplitAcrossWritesIsServed) {
    auto host = BridgeHost::embedded(make_router(), 1);
    ASSERT_TRUE(host->start());

    int fd = host->endpoint().open_connection();
    std::string body = codec::encode_request(Request{ShowDockRequest{}});
    uint32_t length = htonl(static_cast<uint32_t>(body.size()));
    ASSERT_EQ(::write(fd, &length, sizeof(length)), static_cast<ssize_t>(sizeof(length)));
    std::this_thread::sleep_for(50ms);
    ASSERT_EQ(::write(fd, body.data(), body.size()), static_cast<ssize_t>(body.size()));

    std::string reply;
    ASSERT_TRUE(ipc::read_frame(fd, reply));
    Response response = codec::decode_response(reply);
    EXPECT_TRUE(std::holds_alternative<OkResponse>(response));
    EXPECT_EQ(fakes.dock->shows, 1);
    ::close(fd);
}

TEST_F(BridgeHostTest, EmbeddedHostDefaultsToInProcessWithEverythingOffered) {
    auto host = BridgeHost::embedded(fakes.provider(), 2);
    ASSERT_TRUE(host->start());
    auto client = host->connect();

    HandshakeResponse handshake = client->handshake(this_process());
    EXPECT_EQ(handshake.host_kind, HostKind::in_process);
    const auto& offered = handshake.supported_operations;
    EXPECT_NE(std::find(offered.begin(), offered.end(), Operation::scripting_probe), offered.end());
    EXPECT_NE(std::find(offered.begin(), offered.end(), Operation::click), offered.end());
    EXPECT_EQ(std::find(offered.begin(), offered.end(), Operation::daemon_status), offered.end());
}

TEST_F(BridgeHostTest, DaemonControlReachableThroughClient) {
    DaemonBridgeStatus bridge;
    bridge.socket_path = "/tmp/autobridge.sock";
    bridge.host_kind = HostKind::helper;
    std::atomic<int> stops{0};
    fakes.daemon = std::make_shared<ProcessDaemonControl>(bridge, fakes.permissions, "manual", [&stops]() { ++stops; });

    auto host = BridgeHost::embedded(fakes.provider(), 2);
    ASSERT_TRUE(host->start());
    auto client = host->connect();

    DaemonStatus status = client->daemon_status();
    EXPECT_TRUE(status.running);
    ASSERT_TRUE(status.pid.has_value());
    EXPECT_EQ(*status.pid, static_cast<int32_t>(::getpid()));
    ASSERT_TRUE(status.bridge.has_value());
    EXPECT_EQ(status.bridge->socket_path, "/tmp/autobridge.sock");
    EXPECT_EQ(status.mode, std::optional<std::string>("manual"));

    EXPECT_TRUE(client->daemon_stop());
    EXPECT_EQ(stops, 1);
    EXPECT_FALSE(client->daemon_status().running);
}
