#include <gtest/gtest.h>

#include "bridge_client.hpp"
#include "logger.hpp"
#include "pending_reply.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace autobridge;
using autobridge::test::ScriptedConnection;
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

ClickRequest click_at(double x, double y) {
    ClickRequest click;
    click.target = ClickTarget::at(Point{x, y});
    return click;
}

template <typename Call>
ErrorEnvelope envelope_thrown_by(Call&& call) {
    try {
        call();
    } catch (const ErrorEnvelope& error) {
        return error;
    }
    ADD_FAILURE() << "expected an ErrorEnvelope";
    return ErrorEnvelope();
}

} // namespace

TEST(PendingReply, FirstSettlementWins) {
    PendingReply pending;

    EXPECT_TRUE(pending.resolve("first"));
    EXPECT_FALSE(pending.resolve("second"));
    EXPECT_FALSE(pending.fail(std::make_exception_ptr(ConnectionInvalidated("late"))));
    EXPECT_TRUE(pending.settled());
    EXPECT_EQ(pending.wait(), "first");
}

TEST(PendingReply, DroppedHandlerFailsTheCall) {
    auto pending = std::make_shared<PendingReply>();
    {
        ReplyHandler handler = make_reply_handler(pending);
        ReplyHandler copy = handler;
    }
    EXPECT_THROW(pending->wait(), ConnectionInvalidated);
}

TEST(PendingReply, InvokedHandlerIsNotReportedAsDropped) {
    auto pending = std::make_shared<PendingReply>();
    {
        ReplyHandler handler = make_reply_handler(pending);
        handler("bytes", nullptr);
    }
    EXPECT_EQ(pending->wait(), "bytes");
}

TEST(BridgeClient, TypedCallsMapReplies) {
    auto connection = std::make_shared<ScriptedConnection>();
    BridgeClient client(connection);

    WindowInfo inbox;
    inbox.window_id = 42;
    inbox.title = "Inbox";
    connection->push_reply(WindowsResponse{{inbox}});
    connection->push_reply(BoolResponse{true});
    connection->push_reply(IntResponse{3});
    connection->push_reply(SessionIdResponse{"session-9"});
    connection->push_reply(WindowResponse{std::nullopt});

    std::vector<WindowInfo> windows = client.list_windows(WindowTarget::of_application("Mail"));
    ASSERT_EQ(windows.size(), 1u);
    EXPECT_EQ(windows[0].window_id, 42);
    EXPECT_TRUE(client.quit_application("Mail", true));
    EXPECT_EQ(client.clean_all_sessions(), 3);
    EXPECT_EQ(client.most_recent_session(), "session-9");
    EXPECT_FALSE(client.focused_window().has_value());

    // No scripted reply queued: the connection answers ok.
    client.click(click_at(10, 20));

    std::vector<Request> sent = connection->sent();
    ASSERT_EQ(sent.size(), 6u);
    ASSERT_TRUE(std::holds_alternative<ListWindowsRequest>(sent[0]));
    EXPECT_EQ(std::get<ListWindowsRequest>(sent[0]).target.application, std::string("Mail"));
    ASSERT_TRUE(std::holds_alternative<QuitApplicationRequest>(sent[1]));
    EXPECT_TRUE(std::get<QuitApplicationRequest>(sent[1]).force);
    EXPECT_TRUE(std::holds_alternative<ClickRequest>(sent[5]));
}

TEST(BridgeClient, HandshakeCarriesIdentity) {
    auto connection = std::make_shared<ScriptedConnection>();
    BridgeClient client(connection);

    HandshakeResponse reply;
    reply.negotiated_version = kProtocolVersion;
    reply.host_kind = HostKind::on_demand;
    reply.supported_operations = {Operation::click};
    connection->push_reply(HandshakeResult{reply});

    ClientIdentity identity;
    identity.bundle_id = std::string("com.example.cli");
    identity.pid = 1234;
    HandshakeResponse negotiated = client.handshake(identity, HostKind::on_demand);

    EXPECT_EQ(negotiated.host_kind, HostKind::on_demand);
    EXPECT_EQ(negotiated.supported_operations, std::vector<Operation>{Operation::click});

    std::vector<Request> sent = connection->sent();
    ASSERT_EQ(sent.size(), 1u);
    ASSERT_TRUE(std::holds_alternative<HandshakeRequest>(sent[0]));
    const auto& request = std::get<HandshakeRequest>(sent[0]);
    EXPECT_EQ(request.protocol_version, kProtocolVersion);
    EXPECT_EQ(request.client.pid, 1234);
    EXPECT_EQ(request.requested_host_kind, HostKind::on_demand);
}

TEST(BridgeClient, ErrorReplyIsRethrown) {
    auto connection = std::make_shared<ScriptedConnection>();
    BridgeClient client(connection);
    connection->push_reply(make_error(ErrorCode::not_found, "Application Mail not found"));

    ErrorEnvelope error = envelope_thrown_by([&]() { client.find_application("Mail"); });

    EXPECT_EQ(error.code(), ErrorCode::not_found);
    EXPECT_EQ(error.message(), "Application Mail not found");
}

TEST(BridgeClient, WrongReplyKindIsInvalidRequest) {
    auto connection = std::make_shared<ScriptedConnection>();
    BridgeClient client(connection);
    connection->push_reply(BoolResponse{true});
    connection->push_reply(IntResponse{1});

    ErrorEnvelope wrong_value = envelope_thrown_by([&]() { client.list_windows(WindowTarget::frontmost()); });
    EXPECT_EQ(wrong_value.code(), ErrorCode::invalid_request);
    EXPECT_EQ(wrong_value.message(), "Unexpected bool response to list-windows");

    ErrorEnvelope not_ok = envelope_thrown_by([&]() { client.hide_dock(); });
    EXPECT_EQ(not_ok.code(), ErrorCode::invalid_request);
}

TEST(BridgeClient, UndecodableReplyIsDecodingFailed) {
    auto connection = std::make_shared<ScriptedConnection>();
    BridgeClient client(connection);
    connection->push_raw_reply(std::string("\xc1\x00", 2));

    ErrorEnvelope error = envelope_thrown_by([&]() { client.permissions_status(); });

    EXPECT_EQ(error.code(), ErrorCode::decoding_failed);
    EXPECT_EQ(error.message(), "Failed to decode response");
}

TEST(BridgeClient, OversizedContainerReplyIsDecodingFailed) {
    auto connection = std::make_shared<ScriptedConnection>();
    BridgeClient client(connection);
    connection->push_raw_reply(std::string("\xdd\xff\xff\xff\xff", 5));
    connection->push_raw_reply(std::string("\xdf\xff\xff\xff\xff", 5));

    EXPECT_EQ(envelope_thrown_by([&]() { client.permissions_status(); }).code(), ErrorCode::decoding_failed);
    EXPECT_EQ(envelope_thrown_by([&]() { client.is_dock_hidden(); }).code(), ErrorCode::decoding_failed);

    // The connection is still usable afterwards.
    connection->push_reply(BoolResponse{true});
    EXPECT_TRUE(client.is_dock_hidden());
}

TEST(BridgeClient, DaemonCallsAndMenuFrame) {
    auto connection = std::make_shared<ScriptedConnection>();
    BridgeClient client(connection);

    DaemonStatus status;
    status.running = true;
    status.pid = 4242;
    status.mode = std::string("manual");
    connection->push_reply(DaemonStatusResponse{status});
    connection->push_reply(BoolResponse{true});
    Rect frame;
    frame.origin = Point{10, 0};
    frame.size = Size{200, 300};
    connection->push_reply(RectResponse{frame});
    connection->push_reply(RectResponse{std::nullopt});

    DaemonStatus reported = client.daemon_status();
    EXPECT_TRUE(reported.running);
    EXPECT_EQ(reported.pid, std::optional<int32_t>(4242));
    EXPECT_EQ(reported.mode, std::optional<std::string>("manual"));
    EXPECT_TRUE(client.daemon_stop());

    std::optional<Rect> open = client.menu_extra_open_menu_frame("Wi-Fi", 88);
    ASSERT_TRUE(open.has_value());
    EXPECT_EQ(open->origin.x, 10.0);
    EXPECT_EQ(open->size.height, 300.0);
    EXPECT_FALSE(client.menu_extra_open_menu_frame("Clock").has_value());

    std::vector<Request> sent = connection->sent();
    ASSERT_EQ(sent.size(), 4u);
    EXPECT_TRUE(std::holds_alternative<DaemonStatusRequest>(sent[0]));
    EXPECT_TRUE(std::holds_alternative<DaemonStopRequest>(sent[1]));
    ASSERT_TRUE(std::holds_alternative<MenuExtraOpenMenuFrameRequest>(sent[2]));
    EXPECT_EQ(std::get<MenuExtraOpenMenuFrameRequest>(sent[2]).title, "Wi-Fi");
    EXPECT_EQ(std::get<MenuExtraOpenMenuFrameRequest>(sent[2]).owner_pid, std::optional<int32_t>(88));
    EXPECT_FALSE(std::get<MenuExtraOpenMenuFrameRequest>(sent[3]).owner_pid.has_value());
}

TEST(BridgeClient, SendReturnsErrorsUnthrown) {
    auto connection = std::make_shared<ScriptedConnection>();
    BridgeClient client(connection);
    connection->push_reply(make_error(ErrorCode::server_busy, "busy"));

    Response response = client.send(IsDockHiddenRequest{});

    ASSERT_TRUE(std::holds_alternative<ErrorResponse>(response));
    EXPECT_EQ(std::get<ErrorResponse>(response).value.code(), ErrorCode::server_busy);
}

TEST(BridgeClient, InvalidationFailsOutstandingCalls) {
    auto connection = std::make_shared<ScriptedConnection>();
    connection->set_mode(ScriptedConnection::Mode::hold);
    BridgeClient client(connection);

    std::atomic<int> invalidated{0};
    std::vector<std::thread> callers;
    for (int i = 0; i < 2; ++i) {
        callers.emplace_back([&client, &invalidated]() {
            try {
                client.hide_dock();
            } catch (const ConnectionInvalidated&) {
                ++invalidated;
            }
        });
    }
    ASSERT_TRUE(connection->wait_for_held(2, 2000ms));

    connection->invalidate("host exited");
    for (auto& caller : callers) {
        caller.join();
    }

    EXPECT_EQ(invalidated, 2);
    EXPECT_THROW(client.show_dock(), ConnectionInvalidated);
}

TEST(BridgeClient, DroppedReplyFailsTheCall) {
    auto connection = std::make_shared<ScriptedConnection>();
    connection->set_mode(ScriptedConnection::Mode::drop);
    BridgeClient client(connection);

    EXPECT_THROW(client.click(click_at(1, 1)), ConnectionInvalidated);
}

TEST(BridgeClient, CancelPredicateAbandonsWait) {
    auto connection = std::make_shared<ScriptedConnection>();
    connection->set_mode(ScriptedConnection::Mode::hold);
    BridgeClient client(connection);

    std::atomic<bool> cancel{false};
    std::thread canceller([&]() {
        connection->wait_for_held(1, 2000ms);
        cancel = true;
    });

    EXPECT_THROW(client.send(ListSessionsRequest{}, [&]() { return cancel.load(); }), OperationCancelled);
    canceller.join();

    // A late reply to the abandoned call goes nowhere, and the permit is free again.
    EXPECT_TRUE(connection->complete_next(OkResponse{}));
    connection->set_mode(ScriptedConnection::Mode::reply);
    EXPECT_NO_THROW(client.show_all_applications());
}

TEST(BridgeClient, LimitsRequestsOnTheWire) {
    auto connection = std::make_shared<ScriptedConnection>();
    connection->set_mode(ScriptedConnection::Mode::hold);
    BridgeClient client(connection, 2);

    std::atomic<int> finished{0};
    std::vector<std::thread> callers;
    for (int i = 0; i < 3; ++i) {
        callers.emplace_back([&client, &finished]() {
            client.show_dock();
            ++finished;
        });
    }

    ASSERT_TRUE(connection->wait_for_held(2, 2000ms));
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(connection->held_count(), 2u);
    EXPECT_EQ(connection->sent().size(), 2u);

    ASSERT_TRUE(connection->complete_next(OkResponse{}));
    ASSERT_TRUE(connection->wait_for_held(2, 2000ms));
    EXPECT_EQ(connection->sent().size(), 3u);

    ASSERT_TRUE(connection->complete_next(OkResponse{}));
    ASSERT_TRUE(connection->complete_next(OkResponse{}));
    for (auto& caller : callers) {
        caller.join();
    }
    EXPECT_EQ(finished, 3);
}
