#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "mcplink/event/event_loop.h"
#include "mcplink/transport/http_client.h"

#include "../mocks/transport_mocks.h"

namespace mcplink {
namespace transport {
namespace {

using test::MockDisconnectListener;
using test::MockMcpSession;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::StrictMock;

/**
 * Drives HttpMcpClient against mock sessions. The fixture plays the
 * server: it answers initialize, ping, tools/list and tools/call with
 * behaviour the individual tests adjust.
 */
class HttpMcpClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dispatcher_ = event::createLibeventDispatcherFactory()->createDispatcher(
        "test");
    config_ = test::makeHttpConfig("remote", "http://127.0.0.1:1/mcp",
                                   TransportKind::StreamableHttp);
    config_.name = "search";
    options_.heartbeat_interval = std::chrono::milliseconds(20);
  }

  void TearDown() override {
    client_.reset();
    dispatcher_->clearDeferredDeleteList();
  }

  void createClient() {
    client_ = std::make_unique<HttpMcpClient>(
        *dispatcher_, config_, options_, listener_, [this]() {
          return createSession();
        });
  }

  McpSessionPtr createSession() {
    auto session = std::make_unique<NiceMock<MockMcpSession>>();
    ++sessions_created_;

    ON_CALL(*session, open(_, _))
        .WillByDefault(Invoke([this](McpSession::Callbacks callbacks,
                                     McpSession::OpenCallback callback) {
          session_callbacks_ = callbacks;
          if (hold_open_) {
            held_open_ = callback;
            return;
          }
          callback(open_result_);
        }));
    ON_CALL(*session, request(_, _, _, _))
        .WillByDefault(Invoke([this](const std::string& method,
                                     const json& params,
                                     std::chrono::milliseconds,
                                     McpSession::RequestCallback callback) {
          answer(method, params, callback);
        }));
    ON_CALL(*session, notify(_, _))
        .WillByDefault(Invoke([this](const std::string& method, const json&) {
          notifications_.push_back(method);
        }));
    // Like the real sessions, close() fails whatever is outstanding
    ON_CALL(*session, close()).WillByDefault(Invoke([this]() {
      ++closes_;
      std::vector<McpSession::RequestCallback> pending;
      pending.swap(held_pings_);
      for (auto& callback : pending) {
        callback(makeError<json>(makeConnectionError("", "connection closed")));
      }
    }));
    return session;
  }

  void answer(const std::string& method,
              const json& params,
              const McpSession::RequestCallback& callback) {
    methods_.push_back(method);
    if (method == "initialize") {
      initialize_params_ = params;
      if (initialize_error_) {
        callback(makeError<json>(makeProtocolError(-32602, "bad version")));
        return;
      }
      callback(json{{"protocolVersion", "2024-11-05"},
                    {"serverInfo", {{"name", "fake"}, {"version", "1"}}}});
    } else if (method == "ping") {
      if (hold_pings_) {
        held_pings_.push_back(callback);
        return;
      }
      if (ping_failures_ > 0) {
        --ping_failures_;
        callback(makeError<json>(
            makeConnectionError("", "POST failed: HTTP 500", 500)));
        return;
      }
      callback(json::object());
    } else if (method == "tools/list") {
      callback(json{{"tools", {{{"name", "query"}}, {{"name", "index"}}}}});
    } else if (method == "tools/call") {
      if (params.value("name", "") == "boom") {
        callback(makeError<json>(makeProtocolError(-32000, "exploded")));
        return;
      }
      callback(json{{"content",
                     {{{"type", "text"},
                       {"text", params["arguments"].value("q", "")}}}}});
    }
  }

  VoidResult connectNow() {
    VoidResult outcome = makeVoidError(Error(-1, "not completed"));
    bool done = false;
    client_->connect([&](VoidResult result) {
      outcome = result;
      done = true;
    });
    EXPECT_TRUE(done);
    return outcome;
  }

  bool runUntil(const std::function<bool()>& condition,
                std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!condition()) {
      if (std::chrono::steady_clock::now() > deadline) {
        return false;
      }
      dispatcher_->run(event::RunType::NonBlock);
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
  }

  void runFor(std::chrono::milliseconds duration) {
    runUntil([]() { return false; }, duration);
  }

  size_t count(const std::string& method) const {
    size_t n = 0;
    for (const auto& m : methods_) {
      if (m == method) {
        ++n;
      }
    }
    return n;
  }

  event::DispatcherPtr dispatcher_;
  ServerConfig config_;
  ClientOptions options_;
  StrictMock<MockDisconnectListener> listener_;
  std::unique_ptr<HttpMcpClient> client_;

  // Server behaviour
  VoidResult open_result_ = makeVoidSuccess();
  bool hold_open_{false};
  McpSession::OpenCallback held_open_;
  bool initialize_error_{false};
  bool hold_pings_{false};
  int ping_failures_{0};
  std::vector<McpSession::RequestCallback> held_pings_;

  // Observations
  McpSession::Callbacks session_callbacks_;
  std::vector<std::string> methods_;
  std::vector<std::string> notifications_;
  json initialize_params_;
  int sessions_created_{0};
  int closes_{0};
};

TEST_F(HttpMcpClientTest, ConnectRunsHandshake) {
  createClient();
  EXPECT_EQ(client_->status(), ConnectionStatus::Disconnected);

  ASSERT_TRUE(is_success(connectNow()));

  EXPECT_EQ(client_->status(), ConnectionStatus::Connected);
  EXPECT_EQ(client_->kind(), TransportKind::StreamableHttp);
  ASSERT_EQ(methods_.size(), 1u);
  EXPECT_EQ(methods_[0], "initialize");
  EXPECT_EQ(initialize_params_["protocolVersion"], "2024-11-05");
  EXPECT_EQ(initialize_params_["clientInfo"]["name"], "McpClient-search");
  EXPECT_EQ(initialize_params_["clientInfo"]["version"], "1.0.0");
  ASSERT_EQ(notifications_.size(), 1u);
  EXPECT_EQ(notifications_[0], "notifications/initialized");
}

TEST_F(HttpMcpClientTest, ConnectWhenConnectedIsImmediate) {
  createClient();
  ASSERT_TRUE(is_success(connectNow()));
  ASSERT_TRUE(is_success(connectNow()));

  EXPECT_EQ(sessions_created_, 1);
  EXPECT_EQ(count("initialize"), 1u);
}

TEST_F(HttpMcpClientTest, ConcurrentConnectsShareOneAttempt) {
  hold_open_ = true;
  createClient();

  int successes = 0;
  client_->connect([&](VoidResult r) { successes += is_success(r); });
  client_->connect([&](VoidResult r) { successes += is_success(r); });
  EXPECT_EQ(client_->status(), ConnectionStatus::Connecting);
  EXPECT_EQ(sessions_created_, 1);

  held_open_(makeVoidSuccess());

  EXPECT_EQ(successes, 2);
  EXPECT_EQ(client_->status(), ConnectionStatus::Connected);
}

TEST_F(HttpMcpClientTest, OpenFailureIsConnectionError) {
  open_result_ = makeVoidError(
      makeConnectionError("", "event stream rejected: HTTP 401", 401));
  createClient();

  VoidResult result = connectNow();

  ASSERT_TRUE(is_error(result));
  EXPECT_EQ(get_error(result)->kind, ErrorKind::Connection);
  EXPECT_EQ(get_error(result)->server_id, "remote");
  EXPECT_EQ(get_error(result)->code, 401);
  EXPECT_EQ(client_->status(), ConnectionStatus::Error);
  EXPECT_FALSE(client_->heartbeatActive());
}

TEST_F(HttpMcpClientTest, InitializeErrorFailsConnect) {
  initialize_error_ = true;
  createClient();

  VoidResult result = connectNow();

  ASSERT_TRUE(is_error(result));
  EXPECT_EQ(get_error(result)->kind, ErrorKind::Connection);
  EXPECT_EQ(get_error(result)->message, "initialize failed: bad version");
  EXPECT_EQ(closes_, 1);
}

TEST_F(HttpMcpClientTest, HeartbeatPingsWhileConnected) {
  createClient();
  ASSERT_TRUE(is_success(connectNow()));
  EXPECT_TRUE(client_->heartbeatActive());

  ASSERT_TRUE(runUntil([&]() { return count("ping") >= 3; }));

  EXPECT_EQ(client_->status(), ConnectionStatus::Connected);
  EXPECT_EQ(client_->consecutiveHeartbeatFailures(), 0u);
}

TEST_F(HttpMcpClientTest, HeartbeatFailureDisconnectsOnce) {
  ping_failures_ = 100;
  createClient();
  EXPECT_CALL(listener_, onDisconnected("remote")).Times(1);
  ASSERT_TRUE(is_success(connectNow()));

  ASSERT_TRUE(runUntil(
      [&]() { return client_->status() == ConnectionStatus::Disconnected; }));
  size_t pings = count("ping");
  runFor(std::chrono::milliseconds(80));

  EXPECT_EQ(pings, 1u);
  EXPECT_EQ(count("ping"), pings);
  EXPECT_FALSE(client_->heartbeatActive());
  EXPECT_EQ(closes_, 1);
}

TEST_F(HttpMcpClientTest, ToleranceAbsorbsTransientFailures) {
  options_.heartbeat_failure_tolerance = 3;
  ping_failures_ = 2;
  createClient();
  ASSERT_TRUE(is_success(connectNow()));

  ASSERT_TRUE(runUntil([&]() { return count("ping") >= 4; }));

  EXPECT_EQ(client_->status(), ConnectionStatus::Connected);
  EXPECT_EQ(client_->consecutiveHeartbeatFailures(), 0u);
}

TEST_F(HttpMcpClientTest, ToleranceExhaustedDisconnects) {
  options_.heartbeat_failure_tolerance = 2;
  ping_failures_ = 100;
  createClient();
  EXPECT_CALL(listener_, onDisconnected("remote")).Times(1);
  ASSERT_TRUE(is_success(connectNow()));

  ASSERT_TRUE(runUntil(
      [&]() { return client_->status() == ConnectionStatus::Disconnected; }));

  EXPECT_EQ(count("ping"), 2u);
}

TEST_F(HttpMcpClientTest, NextProbeWaitsForPrevious) {
  hold_pings_ = true;
  createClient();
  ASSERT_TRUE(is_success(connectNow()));

  ASSERT_TRUE(runUntil([&]() { return count("ping") == 1; }));
  runFor(std::chrono::milliseconds(100));
  EXPECT_EQ(count("ping"), 1u);
  EXPECT_TRUE(client_->heartbeatActive());

  // Answering re-arms the timer
  held_pings_.front()(json::object());
  ASSERT_TRUE(runUntil([&]() { return count("ping") == 2; }));
}

TEST_F(HttpMcpClientTest, DestroyedWithProbeInFlight) {
  hold_pings_ = true;
  createClient();
  ASSERT_TRUE(is_success(connectNow()));
  ASSERT_TRUE(runUntil([&]() { return count("ping") == 1; }));
  EXPECT_CALL(listener_, onDisconnected(_)).Times(0);

  // The outstanding ping is failed while the client is still whole and is
  // not counted as a heartbeat failure
  client_.reset();

  EXPECT_EQ(closes_, 1);
  EXPECT_TRUE(held_pings_.empty());
  dispatcher_->clearDeferredDeleteList();
}

TEST_F(HttpMcpClientTest, ZeroIntervalDisablesHeartbeat) {
  options_.heartbeat_interval = std::chrono::milliseconds(0);
  createClient();
  ASSERT_TRUE(is_success(connectNow()));

  runFor(std::chrono::milliseconds(60));

  EXPECT_EQ(count("ping"), 0u);
  EXPECT_FALSE(client_->heartbeatActive());
}

TEST_F(HttpMcpClientTest, FailedToolCallTearsDownFirst) {
  createClient();
  ASSERT_TRUE(is_success(connectNow()));

  bool listener_called = false;
  ConnectionStatus status_seen = ConnectionStatus::Connected;
  EXPECT_CALL(listener_, onDisconnected("remote"))
      .WillOnce(Invoke([&](const std::string&) { listener_called = true; }));

  Error error;
  client_->callTool("boom", json::object(), [&](Result<CallToolResult> r) {
    ASSERT_TRUE(is_error(r));
    error = *get_error(r);
    status_seen = client_->status();
  });

  EXPECT_TRUE(listener_called);
  EXPECT_EQ(status_seen, ConnectionStatus::Disconnected);
  EXPECT_EQ(error.kind, ErrorKind::ToolCall);
  EXPECT_EQ(error.tool_name, "boom");
  EXPECT_EQ(error.server_id, "remote");
  EXPECT_EQ(error.code, -32000);
  EXPECT_FALSE(client_->heartbeatActive());
}

TEST_F(HttpMcpClientTest, SuccessfulToolCall) {
  createClient();
  ASSERT_TRUE(is_success(connectNow()));

  CallToolResult result;
  client_->callTool("query", json{{"q", "cats"}},
                    [&](Result<CallToolResult> r) {
                      ASSERT_TRUE(is_success(r));
                      result = *get_value(r);
                    });

  ASSERT_EQ(result.content.size(), 1u);
  EXPECT_EQ(get<TextContent>(result.content[0]).text, "cats");
  EXPECT_EQ(client_->status(), ConnectionStatus::Connected);
}

TEST_F(HttpMcpClientTest, ToolListIsCachedUntilChanged) {
  createClient();
  ASSERT_TRUE(is_success(connectNow()));

  size_t tools = 0;
  auto collect = [&](Result<std::vector<ToolDescriptor>> r) {
    ASSERT_TRUE(is_success(r));
    tools = get_value(r)->size();
  };
  client_->listTools(collect);
  client_->listTools(collect);

  EXPECT_EQ(tools, 2u);
  EXPECT_EQ(client_->toolListRequests(), 1u);

  session_callbacks_.on_notification("notifications/tools/list_changed",
                                     json::object());
  client_->listTools(collect);

  EXPECT_EQ(client_->toolListRequests(), 2u);
}

TEST_F(HttpMcpClientTest, RequestsFailWhenNotConnected) {
  createClient();

  Error error;
  client_->listTools([&](Result<std::vector<ToolDescriptor>> r) {
    ASSERT_TRUE(is_error(r));
    error = *get_error(r);
  });

  EXPECT_EQ(error.kind, ErrorKind::Connection);
  EXPECT_EQ(error.message, "not connected");
  EXPECT_TRUE(methods_.empty());
}

TEST_F(HttpMcpClientTest, SessionClosureNotifiesOnce) {
  createClient();
  ASSERT_TRUE(is_success(connectNow()));
  EXPECT_CALL(listener_, onDisconnected("remote")).Times(1);

  auto on_closed = session_callbacks_.on_closed;
  on_closed(makeConnectionError("", "event stream closed"));
  on_closed(makeConnectionError("", "event stream closed"));

  EXPECT_EQ(client_->status(), ConnectionStatus::Disconnected);
  EXPECT_FALSE(client_->heartbeatActive());
}

TEST_F(HttpMcpClientTest, LocalDisconnectIsSilent) {
  createClient();
  ASSERT_TRUE(is_success(connectNow()));
  EXPECT_CALL(listener_, onDisconnected(_)).Times(0);

  bool done = false;
  client_->disconnect([&]() { done = true; });

  EXPECT_TRUE(done);
  EXPECT_EQ(client_->status(), ConnectionStatus::Disconnected);
  EXPECT_EQ(closes_, 1);
  EXPECT_FALSE(client_->heartbeatActive());

  runFor(std::chrono::milliseconds(60));
  EXPECT_EQ(count("ping"), 0u);
}

TEST_F(HttpMcpClientTest, DisconnectCancelsPendingConnect) {
  hold_open_ = true;
  createClient();

  Error error;
  client_->connect([&](VoidResult r) {
    ASSERT_TRUE(is_error(r));
    error = *get_error(r);
  });
  client_->disconnect(nullptr);

  EXPECT_EQ(error.message, "connection cancelled");
  EXPECT_EQ(client_->status(), ConnectionStatus::Disconnected);

  // A late open completion is ignored
  held_open_(makeVoidSuccess());
  EXPECT_EQ(count("initialize"), 0u);
}

TEST_F(HttpMcpClientTest, ReconnectAfterLocalDisconnect) {
  createClient();
  ASSERT_TRUE(is_success(connectNow()));
  client_->disconnect(nullptr);

  ASSERT_TRUE(is_success(connectNow()));

  EXPECT_EQ(sessions_created_, 2);
  EXPECT_TRUE(client_->heartbeatActive());
}

}  // namespace
}  // namespace transport
}  // namespace mcplink
