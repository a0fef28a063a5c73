#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "mcplink/http/curl_multi_client.h"

#include "../integration/real_io_test_base.h"
#include "../integration/test_http_server.h"

namespace mcplink {
namespace http {
namespace {

using test::TestHttpServer;

/**
 * CurlMultiClient against a local HTTP server, with the dispatcher on its
 * own thread.
 */
class CurlMultiClientTest : public test::RealIoTestBase {
 protected:
  void SetUp() override {
    RealIoTestBase::SetUp();
    server_ = std::make_unique<TestHttpServer>(
        [this](const TestHttpServer::Request& request,
               TestHttpServer::Exchange& exchange) {
          {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
          }
          handle(request, exchange);
        });
    ASSERT_TRUE(server_->start());

    executeInDispatcher([this]() {
      CurlMultiClient::Config config;
      config.connect_timeout = std::chrono::milliseconds(2000);
      config.user_agent = "mcplink-test/1.0";
      client_ = std::make_unique<CurlMultiClient>(*dispatcher_, config);
    });
  }

  void TearDown() override {
    // Transfers die with the client, before the server goes away
    RealIoTestBase::TearDown();
    server_->stop();
  }

  void tearDownInDispatcher() override { client_.reset(); }

  void handle(const TestHttpServer::Request& request,
              TestHttpServer::Exchange& exchange) {
    if (request.target == "/hello") {
      exchange.respond(200, "text/plain", "hello world",
                       {{"X-Custom", "value"}});
    } else if (request.target == "/echo") {
      exchange.respond(201, "application/json", request.body);
    } else if (request.target == "/error") {
      exchange.respond(500, "text/plain", "boom");
    } else if (request.target == "/slow") {
      std::this_thread::sleep_for(std::chrono::milliseconds(600));
      exchange.respond(200, "text/plain", "late");
    } else if (request.target == "/events") {
      exchange.beginStream(200, "text/event-stream");
      exchange.write("data: one\n\n");
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      exchange.write("data: two\n\n");
    } else if (request.target == "/endless") {
      exchange.beginStream(200, "text/event-stream");
      while (!server_->stopping() && !exchange.peerClosed()) {
        if (!exchange.write(": tick\n\n")) {
          break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
    } else {
      exchange.respond(404, "text/plain", "not found");
    }
  }

  TestHttpServer::Request lastRequest() {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.empty() ? TestHttpServer::Request() : requests_.back();
  }

  HttpResponse sendAndWait(const HttpRequest& request) {
    HttpResponse result;
    bool done = false;
    executeInDispatcher([&]() {
      client_->send(request, [&](HttpResponse response) {
        result = std::move(response);
        done = true;
      });
    });
    EXPECT_TRUE(waitFor([&]() { return done; }));
    return result;
  }

  std::unique_ptr<TestHttpServer> server_;
  std::unique_ptr<CurlMultiClient> client_;
  std::mutex mutex_;
  std::vector<TestHttpServer::Request> requests_;
};

TEST_F(CurlMultiClientTest, GetBuffered) {
  HttpRequest request;
  request.url = server_->url("/hello");
  request.timeout = std::chrono::milliseconds(5000);

  HttpResponse response = sendAndWait(request);

  EXPECT_TRUE(response.ok()) << response.error;
  EXPECT_EQ(response.status_code, 200);
  EXPECT_EQ(response.body, "hello world");
  EXPECT_EQ(response.header("X-Custom").value_or(""), "value");
  EXPECT_EQ(response.header("content-type").value_or(""), "text/plain");
  EXPECT_EQ(lastRequest().method, "GET");
  EXPECT_EQ(lastRequest().header("user-agent"), "mcplink-test/1.0");
}

TEST_F(CurlMultiClientTest, PostCarriesBodyAndHeaders) {
  HttpRequest request;
  request.url = server_->url("/echo");
  request.method = HttpMethod::POST;
  request.headers["Content-Type"] = "application/json";
  request.headers["Authorization"] = "Bearer token";
  request.body = "{\"jsonrpc\":\"2.0\",\"method\":\"ping\",\"id\":1}";

  HttpResponse response = sendAndWait(request);

  EXPECT_TRUE(response.ok()) << response.error;
  EXPECT_EQ(response.status_code, 201);
  EXPECT_EQ(response.body, request.body);

  auto seen = lastRequest();
  EXPECT_EQ(seen.method, "POST");
  EXPECT_EQ(seen.body, request.body);
  EXPECT_EQ(seen.header("authorization"), "Bearer token");
  EXPECT_EQ(seen.header("content-type"), "application/json");
}

TEST_F(CurlMultiClientTest, DeleteMethod) {
  HttpRequest request;
  request.url = server_->url("/hello");
  request.method = HttpMethod::DELETE;

  HttpResponse response = sendAndWait(request);

  EXPECT_TRUE(response.ok());
  EXPECT_EQ(lastRequest().method, "DELETE");
  EXPECT_STREQ(toString(HttpMethod::DELETE), "DELETE");
}

TEST_F(CurlMultiClientTest, ErrorStatusIsNotTransportError) {
  HttpRequest request;
  request.url = server_->url("/error");

  HttpResponse response = sendAndWait(request);

  EXPECT_FALSE(response.ok());
  EXPECT_TRUE(response.error.empty()) << response.error;
  EXPECT_EQ(response.status_code, 500);
  EXPECT_EQ(response.body, "boom");
}

TEST_F(CurlMultiClientTest, ConnectionRefused) {
  TestHttpServer closed([](const TestHttpServer::Request&,
                           TestHttpServer::Exchange&) {});
  ASSERT_TRUE(closed.start());
  const std::string url = closed.url("/nothing");
  closed.stop();

  HttpRequest request;
  request.url = url;
  HttpResponse response = sendAndWait(request);

  EXPECT_FALSE(response.ok());
  EXPECT_FALSE(response.error.empty());
  EXPECT_EQ(response.status_code, 0);
}

TEST_F(CurlMultiClientTest, RequestTimeout) {
  HttpRequest request;
  request.url = server_->url("/slow");
  request.timeout = std::chrono::milliseconds(100);

  HttpResponse response = sendAndWait(request);

  EXPECT_FALSE(response.ok());
  EXPECT_FALSE(response.error.empty());
}

TEST_F(CurlMultiClientTest, StreamDeliversChunksInOrder) {
  std::string data;
  bool saw_headers = false;
  bool headers_before_data = false;
  optional<HttpResponse> completed;

  executeInDispatcher([&]() {
    HttpRequest request;
    request.url = server_->url("/events");
    CurlMultiClient::StreamCallbacks callbacks;
    callbacks.on_headers = [&](const HttpResponse& response) {
      saw_headers = true;
      headers_before_data = data.empty();
      EXPECT_EQ(response.status_code, 200);
      EXPECT_EQ(response.header("content-type").value_or(""),
                "text/event-stream");
    };
    callbacks.on_data = [&](const char* chunk, size_t length) {
      data.append(chunk, length);
    };
    callbacks.on_complete = [&](HttpResponse response) {
      completed = std::move(response);
    };
    client_->stream(request, std::move(callbacks));
  });

  ASSERT_TRUE(waitFor([&]() { return completed.has_value(); }));
  EXPECT_TRUE(saw_headers);
  EXPECT_TRUE(headers_before_data);
  EXPECT_EQ(data, "data: one\n\ndata: two\n\n");
  EXPECT_TRUE(completed->error.empty()) << completed->error;
  EXPECT_TRUE(completed->body.empty());
}

TEST_F(CurlMultiClientTest, CancelledStreamIsSilent) {
  std::atomic<int> chunks{0};
  std::atomic<bool> completed{false};
  CurlMultiClient::TransferId id = 0;

  executeInDispatcher([&]() {
    HttpRequest request;
    request.url = server_->url("/endless");
    CurlMultiClient::StreamCallbacks callbacks;
    callbacks.on_data = [&](const char*, size_t) { ++chunks; };
    callbacks.on_complete = [&](HttpResponse) { completed = true; };
    id = client_->stream(request, std::move(callbacks));
  });

  ASSERT_TRUE(waitFor([&]() { return chunks > 0; }));
  executeInDispatcher([&]() {
    client_->cancel(id);
    EXPECT_EQ(client_->activeTransfers(), 0u);
  });
  int seen = chunks;
  std::this_thread::sleep_for(std::chrono::milliseconds(60));

  EXPECT_EQ(chunks, seen);
  EXPECT_FALSE(completed);
}

TEST_F(CurlMultiClientTest, CancelFromInsideDataCallback) {
  int chunks = 0;
  bool completed = false;
  auto id = std::make_shared<CurlMultiClient::TransferId>(0);

  executeInDispatcher([&]() {
    HttpRequest request;
    request.url = server_->url("/endless");
    CurlMultiClient::StreamCallbacks callbacks;
    callbacks.on_data = [&, id](const char*, size_t) {
      ++chunks;
      client_->cancel(*id);
    };
    callbacks.on_complete = [&](HttpResponse) { completed = true; };
    *id = client_->stream(request, std::move(callbacks));
  });

  ASSERT_TRUE(waitFor([&]() { return chunks > 0; }));
  ASSERT_TRUE(waitFor([&]() { return client_->activeTransfers() == 0; }));
  std::this_thread::sleep_for(std::chrono::milliseconds(60));

  EXPECT_EQ(executeInDispatcher([&]() { return chunks; }), 1);
  EXPECT_FALSE(executeInDispatcher([&]() { return completed; }));
}

TEST_F(CurlMultiClientTest, CancelUnknownIdIgnored) {
  executeInDispatcher([&]() {
    client_->cancel(12345);
    EXPECT_EQ(client_->activeTransfers(), 0u);
  });
}

TEST_F(CurlMultiClientTest, ConcurrentRequests) {
  int done = 0;
  std::vector<std::string> bodies;
  executeInDispatcher([&]() {
    for (int i = 0; i < 5; ++i) {
      HttpRequest request;
      request.url = server_->url("/echo");
      request.method = HttpMethod::POST;
      request.body = "request-" + std::to_string(i);
      client_->send(request, [&](HttpResponse response) {
        bodies.push_back(response.body);
        ++done;
      });
    }
    EXPECT_EQ(client_->activeTransfers(), 5u);
  });

  ASSERT_TRUE(waitFor([&]() { return done == 5; }));
  std::sort(bodies.begin(), bodies.end());
  EXPECT_EQ(bodies.front(), "request-0");
  EXPECT_EQ(bodies.back(), "request-4");
}

}  // namespace
}  // namespace http
}  // namespace mcplink
