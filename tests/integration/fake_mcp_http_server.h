#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "test_http_server.h"

namespace mcplink {
namespace test {

/**
 * MCP server speaking either HTTP transport, for client tests.
 *
 * Sse mode serves GET /sse (announcing /messages as the endpoint) and
 * POST /messages, with replies delivered on the event stream. Streamable
 * mode serves POST, DELETE /mcp and answers in the POST response, as JSON
 * or as an event stream.
 *
 * Tools: "echo" returns its "text" argument, "fail" answers with a
 * JSON-RPC error, "slow" never answers.
 */
class FakeMcpHttpServer {
 public:
  enum class Mode { Sse, Streamable };

  explicit FakeMcpHttpServer(Mode mode)
      : mode_(mode),
        server_([this](const TestHttpServer::Request& request,
                       TestHttpServer::Exchange& exchange) {
          handle(request, exchange);
        }) {}

  ~FakeMcpHttpServer() { stop(); }

  bool start() { return server_.start(); }

  void stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      drop_streams_ = true;
    }
    cv_.notify_all();
    server_.stop();
  }

  std::string url() const {
    return server_.url(mode_ == Mode::Sse ? "/sse" : "/mcp");
  }

  // Ends every open event stream; new streams are still accepted
  void dropStreams() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stream_generation_;
    cv_.notify_all();
  }

  // POSTs carrying ping fail with HTTP 500
  void setFailPings(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_pings_ = fail;
  }

  // Every later POST fails with HTTP 500
  void setFailAllPosts(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_all_posts_ = fail;
  }

  // Streamable mode: answer requests as text/event-stream
  void setReplyAsEventStream(bool sse) {
    std::lock_guard<std::mutex> lock(mutex_);
    reply_as_event_stream_ = sse;
  }

  // Streamable mode: forget the session, later requests get 404
  void expireSession() {
    std::lock_guard<std::mutex> lock(mutex_);
    session_expired_ = true;
  }

  // Sse mode: GET /sse answers with this status instead of a stream
  void setStreamStatus(int status) {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_status_ = status;
  }

  // Sse mode: never send the endpoint event
  void setSilentStream(bool silent) {
    std::lock_guard<std::mutex> lock(mutex_);
    silent_stream_ = silent;
  }

  size_t methodCount(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = method_counts_.find(method);
    return it == method_counts_.end() ? 0 : it->second;
  }

  size_t deleteCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return delete_count_;
  }

  size_t openStreams() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_streams_;
  }

  std::string lastHeader(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_headers_.find(name);
    return it == last_headers_.end() ? std::string() : it->second;
  }

  std::string clientName() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_name_;
  }

 private:
  void handle(const TestHttpServer::Request& request,
              TestHttpServer::Exchange& exchange) {
    if (mode_ == Mode::Sse) {
      if (request.method == "GET" && request.target == "/sse") {
        serveStream(exchange);
      } else if (request.method == "POST" &&
                 request.target.compare(0, 9, "/messages") == 0) {
        serveSsePost(request, exchange);
      } else {
        exchange.respond(404, "text/plain", "not found");
      }
      return;
    }

    if (request.target != "/mcp") {
      exchange.respond(404, "text/plain", "not found");
    } else if (request.method == "POST") {
      serveStreamablePost(request, exchange);
    } else if (request.method == "DELETE") {
      std::lock_guard<std::mutex> lock(mutex_);
      ++delete_count_;
      exchange.respond(200, "", "");
    } else {
      exchange.respond(405, "text/plain", "method not allowed");
    }
  }

  void serveStream(TestHttpServer::Exchange& exchange) {
    uint64_t generation;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stream_status_ != 200) {
        exchange.respond(stream_status_, "text/plain", "refused");
        return;
      }
      generation = stream_generation_;
      ++open_streams_;
    }

    bool ok = exchange.beginStream(200, "text/event-stream");
    bool silent;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      silent = silent_stream_;
    }
    if (ok && !silent) {
      ok = exchange.write(": connected\n\nevent: endpoint\ndata: /messages?session=1\n\n");
    }

    std::unique_lock<std::mutex> lock(mutex_);
    while (ok && !drop_streams_ && generation == stream_generation_ &&
           !server_.stopping()) {
      if (!stream_queue_.empty()) {
        std::string event = std::move(stream_queue_.front());
        stream_queue_.pop_front();
        lock.unlock();
        ok = exchange.write(event);
        lock.lock();
        continue;
      }
      cv_.wait_for(lock, std::chrono::milliseconds(20));
      if (exchange.peerClosed()) {
        break;
      }
    }
    --open_streams_;
  }

  void serveSsePost(const TestHttpServer::Request& request,
                    TestHttpServer::Exchange& exchange) {
    nlohmann::json message = nlohmann::json::parse(request.body, nullptr, false);
    if (message.is_discarded()) {
      exchange.respond(400, "text/plain", "bad json");
      return;
    }

    nlohmann::json reply;
    int status = 202;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      status = postStatusLocked(message, request);
      if (status == 202) {
        reply = replyLocked(message);
      }
    }
    if (status != 202) {
      exchange.respond(status, "text/plain", "server error");
      return;
    }
    exchange.respond(202, "text/plain", "Accepted");

    if (!reply.is_null()) {
      std::lock_guard<std::mutex> lock(mutex_);
      stream_queue_.push_back("event: message\ndata: " + reply.dump() + "\n\n");
      cv_.notify_all();
    }
  }

  void serveStreamablePost(const TestHttpServer::Request& request,
                           TestHttpServer::Exchange& exchange) {
    nlohmann::json message = nlohmann::json::parse(request.body, nullptr, false);
    if (message.is_discarded()) {
      exchange.respond(400, "text/plain", "bad json");
      return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (session_expired_ && !request.header("mcp-session-id").empty()) {
      exchange.respond(404, "text/plain", "unknown session");
      return;
    }
    int status = postStatusLocked(message, request);
    if (status != 202) {
      exchange.respond(status, "text/plain", "server error");
      return;
    }

    nlohmann::json reply = replyLocked(message);
    if (reply.is_null()) {
      exchange.respond(202, "", "");
      return;
    }

    std::map<std::string, std::string> headers;
    if (message.value("method", "") == "initialize") {
      headers["Mcp-Session-Id"] = "session-1";
    }
    if (reply_as_event_stream_) {
      exchange.respond(200, "text/event-stream",
                       "event: message\ndata: " + reply.dump() + "\n\n",
                       headers);
    } else {
      exchange.respond(200, "application/json", reply.dump(), headers);
    }
  }

  int postStatusLocked(const nlohmann::json& message,
                       const TestHttpServer::Request& request) {
    for (const auto& header : request.headers) {
      last_headers_[header.first] = header.second;
    }
    std::string method = message.value("method", "");
    if (!method.empty()) {
      ++method_counts_[method];
    }
    if (fail_all_posts_ || (fail_pings_ && method == "ping")) {
      return 500;
    }
    return 202;
  }

  // Null when there is nothing to answer
  nlohmann::json replyLocked(const nlohmann::json& message) {
    if (!message.contains("id") || !message.contains("method")) {
      return nullptr;
    }
    const std::string method = message["method"];
    nlohmann::json result;

    if (method == "initialize") {
      client_name_ = message["params"]["clientInfo"].value("name", "");
      result = {{"protocolVersion", "2024-11-05"},
                {"capabilities", {{"tools", nlohmann::json::object()}}},
                {"serverInfo", {{"name", "fake-http"}, {"version", "1.0"}}}};
    } else if (method == "ping") {
      result = nlohmann::json::object();
    } else if (method == "tools/list") {
      result = {{"tools",
                 {{{"name", "echo"},
                   {"description", "Echo text"},
                   {"inputSchema", {{"type", "object"}}}},
                  {{"name", "fail"}, {"inputSchema", {{"type", "object"}}}}}}};
    } else if (method == "tools/call") {
      const std::string tool = message["params"].value("name", "");
      if (tool == "echo") {
        std::string text =
            message["params"]["arguments"].value("text", std::string());
        result = {{"content", {{{"type", "text"}, {"text", text}}}}};
      } else if (tool == "slow") {
        return nullptr;
      } else {
        return {{"jsonrpc", "2.0"},
                {"id", message["id"]},
                {"error", {{"code", -32000}, {"message", "tool failed"}}}};
      }
    } else {
      return {{"jsonrpc", "2.0"},
              {"id", message["id"]},
              {"error", {{"code", -32601}, {"message", "Method not found"}}}};
    }
    return {{"jsonrpc", "2.0"}, {"id", message["id"]}, {"result", result}};
  }

  const Mode mode_;
  TestHttpServer server_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::string> stream_queue_;
  uint64_t stream_generation_{0};
  bool drop_streams_{false};
  size_t open_streams_{0};
  bool fail_pings_{false};
  bool fail_all_posts_{false};
  bool reply_as_event_stream_{false};
  bool session_expired_{false};
  bool silent_stream_{false};
  int stream_status_{200};
  size_t delete_count_{0};
  std::map<std::string, size_t> method_counts_;
  std::map<std::string, std::string> last_headers_;
  std::string client_name_;
};

}  // namespace test
}  // namespace mcplink
