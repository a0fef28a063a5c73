/**
 * @file echo_mcp_server.cc
 * @brief Minimal MCP server on stdio used by the tests and for manual runs
 *
 * Speaks newline-delimited JSON-RPC 2.0 on stdin/stdout. Diagnostics go to
 * stderr. Tools:
 *   echo {text}           returns the text
 *   sleep {ms, text?}     replies after a delay, other requests proceed
 *   crash {code?}         exits immediately without replying
 *   stats                 number of tools/list requests seen so far
 *   garbage               writes malformed lines, then replies
 *   env {name}            value of an environment variable
 *   fail                  replies with a JSON-RPC error
 *   error_result          replies with isError set
 *   mixed                 text, image and resource parts in one result
 *   notify_changed        sends notifications/tools/list_changed
 *
 * Environment:
 *   ECHO_MCP_PID_FILE     pid is written there at startup
 *   ECHO_MCP_MODE=silent  never answers initialize
 */

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

namespace {

using json = nlohmann::json;

std::mutex g_output_mutex;
std::atomic<int> g_tools_list_count{0};
bool g_silent = false;

void writeMessage(const json& message) {
  std::lock_guard<std::mutex> lock(g_output_mutex);
  std::cout << message.dump() << "\n" << std::flush;
}

void writeRaw(const std::string& line) {
  std::lock_guard<std::mutex> lock(g_output_mutex);
  std::cout << line << "\n" << std::flush;
}

json textResult(const std::string& text) {
  return {{"content", json::array({{{"type", "text"}, {"text", text}}})}};
}

void reply(const json& id, const json& result) {
  writeMessage({{"jsonrpc", "2.0"}, {"id", id}, {"result", result}});
}

void replyError(const json& id, int code, const std::string& message) {
  writeMessage({{"jsonrpc", "2.0"},
                {"id", id},
                {"error", {{"code", code}, {"message", message}}}});
}

json toolList() {
  auto tool = [](const std::string& name, const std::string& description,
                 json properties) {
    return json{{"name", name},
                {"description", description},
                {"inputSchema",
                 {{"type", "object"}, {"properties", std::move(properties)}}}};
  };
  return json::array(
      {tool("echo", "Echo the given text",
            {{"text", {{"type", "string"}}}}),
       tool("sleep", "Reply after a delay",
            {{"ms", {{"type", "integer"}}}, {"text", {{"type", "string"}}}}),
       tool("crash", "Exit without replying", {{"code", {{"type", "integer"}}}}),
       tool("stats", "Count of tools/list requests", json::object()),
       tool("garbage", "Emit malformed output before replying", json::object()),
       tool("env", "Read an environment variable",
            {{"name", {{"type", "string"}}}}),
       tool("fail", "Reply with a JSON-RPC error", json::object()),
       tool("error_result", "Reply with isError set", json::object()),
       tool("mixed", "Reply with several content types", json::object()),
       tool("notify_changed", "Announce a tool list change", json::object())});
}

void callTool(const json& id, const json& params) {
  const std::string name = params.value("name", "");
  json args = params.contains("arguments") && params["arguments"].is_object()
                  ? params["arguments"]
                  : json::object();

  if (name == "echo") {
    reply(id, textResult(args.value("text", "")));
  } else if (name == "sleep") {
    const int ms = args.value("ms", 1000);
    const std::string text = args.value("text", "slept");
    std::thread([id, ms, text]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(ms));
      reply(id, textResult(text));
    }).detach();
  } else if (name == "crash") {
    std::cerr << "crashing on request" << std::endl;
    _exit(args.value("code", 3));
  } else if (name == "stats") {
    reply(id, textResult(std::to_string(g_tools_list_count.load())));
  } else if (name == "garbage") {
    writeRaw("this is not json");
    writeRaw("{\"jsonrpc\": \"2.0\", \"id\": ");
    writeRaw("[1, 2, 3]");
    reply(id, textResult("after garbage"));
  } else if (name == "env") {
    const char* value = std::getenv(args.value("name", "").c_str());
    reply(id, textResult(value ? value : ""));
  } else if (name == "fail") {
    replyError(id, -32000, "tool failed on purpose");
  } else if (name == "error_result") {
    json result = textResult("something went wrong");
    result["isError"] = true;
    reply(id, result);
  } else if (name == "mixed") {
    reply(id,
          {{"content",
            json::array(
                {{{"type", "text"}, {"text", "first"}},
                 {{"type", "image"}, {"data", "aGVsbG8="}, {"mimeType", "image/png"}},
                 {{"type", "resource"},
                  {"resource",
                   {{"uri", "file:///tmp/example.txt"}, {"text", "example"}}}}})}});
  } else if (name == "notify_changed") {
    writeMessage({{"jsonrpc", "2.0"},
                  {"method", "notifications/tools/list_changed"}});
    reply(id, textResult("notified"));
  } else {
    replyError(id, -32602, "Unknown tool: " + name);
  }
}

void handleMessage(const json& message) {
  if (!message.is_object() || !message.contains("method")) {
    // Responses to our own requests; there are none
    return;
  }

  const std::string method = message["method"].get<std::string>();
  const json params = message.value("params", json::object());

  if (!message.contains("id")) {
    std::cerr << "notification: " << method << std::endl;
    return;
  }
  const json id = message["id"];

  if (method == "initialize") {
    if (g_silent) {
      std::cerr << "ignoring initialize" << std::endl;
      return;
    }
    reply(id, {{"protocolVersion", "2024-11-05"},
               {"capabilities", {{"tools", {{"listChanged", true}}}}},
               {"serverInfo", {{"name", "echo-mcp-server"}, {"version", "1.0.0"}}}});
  } else if (method == "ping") {
    reply(id, json::object());
  } else if (method == "tools/list") {
    ++g_tools_list_count;
    reply(id, {{"tools", toolList()}});
  } else if (method == "tools/call") {
    callTool(id, params);
  } else {
    replyError(id, -32601, "Method not found: " + method);
  }
}

}  // namespace

int main() {
  std::ios::sync_with_stdio(false);

  if (const char* pid_file = std::getenv("ECHO_MCP_PID_FILE")) {
    std::ofstream out(pid_file);
    out << getpid() << std::endl;
  }
  if (const char* mode = std::getenv("ECHO_MCP_MODE")) {
    g_silent = std::string(mode) == "silent";
  }

  std::cerr << "echo-mcp-server " << getpid() << " ready" << std::endl;

  std::string line;
  while (std::getline(std::cin, line)) {
    if (line.empty()) {
      continue;
    }
    json message;
    try {
      message = json::parse(line);
    } catch (const json::parse_error& e) {
      std::cerr << "bad input: " << e.what() << std::endl;
      continue;
    }
    try {
      handleMessage(message);
    } catch (const json::exception& e) {
      std::cerr << "bad message: " << e.what() << std::endl;
      if (message.is_object() && message.contains("id")) {
        replyError(message["id"], -32600, e.what());
      }
    }
  }

  std::cerr << "stdin closed, exiting" << std::endl;
  // Let delayed replies finish writing
  std::lock_guard<std::mutex> lock(g_output_mutex);
  return 0;
}
