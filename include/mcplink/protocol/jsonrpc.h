#ifndef MCPLINK_PROTOCOL_JSONRPC_H
#define MCPLINK_PROTOCOL_JSONRPC_H

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "mcplink/core/compat.h"
#include "mcplink/core/result.h"

namespace mcplink {
namespace jsonrpc {

using json = nlohmann::json;

// JSON-RPC error codes as constants
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// Requests we originate always carry integer ids; peers may use strings
using RequestId = variant<int64_t, std::string>;

struct ResponseError {
  int code{0};
  std::string message;
  optional<json> data;

  ResponseError() = default;
  ResponseError(int c, const std::string& m) : code(c), message(m) {}
};

struct Request {
  std::string jsonrpc = "2.0";
  RequestId id;
  std::string method;
  optional<json> params;

  Request() = default;
  Request(const RequestId& i, const std::string& m) : id(i), method(m) {}
  Request(const RequestId& i, const std::string& m, const json& p)
      : id(i), method(m), params(p) {}
};

struct Response {
  std::string jsonrpc = "2.0";
  RequestId id;
  optional<json> result;
  optional<ResponseError> error;

  Response() = default;
  explicit Response(const RequestId& i) : id(i) {}

  static Response success(const RequestId& id, const json& result) {
    Response r(id);
    r.result = result;
    return r;
  }

  static Response make_error(const RequestId& id, const ResponseError& err) {
    Response r(id);
    r.error = err;
    return r;
  }
};

struct Notification {
  std::string jsonrpc = "2.0";
  std::string method;
  optional<json> params;

  Notification() = default;
  explicit Notification(const std::string& m) : method(m) {}
  Notification(const std::string& m, const json& p) : method(m), params(p) {}
};

// One decoded JSON-RPC message
using Message = variant<Request, Response, Notification>;

json toJson(const RequestId& id);
json toJson(const Request& request);
json toJson(const Response& response);
json toJson(const Notification& notification);
json toJson(const Message& message);

std::string requestIdToString(const RequestId& id);

/**
 * Classify and decode a JSON-RPC 2.0 message.
 *
 * A message with "method" and "id" is a request, "method" alone is a
 * notification, and "id" with "result" or "error" is a response. Anything
 * else yields a PARSE_ERROR or INVALID_REQUEST protocol error.
 */
Result<Message> parseMessage(const json& j);
Result<Message> parseMessage(const std::string& text);

// Protocol error carrying the peer's error code and message
Error toError(const ResponseError& error);

}  // namespace jsonrpc
}  // namespace mcplink

#endif  // MCPLINK_PROTOCOL_JSONRPC_H
