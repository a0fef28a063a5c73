#include "mcplink/protocol/jsonrpc.h"

namespace mcplink {
namespace jsonrpc {

namespace {

Result<RequestId> parseId(const json& id) {
  if (id.is_number_integer()) {
    return RequestId(id.get<int64_t>());
  }
  if (id.is_string()) {
    return RequestId(id.get<std::string>());
  }
  if (id.is_null()) {
    // Error responses to unparseable requests carry a null id. Integer 0 is
    // never issued by this side, so such a response correlates to nothing.
    return RequestId(int64_t(0));
  }
  return makeError<RequestId>(
      makeProtocolError(INVALID_REQUEST, "id must be a string or integer"));
}

Result<ResponseError> parseError(const json& j) {
  if (!j.is_object() || !j.contains("code") ||
      !j.at("code").is_number_integer()) {
    return makeError<ResponseError>(
        makeProtocolError(INVALID_REQUEST, "malformed error object"));
  }
  ResponseError error;
  error.code = j.at("code").get<int>();
  if (j.contains("message") && j.at("message").is_string()) {
    error.message = j.at("message").get<std::string>();
  }
  if (j.contains("data")) {
    error.data = j.at("data");
  }
  return error;
}

}  // namespace

json toJson(const RequestId& id) {
  return match(
      id, [](int64_t value) { return json(value); },
      [](const std::string& value) { return json(value); });
}

std::string requestIdToString(const RequestId& id) {
  return match(
      id, [](int64_t value) { return std::to_string(value); },
      [](const std::string& value) { return value; });
}

json toJson(const Request& request) {
  json j = {{"jsonrpc", request.jsonrpc},
            {"id", toJson(request.id)},
            {"method", request.method}};
  if (request.params.has_value()) {
    j["params"] = *request.params;
  }
  return j;
}

json toJson(const Response& response) {
  json j = {{"jsonrpc", response.jsonrpc}, {"id", toJson(response.id)}};
  if (response.error.has_value()) {
    json error = {{"code", response.error->code},
                  {"message", response.error->message}};
    if (response.error->data.has_value()) {
      error["data"] = *response.error->data;
    }
    j["error"] = std::move(error);
  } else {
    j["result"] = response.result.has_value() ? *response.result
                                              : json::object();
  }
  return j;
}

json toJson(const Notification& notification) {
  json j = {{"jsonrpc", notification.jsonrpc},
            {"method", notification.method}};
  if (notification.params.has_value()) {
    j["params"] = *notification.params;
  }
  return j;
}

json toJson(const Message& message) {
  return match(
      message, [](const Request& r) { return toJson(r); },
      [](const Response& r) { return toJson(r); },
      [](const Notification& n) { return toJson(n); });
}

Result<Message> parseMessage(const json& j) {
  if (!j.is_object()) {
    return makeError<Message>(
        makeProtocolError(INVALID_REQUEST, "message is not a JSON object"));
  }
  auto version = j.find("jsonrpc");
  if (version == j.end() || !version->is_string() ||
      version->get<std::string>() != "2.0") {
    return makeError<Message>(
        makeProtocolError(INVALID_REQUEST, "missing or invalid jsonrpc version"));
  }

  auto method = j.find("method");
  auto id = j.find("id");

  if (method != j.end()) {
    if (!method->is_string()) {
      return makeError<Message>(
          makeProtocolError(INVALID_REQUEST, "method must be a string"));
    }
    optional<json> params;
    auto p = j.find("params");
    if (p != j.end() && !p->is_null()) {
      if (!p->is_object() && !p->is_array()) {
        return makeError<Message>(makeProtocolError(
            INVALID_REQUEST, "params must be an object or array"));
      }
      params = *p;
    }

    if (id == j.end()) {
      Notification notification(method->get<std::string>());
      notification.params = std::move(params);
      return Message(std::move(notification));
    }

    auto parsed_id = parseId(*id);
    if (is_error(parsed_id)) {
      return makeError<Message>(*get_error(parsed_id));
    }
    Request request(*get_value(parsed_id), method->get<std::string>());
    request.params = std::move(params);
    return Message(std::move(request));
  }

  if (id != j.end()) {
    auto parsed_id = parseId(*id);
    if (is_error(parsed_id)) {
      return makeError<Message>(*get_error(parsed_id));
    }
    Response response(*get_value(parsed_id));

    auto error = j.find("error");
    if (error != j.end() && !error->is_null()) {
      auto parsed_error = parseError(*error);
      if (is_error(parsed_error)) {
        return makeError<Message>(*get_error(parsed_error));
      }
      response.error = *get_value(parsed_error);
      return Message(std::move(response));
    }

    auto result = j.find("result");
    if (result == j.end()) {
      return makeError<Message>(makeProtocolError(
          INVALID_REQUEST, "response has neither result nor error"));
    }
    response.result = *result;
    return Message(std::move(response));
  }

  return makeError<Message>(makeProtocolError(
      INVALID_REQUEST, "message is neither request, response nor notification"));
}

Result<Message> parseMessage(const std::string& text) {
  json j = json::parse(text, nullptr, false);
  if (j.is_discarded()) {
    return makeError<Message>(makeProtocolError(PARSE_ERROR, "invalid JSON"));
  }
  return parseMessage(j);
}

Error toError(const ResponseError& error) {
  return makeProtocolError(error.code, error.message);
}

}  // namespace jsonrpc
}  // namespace mcplink
