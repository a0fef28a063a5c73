#include <gtest/gtest.h>

#include "mcplink/protocol/jsonrpc.h"

namespace mcplink {
namespace jsonrpc {
namespace {

TEST(JsonRpcTest, ParsesRequest) {
  auto result = parseMessage(
      std::string(R"({"jsonrpc":"2.0","id":3,"method":"ping"})"));

  ASSERT_TRUE(is_success(result));
  const auto* request = get_if<Request>(get_value(result));
  ASSERT_NE(request, nullptr);
  EXPECT_EQ(request->method, "ping");
  EXPECT_EQ(get<int64_t>(request->id), 3);
  EXPECT_FALSE(request->params.has_value());
}

TEST(JsonRpcTest, ParsesNotificationWithParams) {
  auto result = parseMessage(std::string(
      R"({"jsonrpc":"2.0","method":"notifications/progress","params":{"p":1}})"));

  ASSERT_TRUE(is_success(result));
  const auto* notification = get_if<Notification>(get_value(result));
  ASSERT_NE(notification, nullptr);
  EXPECT_EQ(notification->method, "notifications/progress");
  ASSERT_TRUE(notification->params.has_value());
  EXPECT_EQ((*notification->params)["p"], 1);
}

TEST(JsonRpcTest, ParsesSuccessResponse) {
  auto result = parseMessage(
      std::string(R"({"jsonrpc":"2.0","id":"abc","result":{"tools":[]}})"));

  ASSERT_TRUE(is_success(result));
  const auto* response = get_if<Response>(get_value(result));
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(get<std::string>(response->id), "abc");
  ASSERT_TRUE(response->result.has_value());
  EXPECT_TRUE((*response->result)["tools"].is_array());
  EXPECT_FALSE(response->error.has_value());
}

TEST(JsonRpcTest, ParsesErrorResponse) {
  auto result = parseMessage(std::string(
      R"({"jsonrpc":"2.0","id":9,"error":{"code":-32601,"message":"nope","data":[1]}})"));

  ASSERT_TRUE(is_success(result));
  const auto* response = get_if<Response>(get_value(result));
  ASSERT_NE(response, nullptr);
  ASSERT_TRUE(response->error.has_value());
  EXPECT_EQ(response->error->code, METHOD_NOT_FOUND);
  EXPECT_EQ(response->error->message, "nope");
  EXPECT_TRUE(response->error->data.has_value());

  Error error = toError(*response->error);
  EXPECT_EQ(error.kind, ErrorKind::Protocol);
  EXPECT_EQ(error.code, METHOD_NOT_FOUND);
  EXPECT_EQ(error.message, "nope");
}

TEST(JsonRpcTest, NullIdMapsToZero) {
  auto result = parseMessage(std::string(
      R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"bad"}})"));

  ASSERT_TRUE(is_success(result));
  const auto* response = get_if<Response>(get_value(result));
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(get<int64_t>(response->id), 0);
}

TEST(JsonRpcTest, RejectsInvalidJson) {
  auto result = parseMessage(std::string("{not json"));

  ASSERT_TRUE(is_error(result));
  EXPECT_EQ(get_error(result)->code, PARSE_ERROR);
  EXPECT_EQ(get_error(result)->kind, ErrorKind::Protocol);
}

TEST(JsonRpcTest, RejectsMissingVersion) {
  auto result = parseMessage(std::string(R"({"id":1,"method":"ping"})"));

  ASSERT_TRUE(is_error(result));
  EXPECT_EQ(get_error(result)->code, INVALID_REQUEST);
}

TEST(JsonRpcTest, RejectsMalformedShapes) {
  const char* cases[] = {
      R"([1,2])",
      R"({"jsonrpc":"2.0"})",
      R"({"jsonrpc":"2.0","id":1})",
      R"({"jsonrpc":"2.0","id":1.5,"result":{}})",
      R"({"jsonrpc":"2.0","id":1,"method":7})",
      R"({"jsonrpc":"2.0","id":1,"method":"x","params":"str"})",
      R"({"jsonrpc":"2.0","id":1,"error":{"message":"no code"}})",
  };
  for (const char* text : cases) {
    auto result = parseMessage(std::string(text));
    ASSERT_TRUE(is_error(result)) << text;
    EXPECT_EQ(get_error(result)->code, INVALID_REQUEST) << text;
  }
}

TEST(JsonRpcTest, SerializesRequestAndNotification) {
  Request request(int64_t(4), "tools/call", json{{"name", "echo"}});
  json j = toJson(request);
  EXPECT_EQ(j["jsonrpc"], "2.0");
  EXPECT_EQ(j["id"], 4);
  EXPECT_EQ(j["method"], "tools/call");
  EXPECT_EQ(j["params"]["name"], "echo");

  json n = toJson(Notification("notifications/initialized"));
  EXPECT_FALSE(n.contains("id"));
  EXPECT_FALSE(n.contains("params"));
}

TEST(JsonRpcTest, SerializesResponses) {
  json ok = toJson(Response::success(std::string("s1"), json::object()));
  EXPECT_EQ(ok["id"], "s1");
  EXPECT_TRUE(ok["result"].is_object());
  EXPECT_FALSE(ok.contains("error"));

  json failed = toJson(Response::make_error(
      int64_t(2), ResponseError(METHOD_NOT_FOUND, "Method not found")));
  EXPECT_EQ(failed["error"]["code"], METHOD_NOT_FOUND);
  EXPECT_FALSE(failed.contains("result"));
}

TEST(JsonRpcTest, RequestIdToString) {
  EXPECT_EQ(requestIdToString(RequestId(int64_t(12))), "12");
  EXPECT_EQ(requestIdToString(RequestId(std::string("abc"))), "abc");
}

}  // namespace
}  // namespace jsonrpc
}  // namespace mcplink
