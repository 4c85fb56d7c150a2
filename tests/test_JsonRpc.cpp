#include <gtest/gtest.h>
#include <variant>
#include <nlohmann/json.hpp>

#include "mcp/JsonRpc.h"
#include "mcp/McpErrors.h"

TEST(JsonRpc, ParsesSuccessResponse) {
    auto msg = jsonrpc::parseMessage(R"({"jsonrpc":"2.0","id":7,"result":{"tools":[]}})");
    ASSERT_TRUE(std::holds_alternative<jsonrpc::SuccessResponse>(msg));
    const auto& resp = std::get<jsonrpc::SuccessResponse>(msg);
    EXPECT_EQ(resp.id, 7);
    EXPECT_TRUE(resp.result["tools"].is_array());
    EXPECT_EQ(jsonrpc::responseId(msg), 7);
}

TEST(JsonRpc, ParsesErrorResponseWithNullId) {
    auto msg = jsonrpc::parseMessage(R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"Parse error"}})");
    ASSERT_TRUE(std::holds_alternative<jsonrpc::ErrorResponse>(msg));
    const auto& err = std::get<jsonrpc::ErrorResponse>(msg);
    EXPECT_TRUE(err.id.is_null());
    EXPECT_EQ(err.code, -32700);
    EXPECT_EQ(err.message, "Parse error");
}

TEST(JsonRpc, DistinguishesRequestsFromNotifications) {
    auto req = jsonrpc::parseMessage(R"({"jsonrpc":"2.0","id":"abc","method":"roots/list"})");
    ASSERT_TRUE(std::holds_alternative<jsonrpc::Request>(req));
    EXPECT_EQ(std::get<jsonrpc::Request>(req).method, "roots/list");
    EXPECT_TRUE(jsonrpc::responseId(req).is_null());

    auto note = jsonrpc::parseMessage(R"({"jsonrpc":"2.0","method":"notifications/progress","params":{"p":1}})");
    ASSERT_TRUE(std::holds_alternative<jsonrpc::Notification>(note));
    EXPECT_EQ(std::get<jsonrpc::Notification>(note).params["p"], 1);
}

TEST(JsonRpc, RejectsMalformedLines) {
    EXPECT_THROW(jsonrpc::parseMessage("not json"), MalformedResponseError);
    EXPECT_THROW(jsonrpc::parseMessage("[1,2,3]"), MalformedResponseError);
    EXPECT_THROW(jsonrpc::parseMessage(R"({"id":1,"result":{}})"), MalformedResponseError);
    EXPECT_THROW(jsonrpc::parseMessage(R"({"jsonrpc":"1.0","id":1,"result":{}})"), MalformedResponseError);
    EXPECT_THROW(jsonrpc::parseMessage(R"({"jsonrpc":"2.0","id":1.5,"result":{}})"), MalformedResponseError);
}

TEST(JsonRpc, SerializedRequestIsSingleLine) {
    nlohmann::json params = {{"name", "echo"}, {"arguments", {{"text", "a\nb"}}}};
    std::string line = jsonrpc::serialize(jsonrpc::makeRequest(3, "tools/call", params));
    EXPECT_EQ(line.find('\n'), std::string::npos);

    auto j = nlohmann::json::parse(line);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 3);
    EXPECT_EQ(j["method"], "tools/call");
    EXPECT_EQ(j["params"]["arguments"]["text"], "a\nb");
}

TEST(JsonRpc, NotificationWithoutParamsOmitsThem) {
    auto j = nlohmann::json::parse(jsonrpc::serialize(jsonrpc::makeNotification("notifications/initialized")));
    EXPECT_EQ(j["method"], "notifications/initialized");
    EXPECT_FALSE(j.contains("id"));
    EXPECT_FALSE(j.contains("params"));
}
