#include <gtest/gtest.h>

#include "json_codec.hpp"

#include <string>

using rpcstdio::json;
using rpcstdio::Notification;
using rpcstdio::Request;
using rpcstdio::RequestId;
using rpcstdio::Response;
namespace codec = rpcstdio::codec;

TEST(JsonCodec, DecodesResultResponse) {
    auto message = codec::decode_message(R"({"jsonrpc":"2.0","id":7,"result":{"value":[1,2]}})");
    ASSERT_TRUE(message.has_value());

    const auto* response = std::get_if<Response>(&*message);
    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->id, RequestId{int64_t{7}});
    ASSERT_TRUE(response->result.has_value());
    EXPECT_EQ((*response->result)["value"], json::array({1, 2}));
    EXPECT_FALSE(response->error.has_value());
}

TEST(JsonCodec, NullResultIsStillAResult) {
    auto message = codec::decode_message(R"({"jsonrpc":"2.0","id":"abc","result":null})");
    ASSERT_TRUE(message.has_value());

    const auto* response = std::get_if<Response>(&*message);
    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->id, RequestId{std::string("abc")});
    ASSERT_TRUE(response->result.has_value());
    EXPECT_TRUE(response->result->is_null());
}

TEST(JsonCodec, DecodesErrorResponseWithData) {
    auto message = codec::decode_message(
        R"({"jsonrpc":"2.0","id":2,"error":{"code":-32602,"message":"Invalid params","data":{"field":"uri"}}})");
    ASSERT_TRUE(message.has_value());

    const auto* response = std::get_if<Response>(&*message);
    ASSERT_NE(response, nullptr);
    ASSERT_TRUE(response->error.has_value());
    EXPECT_EQ(response->error->code, -32602);
    EXPECT_EQ(response->error->message, "Invalid params");
    ASSERT_TRUE(response->error->data.has_value());
    EXPECT_EQ((*response->error->data)["field"], "uri");
}

TEST(JsonCodec, DecodesNotificationAndPeerRequest) {
    auto notification = codec::decode_message(R"({"jsonrpc":"2.0","method":"window/logMessage","params":{"type":3}})");
    ASSERT_TRUE(notification.has_value());
    ASSERT_TRUE(std::holds_alternative<Notification>(*notification));
    EXPECT_EQ(std::get<Notification>(*notification).method, "window/logMessage");

    auto request = codec::decode_message(R"({"jsonrpc":"2.0","id":0,"method":"workspace/configuration"})");
    ASSERT_TRUE(request.has_value());
    ASSERT_TRUE(std::holds_alternative<Request>(*request));
    EXPECT_FALSE(std::get<Request>(*request).params.has_value());
}

TEST(JsonCodec, RejectsInvalidShapes) {
    const char* payloads[] = {
        "{not json",
        "[1,2,3]",
        "\"text\"",
        R"({"jsonrpc":"2.0"})",
        R"({"jsonrpc":"1.0","id":1,"result":1})",
        R"({"jsonrpc":"2.0","id":null,"result":1})",
        R"({"jsonrpc":"2.0","id":1.5,"result":1})",
        R"({"jsonrpc":"2.0","id":{"x":1},"result":1})",
        R"({"jsonrpc":"2.0","id":1})",
        R"({"jsonrpc":"2.0","id":1,"result":1,"error":{"code":1,"message":"x"}})",
        R"({"jsonrpc":"2.0","id":1,"error":"bad"})",
        R"({"jsonrpc":"2.0","id":1,"error":{"code":"1","message":"x"}})",
        R"({"jsonrpc":"2.0","id":1,"error":{"code":1}})",
        R"({"jsonrpc":"2.0","method":5})",
    };

    for (const char* payload : payloads) {
        EXPECT_FALSE(codec::decode_message(payload).has_value()) << payload;
    }
}

TEST(JsonCodec, MissingVersionIsTolerated) {
    auto message = codec::decode_message(R"({"id":3,"result":true})");
    ASSERT_TRUE(message.has_value());
    EXPECT_TRUE(std::holds_alternative<Response>(*message));
}

TEST(JsonCodec, EncodesRequestWithoutParams) {
    json encoded = codec::encode(Request{RequestId{int64_t{4}}, "shutdown", std::nullopt});

    EXPECT_EQ(encoded, json({{"jsonrpc", "2.0"}, {"id", 4}, {"method", "shutdown"}}));
    EXPECT_FALSE(encoded.contains("params"));
}

TEST(JsonCodec, EncodesNotificationWithoutId) {
    json encoded = codec::encode(Notification{"notifications/initialized", json::object()});

    EXPECT_FALSE(encoded.contains("id"));
    EXPECT_EQ(encoded["method"], "notifications/initialized");
    EXPECT_EQ(encoded["params"], json::object());
}

TEST(JsonCodec, EncodesErrorResponse) {
    Response response{RequestId{std::string("t-1")}, std::nullopt,
                      rpcstdio::ErrorObject{-32601, "Method not found", std::nullopt}};
    json encoded = codec::encode(response);

    EXPECT_EQ(encoded["id"], "t-1");
    EXPECT_EQ(encoded["error"]["code"], -32601);
    EXPECT_FALSE(encoded["error"].contains("data"));
    EXPECT_FALSE(encoded.contains("result"));
}

TEST(JsonCodec, IdHelpers) {
    EXPECT_EQ(rpcstdio::to_string(RequestId{int64_t{12}}), "12");
    EXPECT_EQ(rpcstdio::to_string(RequestId{std::string("x")}), "x");
    EXPECT_FALSE(codec::id_from_json(json(true)).has_value());
    EXPECT_EQ(codec::id_to_json(RequestId{int64_t{5}}), json(5));
}
