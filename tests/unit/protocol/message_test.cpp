#include <gtest/gtest.h>
#include <mcpbridge/protocol/message.h>

using namespace mcpbridge;
using namespace mcpbridge::protocol;

TEST(ProtocolMessage, DecodesRequestResponseAndNotification) {
    auto req = decodeMessage(R"({"jsonrpc":"2.0","id":7,"method":"tools/list","params":{"cursor":"a"}})");
    ASSERT_TRUE(req);
    ASSERT_TRUE(std::holds_alternative<Request>(req.value()));
    const auto& r = std::get<Request>(req.value());
    EXPECT_EQ(r.id, 7);
    EXPECT_EQ(r.method, "tools/list");
    EXPECT_EQ(r.params["cursor"], "a");

    auto resp = decodeMessage(R"({"jsonrpc":"2.0","id":3,"result":{"tools":[]}})");
    ASSERT_TRUE(resp);
    ASSERT_TRUE(std::holds_alternative<Response>(resp.value()));
    EXPECT_FALSE(std::get<Response>(resp.value()).isError());
    EXPECT_EQ(std::get<Response>(resp.value()).id, 3);

    auto note = decodeMessage(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    ASSERT_TRUE(note);
    ASSERT_TRUE(std::holds_alternative<Notification>(note.value()));
    EXPECT_TRUE(std::get<Notification>(note.value()).params.is_object());
}

TEST(ProtocolMessage, DecodesErrorResponse) {
    auto msg = decodeMessage(
        R"({"jsonrpc":"2.0","id":4,"error":{"code":-32601,"message":"nope","data":{"x":1}}})");
    ASSERT_TRUE(msg);
    const auto& resp = std::get<Response>(msg.value());
    ASSERT_TRUE(resp.isError());
    EXPECT_EQ(resp.error->code, METHOD_NOT_FOUND);
    EXPECT_EQ(resp.error->message, "nope");
    ASSERT_TRUE(resp.error->data.has_value());
    EXPECT_EQ((*resp.error->data)["x"], 1);
}

TEST(ProtocolMessage, MalformedInputIsProtocolViolation) {
    const char* bad[] = {
        "",
        "{not json",
        "[1,2,3]",
        R"({"id":1,"method":"ping"})",
        R"({"jsonrpc":"1.0","id":1,"method":"ping"})",
        R"({"jsonrpc":"2.0","id":"abc","method":"ping"})",
        R"({"jsonrpc":"2.0","id":1})",
        R"({"jsonrpc":"2.0","id":1,"result":{},"error":{"code":1,"message":"x"}})",
        R"({"jsonrpc":"2.0","id":1,"error":{"message":"no code"}})",
        R"({"jsonrpc":"2.0"})",
    };
    for (const char* line : bad) {
        auto msg = decodeMessage(line);
        ASSERT_FALSE(msg) << line;
        EXPECT_EQ(msg.error().code, ErrorCode::ProtocolViolation) << line;
    }
}

TEST(ProtocolMessage, EncodedFrameIsOneLine) {
    Request req{12, "tools/call",
                json{{"name", "echo"}, {"arguments", {{"text", "line one\nline two\r\n"}}}}};
    auto frame = encodeFrame(req);
    ASSERT_FALSE(frame.empty());
    EXPECT_EQ(frame.back(), '\n');
    EXPECT_EQ(frame.find('\n'), frame.size() - 1);

    auto decoded = decodeMessage(std::string_view(frame).substr(0, frame.size() - 1));
    ASSERT_TRUE(decoded);
    const auto& back = std::get<Request>(decoded.value());
    EXPECT_EQ(back.params["arguments"]["text"], "line one\nline two\r\n");
}

TEST(ProtocolMessage, NotificationCarriesNoId) {
    auto j = toJson(Notification{std::string(METHOD_INITIALIZED), json::object()});
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_FALSE(j.contains("id"));
    EXPECT_EQ(j["method"], "notifications/initialized");
}

TEST(ProtocolMessage, ErrorResponseSerializesWithoutResult) {
    auto j = toJson(makeError(5, INTERNAL_ERROR, "boom"));
    EXPECT_EQ(j["id"], 5);
    EXPECT_FALSE(j.contains("result"));
    EXPECT_EQ(j["error"]["code"], INTERNAL_ERROR);
    EXPECT_EQ(j["error"]["message"], "boom");
}

TEST(ProtocolMessage, DescribeNamesKindAndId) {
    EXPECT_EQ(describe(Request{9, "ping", json::object()}), "request #9 ping");
    EXPECT_EQ(describe(makeResult(9, json::object())), "response #9");
    EXPECT_EQ(describe(makeError(9, -1, "x")), "error response #9");
}

TEST(ProtocolMessage, WronglyTypedErrorMembersAreProtocolViolation) {
    const char* bad[] = {
        R"({"jsonrpc":"2.0","id":1,"error":{"code":1,"message":5}})",
        R"({"jsonrpc":"2.0","id":1,"error":{"code":1,"message":{"text":"x"}}})",
        R"({"jsonrpc":"2.0","id":1,"error":{"code":"1","message":"x"}})",
        R"({"jsonrpc":"2.0","id":1,"error":{"code":1.5,"message":"x"}})",
        R"({"jsonrpc":"2.0","id":1,"error":{"code":18446744073709551615,"message":"x"}})",
    };
    for (const char* line : bad) {
        auto msg = decodeMessage(line);
        ASSERT_FALSE(msg) << line;
        EXPECT_EQ(msg.error().code, ErrorCode::ProtocolViolation) << line;
    }
}

TEST(ProtocolMessage, WideErrorCodesAreNotTruncated) {
    auto msg = decodeMessage(R"({"jsonrpc":"2.0","id":2,"error":{"code":4294967296,"message":"wide"}})");
    ASSERT_TRUE(msg) << msg.error().message;
    const auto& resp = std::get<Response>(msg.value());
    ASSERT_TRUE(resp.isError());
    EXPECT_EQ(resp.error->code, int64_t{4294967296});
    EXPECT_EQ(toJson(resp)["error"]["code"], int64_t{4294967296});

    auto missingMessage = decodeMessage(R"({"jsonrpc":"2.0","id":3,"error":{"code":-5}})");
    ASSERT_TRUE(missingMessage);
    EXPECT_EQ(std::get<Response>(missingMessage.value()).error->message, "");
}
