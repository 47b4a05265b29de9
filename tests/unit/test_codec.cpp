#include <gtest/gtest.h>
#include "mcpfs/codec.hpp"
#include "mcpfs/error.hpp"
#include <cstdint>
#include <limits>

using namespace mcpfs;

// ---- Parse tests ----

TEST(CodecParse, ValidRequest) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<int64_t>(req.id), 1);
    EXPECT_EQ(req.method, "initialize");
    ASSERT_TRUE(req.params.has_value());
    EXPECT_TRUE(req.params->is_object());
}

TEST(CodecParse, ValidRequestStringId) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":"abc-123","method":"mcp.list_tools"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<std::string>(req.id), "abc-123");
    EXPECT_FALSE(req.params.has_value());
}

TEST(CodecParse, NullIdIsStillARequest) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":null,"method":"ping"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(std::get<JsonRpcRequest>(msg).id));
}

TEST(CodecParse, LargeAndFractionalIds) {
    auto big = Codec::parse(R"({"jsonrpc":"2.0","id":18446744073709551615,"method":"ping"})");
    EXPECT_EQ(std::get<uint64_t>(std::get<JsonRpcRequest>(big).id),
              std::numeric_limits<uint64_t>::max());

    auto neg = Codec::parse(R"({"jsonrpc":"2.0","id":-5,"method":"ping"})");
    EXPECT_EQ(std::get<int64_t>(std::get<JsonRpcRequest>(neg).id), -5);

    auto frac = Codec::parse(R"({"jsonrpc":"2.0","id":1.5,"method":"ping"})");
    EXPECT_DOUBLE_EQ(std::get<double>(std::get<JsonRpcRequest>(frac).id), 1.5);
}

TEST(CodecParse, ValidNotification) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcNotification>(msg));
    EXPECT_EQ(std::get<JsonRpcNotification>(msg).method, "notifications/initialized");
}

TEST(CodecParse, IdlessFrameOutsideNotificationsIsRequest) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","method":"mcp.list_tools"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    const auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(req.method, "mcp.list_tools");
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(req.id));
}

TEST(CodecParse, InvalidJson) {
    EXPECT_THROW(Codec::parse("{invalid json"), McpParseError);
    EXPECT_THROW(Codec::parse(""), McpParseError);
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"ping"} extra)"), McpParseError);
}

TEST(CodecParse, NonObjectIsParseError) {
    EXPECT_THROW(Codec::parse("[1,2,3]"), McpParseError);
    EXPECT_THROW(Codec::parse("42"), McpParseError);
}

TEST(CodecParse, BadIdOrMethodTypeIsParseError) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":{"x":1},"method":"ping"})"), McpParseError);
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":7})"), McpParseError);
}

TEST(CodecParse, MissingJsonrpcIsInvalidRequest) {
    try {
        (void)Codec::parse(R"({"id":9,"method":"ping"})");
        FAIL() << "expected McpProtocolError";
    } catch (const McpProtocolError& e) {
        EXPECT_EQ(e.code, error::InvalidRequest);
        ASSERT_TRUE(e.id.has_value());
        EXPECT_EQ(*e.id, 9);
    }
}

TEST(CodecParse, WrongJsonrpcVersion) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"1.0","id":1,"method":"ping"})"), McpProtocolError);
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":2,"id":1,"method":"ping"})"), McpProtocolError);
}

TEST(CodecParse, MissingMethod) {
    try {
        (void)Codec::parse(R"({"jsonrpc":"2.0","id":"q"})");
        FAIL() << "expected McpProtocolError";
    } catch (const McpProtocolError& e) {
        EXPECT_EQ(e.code, error::InvalidRequest);
        EXPECT_EQ(*e.id, "q");
    }
}

// ---- Serialize tests ----

TEST(CodecSerialize, ResultResponse) {
    JsonRpcResponse resp;
    resp.id = int64_t{3};
    resp.result = nlohmann::json{{"tools", nlohmann::json::array()}};
    auto j = nlohmann::json::parse(Codec::serialize(resp));
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 3);
    EXPECT_TRUE(j["result"]["tools"].is_array());
    EXPECT_FALSE(j.contains("error"));
}

TEST(CodecSerialize, ErrorResponseOmitsResult) {
    JsonRpcResponse resp;
    resp.id = std::string("x");
    resp.error = JsonRpcError{error::MethodNotFound, "Method not found: nope", std::nullopt};
    auto j = nlohmann::json::parse(Codec::serialize(resp));
    EXPECT_EQ(j["id"], "x");
    EXPECT_EQ(j["error"]["code"], -32601);
    EXPECT_FALSE(j.contains("result"));
    EXPECT_FALSE(j["error"].contains("data"));
}

TEST(CodecSerialize, NullIdAndEmptyResult) {
    JsonRpcResponse resp;
    resp.id = nullptr;
    auto j = nlohmann::json::parse(Codec::serialize(resp));
    EXPECT_TRUE(j["id"].is_null());
    EXPECT_TRUE(j["result"].is_object());
}

TEST(CodecSerialize, IdsEchoVerbatim) {
    for (const char* raw : {R"("abc")", "0", "-7", "18446744073709551615", "2.5"}) {
        std::string frame = std::string(R"({"jsonrpc":"2.0","method":"ping","id":)") + raw + "}";
        auto req = std::get<JsonRpcRequest>(Codec::parse(frame));
        JsonRpcResponse resp;
        resp.id = req.id;
        auto out = nlohmann::json::parse(Codec::serialize(resp));
        EXPECT_EQ(out["id"], nlohmann::json::parse(raw)) << raw;
    }
}

TEST(CodecSerialize, InvalidUtf8IsReplaced) {
    nlohmann::json j = std::string("bad \xff byte");
    std::string out;
    EXPECT_NO_THROW(out = Codec::dump(j));
    EXPECT_NE(out.find("bad"), std::string::npos);
}

TEST(CodecSerialize, OutputIsSingleLine) {
    JsonRpcResponse resp;
    resp.id = int64_t{1};
    resp.result = nlohmann::json{{"text", "line1\nline2"}};
    EXPECT_EQ(Codec::serialize(resp).find('\n'), std::string::npos);
}
