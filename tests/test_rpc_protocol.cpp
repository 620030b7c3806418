// =============================================================================
// Unit tests for rpc_protocol.hpp (framing codec + LineBuffer)
// =============================================================================
#include <gtest/gtest.h>
#include "rpc_protocol.hpp"

using namespace phonebridge;
using namespace phonebridge::rpc;

// ---------------------------------------------------------------------------
// decode_request
// ---------------------------------------------------------------------------
TEST(RpcProtocolTest, DecodeValidRequest) {
    auto r = decode_request(R"({"id": 7, "method": "tap", "params": {"x": 10, "y": 20}})");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().id, 7);
    EXPECT_EQ(r.value().method, "tap");
    EXPECT_EQ(r.value().params["x"], 10);
}

TEST(RpcProtocolTest, DecodeMissingParamsIsEmptyObject) {
    auto r = decode_request(R"({"id": "abc", "method": "get_tree"})");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().id, "abc");
    EXPECT_TRUE(r.value().params.is_object());
    EXPECT_TRUE(r.value().params.empty());
}

TEST(RpcProtocolTest, DecodeMissingIdIsNull) {
    auto r = decode_request(R"({"method": "get_tree"})");
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value().id.is_null());
}

TEST(RpcProtocolTest, DecodeInvalidJson) {
    auto r = decode_request("{not json");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().message, "Invalid JSON payload");
    EXPECT_EQ(r.error().kind, ErrorKind::Framing);
    EXPECT_TRUE(r.error().id.is_null());
}

TEST(RpcProtocolTest, DecodeNonObject) {
    auto r = decode_request("[1, 2, 3]");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().message, "Invalid JSON payload");
}

TEST(RpcProtocolTest, DecodeMissingMethodKeepsId) {
    auto r = decode_request(R"({"id": 3})");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().message, "Missing 'method' field");
    EXPECT_EQ(r.error().id, 3);
}

TEST(RpcProtocolTest, DecodeNonStringMethod) {
    auto r = decode_request(R"({"id": 4, "method": 12})");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().message, "Field 'method' must be a string");
    EXPECT_EQ(r.error().id, 4);
}

TEST(RpcProtocolTest, DecodeNonObjectParams) {
    auto r = decode_request(R"({"id": 5, "method": "tap", "params": [1]})");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().message, "Field 'params' must be an object");
    EXPECT_EQ(r.error().id, 5);
}

// ---------------------------------------------------------------------------
// encode
// ---------------------------------------------------------------------------
TEST(RpcProtocolTest, EncodeSuccessIsSingleLine) {
    std::string line = encode_response(Response::success(1, {{"tree", "Hierarchy\n  node"}}));
    ASSERT_FALSE(line.empty());
    EXPECT_EQ(line.back(), '\n');
    EXPECT_EQ(line.find('\n'), line.size() - 1);

    json j = json::parse(line);
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["result"]["tree"], "Hierarchy\n  node");
    EXPECT_FALSE(j.contains("error"));
}

TEST(RpcProtocolTest, EncodeFailure) {
    json j = json::parse(encode_response(Response::failure("req-9", "Unsupported command: fly")));
    EXPECT_EQ(j["id"], "req-9");
    EXPECT_EQ(j["error"]["message"], "Unsupported command: fly");
    EXPECT_FALSE(j.contains("result"));
}

TEST(RpcProtocolTest, EncodeNullIdIsPresent) {
    json j = json::parse(encode_response(Response::failure(nullptr, "Invalid JSON payload")));
    ASSERT_TRUE(j.contains("id"));
    EXPECT_TRUE(j["id"].is_null());
}

TEST(RpcProtocolTest, EncodeInvalidUtf8IsReplaced) {
    std::string line = encode_response(Response::success(1, {{"tree", std::string("a\xFF" "b")}}));
    json j = json::parse(line, nullptr, false);
    EXPECT_FALSE(j.is_discarded());
}

TEST(RpcProtocolTest, EncodeRequest) {
    Request req;
    req.id = 2;
    req.method = "swipe";
    req.params = {{"direction", "up"}};
    json j = json::parse(encode_request(req));
    EXPECT_EQ(j["id"], 2);
    EXPECT_EQ(j["method"], "swipe");
    EXPECT_EQ(j["params"]["direction"], "up");
}

// ---------------------------------------------------------------------------
// decode_response
// ---------------------------------------------------------------------------
TEST(RpcProtocolTest, DecodeResponseSuccess) {
    auto r = decode_response(R"({"id": 1, "result": {"ok": true}})");
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value().is_error());
    EXPECT_EQ(r.value().result["ok"], true);
}

TEST(RpcProtocolTest, DecodeResponseError) {
    auto r = decode_response(R"({"id": 1, "error": {"message": "No API key found"}})");
    ASSERT_TRUE(r.is_ok());
    ASSERT_TRUE(r.value().is_error());
    EXPECT_EQ(*r.value().error_message, "No API key found");
}

TEST(RpcProtocolTest, DecodeResponseGarbage) {
    auto r = decode_response("<html>");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().message, "Invalid JSON response. Head=<html>");
}

TEST(RpcProtocolTest, DecodeResponseNeitherResultNorError) {
    auto r = decode_response(R"({"id": 1})");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().message, "Response has neither 'result' nor 'error'");
}

// ---------------------------------------------------------------------------
// LineBuffer
// ---------------------------------------------------------------------------
TEST(LineBufferTest, TwoLinesInOneChunk) {
    LineBuffer buf;
    std::string data = "{\"id\":1}\n{\"id\":2}\n";
    buf.append(data.data(), data.size());

    auto a = buf.next_line();
    auto b = buf.next_line();
    ASSERT_TRUE(a && b);
    EXPECT_EQ(*a, "{\"id\":1}");
    EXPECT_EQ(*b, "{\"id\":2}");
    EXPECT_FALSE(buf.next_line().has_value());
    EXPECT_EQ(buf.pending(), 0u);
}

TEST(LineBufferTest, LineSplitAcrossChunks) {
    LineBuffer buf;
    buf.append("{\"id\":", 6);
    EXPECT_FALSE(buf.next_line().has_value());
    buf.append("1}\r\n{\"id", 8);

    auto a = buf.next_line();
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(*a, "{\"id\":1}");
    EXPECT_FALSE(buf.next_line().has_value());
    EXPECT_EQ(buf.pending(), 4u);
}

TEST(LineBufferTest, EmptyLines) {
    LineBuffer buf;
    buf.append("\n\n", 2);
    auto a = buf.next_line();
    ASSERT_TRUE(a.has_value());
    EXPECT_TRUE(a->empty());
}

TEST(LineBufferTest, Overflow) {
    LineBuffer buf(16);
    std::string big(17, 'x');
    buf.append(big.data(), big.size());
    EXPECT_TRUE(buf.overflowed());

    buf.clear();
    EXPECT_FALSE(buf.overflowed());
    std::string ok(16, 'x');
    buf.append(ok.data(), ok.size());
    EXPECT_FALSE(buf.overflowed());
}

TEST(LineBufferTest, CompleteLineNotOverflow) {
    LineBuffer buf(8);
    std::string data = "0123456789\n";
    buf.append(data.data(), data.size());
    EXPECT_FALSE(buf.overflowed());
    EXPECT_EQ(*buf.next_line(), "0123456789");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
