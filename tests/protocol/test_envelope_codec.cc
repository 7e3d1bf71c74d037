/**
 * @file test_envelope_codec.cc
 * @brief Decode/encode tests for the JSON-RPC envelope codec
 */

#include <string>

#include <gtest/gtest.h>

#include "mcpgate/protocol/envelope_codec.h"

namespace mcpgate {
namespace protocol {
namespace {

class EnvelopeCodecTest : public ::testing::Test {
 protected:
  RequestEnvelope decodeOk(const std::string& frame) {
    auto result = codec_.decode(frame);
    EXPECT_TRUE(std::holds_alternative<RequestEnvelope>(result)) << frame;
    if (auto* request = std::get_if<RequestEnvelope>(&result)) {
      return *request;
    }
    return RequestEnvelope();
  }

  DecodeFailure decodeFail(const std::string& frame) {
    auto result = codec_.decode(frame);
    EXPECT_TRUE(std::holds_alternative<DecodeFailure>(result)) << frame;
    if (auto* failure = std::get_if<DecodeFailure>(&result)) {
      return *failure;
    }
    return DecodeFailure{DecodeErrorKind::InvalidShape, nullptr, ""};
  }

  EnvelopeCodec codec_;
};

TEST_F(EnvelopeCodecTest, DecodesMinimalRequest) {
  auto request = decodeOk(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");

  EXPECT_EQ(request.id, RequestId(int64_t(1)));
  EXPECT_EQ(request.method, "tools/list");
  EXPECT_TRUE(request.params.is_object());
  EXPECT_TRUE(request.params.empty());
}

TEST_F(EnvelopeCodecTest, AcceptsStringNullAndFloatIds) {
  EXPECT_EQ(decodeOk(R"({"id":"abc","method":"m"})").id,
            RequestId(std::string("abc")));
  EXPECT_EQ(decodeOk(R"({"id":null,"method":"m"})").id, RequestId(nullptr));
  EXPECT_EQ(decodeOk(R"({"method":"m"})").id, RequestId(nullptr));
  EXPECT_EQ(decodeOk(R"({"id":1.5,"method":"m"})").id, RequestId(1.5));
}

TEST_F(EnvelopeCodecTest, JsonrpcMemberIsOptional) {
  EXPECT_EQ(decodeOk(R"({"id":2,"method":"initialize"})").method,
            "initialize");
}

TEST_F(EnvelopeCodecTest, KeepsObjectParams) {
  auto request = decodeOk(
      R"({"id":3,"method":"tools/call","params":{"name":"x","arguments":{"limit":5}}})");

  EXPECT_EQ(request.params["name"], "x");
  EXPECT_EQ(request.params["arguments"]["limit"], 5);
}

TEST_F(EnvelopeCodecTest, NullParamsBecomeEmptyObject) {
  auto request = decodeOk(R"({"id":3,"method":"m","params":null})");
  EXPECT_TRUE(request.params.is_object());
}

TEST_F(EnvelopeCodecTest, TrimsAndBoundsMethodName) {
  EXPECT_EQ(decodeOk(R"({"id":1,"method":"  tools/list \n"})").method,
            "tools/list");

  std::string long_method(150, 'a');
  auto request =
      decodeOk(R"({"id":1,"method":")" + long_method + R"("})");
  EXPECT_EQ(request.method, std::string(100, 'a'));
}

TEST_F(EnvelopeCodecTest, MethodBoundNeverSplitsUtf8) {
  // Two-byte character repeated; bound counts characters
  std::string method;
  for (int i = 0; i < 5; ++i) {
    method += "\xc3\xa9";
  }
  EXPECT_EQ(boundMethodName(method, 3), "\xc3\xa9\xc3\xa9\xc3\xa9");
  EXPECT_EQ(boundMethodName("   ", 10), "");
}

TEST_F(EnvelopeCodecTest, OversizedMessageIsNotParsed) {
  // Valid JSON with a recoverable id, but too large
  std::string padding(10000, 'x');
  auto failure = decodeFail(R"({"id":9,"method":"m","pad":")" + padding +
                            R"("})");

  EXPECT_EQ(failure.kind, DecodeErrorKind::OversizedMessage);
  EXPECT_EQ(failure.id, RequestId(nullptr));
}

TEST_F(EnvelopeCodecTest, MessageAtLimitIsAccepted) {
  std::string prefix = R"({"id":1,"method":"m","pad":")";
  std::string suffix = R"("})";
  std::string frame =
      prefix + std::string(10000 - prefix.size() - suffix.size(), 'x') +
      suffix;
  ASSERT_EQ(frame.size(), 10000u);

  EXPECT_EQ(decodeOk(frame).method, "m");
}

TEST_F(EnvelopeCodecTest, CustomLimits) {
  EnvelopeCodec small(CodecLimits{32, 4});

  EXPECT_TRUE(std::holds_alternative<DecodeFailure>(
      small.decode(R"({"id":1,"method":"tools/list","params":{}})")));

  auto result = small.decode(R"({"method":"abcdefg"})");
  ASSERT_TRUE(std::holds_alternative<RequestEnvelope>(result));
  EXPECT_EQ(std::get<RequestEnvelope>(result).method, "abcd");
}

TEST_F(EnvelopeCodecTest, MalformedJson) {
  auto failure = decodeFail("{not json");
  EXPECT_EQ(failure.kind, DecodeErrorKind::MalformedSyntax);
  EXPECT_EQ(failure.id, RequestId(nullptr));

  EXPECT_EQ(decodeFail("").kind, DecodeErrorKind::MalformedSyntax);
}

TEST_F(EnvelopeCodecTest, NonObjectIsInvalidShape) {
  EXPECT_EQ(decodeFail("[1,2]").kind, DecodeErrorKind::InvalidShape);
  EXPECT_EQ(decodeFail("42").kind, DecodeErrorKind::InvalidShape);
  EXPECT_EQ(decodeFail("\"text\"").kind, DecodeErrorKind::InvalidShape);
}

TEST_F(EnvelopeCodecTest, MissingMethodKeepsId) {
  auto failure = decodeFail(R"({"jsonrpc":"2.0","id":7})");

  EXPECT_EQ(failure.kind, DecodeErrorKind::InvalidShape);
  EXPECT_EQ(failure.id, RequestId(int64_t(7)));

  EXPECT_EQ(decodeFail(R"({"id":"x","method":null})").id,
            RequestId(std::string("x")));
  EXPECT_EQ(decodeFail(R"({"id":"x","method":{"a":1}})").kind,
            DecodeErrorKind::InvalidShape);
  EXPECT_EQ(decodeFail(R"({"id":"x","method":["m"]})").kind,
            DecodeErrorKind::InvalidShape);
}

TEST_F(EnvelopeCodecTest, ScalarMethodIsCoercedToText) {
  auto request = decodeOk(R"({"id":7,"method":42})");
  EXPECT_EQ(request.method, "42");
  EXPECT_EQ(request.id, RequestId(int64_t(7)));

  EXPECT_EQ(decodeOk(R"({"id":1,"method":true})").method, "true");
  EXPECT_EQ(decodeOk(R"({"id":1,"method":-3})").method, "-3");
}

TEST_F(EnvelopeCodecTest, InvalidIdTypes) {
  for (const char* frame : {R"({"id":true,"method":"m"})",
                            R"({"id":{},"method":"m"})",
                            R"({"id":[1],"method":"m"})"}) {
    auto failure = decodeFail(frame);
    EXPECT_EQ(failure.kind, DecodeErrorKind::InvalidShape) << frame;
    EXPECT_EQ(failure.id, RequestId(nullptr)) << frame;
  }
}

TEST_F(EnvelopeCodecTest, WrongJsonrpcVersion) {
  auto failure = decodeFail(R"({"jsonrpc":"1.0","id":4,"method":"m"})");
  EXPECT_EQ(failure.kind, DecodeErrorKind::InvalidShape);
  EXPECT_EQ(failure.id, RequestId(int64_t(4)));
}

TEST_F(EnvelopeCodecTest, NonObjectParams) {
  auto failure = decodeFail(R"({"id":5,"method":"m","params":[1,2]})");
  EXPECT_EQ(failure.kind, DecodeErrorKind::InvalidShape);
  EXPECT_EQ(failure.id, RequestId(int64_t(5)));
}

TEST_F(EnvelopeCodecTest, EncodeSuccessKeepsMemberOrder) {
  auto out = codec_.encode(ResponseEnvelope::success(
      RequestId(int64_t(1)), {{"tools", nlohmann::json::array()}}));

  EXPECT_EQ(out, R"({"jsonrpc":"2.0","id":1,"result":{"tools":[]}})");
}

TEST_F(EnvelopeCodecTest, EncodeError) {
  auto out = codec_.encode(ResponseEnvelope::failure(
      RequestId(std::string("a")), jsonrpc::METHOD_NOT_FOUND,
      "Method not found: foo"));

  EXPECT_EQ(
      out,
      R"({"jsonrpc":"2.0","id":"a","error":{"code":-32601,"message":"Method not found: foo"}})");
}

TEST_F(EnvelopeCodecTest, EncodeNullId) {
  auto out = codec_.encode(
      ResponseEnvelope::failure(nullptr, jsonrpc::PARSE_ERROR, "Invalid JSON format"));

  EXPECT_EQ(
      out,
      R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"Invalid JSON format"}})");
}

TEST_F(EnvelopeCodecTest, DecodedIdEchoesBack) {
  auto request = decodeOk(R"({"id":"req-42","method":"initialize"})");
  auto out =
      codec_.encode(ResponseEnvelope::success(request.id, nlohmann::json::object()));

  auto parsed = nlohmann::json::parse(out);
  EXPECT_EQ(parsed["id"], "req-42");
  EXPECT_FALSE(parsed.contains("error"));
}

TEST_F(EnvelopeCodecTest, ErrorKindNames) {
  EXPECT_STREQ(decodeErrorKindName(DecodeErrorKind::OversizedMessage),
               "OversizedMessage");
  EXPECT_STREQ(decodeErrorKindName(DecodeErrorKind::MalformedSyntax),
               "MalformedSyntax");
  EXPECT_STREQ(decodeErrorKindName(DecodeErrorKind::InvalidShape),
               "InvalidShape");
}

}  // namespace
}  // namespace protocol
}  // namespace mcpgate
