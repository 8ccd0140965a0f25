// =============================================================================
// Envelope Codec Unit Tests
// Validates request encoding and classification of inbound frames
// =============================================================================

#include <string>
#include <variant>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "protocol.hpp"

using nlohmann::json;

// -----------------------------------------------------------------------------
// EncodeRequest_WritesAllEnvelopeFields
// -----------------------------------------------------------------------------
TEST(CodecTest, EncodeRequest_WritesAllEnvelopeFields) {
    protocol::Request request;
    request.seq = 7;
    request.opcode = 64;
    request.payload = {{"chatId", 42}, {"message", {{"text", "hi"}}}};

    auto envelope = json::parse(protocol::encode(request));
    EXPECT_EQ(envelope.at("ver"), 11);
    EXPECT_EQ(envelope.at("cmd"), 0);
    EXPECT_EQ(envelope.at("seq"), 7);
    EXPECT_EQ(envelope.at("opcode"), 64);
    EXPECT_EQ(envelope.at("payload").at("message").at("text"), "hi");
}

// -----------------------------------------------------------------------------
// EncodeRequest_NullPayload_BecomesEmptyObject
// -----------------------------------------------------------------------------
TEST(CodecTest, EncodeRequest_NullPayload_BecomesEmptyObject) {
    protocol::Request request;
    request.opcode = 6;
    request.payload = nullptr;

    auto envelope = json::parse(protocol::encode(request));
    EXPECT_TRUE(envelope.at("payload").is_object());
    EXPECT_TRUE(envelope.at("payload").empty());
}

// -----------------------------------------------------------------------------
// DecodeOkResponse_ReturnsResponse
// -----------------------------------------------------------------------------
TEST(CodecTest, DecodeOkResponse_ReturnsResponse) {
    auto frame = protocol::decode(R"({"ver":11,"cmd":1,"seq":3,"opcode":48,"payload":{"chats":[]}})");

    ASSERT_TRUE(std::holds_alternative<protocol::Response>(frame));
    const auto& response = std::get<protocol::Response>(frame);
    EXPECT_EQ(response.seq, 3u);
    EXPECT_EQ(response.opcode, 48);
    EXPECT_TRUE(response.ok());
    EXPECT_TRUE(response.payload.at("chats").is_array());
}

// -----------------------------------------------------------------------------
// DecodeErrorResponse_CarriesStatus
// -----------------------------------------------------------------------------
TEST(CodecTest, DecodeErrorResponse_CarriesStatus) {
    auto frame = protocol::decode(
        R"({"ver":11,"cmd":3,"seq":9,"opcode":18,"payload":{"error":"verify.code.wrong"}})");

    ASSERT_TRUE(std::holds_alternative<protocol::Response>(frame));
    const auto& response = std::get<protocol::Response>(frame);
    EXPECT_EQ(response.status, protocol::kCmdError);
    EXPECT_FALSE(response.ok());
    EXPECT_EQ(response.payload.at("error"), "verify.code.wrong");
}

// -----------------------------------------------------------------------------
// DecodeWithoutSeq_ReturnsPush
// -----------------------------------------------------------------------------
TEST(CodecTest, DecodeWithoutSeq_ReturnsPush) {
    auto frame = protocol::decode(R"({"ver":11,"opcode":128,"payload":{"chatId":1}})");

    ASSERT_TRUE(std::holds_alternative<protocol::Push>(frame));
    const auto& push = std::get<protocol::Push>(frame);
    EXPECT_EQ(push.opcode, 128);
    EXPECT_FALSE(push.seq.has_value());
    EXPECT_EQ(push.payload.at("chatId"), 1);
}

// -----------------------------------------------------------------------------
// DecodeServerRequest_ReturnsRequest
// -----------------------------------------------------------------------------
TEST(CodecTest, DecodeServerRequest_ReturnsRequest) {
    auto frame = protocol::decode(R"({"ver":10,"cmd":0,"seq":5,"opcode":128,"payload":{}})");

    ASSERT_TRUE(std::holds_alternative<protocol::Request>(frame));
    const auto& request = std::get<protocol::Request>(frame);
    EXPECT_EQ(request.seq, 5u);
    EXPECT_EQ(request.opcode, 128);
    EXPECT_EQ(request.ver, 10);
}

// -----------------------------------------------------------------------------
// DecodeMissingPayload_YieldsEmptyObject
// -----------------------------------------------------------------------------
TEST(CodecTest, DecodeMissingPayload_YieldsEmptyObject) {
    auto frame = protocol::decode(R"({"cmd":1,"seq":1,"opcode":6})");
    const auto& response = std::get<protocol::Response>(frame);
    EXPECT_TRUE(response.payload.is_object());
    EXPECT_TRUE(response.payload.empty());
}

// -----------------------------------------------------------------------------
// DecodeUnknownOpcode_IsNotAnError
// -----------------------------------------------------------------------------
TEST(CodecTest, DecodeUnknownOpcode_IsNotAnError) {
    auto frame = protocol::decode(R"({"opcode":9999,"payload":{"x":1}})");
    EXPECT_EQ(std::get<protocol::Push>(frame).opcode, 9999);
}

// -----------------------------------------------------------------------------
// DecodeMalformed_ThrowsDecodeError
// -----------------------------------------------------------------------------
TEST(CodecTest, DecodeMalformed_ThrowsDecodeError) {
    EXPECT_THROW(protocol::decode("not json at all"), protocol::DecodeError);
    EXPECT_THROW(protocol::decode("[1,2,3]"), protocol::DecodeError);
    EXPECT_THROW(protocol::decode(R"({"seq":1,"cmd":1})"), protocol::DecodeError);
    EXPECT_THROW(protocol::decode(R"({"opcode":"64"})"), protocol::DecodeError);
    EXPECT_THROW(protocol::decode(R"({"opcode":64,"seq":"1"})"), protocol::DecodeError);
    EXPECT_THROW(protocol::decode(R"({"opcode":64,"seq":-1,"cmd":1})"), protocol::DecodeError);
}

// -----------------------------------------------------------------------------
// DecodeError_IsAProtocolError
// -----------------------------------------------------------------------------
TEST(CodecTest, DecodeError_IsAProtocolError) {
    EXPECT_THROW(protocol::decode("{"), protocol::ProtocolError);
}

// -----------------------------------------------------------------------------
// Describe_NamesFrameKind
// -----------------------------------------------------------------------------
TEST(CodecTest, Describe_NamesFrameKind) {
    EXPECT_EQ(protocol::describe(protocol::Frame{protocol::Push{128}}), "push opcode=128");
    EXPECT_EQ(protocol::describe(protocol::Frame{protocol::Response{3, 1, 48}}),
              "response seq=3 opcode=48 status=1");
}

// -----------------------------------------------------------------------------
// ServerError_ExposesPayloadFields
// -----------------------------------------------------------------------------
TEST(CodecTest, ServerError_ExposesPayloadFields) {
    protocol::ServerError error{3, 18, {{"error", "verify.code.wrong"},
                                        {"message", "Wrong code"},
                                        {"localizedMessage", "Неверный код"}}};
    EXPECT_EQ(error.status(), 3);
    EXPECT_EQ(error.opcode(), 18);
    EXPECT_EQ(error.code(), "verify.code.wrong");
    EXPECT_EQ(error.server_message(), "Wrong code");
    EXPECT_EQ(error.localized_message(), "Неверный код");
}
