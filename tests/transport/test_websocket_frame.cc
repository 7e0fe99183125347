#include <gtest/gtest.h>

#include "chatws/transport/close_code.h"
#include "chatws/transport/websocket_frame.h"

namespace chatws {
namespace transport {
namespace {

const uint8_t kMask[4] = {0x37, 0xfa, 0x21, 0x3d};

std::string serverFrame(OpCode opcode,
                        const std::string& payload,
                        bool fin = true) {
  return encodeFrame(opcode, payload, nullptr, fin);
}

class FrameDecoderTest : public ::testing::Test {
 protected:
  VoidResult feed(const std::string& bytes) {
    return decoder_.feed(bytes.data(), bytes.size(), messages_);
  }

  int errorCode(const VoidResult& result) {
    auto* error = getError(result);
    return error ? error->code : 0;
  }

  FrameDecoder decoder_{1024};
  std::vector<WebSocketMessage> messages_;
};

// RFC 6455 section 5.7 examples
TEST(EncodeFrameTest, UnmaskedText) {
  EXPECT_EQ(std::string("\x81\x05Hello", 7),
            encodeFrame(OpCode::Text, "Hello", nullptr));
}

TEST(EncodeFrameTest, MaskedText) {
  EXPECT_EQ(std::string("\x81\x85\x37\xfa\x21\x3d\x7f\x9f\x4d\x51\x58", 11),
            encodeFrame(OpCode::Text, "Hello", kMask));
}

TEST(EncodeFrameTest, ExtendedLengths) {
  std::string medium(256, 'a');
  auto frame = encodeFrame(OpCode::Binary, medium, nullptr);
  ASSERT_EQ(4u + 256u, frame.size());
  EXPECT_EQ(static_cast<char>(126), frame[1]);
  EXPECT_EQ(0x01, static_cast<uint8_t>(frame[2]));
  EXPECT_EQ(0x00, static_cast<uint8_t>(frame[3]));

  std::string large(65536, 'b');
  frame = encodeFrame(OpCode::Binary, large, kMask);
  ASSERT_EQ(14u + 65536u, frame.size());
  EXPECT_EQ(static_cast<char>(0x80 | 127), frame[1]);
  EXPECT_EQ(0x01, static_cast<uint8_t>(frame[7]));
  EXPECT_EQ(0x00, static_cast<uint8_t>(frame[8]));
  EXPECT_EQ(0x00, static_cast<uint8_t>(frame[9]));
}

TEST(EncodeFrameTest, ClientFramesAreMasked) {
  auto frame = encodeClientFrame(OpCode::Text, "payload");
  ASSERT_EQ(2u + 4u + 7u, frame.size());
  EXPECT_EQ(static_cast<char>(0x81), frame[0]);
  EXPECT_EQ(0x80 | 7, static_cast<uint8_t>(frame[1]));

  std::string unmasked;
  for (size_t i = 0; i < 7; ++i) {
    unmasked.push_back(static_cast<char>(frame[6 + i] ^ frame[2 + i % 4]));
  }
  EXPECT_EQ("payload", unmasked);
}

TEST(ClosePayloadTest, EncodeTruncatesReason) {
  auto payload = encodeClosePayload(1000, std::string(200, 'x'));
  EXPECT_EQ(kMaxControlPayload, payload.size());
  EXPECT_EQ(0x03, static_cast<uint8_t>(payload[0]));
  EXPECT_EQ(0xE8, static_cast<uint8_t>(payload[1]));
}

TEST(ClosePayloadTest, ParsesCodeAndReason) {
  auto parsed = parseClosePayload(encodeClosePayload(1011, "boom"));
  ASSERT_TRUE(isSuccess(parsed));
  EXPECT_EQ(1011, get<ClosePayload>(parsed).code);
  EXPECT_EQ("boom", get<ClosePayload>(parsed).reason);
}

TEST(ClosePayloadTest, EmptyBodyMeansNoStatus) {
  auto parsed = parseClosePayload("");
  ASSERT_TRUE(isSuccess(parsed));
  EXPECT_EQ(CloseCode::kNoStatusReceived, get<ClosePayload>(parsed).code);
}

TEST(ClosePayloadTest, RejectsMalformedBodies) {
  auto truncated = parseClosePayload(std::string("\x03", 1));
  ASSERT_NE(nullptr, getError(truncated));
  EXPECT_EQ(CloseCode::kProtocolError, getError(truncated)->code);

  // 1006 may never appear in a close frame
  auto reserved = parseClosePayload(encodeClosePayload(1006, ""));
  ASSERT_NE(nullptr, getError(reserved));
  EXPECT_EQ(CloseCode::kProtocolError, getError(reserved)->code);

  EXPECT_NE(nullptr, getError(parseClosePayload(encodeClosePayload(999, ""))));
  EXPECT_TRUE(isSuccess(parseClosePayload(encodeClosePayload(4000, ""))));
}

TEST_F(FrameDecoderTest, DecodesSingleFrame) {
  ASSERT_TRUE(isSuccess(feed(serverFrame(OpCode::Text, "{\"a\":1}"))));
  ASSERT_EQ(1u, messages_.size());
  EXPECT_EQ(OpCode::Text, messages_[0].opcode);
  EXPECT_EQ("{\"a\":1}", messages_[0].payload);
  EXPECT_EQ(0u, decoder_.bufferedBytes());
}

TEST_F(FrameDecoderTest, DecodesByteByByte) {
  auto bytes = serverFrame(OpCode::Text, std::string(300, 'z'));
  for (char c : bytes) {
    ASSERT_TRUE(isSuccess(feed(std::string(1, c))));
  }
  ASSERT_EQ(1u, messages_.size());
  EXPECT_EQ(std::string(300, 'z'), messages_[0].payload);
}

TEST_F(FrameDecoderTest, DecodesSeveralFramesInOneChunk) {
  ASSERT_TRUE(isSuccess(feed(serverFrame(OpCode::Text, "one") +
                             serverFrame(OpCode::Ping, "p") +
                             serverFrame(OpCode::Text, "two"))));
  ASSERT_EQ(3u, messages_.size());
  EXPECT_EQ("one", messages_[0].payload);
  EXPECT_EQ(OpCode::Ping, messages_[1].opcode);
  EXPECT_EQ("two", messages_[2].payload);
}

TEST_F(FrameDecoderTest, ReassemblesFragmentsAroundControlFrames) {
  ASSERT_TRUE(isSuccess(feed(serverFrame(OpCode::Text, "Hel", false))));
  ASSERT_TRUE(isSuccess(feed(serverFrame(OpCode::Ping, "x"))));
  ASSERT_TRUE(isSuccess(feed(serverFrame(OpCode::Continuation, "lo", false))));
  EXPECT_EQ(1u, messages_.size());
  ASSERT_TRUE(isSuccess(feed(serverFrame(OpCode::Continuation, "!"))));

  ASSERT_EQ(2u, messages_.size());
  EXPECT_EQ(OpCode::Ping, messages_[0].opcode);
  EXPECT_EQ(OpCode::Text, messages_[1].opcode);
  EXPECT_EQ("Hello!", messages_[1].payload);
}

TEST_F(FrameDecoderTest, RejectsMaskedServerFrame) {
  EXPECT_EQ(CloseCode::kProtocolError,
            errorCode(feed(encodeFrame(OpCode::Text, "hi", kMask))));
}

TEST_F(FrameDecoderTest, RejectsReservedBits) {
  EXPECT_EQ(CloseCode::kProtocolError,
            errorCode(feed(std::string("\xC1\x02hi", 4))));
}

TEST_F(FrameDecoderTest, RejectsUnknownOpcode) {
  EXPECT_EQ(CloseCode::kProtocolError,
            errorCode(feed(std::string("\x83\x00", 2))));
}

TEST_F(FrameDecoderTest, RejectsFragmentedControlFrame) {
  EXPECT_EQ(CloseCode::kProtocolError,
            errorCode(feed(serverFrame(OpCode::Ping, "x", false))));
}

TEST_F(FrameDecoderTest, RejectsOversizedControlFrame) {
  EXPECT_EQ(CloseCode::kProtocolError,
            errorCode(feed(serverFrame(OpCode::Ping, std::string(126, 'p')))));
}

TEST_F(FrameDecoderTest, RejectsContinuationWithoutStart) {
  EXPECT_EQ(CloseCode::kProtocolError,
            errorCode(feed(serverFrame(OpCode::Continuation, "x"))));
}

TEST_F(FrameDecoderTest, RejectsNewMessageMidFragment) {
  ASSERT_TRUE(isSuccess(feed(serverFrame(OpCode::Text, "a", false))));
  EXPECT_EQ(CloseCode::kProtocolError,
            errorCode(feed(serverFrame(OpCode::Text, "b"))));
}

TEST_F(FrameDecoderTest, RejectsOversizedMessage) {
  EXPECT_EQ(CloseCode::kMessageTooBig,
            errorCode(feed(serverFrame(OpCode::Text, std::string(1025, 'a')))));
}

TEST_F(FrameDecoderTest, RejectsOversizedReassembledMessage) {
  ASSERT_TRUE(
      isSuccess(feed(serverFrame(OpCode::Text, std::string(600, 'a'), false))));
  EXPECT_EQ(CloseCode::kMessageTooBig,
            errorCode(feed(serverFrame(OpCode::Continuation,
                                       std::string(600, 'a')))));
}

TEST_F(FrameDecoderTest, OversizeDetectedFromHeaderAlone) {
  // Only the header of a 64 KiB frame has arrived
  auto frame = serverFrame(OpCode::Binary, std::string(65536, 'x'));
  EXPECT_EQ(CloseCode::kMessageTooBig, errorCode(feed(frame.substr(0, 10))));
}

TEST_F(FrameDecoderTest, RejectsInputAfterFailure) {
  ASSERT_NE(nullptr, getError(feed(serverFrame(OpCode::Continuation, "x"))));
  EXPECT_NE(nullptr, getError(feed(serverFrame(OpCode::Text, "fine"))));
  EXPECT_TRUE(messages_.empty());

  decoder_.reset();
  EXPECT_TRUE(isSuccess(feed(serverFrame(OpCode::Text, "fine"))));
  EXPECT_EQ(1u, messages_.size());
}

TEST(CloseCodeTest, Names) {
  EXPECT_STREQ("Normal Closure", closeCodeToString(1000));
  EXPECT_STREQ("Abnormal Closure", closeCodeToString(1006));
  EXPECT_STREQ("Internal Error", closeCodeToString(1011));
  EXPECT_STREQ("TLS Handshake Failed", closeCodeToString(1015));
  EXPECT_STREQ("Unknown", closeCodeToString(4321));
}

TEST(CloseCodeTest, Sendable) {
  EXPECT_TRUE(isSendableCloseCode(1000));
  EXPECT_TRUE(isSendableCloseCode(1011));
  EXPECT_TRUE(isSendableCloseCode(3000));
  EXPECT_TRUE(isSendableCloseCode(4999));
  EXPECT_FALSE(isSendableCloseCode(1004));
  EXPECT_FALSE(isSendableCloseCode(1005));
  EXPECT_FALSE(isSendableCloseCode(1006));
  EXPECT_FALSE(isSendableCloseCode(1015));
  EXPECT_FALSE(isSendableCloseCode(999));
  EXPECT_FALSE(isSendableCloseCode(5000));
}

}  // namespace
}  // namespace transport
}  // namespace chatws
