#include "companion/rpc-protocol.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "companion/error.hpp"
#include "companion/little-endian.hpp"

namespace companion {

TEST(RpcProtocolTest, EncodeLaysOutHeaderAndFields) {
  const std::string encoded =
      EncodeRpcFrame(RpcFrame{5, static_cast<uint64_t>(RpcCommand::Move), {"/dst", "", "/a"}});
  ASSERT_EQ(encoded.size(), kRpcHeaderSize + 3 * 8 + 4 + 0 + 2);
  EXPECT_EQ(std::string_view(encoded).substr(0, 8), "CMPNCTRL");
  EXPECT_EQ(Read64LE(encoded.data() + 8), encoded.size());
  EXPECT_EQ(Read64LE(encoded.data() + 16), 5U);
  EXPECT_EQ(Read64LE(encoded.data() + 24), 6U);
  EXPECT_EQ(Read64LE(encoded.data() + kRpcHeaderSize), 4U);
  EXPECT_EQ(std::string_view(encoded).substr(kRpcHeaderSize + 8, 4), "/dst");
  EXPECT_EQ(Read64LE(encoded.data() + kRpcHeaderSize + 12), 0U);
}

TEST(RpcProtocolTest, DecoderHandlesPartialAndConcatenatedFrames) {
  const RpcFrame first{1, static_cast<uint64_t>(RpcCommand::ListPath), {"/Documents"}};
  const RpcFrame second{2, static_cast<uint64_t>(RpcCommand::Describe), {}};
  std::string stream;
  AppendRpcFrame(stream, first);
  AppendRpcFrame(stream, second);

  RpcFrameDecoder decoder(1024);
  std::vector<RpcFrame> frames;
  // Byte by byte.
  for (char ch : stream) {
    decoder.feed(std::string_view(&ch, 1));
    while (auto frame = decoder.next()) {
      frames.push_back(std::move(*frame));
    }
  }
  EXPECT_FALSE(decoder.failed());
  ASSERT_EQ(frames.size(), 2U);
  EXPECT_EQ(frames[0], first);
  EXPECT_EQ(frames[1], second);
  EXPECT_EQ(decoder.bufferedBytes(), 0U);
}

TEST(RpcProtocolTest, DecoderReleasesConsumedBytesOfSplitFrames) {
  const std::string frame = EncodeRpcFrame(RpcFrame{7, static_cast<uint64_t>(RpcCommand::ListPath), {"/Documents"}});
  const std::string_view head = std::string_view(frame).substr(0, frame.size() / 2);
  const std::string_view tail = std::string_view(frame).substr(frame.size() / 2);
  RpcFrameDecoder decoder(1024);
  decoder.feed(head);
  std::size_t nbDecoded = 0;
  // Every read ends in the middle of a frame, so the buffer is never fully drained.
  for (int round = 0; round < 10000; ++round) {
    std::string chunk(tail);
    chunk.append(head);
    decoder.feed(chunk);
    while (auto decoded = decoder.next()) {
      EXPECT_EQ(decoded->requestId, 7U);
      ++nbDecoded;
    }
    ASSERT_LE(decoder.storedBytes(), 2 * frame.size());
  }
  EXPECT_EQ(nbDecoded, 10000U);
  EXPECT_EQ(decoder.bufferedBytes(), head.size());
  EXPECT_FALSE(decoder.failed());
}

TEST(RpcProtocolTest, BinaryFieldsSurvive) {
  std::string payload("a\0b\xff", 4);
  RpcFrameDecoder decoder(1024);
  decoder.feed(EncodeRpcFrame(MakeRpcResponse(9, RpcStatus::StreamChunk, {payload})));
  auto frame = decoder.next();
  ASSERT_TRUE(frame.has_value());
  ASSERT_EQ(frame->fields.size(), 1U);
  EXPECT_EQ(frame->fields[0], payload);
  EXPECT_FALSE(decoder.next().has_value());
}

TEST(RpcProtocolTest, BadMagicIsDetectedEarly) {
  RpcFrameDecoder decoder(1024);
  decoder.feed("CMPX");
  EXPECT_FALSE(decoder.next().has_value());
  ASSERT_TRUE(decoder.failed());
  EXPECT_EQ(decoder.error()->kind(), ErrorKind::ProtocolViolation);

  // Sticky.
  decoder.feed(EncodeRpcFrame(RpcFrame{}));
  EXPECT_FALSE(decoder.next().has_value());
  EXPECT_TRUE(decoder.failed());
}

TEST(RpcProtocolTest, OversizedFrameIsRejected) {
  RpcFrameDecoder decoder(64);
  decoder.feed(EncodeRpcFrame(RpcFrame{1, 2, {std::string(100, 'x')}}).substr(0, kRpcHeaderSize));
  EXPECT_FALSE(decoder.next().has_value());
  ASSERT_TRUE(decoder.failed());
  EXPECT_EQ(decoder.error()->kind(), ErrorKind::ProtocolViolation);
}

TEST(RpcProtocolTest, InconsistentFieldLengthIsRejected) {
  std::string encoded = EncodeRpcFrame(RpcFrame{1, 2, {"abc"}});
  Write64LE(encoded.data() + kRpcHeaderSize, 50);
  RpcFrameDecoder decoder(1024);
  decoder.feed(encoded);
  EXPECT_FALSE(decoder.next().has_value());
  EXPECT_TRUE(decoder.failed());

  encoded = EncodeRpcFrame(RpcFrame{});
  Write64LE(encoded.data() + 8, 10);
  RpcFrameDecoder shortDecoder(1024);
  shortDecoder.feed(encoded);
  EXPECT_FALSE(shortDecoder.next().has_value());
  EXPECT_TRUE(shortDecoder.failed());
}

TEST(RpcProtocolTest, FailureRoundTripsError) {
  const Error error(ErrorKind::DeviceError, "Object not found", 8);
  const RpcFrame frame = MakeRpcFailure(4, error);
  EXPECT_EQ(frame.requestId, 4U);
  EXPECT_EQ(frame.code, static_cast<uint64_t>(RpcStatus::Failed));
  EXPECT_EQ(frame.fields, (std::vector<std::string>{"DeviceError", "8", "Object not found"}));
  EXPECT_EQ(RpcFailureError(frame), error);

  EXPECT_EQ(RpcFailureError(MakeRpcResponse(4, RpcStatus::Ok)).kind(), ErrorKind::ProtocolViolation);
  EXPECT_EQ(RpcFailureError(MakeRpcResponse(4, RpcStatus::Failed, {"Timeout", "x", "m"})).kind(),
            ErrorKind::ProtocolViolation);
}

TEST(RpcProtocolTest, Names) {
  EXPECT_EQ(RpcCommandName(static_cast<uint64_t>(RpcCommand::StartVideo)), "StartVideo");
  EXPECT_EQ(RpcCommandName(999), "Unknown");
  EXPECT_EQ(RpcStatusName(static_cast<uint64_t>(RpcStatus::StreamEnd)), "StreamEnd");
}

}  // namespace companion
