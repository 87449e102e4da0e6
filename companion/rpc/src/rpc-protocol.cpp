#include "companion/rpc-protocol.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "companion/error.hpp"
#include "companion/little-endian.hpp"

namespace companion {

namespace {

void AppendU64(std::string& out, uint64_t value) {
  char buf[sizeof(uint64_t)];
  Write64LE(buf, value);
  out.append(buf, sizeof(buf));
}

}  // namespace

std::string_view RpcCommandName(uint64_t code) noexcept {
  switch (static_cast<RpcCommand>(code)) {
    case RpcCommand::Describe:
      return "Describe";
    case RpcCommand::ListPath:
      return "ListPath";
    case RpcCommand::Pull:
      return "Pull";
    case RpcCommand::Push:
      return "Push";
    case RpcCommand::Remove:
      return "Remove";
    case RpcCommand::Move:
      return "Move";
    case RpcCommand::MakeDirectory:
      return "MakeDirectory";
    case RpcCommand::StreamAttributes:
      return "StreamAttributes";
    case RpcCommand::StartVideo:
      return "StartVideo";
    case RpcCommand::StopVideo:
      return "StopVideo";
    default:
      return "Unknown";
  }
}

std::string_view RpcStatusName(uint64_t code) noexcept {
  switch (static_cast<RpcStatus>(code)) {
    case RpcStatus::Ok:
      return "Ok";
    case RpcStatus::Failed:
      return "Failed";
    case RpcStatus::StreamChunk:
      return "StreamChunk";
    case RpcStatus::StreamEnd:
      return "StreamEnd";
    default:
      return "Unknown";
  }
}

RpcFrame MakeRpcResponse(uint64_t requestId, RpcStatus status, std::vector<std::string> fields) {
  return RpcFrame{requestId, static_cast<uint64_t>(status), std::move(fields)};
}

RpcFrame MakeRpcFailure(uint64_t requestId, const Error& error) {
  return MakeRpcResponse(requestId, RpcStatus::Failed,
                         {std::string(ErrorKindName(error.kind())), std::to_string(error.code()), error.message()});
}

Error RpcFailureError(const RpcFrame& frame) {
  if (frame.code != static_cast<uint64_t>(RpcStatus::Failed) || frame.fields.size() != 3) {
    return {ErrorKind::ProtocolViolation, "malformed Failed response"};
  }
  const std::string& codeStr = frame.fields[1];
  int64_t code = 0;
  const auto [ptr, ec] = std::from_chars(codeStr.data(), codeStr.data() + codeStr.size(), code);
  if (ec != std::errc{} || ptr != codeStr.data() + codeStr.size()) {
    return {ErrorKind::ProtocolViolation, fmt::format("malformed error code '{}'", codeStr)};
  }
  return {ErrorKindFromName(frame.fields[0]), frame.fields[2], code};
}

void AppendRpcFrame(std::string& out, const RpcFrame& frame) {
  std::size_t totalLength = kRpcHeaderSize;
  for (const std::string& field : frame.fields) {
    totalLength += sizeof(uint64_t) + field.size();
  }
  out.reserve(out.size() + totalLength);
  out.append(kRpcMagic);
  AppendU64(out, totalLength);
  AppendU64(out, frame.requestId);
  AppendU64(out, frame.code);
  for (const std::string& field : frame.fields) {
    AppendU64(out, field.size());
    out.append(field);
  }
}

std::string EncodeRpcFrame(const RpcFrame& frame) {
  std::string out;
  AppendRpcFrame(out, frame);
  return out;
}

void RpcFrameDecoder::feed(std::string_view bytes) {
  if (failed()) {
    return;
  }
  if (_pos != 0) {
    _buffer.erase(0, _pos);
    _pos = 0;
  }
  _buffer.append(bytes);
}

std::nullopt_t RpcFrameDecoder::fail(std::string message) {
  _error.emplace(ErrorKind::ProtocolViolation, std::move(message));
  _buffer.clear();
  _pos = 0;
  return std::nullopt;
}

std::optional<RpcFrame> RpcFrameDecoder::next() {
  if (failed()) {
    return std::nullopt;
  }
  const std::string_view pending = std::string_view(_buffer).substr(_pos);
  // The magic is checked as soon as it is readable.
  const std::size_t magicLen = std::min(pending.size(), kRpcMagic.size());
  if (pending.substr(0, magicLen) != kRpcMagic.substr(0, magicLen)) {
    return fail("bad control frame magic");
  }
  if (pending.size() < kRpcHeaderSize) {
    return std::nullopt;
  }
  const uint64_t totalLength = Read64LE(pending.data() + 8);
  if (totalLength < kRpcHeaderSize) {
    return fail(fmt::format("control frame length {} is smaller than its header", totalLength));
  }
  if (totalLength > _maxFrameBytes) {
    return fail(fmt::format("control frame of {} bytes exceeds limit of {}", totalLength, _maxFrameBytes));
  }
  if (pending.size() < totalLength) {
    return std::nullopt;
  }

  RpcFrame frame;
  frame.requestId = Read64LE(pending.data() + 16);
  frame.code = Read64LE(pending.data() + 24);
  std::size_t pos = kRpcHeaderSize;
  while (pos < totalLength) {
    if (totalLength - pos < sizeof(uint64_t)) {
      return fail("truncated control frame field length");
    }
    const uint64_t fieldLength = Read64LE(pending.data() + pos);
    pos += sizeof(uint64_t);
    if (fieldLength > totalLength - pos) {
      return fail(fmt::format("control frame field of {} bytes overflows its frame", fieldLength));
    }
    frame.fields.emplace_back(pending.substr(pos, fieldLength));
    pos += fieldLength;
  }
  _pos += totalLength;
  if (_pos == _buffer.size()) {
    _buffer.clear();
    _pos = 0;
  }
  return frame;
}

}  // namespace companion
