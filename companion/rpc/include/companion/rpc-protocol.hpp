#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "companion/error.hpp"

namespace companion {

// Control protocol frame, all integers little-endian 64-bit:
//   magic "CMPNCTRL" | total_length | request_id | code | fields
// where total_length counts the whole frame and each field is 'length | bytes'.
inline constexpr std::string_view kRpcMagic = "CMPNCTRL";

inline constexpr std::size_t kRpcHeaderSize = 32;

// Request codes, with their fields.
enum class RpcCommand : uint64_t {
  Describe = 1,          // -> Ok [target description JSON]
  ListPath = 2,          // [path] -> Ok [entry...]
  Pull = 3,              // [path, encoding?] -> Ok [encoding, content]
  Push = 4,              // [destination directory, file name, content, encoding?] -> Ok
  Remove = 5,            // [path...] -> Ok
  Move = 6,              // [destination directory, source...] -> Ok
  MakeDirectory = 7,     // [path] -> Ok
  StreamAttributes = 8,  // -> Ok [attributes JSON]
  StartVideo = 9,        // -> Ok [continuation id] once the first chunk is forwarded, StreamChunk [bytes]..., StreamEnd
  StopVideo = 10,        // -> Ok once the stream of the client is stopped
};

// Response codes. Responses echo the request id.
enum class RpcStatus : uint64_t {
  Ok = 0,
  Failed = 1,       // [kind name, code (decimal), message]
  StreamChunk = 2,  // [bytes]
  StreamEnd = 3,    // stream of a StartVideo request is over
};

// Payload encodings of Pull and Push.
inline constexpr std::string_view kIdentityEncoding = "identity";
inline constexpr std::string_view kGzipEncoding = "gzip";

[[nodiscard]] std::string_view RpcCommandName(uint64_t code) noexcept;

[[nodiscard]] std::string_view RpcStatusName(uint64_t code) noexcept;

struct RpcFrame {
  uint64_t requestId{0};
  uint64_t code{0};
  std::vector<std::string> fields;

  bool operator==(const RpcFrame&) const = default;
};

[[nodiscard]] RpcFrame MakeRpcResponse(uint64_t requestId, RpcStatus status, std::vector<std::string> fields = {});

// Failed response carrying 'error'.
[[nodiscard]] RpcFrame MakeRpcFailure(uint64_t requestId, const Error& error);

// Error carried by a Failed response. ProtocolViolation if the fields are malformed.
[[nodiscard]] Error RpcFailureError(const RpcFrame& frame);

void AppendRpcFrame(std::string& out, const RpcFrame& frame);

[[nodiscard]] std::string EncodeRpcFrame(const RpcFrame& frame);

// Incremental decoder of a stream of frames.
// A malformed frame (bad magic, inconsistent lengths, frame larger than the limit) is a ProtocolViolation after
// which the decoder stays failed.
class RpcFrameDecoder {
 public:
  explicit RpcFrameDecoder(std::size_t maxFrameBytes) : _maxFrameBytes(maxFrameBytes) {}

  void feed(std::string_view bytes);

  // Next complete frame, if any.
  [[nodiscard]] std::optional<RpcFrame> next();

  [[nodiscard]] const std::optional<Error>& error() const noexcept { return _error; }

  [[nodiscard]] bool failed() const noexcept { return _error.has_value(); }

  [[nodiscard]] std::size_t bufferedBytes() const noexcept { return _buffer.size() - _pos; }

  // Bytes held by the decoder, decoded frames not yet released included.
  [[nodiscard]] std::size_t storedBytes() const noexcept { return _buffer.size(); }

 private:
  std::nullopt_t fail(std::string message);

  std::string _buffer;
  std::size_t _pos{0};
  std::size_t _maxFrameBytes;
  std::optional<Error> _error;
};

}  // namespace companion
