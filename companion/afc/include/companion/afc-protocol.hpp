#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "companion/error.hpp"

namespace companion {

// Apple File Conduit wire format.
//
// Every packet starts with a fixed 40 byte header of five little-endian 64-bit integers:
//   magic | header_length | total_length | request_id | operation_code
// header_length covers the header and the operation parameters, total_length adds the data payload.

inline constexpr std::string_view kAfcMagic = "CFA6LPAA";
inline constexpr std::size_t kAfcHeaderSize = 40;

enum class AfcOperation : uint64_t {
  Status = 0x01,
  Data = 0x02,
  ReadDirectory = 0x03,
  RemovePath = 0x08,
  MakeDirectory = 0x09,
  GetFileInfo = 0x0A,
  GetDeviceInfo = 0x0B,
  FileOpen = 0x0D,
  FileOpenResult = 0x0E,
  FileRead = 0x0F,
  FileWrite = 0x10,
  FileClose = 0x14,
  RenamePath = 0x18,
  RemovePathAndContents = 0x22,
};

[[nodiscard]] std::string_view AfcOperationName(AfcOperation operation) noexcept;

// Operation of a successful response to 'request': Data for reads and listings, FileOpenResult for FileOpen,
// Status otherwise. A Status with a non zero code is a valid answer to any request.
[[nodiscard]] AfcOperation AfcExpectedResponse(AfcOperation request) noexcept;

// Status codes carried by Status packets. 0 is success.
enum class AfcStatus : uint64_t {
  Success = 0,
  UnknownError = 1,
  OpHeaderInvalid = 2,
  NoResources = 3,
  ReadError = 4,
  WriteError = 5,
  UnknownPacketType = 6,
  InvalidArg = 7,
  ObjectNotFound = 8,
  ObjectIsDir = 9,
  PermDenied = 10,
  ServiceNotConnected = 11,
  OpTimeout = 12,
  TooMuchData = 13,
  EndOfData = 14,
  OpNotSupported = 15,
  ObjectExists = 16,
  ObjectBusy = 17,
  NoSpaceLeft = 18,
  OpWouldBlock = 19,
  IoError = 20,
  OpInterrupted = 21,
  OpInProgress = 22,
  InternalError = 23,
  MuxError = 30,
  NoMem = 31,
  NotEnoughData = 32,
  DirNotEmpty = 33,
};

[[nodiscard]] std::string_view AfcStatusMessage(uint64_t status) noexcept;

// DeviceError carrying the raw status code and its message.
[[nodiscard]] Error AfcStatusError(uint64_t status);

// File open modes of FileOpen.
enum class AfcFileMode : uint64_t {
  ReadOnly = 1,        // r
  ReadWrite = 2,       // r+
  WriteTruncate = 3,   // w, created if missing
  ReadWriteTrunc = 4,  // w+
  Append = 5,          // a
  ReadAppend = 6,      // a+
};

struct AfcHeader {
  uint64_t headerLength{kAfcHeaderSize};
  uint64_t totalLength{kAfcHeaderSize};
  uint64_t requestId{0};
  uint64_t operation{0};

  [[nodiscard]] std::size_t paramsLength() const noexcept { return headerLength - kAfcHeaderSize; }
  [[nodiscard]] std::size_t dataLength() const noexcept { return totalLength - headerLength; }

  bool operator==(const AfcHeader&) const noexcept = default;
};

struct AfcPacket {
  uint64_t requestId{0};
  AfcOperation operation{AfcOperation::Status};
  std::string params;
  std::string data;

  // First 64-bit parameter, used by Status (code) and FileOpenResult (handle). 0 if absent.
  [[nodiscard]] uint64_t firstParam() const noexcept;

  bool operator==(const AfcPacket&) const noexcept = default;
};

// Serialize a whole packet (header, params, data).
[[nodiscard]] std::string EncodeAfcPacket(const AfcPacket& packet);

// Parse and check a packet header of exactly kAfcHeaderSize bytes. ProtocolViolation on bad magic, inconsistent
// lengths or a total length above maxPacketBytes.
[[nodiscard]] std::expected<AfcHeader, Error> DecodeAfcHeader(std::string_view header, std::size_t maxPacketBytes);

// Parameter helpers
void AppendAfcU64(std::string& out, uint64_t value);
void AppendAfcPath(std::string& out, std::string_view path);

// Split a NUL separated payload. A trailing NUL does not produce an empty last element.
[[nodiscard]] std::vector<std::string> SplitAfcStrings(std::string_view data);

// Key / value pairs of NUL separated payloads (GetFileInfo, GetDeviceInfo). A dangling key is dropped.
[[nodiscard]] std::map<std::string, std::string> ParseAfcDictionary(std::string_view data);

}  // namespace companion
