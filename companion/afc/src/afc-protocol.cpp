#include "companion/afc-protocol.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "companion/error.hpp"
#include "companion/little-endian.hpp"

namespace companion {

std::string_view AfcOperationName(AfcOperation operation) noexcept {
  switch (operation) {
    case AfcOperation::Status:
      return "Status";
    case AfcOperation::Data:
      return "Data";
    case AfcOperation::ReadDirectory:
      return "ReadDirectory";
    case AfcOperation::RemovePath:
      return "RemovePath";
    case AfcOperation::MakeDirectory:
      return "MakeDirectory";
    case AfcOperation::GetFileInfo:
      return "GetFileInfo";
    case AfcOperation::GetDeviceInfo:
      return "GetDeviceInfo";
    case AfcOperation::FileOpen:
      return "FileOpen";
    case AfcOperation::FileOpenResult:
      return "FileOpenResult";
    case AfcOperation::FileRead:
      return "FileRead";
    case AfcOperation::FileWrite:
      return "FileWrite";
    case AfcOperation::FileClose:
      return "FileClose";
    case AfcOperation::RenamePath:
      return "RenamePath";
    case AfcOperation::RemovePathAndContents:
      return "RemovePathAndContents";
    default:
      return "Unknown";
  }
}

AfcOperation AfcExpectedResponse(AfcOperation request) noexcept {
  switch (request) {
    case AfcOperation::ReadDirectory:
    case AfcOperation::GetFileInfo:
    case AfcOperation::GetDeviceInfo:
    case AfcOperation::FileRead:
      return AfcOperation::Data;
    case AfcOperation::FileOpen:
      return AfcOperation::FileOpenResult;
    default:
      return AfcOperation::Status;
  }
}

std::string_view AfcStatusMessage(uint64_t status) noexcept {
  switch (static_cast<AfcStatus>(status)) {
    case AfcStatus::Success:
      return "Success";
    case AfcStatus::UnknownError:
      return "Unknown error";
    case AfcStatus::OpHeaderInvalid:
      return "Operation header invalid";
    case AfcStatus::NoResources:
      return "No resources";
    case AfcStatus::ReadError:
      return "Read error";
    case AfcStatus::WriteError:
      return "Write error";
    case AfcStatus::UnknownPacketType:
      return "Unknown packet type";
    case AfcStatus::InvalidArg:
      return "Invalid argument";
    case AfcStatus::ObjectNotFound:
      return "Object not found";
    case AfcStatus::ObjectIsDir:
      return "Object is a directory";
    case AfcStatus::PermDenied:
      return "Permission denied";
    case AfcStatus::ServiceNotConnected:
      return "Service not connected";
    case AfcStatus::OpTimeout:
      return "Operation timeout";
    case AfcStatus::TooMuchData:
      return "Too much data";
    case AfcStatus::EndOfData:
      return "End of data";
    case AfcStatus::OpNotSupported:
      return "Operation not supported";
    case AfcStatus::ObjectExists:
      return "Object exists";
    case AfcStatus::ObjectBusy:
      return "Object busy";
    case AfcStatus::NoSpaceLeft:
      return "No space left";
    case AfcStatus::OpWouldBlock:
      return "Operation would block";
    case AfcStatus::IoError:
      return "IO error";
    case AfcStatus::OpInterrupted:
      return "Operation interrupted";
    case AfcStatus::OpInProgress:
      return "Operation in progress";
    case AfcStatus::InternalError:
      return "Internal error";
    case AfcStatus::MuxError:
      return "Mux error";
    case AfcStatus::NoMem:
      return "Out of memory";
    case AfcStatus::NotEnoughData:
      return "Not enough data";
    case AfcStatus::DirNotEmpty:
      return "Directory not empty";
    default:
      return "Unknown AFC status";
  }
}

Error AfcStatusError(uint64_t status) {
  return {ErrorKind::DeviceError, std::string(AfcStatusMessage(status)), static_cast<int64_t>(status)};
}

uint64_t AfcPacket::firstParam() const noexcept {
  if (params.size() < sizeof(uint64_t)) {
    return 0;
  }
  return Read64LE(params.data());
}

std::string EncodeAfcPacket(const AfcPacket& packet) {
  const uint64_t headerLength = kAfcHeaderSize + packet.params.size();
  const uint64_t totalLength = headerLength + packet.data.size();

  std::string out(kAfcHeaderSize, '\0');
  out.reserve(totalLength);
  char* header = out.data();
  kAfcMagic.copy(header, kAfcMagic.size());
  Write64LE(header + 8, headerLength);
  Write64LE(header + 16, totalLength);
  Write64LE(header + 24, packet.requestId);
  Write64LE(header + 32, static_cast<uint64_t>(packet.operation));
  out.append(packet.params);
  out.append(packet.data);
  return out;
}

std::expected<AfcHeader, Error> DecodeAfcHeader(std::string_view header, std::size_t maxPacketBytes) {
  if (header.size() != kAfcHeaderSize) {
    return std::unexpected(
        Error(ErrorKind::ProtocolViolation, fmt::format("AFC header of {} bytes, expected {}", header.size(),
                                                        kAfcHeaderSize)));
  }
  if (header.substr(0, kAfcMagic.size()) != kAfcMagic) {
    return std::unexpected(Error(ErrorKind::ProtocolViolation, "bad AFC magic"));
  }
  AfcHeader ret;
  ret.headerLength = Read64LE(header.data() + 8);
  ret.totalLength = Read64LE(header.data() + 16);
  ret.requestId = Read64LE(header.data() + 24);
  ret.operation = Read64LE(header.data() + 32);
  if (ret.headerLength < kAfcHeaderSize || ret.totalLength < ret.headerLength) {
    return std::unexpected(Error(ErrorKind::ProtocolViolation,
                                 fmt::format("inconsistent AFC lengths (header {}, total {})", ret.headerLength,
                                             ret.totalLength)));
  }
  if (ret.totalLength > maxPacketBytes) {
    return std::unexpected(Error(ErrorKind::ProtocolViolation,
                                 fmt::format("AFC packet of {} bytes exceeds limit of {}", ret.totalLength,
                                             maxPacketBytes)));
  }
  return ret;
}

void AppendAfcU64(std::string& out, uint64_t value) {
  char buf[sizeof(uint64_t)];
  Write64LE(buf, value);
  out.append(buf, sizeof(buf));
}

void AppendAfcPath(std::string& out, std::string_view path) {
  out.append(path);
  out.push_back('\0');
}

std::vector<std::string> SplitAfcStrings(std::string_view data) {
  std::vector<std::string> ret;
  while (!data.empty()) {
    const auto pos = data.find('\0');
    if (pos == std::string_view::npos) {
      ret.emplace_back(data);
      break;
    }
    ret.emplace_back(data.substr(0, pos));
    data.remove_prefix(pos + 1);
  }
  return ret;
}

std::map<std::string, std::string> ParseAfcDictionary(std::string_view data) {
  std::map<std::string, std::string> ret;
  auto strings = SplitAfcStrings(data);
  for (std::size_t pos = 0; pos + 1 < strings.size(); pos += 2) {
    ret.insert_or_assign(std::move(strings[pos]), std::move(strings[pos + 1]));
  }
  return ret;
}

}  // namespace companion
