#include "companion/error.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace companion {

std::string_view ErrorKindName(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::ConnectionClosed:
      return "ConnectionClosed";
    case ErrorKind::ProtocolViolation:
      return "ProtocolViolation";
    case ErrorKind::DeviceError:
      return "DeviceError";
    case ErrorKind::AlreadyStarted:
      return "AlreadyStarted";
    case ErrorKind::InvalidState:
      return "InvalidState";
    case ErrorKind::InvalidArgument:
      return "InvalidArgument";
    case ErrorKind::BindFailure:
      return "BindFailure";
    case ErrorKind::Cancelled:
      return "Cancelled";
    case ErrorKind::Timeout:
      return "Timeout";
    case ErrorKind::InitializationFailure:
      return "InitializationFailure";
    case ErrorKind::Internal:
      return "Internal";
    default:
      return "Unknown";
  }
}

ErrorKind ErrorKindFromName(std::string_view name) noexcept {
  for (auto kind = ErrorKind::ConnectionClosed; kind < ErrorKind::Internal;
       kind = static_cast<ErrorKind>(static_cast<std::uint8_t>(kind) + 1U)) {
    if (ErrorKindName(kind) == name) {
      return kind;
    }
  }
  return ErrorKind::Internal;
}

std::string Error::describe() const {
  if (_code == 0) {
    return fmt::format("{}: {}", ErrorKindName(_kind), _message);
  }
  return fmt::format("{} ({}): {}", ErrorKindName(_kind), _code, _message);
}

FutureError::FutureError(Error error) : std::runtime_error(error.describe()), _error(std::move(error)) {}

}  // namespace companion
