#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace companion {

enum class ErrorKind : std::uint8_t {
  ConnectionClosed,       // the channel is gone, nothing was (or will be) exchanged
  ProtocolViolation,      // bad framing or ordering, fatal to the connection
  DeviceError,            // error reported by the device, the connection stays usable
  AlreadyStarted,         // state machine misuse
  InvalidState,           // state machine misuse
  InvalidArgument,        // malformed command input
  BindFailure,            // the listener could not be acquired
  Cancelled,              // terminal, not a failure to be retried
  Timeout,                // lost a race against a timer
  InitializationFailure,  // server construction
  Internal,               // unexpected exception
};

[[nodiscard]] std::string_view ErrorKindName(ErrorKind kind) noexcept;

// Inverse of ErrorKindName. Internal for unknown names.
[[nodiscard]] ErrorKind ErrorKindFromName(std::string_view name) noexcept;

class Error {
 public:
  Error() noexcept = default;

  Error(ErrorKind kind, std::string message, int64_t code = 0)
      : _message(std::move(message)), _code(code), _kind(kind) {}

  [[nodiscard]] ErrorKind kind() const noexcept { return _kind; }

  // Raw code from the source of the error (device status, errno), 0 if none.
  [[nodiscard]] int64_t code() const noexcept { return _code; }

  [[nodiscard]] const std::string& message() const noexcept { return _message; }

  // "Kind (code): message" - the code part is omitted when 0.
  [[nodiscard]] std::string describe() const;

  bool operator==(const Error&) const noexcept = default;

 private:
  std::string _message;
  int64_t _code{0};
  ErrorKind _kind{ErrorKind::Internal};
};

// Exception carrying an Error, thrown when a failed or cancelled Future value is accessed.
class FutureError : public std::runtime_error {
 public:
  explicit FutureError(Error error);

  [[nodiscard]] const Error& error() const noexcept { return _error; }

 private:
  Error _error;
};

}  // namespace companion
