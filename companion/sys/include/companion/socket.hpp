#pragma once

#include <cstdint>

#include "companion/base-fd.hpp"

namespace companion {

// RAII class wrapping an IPv4 TCP socket, used for the control listener.
class Socket {
 public:
  enum class Type : std::uint8_t { Stream, StreamNonBlock };

  Socket() noexcept = default;

  // Throws std::system_error on failure, std::invalid_argument on unknown type.
  explicit Socket(Type type, int protocol = 0);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Try to bind the socket to the given port on all interfaces.
  // Returns false if bind failed (errno is set).
  // Throws std::system_error on setsockopt failure.
  [[nodiscard]] bool tryBind(bool reusePort, bool tcpNoDelay, uint16_t port) const;

  // Bind and start listening on the given port. If port is 0, an ephemeral port is chosen and written back.
  // Throws std::system_error on failure.
  void bindAndListen(bool reusePort, bool tcpNoDelay, uint16_t& port);

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace companion
