#pragma once

#include <string>
#include <utility>

#include "companion/base-fd.hpp"
#include "companion/socket.hpp"

namespace companion {

// Connected stream socket: a control client accepted by the server, or an outgoing connection of ConnectTCP.
class Connection {
 public:
  Connection() noexcept = default;

  // Accepts one pending client of 'listener', non-blocking and close-on-exec. Invalid when nothing was pending or
  // accept failed.
  explicit Connection(const Socket& listener);

  explicit Connection(BaseFd&& bd, std::string peer = {}) noexcept : _baseFd(std::move(bd)), _peer(std::move(peer)) {}

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // "address:port" of the remote end when known, empty otherwise.
  [[nodiscard]] const std::string& peer() const noexcept { return _peer; }

  [[nodiscard]] BaseFd releaseFd() noexcept { return std::move(_baseFd); }

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
  std::string _peer;
};

}  // namespace companion
