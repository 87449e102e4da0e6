#pragma once

#include <cstdint>

namespace companion {

inline constexpr uint16_t kDefaultControlPort = 10882;

struct PortsConfig {
  // TCP port of the control listener. 0 lets the OS pick an ephemeral free port, which can be retrieved after
  // start via CompanionServer::port().
  uint16_t port{kDefaultControlPort};

  // If true, enables SO_REUSEPORT on the control listener. Failure to set it is logged, not fatal.
  bool reusePort{false};

  // Disables the Nagle algorithm on accepted control connections. Stream chunks are small and latency sensitive.
  bool tcpNoDelay{true};

  PortsConfig& withPort(uint16_t port) {
    this->port = port;
    return *this;
  }

  PortsConfig& withReusePort(bool on = true) {
    this->reusePort = on;
    return *this;
  }

  PortsConfig& withTcpNoDelay(bool on = true) {
    this->tcpNoDelay = on;
    return *this;
  }

  bool operator==(const PortsConfig&) const noexcept = default;
};

}  // namespace companion
