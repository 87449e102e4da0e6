#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "companion/ports-config.hpp"

namespace companion {

struct CompanionConfig {
  PortsConfig ports;

  // Maximum duration the reactor blocks in epoll_wait. Also bounds the latency of cross thread wakeups that
  // do not go through the wakeup eventfd. Default: 500 ms.
  std::chrono::milliseconds pollInterval{500};

  // Period of the target state check. Default: 1 s.
  std::chrono::milliseconds targetCheckInterval{1000};

  // If true, the server shuts itself down once the target is observed Offline.
  bool terminateWhenOffline{false};

  // Upper bound of the wait for registered continuations to settle during shutdown. Continuations still
  // running afterwards are logged and abandoned. Default: 5 s.
  std::chrono::milliseconds shutdownGracePeriod{5000};

  // Maximum size of one inbound control frame. Larger frames close the client. Default: 64 MiB.
  std::size_t maxFrameBytes{std::size_t{1} << 26};

  // Per client bound of bytes queued but not yet written. Stream chunks beyond it are dropped, command
  // responses are always queued. Default: 16 MiB.
  std::size_t maxOutboundBufferBytes{std::size_t{1} << 24};

  // Maximum size of a decompressed push payload. Default: 256 MiB.
  std::size_t maxDecompressedBytes{std::size_t{1} << 28};

  CompanionConfig& withPort(uint16_t port) {
    ports.withPort(port);
    return *this;
  }

  CompanionConfig& withPollInterval(std::chrono::milliseconds interval) {
    this->pollInterval = interval;
    return *this;
  }

  CompanionConfig& withTargetCheckInterval(std::chrono::milliseconds interval) {
    this->targetCheckInterval = interval;
    return *this;
  }

  CompanionConfig& withTerminateWhenOffline(bool on = true) {
    this->terminateWhenOffline = on;
    return *this;
  }

  CompanionConfig& withShutdownGracePeriod(std::chrono::milliseconds gracePeriod) {
    this->shutdownGracePeriod = gracePeriod;
    return *this;
  }

  CompanionConfig& withMaxFrameBytes(std::size_t maxFrameBytes) {
    this->maxFrameBytes = maxFrameBytes;
    return *this;
  }

  CompanionConfig& withMaxOutboundBufferBytes(std::size_t maxOutboundBufferBytes) {
    this->maxOutboundBufferBytes = maxOutboundBufferBytes;
    return *this;
  }

  CompanionConfig& withMaxDecompressedBytes(std::size_t maxDecompressedBytes) {
    this->maxDecompressedBytes = maxDecompressedBytes;
    return *this;
  }

  // Throws std::invalid_argument if the configuration is not usable.
  void validate() const;

  bool operator==(const CompanionConfig&) const noexcept = default;
};

}  // namespace companion
