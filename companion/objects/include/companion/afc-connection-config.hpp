#pragma once

#include <chrono>
#include <cstddef>

namespace companion {

struct AfcConnectionConfig {
  // Bound of a single request write and of the wait for its response. Default: 10 s.
  std::chrono::milliseconds ioTimeout{10000};

  // Largest accepted response packet (header included). Default: 64 MiB.
  std::size_t maxPacketBytes{std::size_t{1} << 26};

  // Size of the chunks used by file reads and writes. Default: 64 KiB.
  std::size_t fileChunkSize{std::size_t{1} << 16};

  AfcConnectionConfig& withIoTimeout(std::chrono::milliseconds timeout) {
    this->ioTimeout = timeout;
    return *this;
  }

  AfcConnectionConfig& withMaxPacketBytes(std::size_t maxPacketBytes) {
    this->maxPacketBytes = maxPacketBytes;
    return *this;
  }

  AfcConnectionConfig& withFileChunkSize(std::size_t fileChunkSize) {
    this->fileChunkSize = fileChunkSize;
    return *this;
  }

  // Throws std::invalid_argument if the configuration is not usable.
  void validate() const;

  bool operator==(const AfcConnectionConfig&) const noexcept = default;
};

}  // namespace companion
