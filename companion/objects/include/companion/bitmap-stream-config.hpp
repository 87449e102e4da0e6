#pragma once

#include <chrono>
#include <cstddef>

namespace companion {

struct BitmapStreamConfig {
  // Bound of the wait for the first chunk to reach the consumer. Default: 10 s.
  std::chrono::milliseconds startTimeout{10000};

  // Maximum duration of one blocking read on the frame source before checking for a stop request. Default: 100 ms.
  std::chrono::milliseconds readTimeout{100};

  // Size of the read buffer, and thus upper bound of a chunk forwarded to the consumer. Default: 64 KiB.
  std::size_t chunkSize{std::size_t{1} << 16};

  BitmapStreamConfig& withStartTimeout(std::chrono::milliseconds timeout) {
    this->startTimeout = timeout;
    return *this;
  }

  BitmapStreamConfig& withReadTimeout(std::chrono::milliseconds timeout) {
    this->readTimeout = timeout;
    return *this;
  }

  BitmapStreamConfig& withChunkSize(std::size_t chunkSize) {
    this->chunkSize = chunkSize;
    return *this;
  }

  // Throws std::invalid_argument if the configuration is not usable.
  void validate() const;

  bool operator==(const BitmapStreamConfig&) const noexcept = default;
};

}  // namespace companion
