#include "companion/companion-config.hpp"

#include <chrono>
#include <stdexcept>

namespace companion {

void CompanionConfig::validate() const {
  if (pollInterval <= std::chrono::milliseconds{0}) {
    throw std::invalid_argument("pollInterval must be > 0");
  }
  if (pollInterval > std::chrono::hours{1}) {
    throw std::invalid_argument("Poll interval value is too large");
  }
  if (targetCheckInterval <= std::chrono::milliseconds{0}) {
    throw std::invalid_argument("targetCheckInterval must be > 0");
  }
  if (shutdownGracePeriod < std::chrono::milliseconds{0}) {
    throw std::invalid_argument("shutdownGracePeriod must be non-negative");
  }
  if (maxFrameBytes < 64) {
    throw std::invalid_argument("maxFrameBytes must be >= 64");
  }
  if (maxOutboundBufferBytes < 1024) {
    throw std::invalid_argument("maxOutboundBufferBytes must be >= 1024");
  }
  if (maxDecompressedBytes == 0) {
    throw std::invalid_argument("maxDecompressedBytes must be > 0");
  }
}

}  // namespace companion
