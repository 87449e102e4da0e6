#include "companion/video-source-config.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <system_error>

namespace companion {

void VideoSourceConfig::validate() const {
  if (host.empty()) {
    throw std::invalid_argument("video relay host must not be empty");
  }
  uint16_t portValue = 0;
  const auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), portValue);
  if (port.empty() || ec != std::errc{} || ptr != port.data() + port.size() || portValue == 0) {
    throw std::invalid_argument("video relay port must be a number in [1, 65535]");
  }
  if (framesPerSecond == 0) {
    throw std::invalid_argument("framesPerSecond must be > 0");
  }
  if (pixelFormat.empty()) {
    throw std::invalid_argument("pixelFormat must not be empty");
  }
  if (connectTimeout <= std::chrono::milliseconds{0}) {
    throw std::invalid_argument("connectTimeout must be > 0");
  }
}

}  // namespace companion
