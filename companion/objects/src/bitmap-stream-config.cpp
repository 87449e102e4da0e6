#include "companion/bitmap-stream-config.hpp"

#include <chrono>
#include <stdexcept>

namespace companion {

void BitmapStreamConfig::validate() const {
  if (startTimeout <= std::chrono::milliseconds{0}) {
    throw std::invalid_argument("startTimeout must be > 0");
  }
  if (readTimeout <= std::chrono::milliseconds{0}) {
    throw std::invalid_argument("readTimeout must be > 0");
  }
  if (chunkSize == 0) {
    throw std::invalid_argument("chunkSize must be > 0");
  }
}

}  // namespace companion
