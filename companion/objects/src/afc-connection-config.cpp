#include "companion/afc-connection-config.hpp"

#include <chrono>
#include <stdexcept>

namespace companion {

void AfcConnectionConfig::validate() const {
  if (ioTimeout <= std::chrono::milliseconds{0}) {
    throw std::invalid_argument("ioTimeout must be > 0");
  }
  // A packet must at least hold its own header.
  if (maxPacketBytes < 40) {
    throw std::invalid_argument("maxPacketBytes must be >= 40");
  }
  if (fileChunkSize == 0 || fileChunkSize + 40 > maxPacketBytes) {
    throw std::invalid_argument("fileChunkSize must be > 0 and fit in a packet");
  }
}

}  // namespace companion
