#include "companion/target-config.hpp"

#include <chrono>
#include <stdexcept>

namespace companion {

void DeviceTargetConfig::validate() const {
  if (udid.empty()) {
    throw std::invalid_argument("device udid must not be empty");
  }
  if (afcHost.empty() || afcPort.empty()) {
    throw std::invalid_argument("device AFC endpoint must be set");
  }
  if (connectTimeout <= std::chrono::milliseconds{0}) {
    throw std::invalid_argument("connectTimeout must be > 0");
  }
  afc.validate();
  stream.validate();
  if (video) {
    video->validate();
  }
}

void SimulatorTargetConfig::validate() const {
  if (udid.empty()) {
    throw std::invalid_argument("simulator udid must not be empty");
  }
  if (root.empty()) {
    throw std::invalid_argument("simulator root must not be empty");
  }
  stream.validate();
  if (video) {
    video->validate();
  }
}

}  // namespace companion
