#include "companion/continuation.hpp"

#include <string_view>

namespace companion {

std::string_view ContinuationTypeName(ContinuationType type) noexcept {
  switch (type) {
    case ContinuationType::VideoStreaming:
      return "VideoStreaming";
    case ContinuationType::TargetOfflineWatch:
      return "TargetOfflineWatch";
    default:
      return "Unknown";
  }
}

}  // namespace companion
